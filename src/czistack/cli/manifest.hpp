#pragma once
#include "czistack/core/Errors.hpp"
#include "czistack/core/Exporter.hpp"

#include <zlib.h>

#include <chrono>
#include <cstdint>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <string>
#include <vector>

namespace manifest {

/* Artifact metadata for the output manifest.
   - path    : file name relative to the output directory
   - size    : file size in bytes
   - crc32   : CRC32 of the file contents, 8 upper-case hex digits
   - kind    : "mip", "aip" or "slice"
   - channel : channel index; z: slice index or -1 */
struct Artifact {
    std::string path;
    std::uintmax_t size{0};
    std::string crc32;
    std::string kind;
    int channel{0};
    int z{-1};
};

/* Current UTC time in ISO-8601 format. */
inline std::string iso_utc_now() {
    using namespace std::chrono;
    auto now = system_clock::now();
    std::time_t t = system_clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream os;
    os << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return os.str();
}

/* Minimal JSON string escaper: quotes, backslashes, and control chars. */
inline std::string jesc(const std::string& s) {
    std::string o; o.reserve(s.size()+8);
    for (char c: s) {
        switch(c){
            case '\"': o += "\\\""; break;
            case '\\': o += "\\\\"; break;
            case '\n': o += "\\n"; break;
            case '\r': o += "\\r"; break;
            case '\t': o += "\\t"; break;
            default: o += (unsigned char)c < 0x20 ? '?' : c;
        }
    }
    return o;
}

/* CRC32 (zlib) of a buffer as 8 upper-case hex digits. */
inline std::string crc32_hex(std::uint32_t crc) {
    std::ostringstream os;
    os << std::hex << std::setfill('0') << std::setw(8) << std::uppercase << crc;
    return os.str();
}

/* CRC32 of a whole file. Throws czistack::IOError if it cannot be read. */
inline std::string crc32_file_hex(const std::filesystem::path& p) {
    std::ifstream f(p, std::ios::binary);
    if (!f) throw czistack::IOError("cannot read '" + p.string() + "' for checksum");
    std::vector<unsigned char> buf(1<<20);
    uLong crc = crc32(0L, Z_NULL, 0);
    while (f) {
        f.read(reinterpret_cast<char*>(buf.data()), static_cast<std::streamsize>(buf.size()));
        std::streamsize got = f.gcount();
        if (got <= 0) break;
        crc = crc32(crc, buf.data(), static_cast<uInt>(got));
    }
    return crc32_hex(static_cast<std::uint32_t>(crc));
}

/* Join argv arguments into a single command-line string. */
inline std::string join_argv(int argc, char** argv) {
    std::ostringstream os;
    for (int i=0;i<argc;++i) {
        if (i) os<<' ';
        os<<argv[i];
    }
    return os.str();
}

/* Describe exported files (size + CRC32 read back from disk). */
inline std::vector<Artifact> collect(const std::vector<czistack::ExportedFile>& files) {
    std::vector<Artifact> out;
    out.reserve(files.size());
    for (const auto& f : files) {
        std::error_code ec;
        const auto size = std::filesystem::file_size(f.path, ec);
        if (ec) throw czistack::IOError("cannot stat '" + f.path.string() + "': " + ec.message());
        out.push_back(Artifact{f.path.filename().string(), size, crc32_file_hex(f.path),
                               f.kind, f.channel, f.z});
    }
    return out;
}

/* Manifest document, one artifact per line. */
inline std::string to_json(const std::vector<std::string>& inputs,
                           const std::vector<Artifact>& artifacts,
                           const std::string& command,
                           const std::string& created)
{
    std::ostringstream os;
    os << "{\n"
       << "  \"tool\": \"czistack-cli\",\n"
       << "  \"created\": \"" << jesc(created) << "\",\n"
       << "  \"command\": \"" << jesc(command) << "\",\n"
       << "  \"inputs\": [";
    for (std::size_t i=0;i<inputs.size();++i) {
        os << (i ? ", " : "") << "\"" << jesc(inputs[i]) << "\"";
    }
    os << "],\n"
       << "  \"artifacts\": [\n";
    for (std::size_t i=0;i<artifacts.size();++i) {
        const auto& a = artifacts[i];
        os << "    {\"path\": \"" << jesc(a.path) << "\", \"kind\": \"" << a.kind
           << "\", \"channel\": " << a.channel << ", \"z\": " << a.z
           << ", \"size\": " << a.size << ", \"crc32\": \"" << a.crc32 << "\"}"
           << (i + 1 < artifacts.size() ? ",\n" : "\n");
    }
    os << "  ]\n"
       << "}\n";
    return os.str();
}

/* Write text to a file (binary mode). Throws czistack::IOError. */
inline void write_text_file(const std::filesystem::path& p, const std::string& txt) {
    std::ofstream f(p, std::ios::binary);
    f << txt;
    f.flush();
    if (!f) throw czistack::IOError("cannot write '" + p.string() + "'");
}

} // namespace manifest
