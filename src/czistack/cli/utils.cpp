#include "utils.hpp"
#include "args.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <map>
#include <stdexcept>

static std::string ext_of(const std::filesystem::path& p) {
    std::string e = p.extension().string();
    if (!e.empty() && e[0]=='.') e.erase(0,1);
    std::transform(e.begin(), e.end(), e.begin(), [](unsigned char c){ return std::tolower(c); });
    return e;
}

std::vector<std::filesystem::path> list_czi_in_folder(const std::filesystem::path& folder) {
    std::vector<std::filesystem::path> files;
    std::error_code ec;
    if (!std::filesystem::is_directory(folder, ec)) return files;
    for (auto& de : std::filesystem::directory_iterator(folder, ec)) {
        if (!de.is_regular_file(ec)) continue;
        if (ext_of(de.path()) == "czi") files.push_back(de.path());
    }
    std::sort(files.begin(), files.end());
    return files;
}

std::string find_stem_collision(const std::vector<std::filesystem::path>& files) {
    std::map<std::string, std::string> seen;
    for (const auto& f : files) {
        const std::string stem = f.stem().string();
        std::string key = stem;
        std::transform(key.begin(), key.end(), key.begin(), [](unsigned char c){ return std::tolower(c); });
        if (!seen.emplace(key, stem).second) return stem;
    }
    return {};
}

czistack::ExportOptions export_options_from_args(int argc, char** argv) {
    czistack::ExportOptions opt{};
    opt.writeMip    = !argHas(argc, argv, "no-mip");
    opt.writeAip    = !argHas(argc, argv, "no-aip");
    opt.writeSlices = !argHas(argc, argv, "no-slices");
    opt.verbose     = !argHas(argc, argv, "quiet");

    const std::string unsafe = argValue(argc, argv, "unsafe-names", "sanitize");
    if      (unsafe == "sanitize") opt.unsafeNames = czistack::UnsafeNamePolicy::Sanitize;
    else if (unsafe == "reject")   opt.unsafeNames = czistack::UnsafeNamePolicy::Reject;
    else throw std::invalid_argument("--unsafe-names must be 'sanitize' or 'reject'");

    const std::string dup = argValue(argc, argv, "duplicate-names", "index");
    if      (dup == "index")  opt.duplicateNames = czistack::DuplicateNamePolicy::AppendIndex;
    else if (dup == "reject") opt.duplicateNames = czistack::DuplicateNamePolicy::Reject;
    else throw std::invalid_argument("--duplicate-names must be 'index' or 'reject'");

    opt.pngCompression = argValueInt(argc, argv, "png-compression", opt.pngCompression);
    if (opt.pngCompression < 0 || opt.pngCompression > 9) {
        throw std::invalid_argument("--png-compression must be within 0..9");
    }
    return opt;
}

void report_failure(const std::string& mode, const std::filesystem::path& file,
                    const czistack::Error& e, std::size_t writtenSoFar) {
    std::cerr << "[" << mode << "] " << file.string() << ": " << e.stage()
              << " error: " << e.what() << "\n";
    if (writtenSoFar > 0) {
        std::cerr << "[" << mode << "] " << writtenSoFar
                  << " file(s) were already written and have been left on disk\n";
    }
}
