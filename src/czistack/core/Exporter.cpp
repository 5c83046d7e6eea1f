#include "czistack/core/Exporter.hpp"
#include "czistack/core/Color.hpp"
#include "czistack/core/Errors.hpp"
#include "czistack/compose/Colorize.hpp"
#include "czistack/io/PngWriter.hpp"
#include "czistack/io/StackReader.hpp"

#include <iostream>
#include <map>
#include <set>

namespace czistack {

namespace fs = std::filesystem;

static bool isSafeNameChar(unsigned char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9')
        || c == '.' || c == '_' || c == '-';
}

std::string sanitizeChannelName(const std::string& name, int index, UnsafeNamePolicy policy) {
    if (name.empty()) {
        if (policy == UnsafeNamePolicy::Reject) {
            throw MetadataError("channel " + std::to_string(index) + " has an empty name");
        }
        return "ch" + std::to_string(index);
    }

    std::string out = name;
    for (auto& ch : out) {
        if (isSafeNameChar(static_cast<unsigned char>(ch))) continue;
        if (policy == UnsafeNamePolicy::Reject) {
            throw MetadataError("channel " + std::to_string(index) + " name '" + name
                                + "' contains characters unsafe for file names");
        }
        ch = '_';
    }
    return out;
}

std::vector<std::string> resolveChannelNames(const std::vector<ChannelMetadata>& channels,
                                             const ExportOptions& opt)
{
    std::vector<std::string> names;
    names.reserve(channels.size());
    std::map<std::string, int> uses;
    for (const auto& ch : channels) {
        names.push_back(sanitizeChannelName(ch.name, ch.index, opt.unsafeNames));
        ++uses[names.back()];
    }

    for (std::size_t i = 0; i < names.size(); ++i) {
        if (uses[names[i]] < 2) continue;
        if (opt.duplicateNames == DuplicateNamePolicy::Reject) {
            throw MetadataError("channel name '" + names[i] + "' is used by more than one channel");
        }
        names[i] += "_ch" + std::to_string(channels[i].index);
    }

    std::set<std::string> seen;
    for (const auto& n : names) {
        if (!seen.insert(n).second) {
            throw MetadataError("channel names collide after disambiguation: '" + n + "'");
        }
    }
    return names;
}

std::string projectionFileName(const std::string& base, const std::string& name, Reduction r) {
    return base + "_color_" + name + "_" + reductionTag(r) + ".png";
}

std::string sliceFileName(const std::string& base, const std::string& name, int z) {
    return base + "_color_" + name + "_slice_" + std::to_string(z) + ".png";
}

//---------------- StackExporter ----------------

StackExporter::StackExporter()
    : StackExporter(ExportOptions{}) {}

StackExporter::StackExporter(const ExportOptions& opt)
    : opt_(opt) {}

void StackExporter::prepareOutputDir(const fs::path& dir) {
    std::error_code ec;
    if (fs::exists(dir, ec)) {
        throw OutputExistsError("output path '" + dir.string()
                                + "' already exists; provide a path that does not exist");
    }
    fs::create_directories(dir, ec);
    if (ec) {
        throw IOError("cannot create output directory '" + dir.string() + "': " + ec.message());
    }
}

void StackExporter::emit(const cv::Mat& rgb, const fs::path& path,
                         int channel, const std::string& kind, int z,
                         std::vector<ExportedFile>& out)
{
    if (!writtenPaths_.insert(path.lexically_normal()).second) {
        throw OutputExistsError("'" + path.string() + "' was already written by this export");
    }
    writeRgbPng(rgb, path, opt_.pngCompression);

    ExportedFile f{path, channel, kind, z};
    out.push_back(f);
    written_.push_back(std::move(f));

    if (opt_.verbose) std::cout << "[export] " << path.filename().string() << "\n";
}

/*
  Per channel c (ascending):
    a) color  = decodeColor(channels[c].color)       -> FormatError
    b) MIP    = colorize(max over z / 255)           -> <base>_color_<name>_mip.png
    c) AIP    = colorize(mean over z / 255)          -> <base>_color_<name>_aip.png
    d) slices = colorize(plane(c, z) / 255), z asc.  -> <base>_color_<name>_slice_<z>.png
  Channels never mix; alpha is decoded but not applied.
*/
std::vector<ExportedFile> StackExporter::exportStack(const DecodedStack& decoded,
                                                     const std::string& basename,
                                                     const fs::path& outDir)
{
    const ImageStack& stack = decoded.stack;
    if (static_cast<int>(decoded.channels.size()) != stack.channels()) {
        throw MetadataError(std::to_string(decoded.channels.size()) + " channel record(s) for "
                            + std::to_string(stack.channels()) + " channel(s) of pixel data");
    }
    for (std::size_t i = 0; i < decoded.channels.size(); ++i) {
        if (decoded.channels[i].index != static_cast<int>(i)) {
            throw MetadataError("channel records are not ordered by index");
        }
    }

    const std::vector<std::string> names = resolveChannelNames(decoded.channels, opt_);

    std::vector<ExportedFile> out;
    for (int c = 0; c < stack.channels(); ++c) {
        const Rgba color = decodeColor(decoded.channels[c].color);
        const std::string& name = names[c];

        if (opt_.writeMip) {
            cv::Mat rgb = colorizeRaw(projectChannel(stack, c, Reduction::Max), color);
            emit(rgb, outDir / projectionFileName(basename, name, Reduction::Max), c, "mip", -1, out);
        }
        if (opt_.writeAip) {
            cv::Mat rgb = colorizeRaw(projectChannel(stack, c, Reduction::Mean), color);
            emit(rgb, outDir / projectionFileName(basename, name, Reduction::Mean), c, "aip", -1, out);
        }
        if (opt_.writeSlices) {
            for (int z = 0; z < stack.depth(); ++z) {
                cv::Mat rgb = colorizeRaw(stack.plane(c, z), color);
                emit(rgb, outDir / sliceFileName(basename, name, z), c, "slice", z, out);
            }
        }

        if (opt_.verbose) {
            std::cout << "[export] channel " << c << " '" << decoded.channels[c].name << "' "
                      << encodeColor(color) << " done\n";
        }
    }
    return out;
}

std::vector<ExportedFile> convertFile(const fs::path& input,
                                      const fs::path& outDir,
                                      StackExporter& exporter)
{
    DecodedStack decoded = readStack(input);
    return exporter.exportStack(decoded, input.stem().string(), outDir);
}

} // namespace czistack
