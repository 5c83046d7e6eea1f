#pragma once
#include "czistack/core/Config.hpp"
#include "czistack/core/Stack.hpp"
#include "czistack/compose/Projection.hpp"

#include <opencv2/core.hpp>
#include <filesystem>
#include <set>
#include <string>
#include <vector>

namespace czistack {

/// One PNG produced by an export.
struct ExportedFile {
    std::filesystem::path path;
    int         channel{0};
    std::string kind;       // "mip", "aip" or "slice"
    int         z{-1};      // slice index, -1 for projections
};

/* Output-safe form of a channel name.
   Sanitize: bytes outside [A-Za-z0-9._-] become '_', an empty name becomes
   "ch<index>". Reject: throws MetadataError for such names instead. */
std::string sanitizeChannelName(const std::string& name, int index, UnsafeNamePolicy policy);

/* Final per-channel name used in file names, indexed like `channels`.
   Names shared by several channels get "_ch<index>" appended (or are
   rejected, per policy). Throws MetadataError if names still collide. */
std::vector<std::string> resolveChannelNames(const std::vector<ChannelMetadata>& channels,
                                             const ExportOptions& opt);

/// "<base>_color_<name>_mip.png" / "..._aip.png"
std::string projectionFileName(const std::string& base, const std::string& name, Reduction r);
/// "<base>_color_<name>_slice_<z>.png", z not zero padded
std::string sliceFileName(const std::string& base, const std::string& name, int z);

/*
  Writes the colorized outputs of a decoded stack.

  For every channel in ascending index order: decode its color, write the
  MIP, the AIP, then every slice in ascending z. Stops at the first error;
  files written up to that point stay on disk and are listed by written().
  A path this exporter already wrote is never overwritten (OutputExistsError).
*/
class StackExporter {
public:
    explicit StackExporter(const ExportOptions& opt);
    StackExporter();

    /// Create `dir`; throws OutputExistsError if it is already present, IOError on failure.
    static void prepareOutputDir(const std::filesystem::path& dir);

    /// Export into an existing directory. Returns the files of this call.
    std::vector<ExportedFile> exportStack(const DecodedStack& decoded,
                                          const std::string& basename,
                                          const std::filesystem::path& outDir);

    /// Everything this exporter has written so far, across calls.
    const std::vector<ExportedFile>& written() const { return written_; }

    const ExportOptions& options() const { return opt_; }

private:
    void emit(const cv::Mat& rgb, const std::filesystem::path& path,
              int channel, const std::string& kind, int z,
              std::vector<ExportedFile>& out);

    ExportOptions opt_;
    std::vector<ExportedFile> written_;
    std::set<std::filesystem::path> writtenPaths_;
};

/// Decode `input` and export it into the existing directory `outDir`.
std::vector<ExportedFile> convertFile(const std::filesystem::path& input,
                                      const std::filesystem::path& outDir,
                                      StackExporter& exporter);

} // namespace czistack
