#pragma once

#include "czistack/core/Stack.hpp"

#include <libCZI.h>

#include <filesystem>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace czistack {

/*
  CZI decoder built on libCZI.

  Axis contract: the decoded stack is always (C, Z, Y, X).
    - C and Z come from the sub-block dimension bounds; a file without
      a C (or Z) dimension decodes with 1 channel (or depth 1).
    - Every other dimension (T, R, I, H, V, B) is pinned to the first
      index of its interval.
    - Only Gray8 sub-blocks are accepted, so there is never a sample axis.
    - Y/X cover the layer-0 bounding box; each (C, Z) plane is composed
      from its sub-blocks over a black background.

  The file is opened read-only and stays open for the reader's lifetime.
*/
class StackReader {
public:
    /// Opens the container and inspects its sub-blocks. Throws DecodeError.
    explicit StackReader(const std::filesystem::path& path);
    ~StackReader();

    StackReader(const StackReader&) = delete;
    StackReader& operator=(const StackReader&) = delete;

    const std::filesystem::path& path() const { return path_; }
    const StackShape& shape() const { return shape_; }

    /// Decode all planes. Throws DecodeError.
    ImageStack readPixels();

    /// DisplaySetting channel records in document order. Throws MetadataError.
    std::vector<ChannelMetadata> readChannels();

    /// readPixels() + readChannels(), checking the channel count matches.
    DecodedStack read();

private:
    void inspect();
    libCZI::CDimCoordinate planeCoordinate(int c, int z) const;

    std::filesystem::path path_;
    std::shared_ptr<libCZI::ICZIReader> reader_;

    StackShape shape_{};
    libCZI::IntRect roi_{};
    bool hasC_{false}, hasZ_{false};
    int  cStart_{0}, zStart_{0};
    std::vector<std::pair<libCZI::DimensionIndex, int>> pinned_; // other dims -> first index
};

/// One-shot decode of a file.
DecodedStack readStack(const std::filesystem::path& path);

/// UTF-32 wide text to UTF-8; surrogates and values above U+10FFFF become '?'.
std::string wideToUtf8(const std::wstring& ws);

} // namespace czistack
