//====================================================================
// File: core/include/czistack/core/Stack.hpp
//====================================================================
#pragma once

#include <opencv2/core.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace czistack {

/// Extents of a decoded stack, axes ordered (channel, depth, row, column).
struct StackShape {
    int channels{0};
    int depth{0};
    int height{0};
    int width{0};

    [[nodiscard]] std::size_t planeSize() const noexcept {
        return static_cast<std::size_t>(width) * height;
    }
    [[nodiscard]] std::size_t voxels() const noexcept {
        return planeSize() * depth * channels;
    }

    bool operator==(const StackShape&) const = default;
};

/*
  4D 8-bit intensity array (C, Z, Y, X) in one contiguous buffer.
  All channels share the same depth/height/width.

  plane() hands out cv::Mat headers over the internal buffer, no copy;
  they stay valid as long as the stack is alive and not reassigned.
*/
class ImageStack {
public:
    ImageStack() = default;
    explicit ImageStack(const StackShape& shape); // zero filled

    const StackShape& shape() const noexcept { return shape_; }
    int channels() const noexcept { return shape_.channels; }
    int depth()    const noexcept { return shape_.depth; }
    int height()   const noexcept { return shape_.height; }
    int width()    const noexcept { return shape_.width; }
    bool empty()   const noexcept { return data_.empty(); }

    std::uint8_t  at(int c, int z, int y, int x) const;
    std::uint8_t& at(int c, int z, int y, int x);

    /// Read-only CV_8UC1 view of plane (c, z).
    cv::Mat plane(int c, int z) const;
    /// Writable CV_8UC1 view of plane (c, z).
    cv::Mat plane(int c, int z);

    /// All depth planes of channel c, ascending z.
    std::vector<cv::Mat> channelPlanes(int c) const;

    std::span<const std::uint8_t> data() const noexcept { return data_; }

private:
    std::size_t offset(int c, int z) const;

    StackShape shape_{};
    std::vector<std::uint8_t> data_;
};

/*
  Per-channel display record, taken from the container's DisplaySetting.
  index is the channel position in the ImageStack; color is the raw
  "#AARRGGBB" string as stored in the file.
*/
struct ChannelMetadata {
    int index{0};
    std::string name;
    std::string color;
};

/// Pixels plus channel records of one decoded file, channels[i].index == i.
struct DecodedStack {
    ImageStack stack;
    std::vector<ChannelMetadata> channels;
};

} // namespace czistack
