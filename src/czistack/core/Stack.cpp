#include "czistack/core/Stack.hpp"

#include <stdexcept>

namespace czistack {

ImageStack::ImageStack(const StackShape& shape)
    : shape_(shape)
{
    if (shape.channels <= 0 || shape.depth <= 0 || shape.height <= 0 || shape.width <= 0) {
        throw std::invalid_argument("ImageStack: all extents must be positive");
    }
    data_.assign(shape.voxels(), 0);
}

std::size_t ImageStack::offset(int c, int z) const {
    if (c < 0 || c >= shape_.channels || z < 0 || z >= shape_.depth) {
        throw std::out_of_range("ImageStack: plane index out of range");
    }
    return (static_cast<std::size_t>(c) * shape_.depth + z) * shape_.planeSize();
}

std::uint8_t ImageStack::at(int c, int z, int y, int x) const {
    return data_[offset(c, z) + static_cast<std::size_t>(y) * shape_.width + x];
}

std::uint8_t& ImageStack::at(int c, int z, int y, int x) {
    return data_[offset(c, z) + static_cast<std::size_t>(y) * shape_.width + x];
}

cv::Mat ImageStack::plane(int c, int z) const {
    // cv::Mat has no const-data header; callers of the const overload only read
    return cv::Mat(shape_.height, shape_.width, CV_8UC1,
                   const_cast<std::uint8_t*>(data_.data() + offset(c, z)));
}

cv::Mat ImageStack::plane(int c, int z) {
    return cv::Mat(shape_.height, shape_.width, CV_8UC1, data_.data() + offset(c, z));
}

std::vector<cv::Mat> ImageStack::channelPlanes(int c) const {
    std::vector<cv::Mat> planes;
    planes.reserve(static_cast<std::size_t>(shape_.depth));
    for (int z = 0; z < shape_.depth; ++z) planes.push_back(plane(c, z));
    return planes;
}

} // namespace czistack
