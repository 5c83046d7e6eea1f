#pragma once
#include "czistack/core/Stack.hpp"

#include <opencv2/core.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace czistack {

/// Reduction applied along the depth axis.
enum class Reduction : std::uint8_t {
    Max = 0,  ///< maximum intensity projection (MIP)
    Mean      ///< average intensity projection (AIP)
};

/// Short tag used in file names and logs ("mip" / "aip").
std::string reductionTag(Reduction r);

/*
  Reduce a depth stack of CV_8UC1 planes (same size, at least one) to a
  single plane in the raw 0..255 domain:
    - Max  -> CV_8UC1, per-pixel maximum;
    - Mean -> CV_64F,  per-pixel sum / depth, not rounded.
*/
cv::Mat project(const std::vector<cv::Mat>& planes, Reduction r);

/// Convenience: project channel c of the stack.
cv::Mat projectChannel(const ImageStack& stack, int c, Reduction r);

} // namespace czistack
