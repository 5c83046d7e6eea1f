#pragma once
#include "czistack/core/Color.hpp"

#include <opencv2/core.hpp>

namespace czistack {

/* Map a raw-domain plane (CV_8UC1 or CV_64F, values 0..255) to CV_32F
   intensities in [0..1]: float(v) / 255. */
cv::Mat normalizePlane(const cv::Mat& raw);

/*
  Tint a normalized CV_32F plane with a channel color.

  Output is CV_8UC3 in R,G,B component order (not OpenCV's BGR), with
    out[k] = clamp(nearbyint(i * color[k]), 0, 255)
  computed in single precision. nearbyint rounds half to even
  (126.5 -> 126, 127.5 -> 128). Alpha is not applied.
*/
cv::Mat colorize(const cv::Mat& normalized, const Rgba& color);

/// normalizePlane() followed by colorize().
cv::Mat colorizeRaw(const cv::Mat& raw, const Rgba& color);

} // namespace czistack
