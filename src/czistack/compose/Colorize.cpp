#include "czistack/compose/Colorize.hpp"

#include <algorithm>
#include <cmath>

namespace czistack {

namespace {
inline std::uint8_t tint(float intensity, float k) {
    const float v = std::nearbyint(intensity * k);
    return static_cast<std::uint8_t>(std::clamp(v, 0.0f, 255.0f));
}
} // namespace

cv::Mat normalizePlane(const cv::Mat& raw) {
    CV_Assert(!raw.empty());
    CV_Assert(raw.type() == CV_8UC1 || raw.type() == CV_64FC1);

    cv::Mat out(raw.size(), CV_32F);
    for (int y = 0; y < raw.rows; ++y) {
        float* dst = out.ptr<float>(y);
        if (raw.type() == CV_8UC1) {
            const std::uint8_t* src = raw.ptr<std::uint8_t>(y);
            for (int x = 0; x < raw.cols; ++x) dst[x] = static_cast<float>(src[x]) / 255.0f;
        } else {
            const double* src = raw.ptr<double>(y);
            for (int x = 0; x < raw.cols; ++x) dst[x] = static_cast<float>(src[x]) / 255.0f;
        }
    }
    return out;
}

cv::Mat colorize(const cv::Mat& normalized, const Rgba& color) {
    CV_Assert(!normalized.empty());
    CV_Assert(normalized.type() == CV_32FC1);

    const float kr = color.r, kg = color.g, kb = color.b;

    cv::Mat rgb(normalized.size(), CV_8UC3);
    for (int y = 0; y < normalized.rows; ++y) {
        const float* src = normalized.ptr<float>(y);
        cv::Vec3b* dst = rgb.ptr<cv::Vec3b>(y);
        for (int x = 0; x < normalized.cols; ++x) {
            dst[x][0] = tint(src[x], kr);
            dst[x][1] = tint(src[x], kg);
            dst[x][2] = tint(src[x], kb);
        }
    }
    return rgb;
}

cv::Mat colorizeRaw(const cv::Mat& raw, const Rgba& color) {
    return colorize(normalizePlane(raw), color);
}

} // namespace czistack
