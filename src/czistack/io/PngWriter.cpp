#include "czistack/io/PngWriter.hpp"
#include "czistack/core/Errors.hpp"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <vector>

namespace czistack {

void writeRgbPng(const cv::Mat& rgb, const std::filesystem::path& path, int compression) {
    if (rgb.empty() || rgb.type() != CV_8UC3) {
        throw IOError("refusing to write '" + path.string() + "': raster is not 8-bit RGB");
    }

    // imwrite expects BGR
    cv::Mat bgr;
    cv::cvtColor(rgb, bgr, cv::COLOR_RGB2BGR);

    const std::vector<int> params{
        cv::IMWRITE_PNG_COMPRESSION, std::clamp(compression, 0, 9)
    };

    bool ok = false;
    try {
        ok = cv::imwrite(path.string(), bgr, params);
    } catch (const cv::Exception& e) {
        throw IOError("failed to write '" + path.string() + "': " + e.what());
    }
    if (!ok) {
        throw IOError("failed to write '" + path.string() + "'");
    }
}

} // namespace czistack
