#pragma once
#include <opencv2/core.hpp>

#include <filesystem>

namespace czistack {

/* Write a CV_8UC3 raster in R,G,B order as an 8-bit 3-channel PNG.
   The PNG encoder runs with a fixed compression level, so identical
   rasters produce identical files. Throws IOError on failure. */
void writeRgbPng(const cv::Mat& rgb, const std::filesystem::path& path, int compression = 3);

} // namespace czistack
