#include "czistack/io/SyntheticStackSource.hpp"
#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace czistack {

namespace {
struct PaletteEntry { const char* name; const char* color; };

constexpr PaletteEntry kPalette[] = {
    {"Red",     "#FFFF0000"},
    {"Green",   "#FF00FF00"},
    {"Blue",    "#FF0000FF"},
    {"Magenta", "#FFFF00FF"},
    {"Cyan",    "#FF00FFFF"},
    {"Yellow",  "#FFFFFF00"},
};
constexpr int kPaletteSize = static_cast<int>(sizeof(kPalette) / sizeof(kPalette[0]));
} // namespace

SyntheticStackSource::SyntheticStackSource()
    : SyntheticStackSource(Options{}) {}

SyntheticStackSource::SyntheticStackSource(const Options& opt)
    : opt_(opt)
{
    if (opt_.channels <= 0 || opt_.depth <= 0 || opt_.width <= 0 || opt_.height <= 0) {
        throw std::invalid_argument("SyntheticStackSource: channels, depth and size must be positive");
    }
}

ChannelMetadata SyntheticStackSource::paletteChannel(int c) {
    const PaletteEntry& e = kPalette[c % kPaletteSize];
    ChannelMetadata ch;
    ch.index = c;
    ch.name  = (c < kPaletteSize) ? std::string(e.name)
                                  : std::string(e.name) + std::to_string(c / kPaletteSize);
    ch.color = e.color;
    return ch;
}

cv::Mat SyntheticStackSource::makePlane(int c, int z) const {
    const int w = opt_.width, h = opt_.height;

    // background: gaussian noise, seeded per plane
    cv::Mat base(h, w, CV_32F);
    cv::RNG noise(opt_.seed * 7919u + static_cast<unsigned>(c) * 131u + static_cast<unsigned>(z) + 1u);
    noise.fill(base, cv::RNG::NORMAL, opt_.background, opt_.noiseSigma);

    // blob layout depends on the channel only, so it is the same on every slice
    cv::RNG layout(opt_.seed * 104729u + static_cast<unsigned>(c) + 1u);
    cv::Mat blobs = cv::Mat::zeros(h, w, CV_32F);
    for (int i = 0; i < opt_.blobs; ++i) {
        const cv::Point center(layout.uniform(0, w), layout.uniform(0, h));
        const int radius   = layout.uniform(std::max(2, std::min(w, h) / 40),
                                            std::max(3, std::min(w, h) / 12));
        const double peak  = layout.uniform(120.0, 240.0);
        const double focus = layout.uniform(0.0, static_cast<double>(opt_.depth));

        const double dz = (z + 0.5 - focus) / std::max(1e-3, opt_.focusSigma);
        const double level = peak * std::exp(-0.5 * dz * dz);
        cv::circle(blobs, center, radius, cv::Scalar(level), cv::FILLED, cv::LINE_8);
    }
    cv::GaussianBlur(blobs, blobs, {0, 0}, 1.5);

    cv::Mat out;
    cv::Mat sum = base + blobs;
    sum.convertTo(out, CV_8U); // saturating
    return out;
}

DecodedStack SyntheticStackSource::generate() const {
    DecodedStack d;
    d.stack = ImageStack(StackShape{opt_.channels, opt_.depth, opt_.height, opt_.width});
    for (int c = 0; c < opt_.channels; ++c) {
        for (int z = 0; z < opt_.depth; ++z) {
            cv::Mat dst = d.stack.plane(c, z);
            makePlane(c, z).copyTo(dst);
        }
        d.channels.push_back(paletteChannel(c));
    }
    return d;
}

} // namespace czistack
