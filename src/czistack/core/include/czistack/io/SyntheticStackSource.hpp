#pragma once
#include "czistack/core/Stack.hpp"

#include <opencv2/core.hpp>
#include <string>

namespace czistack {

/**
 * Builds a synthetic fluorescence Z-stack: per channel, a set of bright
 * blobs over a noisy dark background, each blob in focus at its own depth
 * and fading above/below it. Output is deterministic for a given seed.
 */
class SyntheticStackSource {
public:
    struct Options {
        int    channels = 2;
        int    depth    = 5;
        int    width    = 256, height = 256;
        int    blobs    = 12;       // blobs per channel
        double background = 12.0;   // mean background level (0..255)
        double noiseSigma = 4.0;    // gaussian noise RMS
        double focusSigma = 1.2;    // blob falloff along z, in slices
        unsigned seed     = 1;
    };

    // no default argument, mirrors the other sources
    explicit SyntheticStackSource(const Options& opt);
    SyntheticStackSource();

    /// Stack plus one DisplaySetting record per channel.
    DecodedStack generate() const;

    /// Display name/color of channel c in the built-in palette.
    static ChannelMetadata paletteChannel(int c);

private:
    Options opt_;

    cv::Mat makePlane(int c, int z) const; // 8UC1
};

} // namespace czistack
