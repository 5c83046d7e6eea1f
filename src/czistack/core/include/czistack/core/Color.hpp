#pragma once

#include <cstdint>
#include <string>

namespace czistack {

/// Display color of a channel, each component in [0..255].
struct Rgba {
    std::uint8_t r{0};
    std::uint8_t g{0};
    std::uint8_t b{0};
    std::uint8_t a{255};

    bool operator==(const Rgba&) const = default;
};

/* Parse "#AARRGGBB" (the leading '#' is optional).
   Throws FormatError unless exactly 8 hex digits remain. */
Rgba decodeColor(const std::string& hex);

/* Inverse of decodeColor: "#AARRGGBB", upper case. */
std::string encodeColor(const Rgba& c);

} // namespace czistack
