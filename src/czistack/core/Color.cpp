#include "czistack/core/Color.hpp"
#include "czistack/core/Errors.hpp"

#include <cstdio>

namespace czistack {

namespace {
int hexNibble(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}
} // namespace

Rgba decodeColor(const std::string& hex) {
    std::string s = hex;
    if (!s.empty() && s[0] == '#') s.erase(0, 1);

    if (s.size() != 8) {
        throw FormatError("color '" + hex + "' is not 8 hex digits (#AARRGGBB)");
    }

    std::uint8_t bytes[4];
    for (int i = 0; i < 4; ++i) {
        const int hi = hexNibble(s[2*i]);
        const int lo = hexNibble(s[2*i + 1]);
        if (hi < 0 || lo < 0) {
            throw FormatError("color '" + hex + "' contains a non-hex character");
        }
        bytes[i] = static_cast<std::uint8_t>(hi * 16 + lo);
    }

    // nibble order on disk is alpha, red, green, blue
    Rgba c;
    c.a = bytes[0];
    c.r = bytes[1];
    c.g = bytes[2];
    c.b = bytes[3];
    return c;
}

std::string encodeColor(const Rgba& c) {
    char buf[10];
    std::snprintf(buf, sizeof(buf), "#%02X%02X%02X%02X",
                  unsigned(c.a), unsigned(c.r), unsigned(c.g), unsigned(c.b));
    return std::string(buf);
}

} // namespace czistack
