#pragma once

#include <cstdint>

namespace czistack {

/* What to do with channel names that are not filesystem safe. */
enum class UnsafeNamePolicy : std::uint8_t {
    Sanitize = 0,   // replace anything outside [A-Za-z0-9._-] with '_'
    Reject   = 1    // throw MetadataError
};

/* What to do when two channels end up with the same output name. */
enum class DuplicateNamePolicy : std::uint8_t {
    AppendIndex = 0, // "<name>_ch<index>" for every channel sharing the name
    Reject      = 1  // throw MetadataError
};

/* Options of one export run.
   Filled from the command line; defaults reproduce the full output set. */
struct ExportOptions {
    bool writeMip    {true};    // <base>_color_<name>_mip.png
    bool writeAip    {true};    // <base>_color_<name>_aip.png
    bool writeSlices {true};    // <base>_color_<name>_slice_<z>.png

    UnsafeNamePolicy    unsafeNames   {UnsafeNamePolicy::Sanitize};
    DuplicateNamePolicy duplicateNames{DuplicateNamePolicy::AppendIndex};

    int  pngCompression {3};    // zlib level passed to the PNG encoder, 0..9
    bool verbose        {true}; // one log line per written file
};

} // namespace czistack
