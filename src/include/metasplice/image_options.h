#pragma once

#include <cstdint>
#include <string_view>

/**
 * \file image_options.h
 * \brief Read limits and edit settings for untrusted container input.
 */

namespace metasplice {

/// Resource limits applied while parsing and extracting payloads.
struct ReadLimits final {
    /// Maximum RIFF list nesting (the outer `RIFF` chunk is depth 0).
    uint32_t max_riff_depth = 32;
    /// Maximum inflated size of a PNG `iCCP` profile (0 = unlimited).
    uint64_t max_icc_bytes = 64ULL * 1024ULL * 1024ULL;
};

/// Settings used when synthesizing new metadata units.
struct EditOptions final {
    /// Profile name written into new PNG `iCCP` chunks (1..79 bytes, no NUL).
    std::string_view png_icc_profile_name = "icc";
    /// zlib level used to deflate PNG `iCCP` payloads (0..9).
    int png_icc_deflate_level = 9;
    /// Segment index where JPEG ICC/EXIF segments are inserted (clamped).
    uint32_t jpeg_metadata_index = 3;
};

/// Bundle of every knob, convenient for tools that configure once.
struct ImageOptions final {
    ReadLimits limits;
    EditOptions edit;
};

inline void
apply_image_options(const ImageOptions& options, ReadLimits* limits,
                    EditOptions* edit) noexcept
{
    if (limits) {
        *limits = options.limits;
    }
    if (edit) {
        *edit = options.edit;
    }
}

}  // namespace metasplice
