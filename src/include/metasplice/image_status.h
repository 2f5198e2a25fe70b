#pragma once

#include <cstdint>

/**
 * \file image_status.h
 * \brief Outcome codes shared by every parser, editor and encoder.
 */

namespace metasplice {

/// Result status for parse, edit and write operations.
enum class ImageStatus : uint8_t {
    Ok,
    /// Magic bytes or the recognized container kind did not match.
    WrongSignature,
    /// A PNG chunk CRC did not match its kind and contents.
    BadCrc,
    /// Input ended before a field could be read.
    Truncated,
    /// A configured resource limit was hit (see \ref ReadLimits). Never
    /// produced with the default limits on JPEG or PNG input.
    LimitExceeded,
    /// The requested edit cannot be expressed for this image.
    Unsupported,
    /// The output sink refused a write.
    Io,
};

/// Returns a stable lowercase name for \p status (e.g. "bad_crc").
const char*
status_name(ImageStatus status) noexcept;

}  // namespace metasplice
