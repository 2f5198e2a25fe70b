#pragma once

#include <cstdint>

/**
 * \file jpeg_markers.h
 * \brief JPEG (ITU T.81) marker codes and framing predicates.
 *
 * Values are the second marker byte; the first is always \ref jpeg_marker::kPrefix.
 */

namespace metasplice {
namespace jpeg_marker {

    inline constexpr uint8_t kStuff  = 0x00;
    inline constexpr uint8_t kPrefix = 0xFF;

    inline constexpr uint8_t kTem = 0x01;

    // Start of frame (0xC4, 0xC8 and 0xCC are DHT, JPG and DAC).
    inline constexpr uint8_t kSof0  = 0xC0;
    inline constexpr uint8_t kSof1  = 0xC1;
    inline constexpr uint8_t kSof2  = 0xC2;
    inline constexpr uint8_t kSof3  = 0xC3;
    inline constexpr uint8_t kDht   = 0xC4;
    inline constexpr uint8_t kSof5  = 0xC5;
    inline constexpr uint8_t kSof6  = 0xC6;
    inline constexpr uint8_t kSof7  = 0xC7;
    inline constexpr uint8_t kJpg   = 0xC8;
    inline constexpr uint8_t kSof9  = 0xC9;
    inline constexpr uint8_t kSof10 = 0xCA;
    inline constexpr uint8_t kSof11 = 0xCB;
    inline constexpr uint8_t kDac   = 0xCC;
    inline constexpr uint8_t kSof13 = 0xCD;
    inline constexpr uint8_t kSof14 = 0xCE;
    inline constexpr uint8_t kSof15 = 0xCF;

    inline constexpr uint8_t kRst0 = 0xD0;
    inline constexpr uint8_t kRst7 = 0xD7;

    inline constexpr uint8_t kSoi = 0xD8;
    inline constexpr uint8_t kEoi = 0xD9;
    inline constexpr uint8_t kSos = 0xDA;
    inline constexpr uint8_t kDqt = 0xDB;
    inline constexpr uint8_t kDnl = 0xDC;
    inline constexpr uint8_t kDri = 0xDD;
    inline constexpr uint8_t kDhp = 0xDE;
    inline constexpr uint8_t kExp = 0xDF;

    inline constexpr uint8_t kApp0  = 0xE0;
    inline constexpr uint8_t kApp1  = 0xE1;
    inline constexpr uint8_t kApp2  = 0xE2;
    inline constexpr uint8_t kApp13 = 0xED;
    inline constexpr uint8_t kApp14 = 0xEE;
    inline constexpr uint8_t kApp15 = 0xEF;

    inline constexpr uint8_t kJpg0  = 0xF0;
    inline constexpr uint8_t kJpg13 = 0xFD;

    inline constexpr uint8_t kCom = 0xFE;

}  // namespace jpeg_marker

/// True if a 16-bit big-endian length field follows the marker.
bool
jpeg_marker_has_length(uint8_t marker) noexcept;

/// True if entropy-coded data follows the marker's contents (SOS only).
bool
jpeg_marker_has_entropy(uint8_t marker) noexcept;

/// Mnemonic such as "SOF0", "APP1" or "RST3"; "RES" for reserved codes.
const char*
jpeg_marker_name(uint8_t marker) noexcept;

}  // namespace metasplice
