#pragma once

#include "metasplice/shared_bytes.h"

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

/**
 * \file byte_cursor.h
 * \brief Bounds-checked reads over \ref SharedBytes and big/little-endian writers.
 */

namespace metasplice {

/// Packs four tag characters so that \p a is the most significant byte.
static constexpr uint32_t
fourcc(char a, char b, char c, char d) noexcept
{
    return (static_cast<uint32_t>(static_cast<uint8_t>(a)) << 24)
           | (static_cast<uint32_t>(static_cast<uint8_t>(b)) << 16)
           | (static_cast<uint32_t>(static_cast<uint8_t>(c)) << 8)
           | (static_cast<uint32_t>(static_cast<uint8_t>(d)) << 0);
}

/// Writes \p tag as 4 printable characters plus a terminator into \p out.
/// Non-printable bytes are replaced with '.'.
void
fourcc_to_chars(uint32_t tag, char out[5]) noexcept;

/**
 * \brief Forward-only cursor over a shared buffer.
 *
 * Every read checks the remaining length first. A read that does not fit
 * returns false and leaves the cursor where it was, so callers can report
 * \ref ImageStatus::Truncated without ever touching out-of-range memory.
 */
class ByteCursor final {
public:
    ByteCursor() noexcept = default;
    explicit ByteCursor(SharedBytes bytes) noexcept;

    bool read_u8(uint8_t* out) noexcept;
    bool read_u16be(uint16_t* out) noexcept;
    bool read_u32be(uint32_t* out) noexcept;
    bool read_u32le(uint32_t* out) noexcept;
    /// Reads 4 raw tag bytes packed like \ref fourcc.
    bool read_fourcc(uint32_t* out) noexcept;
    /// Copies exactly \p out.size() bytes.
    bool read_bytes(std::span<std::byte> out) noexcept;

    /// Returns the next \p size bytes as a zero-copy slice.
    bool take(size_t size, SharedBytes* out) noexcept;
    bool skip(size_t size) noexcept;

    size_t offset() const noexcept { return offset_; }
    size_t remaining() const noexcept { return bytes_.size() - offset_; }
    bool empty() const noexcept { return offset_ >= bytes_.size(); }
    /// The unread tail (zero-copy).
    SharedBytes rest() const noexcept;

private:
    SharedBytes bytes_;
    size_t offset_ = 0;
};

void
append_u8(std::vector<std::byte>* out, uint8_t v);
void
append_u16be(std::vector<std::byte>* out, uint16_t v);
void
append_u24le(std::vector<std::byte>* out, uint32_t v);
void
append_u32be(std::vector<std::byte>* out, uint32_t v);
void
append_u32le(std::vector<std::byte>* out, uint32_t v);
void
append_fourcc(std::vector<std::byte>* out, uint32_t tag);
void
append_bytes(std::vector<std::byte>* out, std::span<const std::byte> bytes);

/// Reads a 24-bit little-endian value; \p bytes must hold at least 3 bytes.
uint32_t
load_u24le(const std::byte* bytes) noexcept;
uint16_t
load_u16le(const std::byte* bytes) noexcept;
uint32_t
load_u32le(const std::byte* bytes) noexcept;

}  // namespace metasplice
