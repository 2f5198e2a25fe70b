#include "metasplice/byte_cursor.h"

#include <cstring>
#include <utility>

namespace metasplice {
namespace {

    static constexpr uint8_t u8(std::byte b) noexcept
    {
        return static_cast<uint8_t>(b);
    }

}  // namespace

void
fourcc_to_chars(uint32_t tag, char out[5]) noexcept
{
    for (uint32_t i = 0; i < 4; ++i) {
        const uint8_t c = static_cast<uint8_t>((tag >> (24 - 8 * i)) & 0xFF);
        out[i]          = (c >= 0x20 && c < 0x7F) ? static_cast<char>(c) : '.';
    }
    out[4] = '\0';
}


ByteCursor::ByteCursor(SharedBytes bytes) noexcept
    : bytes_(std::move(bytes))
{
}


bool
ByteCursor::read_u8(uint8_t* out) noexcept
{
    if (remaining() < 1) {
        return false;
    }
    *out = u8(bytes_[offset_]);
    offset_ += 1;
    return true;
}


bool
ByteCursor::read_u16be(uint16_t* out) noexcept
{
    if (remaining() < 2) {
        return false;
    }
    *out = static_cast<uint16_t>(u8(bytes_[offset_ + 0]) << 8)
           | static_cast<uint16_t>(u8(bytes_[offset_ + 1]) << 0);
    offset_ += 2;
    return true;
}


bool
ByteCursor::read_u32be(uint32_t* out) noexcept
{
    if (remaining() < 4) {
        return false;
    }
    *out = (static_cast<uint32_t>(u8(bytes_[offset_ + 0])) << 24)
           | (static_cast<uint32_t>(u8(bytes_[offset_ + 1])) << 16)
           | (static_cast<uint32_t>(u8(bytes_[offset_ + 2])) << 8)
           | (static_cast<uint32_t>(u8(bytes_[offset_ + 3])) << 0);
    offset_ += 4;
    return true;
}


bool
ByteCursor::read_u32le(uint32_t* out) noexcept
{
    if (remaining() < 4) {
        return false;
    }
    *out = load_u32le(bytes_.data() + offset_);
    offset_ += 4;
    return true;
}


bool
ByteCursor::read_fourcc(uint32_t* out) noexcept
{
    return read_u32be(out);
}


bool
ByteCursor::read_bytes(std::span<std::byte> out) noexcept
{
    if (remaining() < out.size()) {
        return false;
    }
    if (!out.empty()) {
        std::memcpy(out.data(), bytes_.data() + offset_, out.size());
    }
    offset_ += out.size();
    return true;
}


bool
ByteCursor::take(size_t size, SharedBytes* out) noexcept
{
    if (remaining() < size) {
        return false;
    }
    *out = bytes_.slice(offset_, size);
    offset_ += size;
    return true;
}


bool
ByteCursor::skip(size_t size) noexcept
{
    if (remaining() < size) {
        return false;
    }
    offset_ += size;
    return true;
}


SharedBytes
ByteCursor::rest() const noexcept
{
    return bytes_.slice_from(offset_);
}


void
append_u8(std::vector<std::byte>* out, uint8_t v)
{
    out->push_back(std::byte { v });
}


void
append_u16be(std::vector<std::byte>* out, uint16_t v)
{
    out->push_back(std::byte { static_cast<uint8_t>((v >> 8) & 0xFF) });
    out->push_back(std::byte { static_cast<uint8_t>((v >> 0) & 0xFF) });
}


void
append_u24le(std::vector<std::byte>* out, uint32_t v)
{
    out->push_back(std::byte { static_cast<uint8_t>((v >> 0) & 0xFF) });
    out->push_back(std::byte { static_cast<uint8_t>((v >> 8) & 0xFF) });
    out->push_back(std::byte { static_cast<uint8_t>((v >> 16) & 0xFF) });
}


void
append_u32be(std::vector<std::byte>* out, uint32_t v)
{
    out->push_back(std::byte { static_cast<uint8_t>((v >> 24) & 0xFF) });
    out->push_back(std::byte { static_cast<uint8_t>((v >> 16) & 0xFF) });
    out->push_back(std::byte { static_cast<uint8_t>((v >> 8) & 0xFF) });
    out->push_back(std::byte { static_cast<uint8_t>((v >> 0) & 0xFF) });
}


void
append_u32le(std::vector<std::byte>* out, uint32_t v)
{
    out->push_back(std::byte { static_cast<uint8_t>((v >> 0) & 0xFF) });
    out->push_back(std::byte { static_cast<uint8_t>((v >> 8) & 0xFF) });
    out->push_back(std::byte { static_cast<uint8_t>((v >> 16) & 0xFF) });
    out->push_back(std::byte { static_cast<uint8_t>((v >> 24) & 0xFF) });
}


void
append_fourcc(std::vector<std::byte>* out, uint32_t tag)
{
    append_u32be(out, tag);
}


void
append_bytes(std::vector<std::byte>* out, std::span<const std::byte> bytes)
{
    out->insert(out->end(), bytes.begin(), bytes.end());
}


uint16_t
load_u16le(const std::byte* bytes) noexcept
{
    return static_cast<uint16_t>(u8(bytes[0]) | (u8(bytes[1]) << 8));
}


uint32_t
load_u24le(const std::byte* bytes) noexcept
{
    return (static_cast<uint32_t>(u8(bytes[0])) << 0)
           | (static_cast<uint32_t>(u8(bytes[1])) << 8)
           | (static_cast<uint32_t>(u8(bytes[2])) << 16);
}


uint32_t
load_u32le(const std::byte* bytes) noexcept
{
    return (static_cast<uint32_t>(u8(bytes[0])) << 0)
           | (static_cast<uint32_t>(u8(bytes[1])) << 8)
           | (static_cast<uint32_t>(u8(bytes[2])) << 16)
           | (static_cast<uint32_t>(u8(bytes[3])) << 24);
}

}  // namespace metasplice
