#include "metasplice/png.h"

#include <algorithm>
#include <array>
#include <string_view>
#include <utility>

#include <zlib.h>

namespace metasplice {
namespace {

    static constexpr uint32_t kPngSignatureSize                             = 8;
    static constexpr std::array<std::byte, kPngSignatureSize> kPngSignature = {
        std::byte { 0x89 }, std::byte { 0x50 }, std::byte { 0x4E },
        std::byte { 0x47 }, std::byte { 0x0D }, std::byte { 0x0A },
        std::byte { 0x1A }, std::byte { 0x0A },
    };

    // iCCP profile names are 1-79 Latin-1 printable characters.
    static constexpr size_t kPngMaxProfileName = 79;

    static constexpr uint8_t u8(std::byte b) noexcept
    {
        return static_cast<uint8_t>(b);
    }


    static bool valid_profile_name(std::string_view name) noexcept
    {
        if (name.empty() || name.size() > kPngMaxProfileName) {
            return false;
        }
        for (char c : name) {
            const uint8_t v = static_cast<uint8_t>(c);
            if (!((v >= 32 && v <= 126) || v >= 161)) {
                return false;
            }
        }
        return true;
    }


    static bool inflate_zlib(std::span<const std::byte> in, uint64_t max_out,
                             std::vector<std::byte>* out)
    {
        z_stream strm {};
        strm.zalloc = Z_NULL;
        strm.zfree  = Z_NULL;
        strm.opaque = Z_NULL;

        int ret = inflateInit(&strm);
        if (ret != Z_OK) {
            return false;
        }

        std::array<std::byte, 32768> buf {};
        uint64_t in_off  = 0;
        bool output_full = false;

        for (;;) {
            if (strm.avail_in == 0 && in_off < in.size()) {
                const uint64_t remaining = static_cast<uint64_t>(in.size())
                                           - in_off;
                const uint32_t chunk
                    = (remaining < static_cast<uint64_t>(0xFFFFFFFFU))
                          ? static_cast<uint32_t>(remaining)
                          : 0xFFFFFFFFU;
                strm.next_in  = reinterpret_cast<Bytef*>(const_cast<std::byte*>(
                    in.data() + static_cast<size_t>(in_off)));
                strm.avail_in = static_cast<uInt>(chunk);
                in_off += chunk;
            } else if (strm.avail_in == 0 && !output_full) {
                // Input exhausted before the end of the stream.
                (void)inflateEnd(&strm);
                return false;
            }

            strm.next_out  = reinterpret_cast<Bytef*>(buf.data());
            strm.avail_out = static_cast<uInt>(buf.size());

            ret                   = inflate(&strm, Z_NO_FLUSH);
            const size_t produced = buf.size() - strm.avail_out;
            output_full           = strm.avail_out == 0;

            if (max_out != 0U && out->size() + produced > max_out) {
                (void)inflateEnd(&strm);
                return false;
            }
            out->insert(out->end(), buf.begin(),
                        buf.begin() + static_cast<std::ptrdiff_t>(produced));

            if (ret == Z_STREAM_END) {
                break;
            }
            if (ret != Z_OK) {
                (void)inflateEnd(&strm);
                return false;
            }
        }

        (void)inflateEnd(&strm);
        return true;
    }


    static bool deflate_zlib(std::span<const std::byte> in, int level,
                             std::vector<std::byte>* out)
    {
        uLongf size = compressBound(static_cast<uLong>(in.size()));
        out->resize(static_cast<size_t>(size));
        const int ret = compress2(reinterpret_cast<Bytef*>(out->data()), &size,
                                  reinterpret_cast<const Bytef*>(in.data()),
                                  static_cast<uLong>(in.size()), level);
        if (ret != Z_OK) {
            out->clear();
            return false;
        }
        out->resize(static_cast<size_t>(size));
        return true;
    }

}  // namespace

uint32_t
png_chunk_crc(uint32_t kind, std::span<const std::byte> contents) noexcept
{
    std::array<Bytef, 4> tag = {
        static_cast<Bytef>((kind >> 24) & 0xFFU),
        static_cast<Bytef>((kind >> 16) & 0xFFU),
        static_cast<Bytef>((kind >> 8) & 0xFFU),
        static_cast<Bytef>((kind >> 0) & 0xFFU),
    };
    uLong crc = crc32_z(0L, Z_NULL, 0);
    crc       = crc32_z(crc, tag.data(), tag.size());
    // crc32_z with a null buffer returns the initial value, not \p crc.
    if (!contents.empty()) {
        crc = crc32_z(crc, reinterpret_cast<const Bytef*>(contents.data()),
                      static_cast<z_size_t>(contents.size()));
    }
    return static_cast<uint32_t>(crc);
}


PngChunk::PngChunk(uint32_t kind, SharedBytes contents) noexcept
    : kind_(kind)
    , contents_(std::move(contents))
    , crc_(png_chunk_crc(kind_, contents_.span()))
{
}


bool
PngChunk::length_fits() const noexcept
{
    return contents_.size() <= 0x7FFFFFFFU;
}


uint64_t
PngChunk::encoded_size() const noexcept
{
    return 12U + contents_.size();
}


bool
PngChunk::encode_at(uint64_t* index, SharedBytes* out) const
{
    if (*index == 0) {
        std::vector<std::byte> header;
        header.reserve(8);
        append_u32be(&header, static_cast<uint32_t>(contents_.size()));
        append_fourcc(&header, kind_);
        *out = SharedBytes::from_vector(std::move(header));
        return true;
    }
    *index -= 1;

    if (!contents_.empty()) {
        if (*index == 0) {
            *out = contents_;
            return true;
        }
        *index -= 1;
    }

    if (*index == 0) {
        std::vector<std::byte> crc;
        crc.reserve(4);
        append_u32be(&crc, crc_);
        *out = SharedBytes::from_vector(std::move(crc));
        return true;
    }
    *index -= 1;
    return false;
}


ImageStatus
Png::parse(const SharedBytes& bytes, Png* out)
{
    ByteCursor cur(bytes);
    std::array<std::byte, kPngSignatureSize> sig {};
    if (!cur.read_bytes(sig)) {
        return ImageStatus::Truncated;
    }
    if (sig != kPngSignature) {
        return ImageStatus::WrongSignature;
    }

    std::vector<PngChunk> chunks;
    while (!cur.empty()) {
        uint32_t length = 0;
        uint32_t kind   = 0;
        SharedBytes contents;
        uint32_t crc = 0;
        if (!cur.read_u32be(&length) || !cur.read_fourcc(&kind)
            || !cur.take(static_cast<size_t>(length), &contents)
            || !cur.read_u32be(&crc)) {
            return ImageStatus::Truncated;
        }
        PngChunk chunk(kind, std::move(contents));
        if (chunk.crc() != crc) {
            return ImageStatus::BadCrc;
        }
        chunks.push_back(std::move(chunk));
    }

    out->chunks_ = std::move(chunks);
    return ImageStatus::Ok;
}


bool
Png::lengths_fit() const noexcept
{
    for (const PngChunk& chunk : chunks_) {
        if (!chunk.length_fits()) {
            return false;
        }
    }
    return true;
}


const PngChunk*
Png::chunk_by_kind(uint32_t kind) const noexcept
{
    for (const PngChunk& chunk : chunks_) {
        if (chunk.kind() == kind) {
            return &chunk;
        }
    }
    return nullptr;
}


std::vector<const PngChunk*>
Png::chunks_by_kind(uint32_t kind) const
{
    std::vector<const PngChunk*> out;
    for (const PngChunk& chunk : chunks_) {
        if (chunk.kind() == kind) {
            out.push_back(&chunk);
        }
    }
    return out;
}


void
Png::remove_chunks_by_kind(uint32_t kind)
{
    std::erase_if(chunks_, [kind](const PngChunk& chunk) {
        return chunk.kind() == kind;
    });
}


bool
Png::icc_profile(SharedBytes* out, const ReadLimits& limits) const
{
    const PngChunk* chunk = chunk_by_kind(kPngIccp);
    if (!chunk) {
        return false;
    }

    // name (1-79 bytes) NUL method data
    const SharedBytes& contents = chunk->contents();
    const size_t scan = std::min<size_t>(contents.size(),
                                         kPngMaxProfileName + 1);
    size_t nul = scan;
    for (size_t i = 0; i < scan; ++i) {
        if (u8(contents[i]) == 0) {
            nul = i;
            break;
        }
    }
    if (nul == scan || nul + 2 > contents.size()) {
        return false;
    }
    if (u8(contents[nul + 1]) != 0) {
        return false;
    }

    std::vector<std::byte> profile;
    if (!inflate_zlib(contents.slice_from(nul + 2).span(),
                      limits.max_icc_bytes, &profile)) {
        return false;
    }
    *out = SharedBytes::from_vector(std::move(profile));
    return true;
}


ImageStatus
Png::set_icc_profile(const SharedBytes& profile, const EditOptions& options)
{
    if (!valid_profile_name(options.png_icc_profile_name)) {
        return ImageStatus::Unsupported;
    }
    std::vector<std::byte> compressed;
    if (!deflate_zlib(profile.span(), options.png_icc_deflate_level,
                      &compressed)) {
        return ImageStatus::Unsupported;
    }

    std::vector<std::byte> buf;
    buf.reserve(options.png_icc_profile_name.size() + 2 + compressed.size());
    append_bytes(&buf, as_bytes(options.png_icc_profile_name));
    append_u8(&buf, 0);
    append_u8(&buf, 0);
    append_bytes(&buf, compressed);

    remove_icc_profile();
    const size_t at = std::min<size_t>(1, chunks_.size());
    chunks_.insert(chunks_.begin() + static_cast<std::ptrdiff_t>(at),
                   PngChunk(kPngIccp, SharedBytes::from_vector(std::move(buf))));
    return ImageStatus::Ok;
}


void
Png::remove_icc_profile()
{
    remove_chunks_by_kind(kPngIccp);
}


bool
Png::exif(SharedBytes* out) const
{
    const PngChunk* chunk = chunk_by_kind(kPngExif);
    if (!chunk) {
        return false;
    }
    *out = chunk->contents();
    return true;
}


ImageStatus
Png::set_exif(const SharedBytes& exif, const EditOptions& options)
{
    (void)options;
    remove_exif();
    const size_t at = chunks_.empty() ? 0 : chunks_.size() - 1;
    chunks_.insert(chunks_.begin() + static_cast<std::ptrdiff_t>(at),
                   PngChunk(kPngExif, exif));
    return ImageStatus::Ok;
}


void
Png::remove_exif()
{
    remove_chunks_by_kind(kPngExif);
}


uint64_t
Png::encoded_size() const noexcept
{
    uint64_t size = kPngSignatureSize;
    for (const PngChunk& chunk : chunks_) {
        size += chunk.encoded_size();
    }
    return size;
}


bool
Png::encode_at(uint64_t* index, SharedBytes* out) const
{
    if (*index == 0) {
        *out = SharedBytes::from_static(kPngSignature);
        return true;
    }
    *index -= 1;

    for (const PngChunk& chunk : chunks_) {
        if (chunk.encode_at(index, out)) {
            return true;
        }
    }
    return false;
}

}  // namespace metasplice
