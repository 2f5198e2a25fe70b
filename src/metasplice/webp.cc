#include "metasplice/webp.h"

#include <string_view>
#include <utility>

namespace metasplice {
namespace {

    static constexpr std::string_view kExifSignature("Exif\0\0", 6);

    static constexpr uint8_t kVp8lSignature = 0x2F;

    static constexpr uint8_t u8(std::byte b) noexcept
    {
        return static_cast<uint8_t>(b);
    }


    static size_t index_of(const std::vector<RiffChunk>& chunks, uint32_t id,
                           size_t not_found) noexcept
    {
        for (size_t i = 0; i < chunks.size(); ++i) {
            if (chunks[i].id() == id) {
                return i;
            }
        }
        return not_found;
    }


    static const SharedBytes* chunk_data(const RiffChunk* chunk) noexcept
    {
        return chunk ? chunk->data() : nullptr;
    }

}  // namespace

bool
webp_vp8x_dimensions(std::span<const std::byte> vp8x,
                     WebpDimensions* out) noexcept
{
    if (vp8x.size() < kWebpVp8xSize) {
        return false;
    }
    out->width  = load_u24le(vp8x.data() + 4) + 1U;
    out->height = load_u24le(vp8x.data() + 7) + 1U;
    return true;
}


bool
webp_vp8_dimensions(std::span<const std::byte> vp8,
                    WebpDimensions* out) noexcept
{
    // 3-byte frame tag, start code 9D 01 2A, then 14-bit width and height.
    if (vp8.size() < 10) {
        return false;
    }
    if ((u8(vp8[0]) & 0x01U) != 0) {
        return false;
    }
    if (u8(vp8[3]) != 0x9D || u8(vp8[4]) != 0x01 || u8(vp8[5]) != 0x2A) {
        return false;
    }
    out->width  = load_u16le(vp8.data() + 6) & 0x3FFFU;
    out->height = load_u16le(vp8.data() + 8) & 0x3FFFU;
    return true;
}


bool
webp_vp8l_dimensions(std::span<const std::byte> vp8l, WebpDimensions* out,
                     bool* has_alpha) noexcept
{
    if (vp8l.size() < 5 || u8(vp8l[0]) != kVp8lSignature) {
        return false;
    }
    const uint32_t bits = load_u32le(vp8l.data() + 1);
    out->width          = (bits & 0x3FFFU) + 1U;
    out->height         = ((bits >> 14) & 0x3FFFU) + 1U;
    if (has_alpha) {
        *has_alpha = ((bits >> 28) & 0x01U) != 0;
    }
    return true;
}


ImageStatus
WebP::from_riff(RiffChunk riff, WebP* out)
{
    const RiffList* list = riff.list();
    if (riff.id() != kRiffId || !list || list->kind != kWebpKind) {
        return ImageStatus::WrongSignature;
    }
    out->riff_ = std::move(riff);
    return ImageStatus::Ok;
}


ImageStatus
WebP::parse(const SharedBytes& bytes, WebP* out, const ReadLimits& limits)
{
    RiffChunk riff;
    const ImageStatus status = RiffChunk::parse(bytes, &riff, limits);
    if (status != ImageStatus::Ok) {
        return status;
    }
    return from_riff(std::move(riff), out);
}


const std::vector<RiffChunk>&
WebP::chunks() const noexcept
{
    return riff_.list()->subchunks;
}


std::vector<RiffChunk>&
WebP::chunks_mut() noexcept
{
    return riff_.list_mut()->subchunks;
}


bool
WebP::has_chunk(uint32_t id) const noexcept
{
    return chunk_by_id(id) != nullptr;
}


const RiffChunk*
WebP::chunk_by_id(uint32_t id) const noexcept
{
    for (const RiffChunk& chunk : chunks()) {
        if (chunk.id() == id) {
            return &chunk;
        }
    }
    return nullptr;
}


std::vector<const RiffChunk*>
WebP::chunks_by_id(uint32_t id) const
{
    std::vector<const RiffChunk*> out;
    for (const RiffChunk& chunk : chunks()) {
        if (chunk.id() == id) {
            out.push_back(&chunk);
        }
    }
    return out;
}


void
WebP::remove_chunks_by_id(uint32_t id)
{
    std::erase_if(chunks_mut(),
                  [id](const RiffChunk& chunk) { return chunk.id() == id; });
}


WebpKind
WebP::kind() const noexcept
{
    if (has_chunk(kWebpVp8x)) {
        return WebpKind::Extended;
    }
    if (has_chunk(kWebpVp8l)) {
        return WebpKind::Lossless;
    }
    return WebpKind::Lossy;
}


bool
WebP::dimensions(WebpDimensions* out) const noexcept
{
    const SharedBytes* vp8x = chunk_data(chunk_by_id(kWebpVp8x));
    if (vp8x && webp_vp8x_dimensions(vp8x->span(), out)) {
        return true;
    }
    const SharedBytes* vp8 = chunk_data(chunk_by_id(kWebpVp8));
    if (vp8 && webp_vp8_dimensions(vp8->span(), out)) {
        return true;
    }
    const SharedBytes* vp8l = chunk_data(chunk_by_id(kWebpVp8l));
    if (vp8l && webp_vp8l_dimensions(vp8l->span(), out)) {
        return true;
    }
    return false;
}


bool
WebP::extended_flags(uint8_t* out) const noexcept
{
    const SharedBytes* vp8x = chunk_data(chunk_by_id(kWebpVp8x));
    if (!vp8x || vp8x->empty()) {
        return false;
    }
    *out = u8((*vp8x)[0]);
    return true;
}


bool
WebP::icc_profile(SharedBytes* out) const
{
    const SharedBytes* data = chunk_data(chunk_by_id(kWebpIccp));
    if (!data) {
        return false;
    }
    *out = *data;
    return true;
}


ImageStatus
WebP::set_icc_profile(const SharedBytes& profile, const EditOptions& options)
{
    (void)options;
    if (!can_add_extended_header()) {
        return ImageStatus::Unsupported;
    }

    remove_chunks_by_id(kWebpIccp);
    std::vector<RiffChunk>& list = chunks_mut();
    const size_t vp8x            = index_of(list, kWebpVp8x, list.size());
    const size_t at              = (vp8x < list.size()) ? vp8x + 1 : 0;
    list.insert(list.begin() + static_cast<std::ptrdiff_t>(at),
                RiffChunk(kWebpIccp, profile));
    return reconcile_extended_header();
}


ImageStatus
WebP::remove_icc_profile()
{
    remove_chunks_by_id(kWebpIccp);
    return reconcile_extended_header();
}


bool
WebP::exif(SharedBytes* out) const
{
    const SharedBytes* data = chunk_data(chunk_by_id(kWebpExif));
    if (!data) {
        return false;
    }
    *out = data->starts_with(kExifSignature)
               ? data->slice_from(kExifSignature.size())
               : *data;
    return true;
}


ImageStatus
WebP::set_exif(const SharedBytes& exif, const EditOptions& options)
{
    (void)options;
    if (!can_add_extended_header()) {
        return ImageStatus::Unsupported;
    }

    std::vector<std::byte> buf;
    buf.reserve(kExifSignature.size() + exif.size());
    append_bytes(&buf, as_bytes(kExifSignature));
    append_bytes(&buf, exif.span());

    remove_chunks_by_id(kWebpExif);
    std::vector<RiffChunk>& list = chunks_mut();
    const size_t at              = index_of(list, kWebpXmp, list.size());
    list.insert(list.begin() + static_cast<std::ptrdiff_t>(at),
                RiffChunk(kWebpExif, SharedBytes::from_vector(std::move(buf))));
    return reconcile_extended_header();
}


ImageStatus
WebP::remove_exif()
{
    remove_chunks_by_id(kWebpExif);
    return reconcile_extended_header();
}


bool
WebP::needs_extended_header() const noexcept
{
    return has_chunk(kWebpIccp) || has_chunk(kWebpExif) || has_chunk(kWebpXmp)
           || has_chunk(kWebpAnim) || has_chunk(kWebpAlph);
}


bool
WebP::can_add_extended_header() const noexcept
{
    if (has_chunk(kWebpVp8x)) {
        return true;
    }
    WebpDimensions dims;
    return dimensions(&dims) && dims.width != 0 && dims.height != 0;
}


uint8_t
WebP::computed_flags() const noexcept
{
    uint8_t flags = 0;
    if (has_chunk(kWebpIccp)) {
        flags |= kWebpFlagIcc;
    }
    if (has_chunk(kWebpExif)) {
        flags |= kWebpFlagExif;
    }
    if (has_chunk(kWebpXmp)) {
        flags |= kWebpFlagXmp;
    }
    if (has_chunk(kWebpAnim)) {
        flags |= kWebpFlagAnimation;
    }

    bool alpha = has_chunk(kWebpAlph);
    if (!alpha) {
        const SharedBytes* vp8l = chunk_data(chunk_by_id(kWebpVp8l));
        WebpDimensions dims;
        bool hint = false;
        if (vp8l && webp_vp8l_dimensions(vp8l->span(), &dims, &hint)) {
            alpha = hint;
        }
    }
    if (alpha) {
        flags |= kWebpFlagAlpha;
    }
    return flags;
}


ImageStatus
WebP::reconcile_extended_header()
{
    std::vector<RiffChunk>& list = chunks_mut();
    const size_t vp8x            = index_of(list, kWebpVp8x, list.size());
    const bool present           = vp8x < list.size();
    const bool needed            = needs_extended_header();

    if (!needed) {
        if (present) {
            list.erase(list.begin() + static_cast<std::ptrdiff_t>(vp8x));
        }
        return ImageStatus::Ok;
    }

    if (!present) {
        WebpDimensions dims;
        if (!can_add_extended_header() || !dimensions(&dims)) {
            return ImageStatus::Unsupported;
        }
        std::vector<std::byte> buf;
        buf.reserve(kWebpVp8xSize);
        append_u8(&buf, computed_flags());
        append_u8(&buf, 0);
        append_u8(&buf, 0);
        append_u8(&buf, 0);
        append_u24le(&buf, dims.width - 1U);
        append_u24le(&buf, dims.height - 1U);
        list.insert(list.begin(),
                    RiffChunk(kWebpVp8x,
                              SharedBytes::from_vector(std::move(buf))));
        return ImageStatus::Ok;
    }

    // Only the metadata bits follow the chunk list; alpha and animation are
    // left as the encoder wrote them.
    const SharedBytes* data = list[vp8x].data();
    if (!data || data->empty()) {
        return ImageStatus::Ok;
    }
    const uint8_t mask  = kWebpFlagIcc | kWebpFlagExif | kWebpFlagXmp;
    const uint8_t old   = u8((*data)[0]);
    const uint8_t flags = static_cast<uint8_t>((old & ~mask)
                                               | (computed_flags() & mask));
    if (flags == old) {
        return ImageStatus::Ok;
    }
    std::vector<std::byte> buf(data->span().begin(), data->span().end());
    buf[0]     = std::byte { flags };
    list[vp8x] = RiffChunk(kWebpVp8x, SharedBytes::from_vector(std::move(buf)));
    return ImageStatus::Ok;
}


uint64_t
WebP::encoded_size() const noexcept
{
    return riff_.encoded_size();
}


bool
WebP::encode_at(uint64_t* index, SharedBytes* out) const
{
    return riff_.encode_at(index, out);
}

}  // namespace metasplice
