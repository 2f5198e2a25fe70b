#include "metasplice/riff.h"

#include <utility>

namespace metasplice {
namespace {

    static constexpr std::byte kPadByte[] = { std::byte { 0x00 } };

    static ImageStatus parse_chunk(ByteCursor* cur, uint32_t depth,
                                   const ReadLimits& limits, RiffChunk* out)
    {
        uint32_t id     = 0;
        uint32_t length = 0;
        SharedBytes body;
        if (!cur->read_fourcc(&id) || !cur->read_u32le(&length)
            || !cur->take(static_cast<size_t>(length), &body)) {
            return ImageStatus::Truncated;
        }
        if ((length & 1U) != 0 && !cur->skip(1)) {
            return ImageStatus::Truncated;
        }

        if (!riff_id_has_subchunks(id)) {
            *out = RiffChunk(id, std::move(body));
            return ImageStatus::Ok;
        }
        if (depth > limits.max_riff_depth) {
            return ImageStatus::LimitExceeded;
        }

        RiffList list;
        ByteCursor sub(std::move(body));
        if (riff_id_has_kind(id)) {
            uint32_t kind = 0;
            if (!sub.read_fourcc(&kind)) {
                return ImageStatus::Truncated;
            }
            list.kind = kind;
        }
        while (!sub.empty()) {
            RiffChunk child;
            const ImageStatus status = parse_chunk(&sub, depth + 1, limits,
                                                   &child);
            if (status != ImageStatus::Ok) {
                return status;
            }
            list.subchunks.push_back(std::move(child));
        }

        *out = RiffChunk(id, std::move(list));
        return ImageStatus::Ok;
    }

}  // namespace

bool
riff_id_has_subchunks(uint32_t id) noexcept
{
    return id == kRiffId || id == kListId || id == kSeqtId;
}


bool
riff_id_has_kind(uint32_t id) noexcept
{
    return id == kRiffId || id == kListId;
}


RiffChunk::RiffChunk(uint32_t id, RiffContent content)
    : id_(id)
    , content_(std::move(content))
{
}


ImageStatus
RiffChunk::parse(const SharedBytes& bytes, RiffChunk* out,
                 const ReadLimits& limits)
{
    ByteCursor cur(bytes);
    uint32_t id = 0;
    if (!cur.read_fourcc(&id)) {
        return ImageStatus::Truncated;
    }
    if (id != kRiffId) {
        return ImageStatus::WrongSignature;
    }

    ByteCursor outer(bytes);
    return parse_chunk(&outer, 0, limits, out);
}


const RiffList*
RiffChunk::list() const noexcept
{
    return std::get_if<RiffList>(&content_);
}


RiffList*
RiffChunk::list_mut() noexcept
{
    return std::get_if<RiffList>(&content_);
}


const SharedBytes*
RiffChunk::data() const noexcept
{
    return std::get_if<SharedBytes>(&content_);
}


uint64_t
RiffChunk::content_length() const noexcept
{
    if (const SharedBytes* bytes = data()) {
        return bytes->size();
    }
    const RiffList* l = list();
    uint64_t size     = l->kind ? 4U : 0U;
    for (const RiffChunk& child : l->subchunks) {
        size += child.encoded_size();
    }
    return size;
}


bool
RiffChunk::length_fits() const noexcept
{
    if (content_length() > 0xFFFFFFFFU) {
        return false;
    }
    if (const RiffList* l = list()) {
        for (const RiffChunk& child : l->subchunks) {
            if (!child.length_fits()) {
                return false;
            }
        }
    }
    return true;
}


uint64_t
RiffChunk::encoded_size() const noexcept
{
    const uint64_t length = content_length();
    return 8U + length + (length & 1U);
}


bool
RiffChunk::encode_at(uint64_t* index, SharedBytes* out) const
{
    if (*index == 0) {
        std::vector<std::byte> header;
        header.reserve(8);
        append_fourcc(&header, id_);
        append_u32le(&header, static_cast<uint32_t>(content_length()));
        *out = SharedBytes::from_vector(std::move(header));
        return true;
    }
    *index -= 1;

    if (const RiffList* l = list()) {
        if (l->kind) {
            if (*index == 0) {
                std::vector<std::byte> kind;
                kind.reserve(4);
                append_fourcc(&kind, *l->kind);
                *out = SharedBytes::from_vector(std::move(kind));
                return true;
            }
            *index -= 1;
        }
        for (const RiffChunk& child : l->subchunks) {
            if (child.encode_at(index, out)) {
                return true;
            }
        }
        // Children are always even-sized, so a list never needs a pad byte.
        return false;
    }

    const SharedBytes& bytes = *data();
    if (!bytes.empty()) {
        if (*index == 0) {
            *out = bytes;
            return true;
        }
        *index -= 1;
    }
    if ((bytes.size() & 1U) != 0) {
        if (*index == 0) {
            *out = SharedBytes::from_static(kPadByte);
            return true;
        }
        *index -= 1;
    }
    return false;
}

}  // namespace metasplice
