#include "metasplice/jpeg.h"

#include "metasplice/byte_cursor.h"
#include "metasplice/jpeg_markers.h"

#include <algorithm>
#include <iterator>
#include <string_view>
#include <utility>

namespace metasplice {
namespace {

    static constexpr std::byte kSoiBytes[] = { std::byte { 0xFF },
                                               std::byte { 0xD8 } };
    static constexpr std::byte kEoiBytes[] = { std::byte { 0xFF },
                                               std::byte { 0xD9 } };

    static constexpr std::string_view kIccSignature("ICC_PROFILE\0", 12);
    static constexpr std::string_view kExifSignature("Exif\0\0", 6);

    struct IccPart final {
        uint8_t seq   = 0;
        uint8_t count = 0;
        SharedBytes data;
    };

    static constexpr uint8_t u8(std::byte b) noexcept
    {
        return static_cast<uint8_t>(b);
    }


    static bool is_icc_segment(const JpegSegment& seg) noexcept
    {
        return seg.marker() == jpeg_marker::kApp2
               && seg.contents().size() >= kJpegIccHeaderSize
               && seg.contents().starts_with(kIccSignature);
    }


    static bool is_exif_segment(const JpegSegment& seg) noexcept
    {
        return seg.marker() == jpeg_marker::kApp1
               && seg.contents().starts_with(kExifSignature);
    }


    // Finds the first `FF xx` (xx != 0) in the entropy-coded tail.
    static bool entropy_has_marker(const SharedBytes& tail) noexcept
    {
        for (size_t i = 0; i + 1 < tail.size(); ++i) {
            if (u8(tail[i]) == 0xFF && u8(tail[i + 1]) != 0x00) {
                return true;
            }
        }
        return false;
    }


    static SharedBytes make_icc_part(uint8_t seq, uint8_t count,
                                     std::span<const std::byte> data)
    {
        std::vector<std::byte> buf;
        buf.reserve(kJpegIccHeaderSize + data.size());
        append_bytes(&buf, as_bytes(kIccSignature));
        append_u8(&buf, seq);
        append_u8(&buf, count);
        append_bytes(&buf, data);
        return SharedBytes::from_vector(std::move(buf));
    }

}  // namespace

JpegSegment::JpegSegment(uint8_t marker) noexcept
    : marker_(marker)
{
}


JpegSegment::JpegSegment(uint8_t marker, SharedBytes contents) noexcept
    : marker_(marker)
    , contents_(std::move(contents))
{
}


JpegSegment::JpegSegment(uint8_t marker, SharedBytes contents,
                         SharedBytes entropy) noexcept
    : marker_(marker)
    , contents_(std::move(contents))
    , entropy_(std::move(entropy))
{
}


uint64_t
JpegSegment::header_and_contents_size() const noexcept
{
    uint64_t size = 2;
    if (jpeg_marker_has_length(marker_)) {
        size += 2;
    }
    return size + contents_.size();
}


bool
JpegSegment::length_fits() const noexcept
{
    if (!jpeg_marker_has_length(marker_)) {
        return contents_.empty();
    }
    return contents_.size() <= kJpegMaxContentsSize;
}


uint64_t
JpegSegment::encoded_size() const noexcept
{
    return header_and_contents_size() + entropy_.size();
}


bool
JpegSegment::encode_at(uint64_t* index, SharedBytes* out) const
{
    if (*index == 0) {
        std::vector<std::byte> header;
        header.reserve(4);
        append_u8(&header, jpeg_marker::kPrefix);
        append_u8(&header, marker_);
        if (jpeg_marker_has_length(marker_)) {
            append_u16be(&header,
                         static_cast<uint16_t>(contents_.size() + 2));
        }
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
    if (!entropy_.empty()) {
        if (*index == 0) {
            *out = entropy_;
            return true;
        }
        *index -= 1;
    }
    return false;
}


ImageStatus
Jpeg::parse(const SharedBytes& bytes, Jpeg* out)
{
    ByteCursor cur(bytes);
    uint8_t b0 = 0;
    uint8_t b1 = 0;
    if (!cur.read_u8(&b0) || !cur.read_u8(&b1)) {
        return ImageStatus::Truncated;
    }
    if (b0 != jpeg_marker::kPrefix || b1 != jpeg_marker::kSoi) {
        return ImageStatus::WrongSignature;
    }

    std::vector<JpegSegment> segments;
    for (;;) {
        uint8_t prefix = 0;
        if (!cur.read_u8(&prefix)) {
            return ImageStatus::Truncated;
        }
        if (prefix != jpeg_marker::kPrefix) {
            // Stray bytes between segments are dropped.
            continue;
        }
        uint8_t marker = jpeg_marker::kPrefix;
        while (marker == jpeg_marker::kPrefix) {
            if (!cur.read_u8(&marker)) {
                return ImageStatus::Truncated;
            }
        }

        if (marker == jpeg_marker::kEoi) {
            break;
        }
        if (!jpeg_marker_has_length(marker)) {
            segments.emplace_back(marker);
            continue;
        }

        uint16_t length = 0;
        if (!cur.read_u16be(&length)) {
            return ImageStatus::Truncated;
        }
        if (length < 2) {
            // The length counts its own two bytes.
            return ImageStatus::Truncated;
        }
        SharedBytes contents;
        if (!cur.take(static_cast<size_t>(length - 2), &contents)) {
            return ImageStatus::Truncated;
        }

        if (jpeg_marker_has_entropy(marker)) {
            SharedBytes entropy = cur.rest();
            if (!entropy_has_marker(entropy)) {
                return ImageStatus::Truncated;
            }
            segments.emplace_back(marker, std::move(contents),
                                  std::move(entropy));
            break;
        }
        segments.emplace_back(marker, std::move(contents));
    }

    out->segments_ = std::move(segments);
    return ImageStatus::Ok;
}


const JpegSegment*
Jpeg::segment_by_marker(uint8_t marker) const noexcept
{
    for (const JpegSegment& seg : segments_) {
        if (seg.marker() == marker) {
            return &seg;
        }
    }
    return nullptr;
}


std::vector<const JpegSegment*>
Jpeg::segments_by_marker(uint8_t marker) const
{
    std::vector<const JpegSegment*> out;
    for (const JpegSegment& seg : segments_) {
        if (seg.marker() == marker) {
            out.push_back(&seg);
        }
    }
    return out;
}


void
Jpeg::remove_segments_by_marker(uint8_t marker)
{
    std::erase_if(segments_, [marker](const JpegSegment& seg) {
        return seg.marker() == marker;
    });
}


bool
Jpeg::icc_profile(SharedBytes* out) const
{
    std::vector<IccPart> parts;
    for (const JpegSegment& seg : segments_) {
        if (!is_icc_segment(seg)) {
            continue;
        }
        IccPart part;
        part.seq   = u8(seg.contents()[12]);
        part.count = u8(seg.contents()[13]);
        part.data  = seg.contents().slice_from(kJpegIccHeaderSize);
        parts.push_back(std::move(part));
    }
    if (parts.empty()) {
        return false;
    }

    const uint8_t count = parts.front().count;
    for (const IccPart& part : parts) {
        if (part.count != count || part.seq == 0 || part.seq > count) {
            return false;
        }
    }
    if (parts.size() != count) {
        return false;
    }
    std::sort(parts.begin(), parts.end(),
              [](const IccPart& a, const IccPart& b) { return a.seq < b.seq; });
    for (size_t i = 1; i < parts.size(); ++i) {
        if (parts[i].seq == parts[i - 1].seq) {
            return false;
        }
    }

    if (parts.size() == 1) {
        *out = parts.front().data;
        return true;
    }
    size_t total = 0;
    for (const IccPart& part : parts) {
        total += part.data.size();
    }
    std::vector<std::byte> buf;
    buf.reserve(total);
    for (const IccPart& part : parts) {
        append_bytes(&buf, part.data.span());
    }
    *out = SharedBytes::from_vector(std::move(buf));
    return true;
}


ImageStatus
Jpeg::set_icc_profile(const SharedBytes& profile, const EditOptions& options)
{
    size_t chunk_count = (profile.size() + kJpegIccMaxChunkSize - 1)
                         / kJpegIccMaxChunkSize;
    if (chunk_count == 0) {
        chunk_count = 1;
    }
    if (chunk_count > 255) {
        return ImageStatus::LimitExceeded;
    }

    remove_icc_profile();

    std::vector<JpegSegment> parts;
    parts.reserve(chunk_count);
    for (size_t i = 0; i < chunk_count; ++i) {
        const SharedBytes slice = profile.slice(i * kJpegIccMaxChunkSize,
                                                kJpegIccMaxChunkSize);
        parts.emplace_back(jpeg_marker::kApp2,
                           make_icc_part(static_cast<uint8_t>(i + 1),
                                         static_cast<uint8_t>(chunk_count),
                                         slice.span()));
    }

    const size_t at = metadata_index(options);
    segments_.insert(segments_.begin() + static_cast<std::ptrdiff_t>(at),
                     std::make_move_iterator(parts.begin()),
                     std::make_move_iterator(parts.end()));
    return ImageStatus::Ok;
}


void
Jpeg::remove_icc_profile()
{
    std::erase_if(segments_, is_icc_segment);
}


bool
Jpeg::exif(SharedBytes* out) const
{
    for (const JpegSegment& seg : segments_) {
        if (is_exif_segment(seg)) {
            *out = seg.contents().slice_from(kExifSignature.size());
            return true;
        }
    }
    return false;
}


ImageStatus
Jpeg::set_exif(const SharedBytes& exif, const EditOptions& options)
{
    if (exif.size() > kJpegExifMaxSize) {
        return ImageStatus::LimitExceeded;
    }

    remove_exif();

    std::vector<std::byte> buf;
    buf.reserve(kExifSignature.size() + exif.size());
    append_bytes(&buf, as_bytes(kExifSignature));
    append_bytes(&buf, exif.span());

    const size_t at = metadata_index(options);
    segments_.insert(segments_.begin() + static_cast<std::ptrdiff_t>(at),
                     JpegSegment(jpeg_marker::kApp1,
                                 SharedBytes::from_vector(std::move(buf))));
    return ImageStatus::Ok;
}


void
Jpeg::remove_exif()
{
    std::erase_if(segments_, is_exif_segment);
}


bool
Jpeg::lengths_fit() const noexcept
{
    for (const JpegSegment& seg : segments_) {
        if (!seg.length_fits()) {
            return false;
        }
    }
    return true;
}


bool
Jpeg::has_scan() const noexcept
{
    for (const JpegSegment& seg : segments_) {
        if (seg.has_entropy()) {
            return true;
        }
    }
    return false;
}


size_t
Jpeg::metadata_index(const EditOptions& options) const noexcept
{
    // Never past the scan: everything after it is opaque entropy data.
    size_t limit = segments_.size();
    for (size_t i = 0; i < segments_.size(); ++i) {
        if (segments_[i].has_entropy()) {
            limit = i;
            break;
        }
    }
    return std::min(static_cast<size_t>(options.jpeg_metadata_index), limit);
}


uint64_t
Jpeg::encoded_size() const noexcept
{
    uint64_t size = sizeof(kSoiBytes);
    for (const JpegSegment& seg : segments_) {
        size += seg.encoded_size();
    }
    if (!has_scan()) {
        size += sizeof(kEoiBytes);
    }
    return size;
}


bool
Jpeg::encode_at(uint64_t* index, SharedBytes* out) const
{
    if (*index == 0) {
        *out = SharedBytes::from_static(kSoiBytes);
        return true;
    }
    *index -= 1;

    for (const JpegSegment& seg : segments_) {
        if (seg.encode_at(index, out)) {
            return true;
        }
    }
    if (!has_scan()) {
        if (*index == 0) {
            *out = SharedBytes::from_static(kEoiBytes);
            return true;
        }
        *index -= 1;
    }
    return false;
}

}  // namespace metasplice
