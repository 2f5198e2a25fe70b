#pragma once

#include "metasplice/fragment_encoder.h"
#include "metasplice/image_options.h"
#include "metasplice/image_status.h"
#include "metasplice/shared_bytes.h"

#include <cstddef>
#include <cstdint>
#include <vector>

/**
 * \file jpeg.h
 * \brief JPEG marker segment model, parser, encoder and ICC/EXIF codecs.
 */

namespace metasplice {

/// `"ICC_PROFILE\0"` + seqno + count.
inline constexpr size_t kJpegIccHeaderSize = 14;
/// Largest ICC slice per APP2 segment: 65535 - length field (2) - ICC header (14).
inline constexpr size_t kJpegIccMaxChunkSize = 65535 - 16;
/// Largest EXIF blob that fits one APP1 segment after the 6-byte prefix.
inline constexpr size_t kJpegExifMaxSize = 65535 - 2 - 6;
/// Largest contents of a length-bearing segment.
inline constexpr size_t kJpegMaxContentsSize = 65535 - 2;

/**
 * \brief One marker segment.
 *
 * \ref contents excludes the marker and the 16-bit length field. Only the
 * scan (SOS) segment carries \ref entropy: the raw bytes following its header
 * through the end of the input, which includes byte stuffing, in-scan
 * markers, the terminal EOI and any trailing bytes.
 *
 * Segments whose \ref length_fits is false encode with a wrapped length.
 */
class JpegSegment final : public FragmentSource {
public:
    JpegSegment() noexcept = default;
    explicit JpegSegment(uint8_t marker) noexcept;
    JpegSegment(uint8_t marker, SharedBytes contents) noexcept;
    JpegSegment(uint8_t marker, SharedBytes contents,
                SharedBytes entropy) noexcept;

    uint8_t marker() const noexcept { return marker_; }
    const SharedBytes& contents() const noexcept { return contents_; }
    const SharedBytes& entropy() const noexcept { return entropy_; }
    bool has_entropy() const noexcept { return !entropy_.empty(); }

    /// Encoded size without the entropy tail.
    uint64_t header_and_contents_size() const noexcept;

    /// False when \ref contents cannot be framed by this marker: more than
    /// \ref kJpegMaxContentsSize bytes, or any bytes on an unlengthed marker.
    bool length_fits() const noexcept;

    bool encode_at(uint64_t* index, SharedBytes* out) const override;
    uint64_t encoded_size() const noexcept override;

private:
    uint8_t marker_ = 0;
    SharedBytes contents_;
    SharedBytes entropy_;
};

/// A parsed JPEG stream: implicit SOI followed by \ref segments.
class Jpeg final : public FragmentSource {
public:
    Jpeg() = default;

    /**
     * \brief Parses \p bytes.
     *
     * Segments are zero-copy slices of \p bytes. Parsing stops after the scan
     * segment or at EOI.
     */
    static ImageStatus parse(const SharedBytes& bytes, Jpeg* out);

    const std::vector<JpegSegment>& segments() const noexcept
    {
        return segments_;
    }
    /// Direct access for custom edits. Every segment added here must satisfy
    /// \ref JpegSegment::length_fits; check with \ref lengths_fit.
    std::vector<JpegSegment>& segments_mut() noexcept { return segments_; }
    /// True when every segment can be framed.
    bool lengths_fit() const noexcept;

    /// First segment with \p marker, or nullptr.
    const JpegSegment* segment_by_marker(uint8_t marker) const noexcept;
    std::vector<const JpegSegment*> segments_by_marker(uint8_t marker) const;
    void remove_segments_by_marker(uint8_t marker);

    /**
     * \brief Reassembles the embedded ICC profile from its APP2 parts.
     *
     * Returns false if there are no parts or the parts are inconsistent
     * (sequence number outside 1..count, differing counts, duplicates, or a
     * part count different from the declared count).
     */
    bool icc_profile(SharedBytes* out) const;
    /// Replaces every ICC part. Returns \ref ImageStatus::LimitExceeded
    /// (image untouched) if the profile needs more than 255 segments.
    ImageStatus set_icc_profile(const SharedBytes& profile,
                                const EditOptions& options = EditOptions());
    void remove_icc_profile();

    /// EXIF blob without the `"Exif\0\0"` prefix.
    bool exif(SharedBytes* out) const;
    ImageStatus set_exif(const SharedBytes& exif,
                         const EditOptions& options = EditOptions());
    void remove_exif();

    bool encode_at(uint64_t* index, SharedBytes* out) const override;
    uint64_t encoded_size() const noexcept override;

private:
    bool has_scan() const noexcept;
    size_t metadata_index(const EditOptions& options) const noexcept;

    std::vector<JpegSegment> segments_;
};

}  // namespace metasplice
