#pragma once

#include "metasplice/byte_cursor.h"
#include "metasplice/fragment_encoder.h"
#include "metasplice/image_options.h"
#include "metasplice/image_status.h"
#include "metasplice/riff.h"
#include "metasplice/shared_bytes.h"

#include <cstdint>
#include <span>
#include <vector>

/**
 * \file webp.h
 * \brief WebP view over a RIFF tree, with ICC/EXIF editing.
 *
 * Adding or removing metadata keeps the `VP8X` extended header consistent:
 * it is synthesized when metadata appears on a simple image and removed when
 * nothing requires it any more.
 */

namespace metasplice {

inline constexpr uint32_t kWebpKind = fourcc('W', 'E', 'B', 'P');
inline constexpr uint32_t kWebpVp8  = fourcc('V', 'P', '8', ' ');
inline constexpr uint32_t kWebpVp8l = fourcc('V', 'P', '8', 'L');
inline constexpr uint32_t kWebpVp8x = fourcc('V', 'P', '8', 'X');
inline constexpr uint32_t kWebpIccp = fourcc('I', 'C', 'C', 'P');
inline constexpr uint32_t kWebpExif = fourcc('E', 'X', 'I', 'F');
inline constexpr uint32_t kWebpXmp  = fourcc('X', 'M', 'P', ' ');
inline constexpr uint32_t kWebpAnim = fourcc('A', 'N', 'I', 'M');
inline constexpr uint32_t kWebpAlph = fourcc('A', 'L', 'P', 'H');

/// `VP8X` flag bits.
inline constexpr uint8_t kWebpFlagIcc       = 0x20;
inline constexpr uint8_t kWebpFlagAlpha     = 0x10;
inline constexpr uint8_t kWebpFlagExif      = 0x08;
inline constexpr uint8_t kWebpFlagXmp       = 0x04;
inline constexpr uint8_t kWebpFlagAnimation = 0x02;

/// Size of the `VP8X` payload: flags, 3 reserved bytes, two 24-bit sizes.
inline constexpr size_t kWebpVp8xSize = 10;

enum class WebpKind : uint8_t {
    /// `VP8 ` bitstream only.
    Lossy,
    /// `VP8L` bitstream only.
    Lossless,
    /// `VP8X` header present.
    Extended,
};

struct WebpDimensions final {
    uint32_t width  = 0;
    uint32_t height = 0;
};

/// Canvas size from a `VP8X` payload.
bool
webp_vp8x_dimensions(std::span<const std::byte> vp8x,
                     WebpDimensions* out) noexcept;
/// Frame size from a `VP8 ` keyframe header.
bool
webp_vp8_dimensions(std::span<const std::byte> vp8,
                    WebpDimensions* out) noexcept;
/// Image size and alpha hint from a `VP8L` header.
bool
webp_vp8l_dimensions(std::span<const std::byte> vp8l, WebpDimensions* out,
                     bool* has_alpha = nullptr) noexcept;

class WebP final : public FragmentSource {
public:
    WebP() = default;

    /// Accepts only a `RIFF` chunk with kind `WEBP`.
    static ImageStatus from_riff(RiffChunk riff, WebP* out);
    static ImageStatus parse(const SharedBytes& bytes, WebP* out,
                             const ReadLimits& limits = ReadLimits());

    const RiffChunk& riff() const noexcept { return riff_; }

    const std::vector<RiffChunk>& chunks() const noexcept;
    /// Direct access for custom edits; the VP8X flags are not reconciled and
    /// \ref RiffChunk::length_fits must hold for \ref riff afterwards.
    std::vector<RiffChunk>& chunks_mut() noexcept;

    bool has_chunk(uint32_t id) const noexcept;
    const RiffChunk* chunk_by_id(uint32_t id) const noexcept;
    std::vector<const RiffChunk*> chunks_by_id(uint32_t id) const;
    void remove_chunks_by_id(uint32_t id);

    WebpKind kind() const noexcept;
    /// Canvas size from `VP8X`, else `VP8 `, else `VP8L`.
    bool dimensions(WebpDimensions* out) const noexcept;
    /// Flags byte of the `VP8X` header.
    bool extended_flags(uint8_t* out) const noexcept;

    bool icc_profile(SharedBytes* out) const;
    /// \return \ref ImageStatus::Unsupported (image unchanged) when a `VP8X`
    /// header must be synthesized but the canvas size cannot be decoded.
    ImageStatus set_icc_profile(const SharedBytes& profile,
                                const EditOptions& options = EditOptions());
    /// Can only fail on an input that carried metadata without `VP8X` and
    /// whose canvas size is unknown; the chunk is removed regardless.
    ImageStatus remove_icc_profile();

    /// EXIF blob with any `"Exif\0\0"` prefix stripped.
    bool exif(SharedBytes* out) const;
    ImageStatus set_exif(const SharedBytes& exif,
                         const EditOptions& options = EditOptions());
    ImageStatus remove_exif();

    bool encode_at(uint64_t* index, SharedBytes* out) const override;
    uint64_t encoded_size() const noexcept override;

private:
    bool needs_extended_header() const noexcept;
    bool can_add_extended_header() const noexcept;
    ImageStatus reconcile_extended_header();
    uint8_t computed_flags() const noexcept;

    RiffChunk riff_ { kRiffId, RiffList { kWebpKind, {} } };
};

}  // namespace metasplice
