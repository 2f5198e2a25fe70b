#pragma once

#include "metasplice/byte_cursor.h"
#include "metasplice/fragment_encoder.h"
#include "metasplice/image_options.h"
#include "metasplice/image_status.h"
#include "metasplice/shared_bytes.h"

#include <cstddef>
#include <cstdint>
#include <vector>

/**
 * \file png.h
 * \brief PNG chunk model, parser, encoder and iCCP/eXIf codecs.
 */

namespace metasplice {

inline constexpr uint32_t kPngIccp = fourcc('i', 'C', 'C', 'P');
inline constexpr uint32_t kPngExif = fourcc('e', 'X', 'I', 'f');
inline constexpr uint32_t kPngIhdr = fourcc('I', 'H', 'D', 'R');
inline constexpr uint32_t kPngIend = fourcc('I', 'E', 'N', 'D');

/// CRC-32 (zlib polynomial) over \p kind followed by \p contents.
uint32_t
png_chunk_crc(uint32_t kind, std::span<const std::byte> contents) noexcept;

/// One length-prefixed, CRC-protected chunk.
class PngChunk final : public FragmentSource {
public:
    PngChunk() noexcept = default;
    /// Builds a chunk and computes its CRC.
    PngChunk(uint32_t kind, SharedBytes contents) noexcept;

    uint32_t kind() const noexcept { return kind_; }
    const SharedBytes& contents() const noexcept { return contents_; }
    uint32_t crc() const noexcept { return crc_; }
    /// False when \ref contents exceed the 2^31-1 byte PNG length limit.
    bool length_fits() const noexcept;

    bool encode_at(uint64_t* index, SharedBytes* out) const override;
    uint64_t encoded_size() const noexcept override;

private:
    uint32_t kind_ = 0;
    SharedBytes contents_;
    uint32_t crc_ = 0;
};

/// A parsed PNG stream: the 8-byte signature followed by \ref chunks.
class Png final : public FragmentSource {
public:
    Png() = default;

    /// Parses chunks until the input is exhausted, verifying every CRC.
    static ImageStatus parse(const SharedBytes& bytes, Png* out);

    const std::vector<PngChunk>& chunks() const noexcept { return chunks_; }
    /// Direct access for custom edits. Chunks added here must satisfy
    /// \ref PngChunk::length_fits; check with \ref lengths_fit.
    std::vector<PngChunk>& chunks_mut() noexcept { return chunks_; }
    bool lengths_fit() const noexcept;

    const PngChunk* chunk_by_kind(uint32_t kind) const noexcept;
    std::vector<const PngChunk*> chunks_by_kind(uint32_t kind) const;
    void remove_chunks_by_kind(uint32_t kind);

    /**
     * \brief Inflates the profile stored in the first `iCCP` chunk.
     *
     * Returns false when there is no `iCCP` chunk, the profile name is not
     * terminated, the compression method is not 0, the stream is invalid, or
     * the inflated size exceeds \p limits.max_icc_bytes.
     */
    bool icc_profile(SharedBytes* out,
                     const ReadLimits& limits = ReadLimits()) const;
    /// \return \ref ImageStatus::Unsupported for an invalid profile name or
    /// when deflate fails. The image is left unchanged in that case.
    ImageStatus set_icc_profile(const SharedBytes& profile,
                                const EditOptions& options = EditOptions());
    void remove_icc_profile();

    bool exif(SharedBytes* out) const;
    ImageStatus set_exif(const SharedBytes& exif,
                         const EditOptions& options = EditOptions());
    void remove_exif();

    bool encode_at(uint64_t* index, SharedBytes* out) const override;
    uint64_t encoded_size() const noexcept override;

private:
    std::vector<PngChunk> chunks_;
};

}  // namespace metasplice
