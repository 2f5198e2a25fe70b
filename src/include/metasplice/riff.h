#pragma once

#include "metasplice/byte_cursor.h"
#include "metasplice/fragment_encoder.h"
#include "metasplice/image_options.h"
#include "metasplice/image_status.h"
#include "metasplice/shared_bytes.h"

#include <cstdint>
#include <optional>
#include <variant>
#include <vector>

/**
 * \file riff.h
 * \brief Generic RIFF chunk tree (used by WebP).
 */

namespace metasplice {

inline constexpr uint32_t kRiffId = fourcc('R', 'I', 'F', 'F');
inline constexpr uint32_t kListId = fourcc('L', 'I', 'S', 'T');
inline constexpr uint32_t kSeqtId = fourcc('s', 'e', 'q', 't');

/// True for ids whose content is a list of subchunks (`RIFF`, `LIST`, `seqt`).
bool
riff_id_has_subchunks(uint32_t id) noexcept;
/// True for ids whose subchunk list is preceded by a kind tag (`RIFF`, `LIST`).
bool
riff_id_has_kind(uint32_t id) noexcept;

class RiffChunk;

/// Content of a subchunk-bearing chunk.
struct RiffList final {
    std::optional<uint32_t> kind;
    std::vector<RiffChunk> subchunks;
};

/// Either nested chunks or opaque bytes.
using RiffContent = std::variant<RiffList, SharedBytes>;

/**
 * \brief One RIFF chunk: fourcc id, little-endian length, content, pad byte.
 *
 * On-wire size is `8 + length`, rounded up to even.
 */
class RiffChunk final : public FragmentSource {
public:
    RiffChunk() = default;
    RiffChunk(uint32_t id, RiffContent content);

    /**
     * \brief Parses the outer `RIFF` chunk of \p bytes.
     *
     * Bytes after the outer chunk are ignored.
     * \return \ref ImageStatus::WrongSignature when the id is not `RIFF`,
     * \ref ImageStatus::LimitExceeded when lists nest deeper than
     * \p limits.max_riff_depth.
     */
    static ImageStatus parse(const SharedBytes& bytes, RiffChunk* out,
                             const ReadLimits& limits = ReadLimits());

    uint32_t id() const noexcept { return id_; }
    const RiffContent& content() const noexcept { return content_; }
    /// Chunks placed here must keep \ref length_fits true.
    RiffContent& content_mut() noexcept { return content_; }

    /// Null when the chunk holds opaque data.
    const RiffList* list() const noexcept;
    RiffList* list_mut() noexcept;
    /// Null when the chunk holds subchunks.
    const SharedBytes* data() const noexcept;

    /// Value of the length field.
    uint64_t content_length() const noexcept;
    /// False when this chunk or a descendant needs more than a 32-bit length.
    bool length_fits() const noexcept;

    bool encode_at(uint64_t* index, SharedBytes* out) const override;
    uint64_t encoded_size() const noexcept override;

private:
    uint32_t id_ = 0;
    RiffContent content_;
};

}  // namespace metasplice
