#pragma once

#include "metasplice/image_status.h"
#include "metasplice/shared_bytes.h"

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

/**
 * \file fragment_encoder.h
 * \brief Lazy, mostly zero-copy serialization of parsed containers.
 *
 * A container is written as a sequence of fragments: small synthesized
 * headers interleaved with slices of the original payloads. Streaming the
 * fragments avoids building one large contiguous copy of the file.
 */

namespace metasplice {

/**
 * \brief Produces the Nth output fragment of an encoded unit.
 *
 * Implementations route small indices to their own framing and hand the rest
 * to their children in order. When \p index is past the last fragment of this
 * source, the number of fragments this source owns is subtracted from
 * \p *index before returning false, so a parent can pass the same rebased
 * index to the next child and a single increasing index walks the whole tree.
 */
class FragmentSource {
public:
    virtual ~FragmentSource() = default;

    /// Stores fragment \p *index into \p out and returns true, or rebases
    /// \p *index and returns false. Never produces empty fragments.
    virtual bool encode_at(uint64_t* index, SharedBytes* out) const = 0;

    /// Total number of bytes the fragments add up to.
    virtual uint64_t encoded_size() const noexcept = 0;
};

/// Pulls fragments from a \ref FragmentSource one at a time.
class FragmentSequence final {
public:
    explicit FragmentSequence(const FragmentSource& source) noexcept;

    /// Returns false once the source is exhausted.
    bool next(SharedBytes* out);

    /// Index of the next fragment to be produced.
    uint64_t position() const noexcept { return pos_; }

private:
    const FragmentSource* source_ = nullptr;
    uint64_t pos_                 = 0;
};

/// Destination for \ref write_fragments.
class ByteSink {
public:
    virtual ~ByteSink() = default;
    /// Writes all of \p bytes; returns false on failure.
    virtual bool write(std::span<const std::byte> bytes) = 0;
};

/// Appends to a caller-owned vector.
class VectorSink final : public ByteSink {
public:
    explicit VectorSink(std::vector<std::byte>* out) noexcept;
    bool write(std::span<const std::byte> bytes) override;

private:
    std::vector<std::byte>* out_ = nullptr;
};

/// Copies every fragment into a single buffer.
///
/// Prefer \ref write_fragments when the bytes go to a file or socket.
SharedBytes
encode_to_bytes(const FragmentSource& source);

/**
 * \brief Streams every fragment of \p source into \p sink.
 *
 * \param written Optional; receives the number of bytes accepted by the sink.
 * \return \ref ImageStatus::Ok, or \ref ImageStatus::Io when the sink fails.
 */
ImageStatus
write_fragments(const FragmentSource& source, ByteSink& sink,
                uint64_t* written = nullptr);

/**
 * \brief Adapts a \ref FragmentSource to a read-into-buffer interface.
 *
 * Fragments larger than the caller's buffer are handed out in pieces.
 */
class FragmentReader final {
public:
    explicit FragmentReader(const FragmentSource& source) noexcept;

    /// Copies up to \p out.size() bytes; returns 0 at the end of the stream.
    size_t read(std::span<std::byte> out);

private:
    FragmentSequence sequence_;
    SharedBytes pending_;
};

}  // namespace metasplice
