#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string_view>
#include <vector>

/**
 * \file shared_bytes.h
 * \brief Reference-counted, immutable, sliceable byte view.
 */

namespace metasplice {

/**
 * \brief An immutable view into a shared backing buffer.
 *
 * Copies and slices share the same owner, so splitting a file into segments
 * or chunks never copies payload bytes. The owner may be a heap vector, a
 * read-only file mapping (see \ref map_file) or nothing at all for static
 * storage.
 *
 * \note The bytes are never mutated through a \ref SharedBytes. Edits build a
 * new buffer and wrap it.
 */
class SharedBytes final {
public:
    SharedBytes() noexcept = default;

    /// Wraps \p view, keeping \p owner alive for as long as any slice exists.
    SharedBytes(std::shared_ptr<const void> owner,
                std::span<const std::byte> view) noexcept;

    /// Copies \p bytes into a new heap buffer.
    static SharedBytes copy_of(std::span<const std::byte> bytes);
    /// Copies the characters of \p text (no terminator).
    static SharedBytes from_string(std::string_view text);
    /// Takes ownership of \p bytes without copying.
    static SharedBytes from_vector(std::vector<std::byte> bytes);
    /// References storage with static lifetime (no owner).
    static SharedBytes from_static(std::span<const std::byte> bytes) noexcept;

    const std::byte* data() const noexcept { return data_; }
    size_t size() const noexcept { return size_; }
    bool empty() const noexcept { return size_ == 0; }
    std::span<const std::byte> span() const noexcept;

    std::byte operator[](size_t index) const noexcept { return data_[index]; }

    /// Returns up to \p size bytes starting at \p offset. Out of range parts are clamped.
    SharedBytes slice(size_t offset, size_t size) const noexcept;
    /// Returns everything from \p offset to the end (empty if out of range).
    SharedBytes slice_from(size_t offset) const noexcept;

    bool starts_with(std::span<const std::byte> prefix) const noexcept;
    bool starts_with(std::string_view prefix) const noexcept;

    /// Number of distinct owners sharing the backing buffer (0 for static or empty).
    long use_count() const noexcept { return owner_.use_count(); }

private:
    std::shared_ptr<const void> owner_;
    const std::byte* data_ = nullptr;
    size_t size_           = 0;
};

/// Content equality (not identity).
bool
operator==(const SharedBytes& a, const SharedBytes& b) noexcept;

/// Views the characters of \p text as bytes.
inline std::span<const std::byte>
as_bytes(std::string_view text) noexcept
{
    return std::span<const std::byte>(
        reinterpret_cast<const std::byte*>(text.data()), text.size());
}

}  // namespace metasplice
