#pragma once

#include "metasplice/fragment_encoder.h"
#include "metasplice/image_status.h"
#include "metasplice/shared_bytes.h"

#include <cstdint>
#include <cstdio>
#include <span>

/**
 * \file file_bytes.h
 * \brief Read-only file mapping into \ref SharedBytes, and file output.
 */

namespace metasplice {

/**
 * \brief Maps \p path read-only and wraps the mapping in \p out.
 *
 * The mapping stays alive until the last slice referencing it is destroyed.
 * \param max_file_bytes Hard cap on the file size (0 = unlimited).
 * \return \ref ImageStatus::Io when the file cannot be opened, stat'ed or
 * mapped; \ref ImageStatus::LimitExceeded when it is larger than the cap.
 */
ImageStatus
map_file(const char* path, uint64_t max_file_bytes, SharedBytes* out);

/// Writes to a caller-owned `FILE*`.
class FileSink final : public ByteSink {
public:
    explicit FileSink(std::FILE* file) noexcept;
    bool write(std::span<const std::byte> bytes) override;

private:
    std::FILE* file_ = nullptr;
};

/**
 * \brief True when \p a and \p b name the same existing file.
 *
 * Aliases such as `./x`, symlinks and hard links compare equal. Writing to a
 * path that is the same file as a mapped input truncates the mapping.
 */
bool
same_file(const char* a, const char* b);

/// Streams \p source into a newly created \p path (truncating).
ImageStatus
write_file(const char* path, const FragmentSource& source);

}  // namespace metasplice
