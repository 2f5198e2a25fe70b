#include "metasplice/file_bytes.h"

#include <cstddef>
#include <filesystem>
#include <limits>
#include <memory>
#include <system_error>
#include <utility>

#if defined(_WIN32)
#    define WIN32_LEAN_AND_MEAN
#    include <windows.h>
#else
#    include <fcntl.h>
#    include <sys/mman.h>
#    include <sys/stat.h>
#    include <unistd.h>
#endif

namespace metasplice {
namespace {

    // Owns one read-only view; released when the last SharedBytes goes away.
    struct Mapping final {
        Mapping() noexcept = default;
        Mapping(const Mapping&)            = delete;
        Mapping& operator=(const Mapping&) = delete;

        ~Mapping() noexcept
        {
#if defined(_WIN32)
            if (data) {
                ::UnmapViewOfFile(
                    const_cast<void*>(static_cast<const void*>(data)));
            }
            if (map_handle) {
                ::CloseHandle(static_cast<HANDLE>(map_handle));
            }
            if (file_handle) {
                ::CloseHandle(static_cast<HANDLE>(file_handle));
            }
#else
            if (data && size != 0U) {
                (void)::munmap(const_cast<void*>(static_cast<const void*>(data)),
                               size);
            }
            if (fd >= 0) {
                (void)::close(fd);
            }
#endif
        }

#if defined(_WIN32)
        void* file_handle = nullptr;
        void* map_handle  = nullptr;
#else
        int fd = -1;
#endif
        const std::byte* data = nullptr;
        size_t size           = 0;
    };


    static ImageStatus check_size(uint64_t size_u64,
                                  uint64_t max_file_bytes) noexcept
    {
        if (max_file_bytes != 0U && size_u64 > max_file_bytes) {
            return ImageStatus::LimitExceeded;
        }
        if (size_u64
            > static_cast<uint64_t>(std::numeric_limits<size_t>::max())) {
            return ImageStatus::LimitExceeded;
        }
        return ImageStatus::Ok;
    }


#if defined(_WIN32)
    static ImageStatus open_mapping(const char* path, uint64_t max_file_bytes,
                                    Mapping* m) noexcept
    {
        HANDLE h = ::CreateFileA(path, GENERIC_READ, FILE_SHARE_READ, nullptr,
                                 OPEN_EXISTING, FILE_ATTRIBUTE_NORMAL, nullptr);
        if (h == INVALID_HANDLE_VALUE) {
            return ImageStatus::Io;
        }
        m->file_handle = static_cast<void*>(h);

        LARGE_INTEGER sz;
        if (!::GetFileSizeEx(h, &sz) || sz.QuadPart < 0) {
            return ImageStatus::Io;
        }
        const uint64_t size_u64  = static_cast<uint64_t>(sz.QuadPart);
        const ImageStatus status = check_size(size_u64, max_file_bytes);
        if (status != ImageStatus::Ok || size_u64 == 0U) {
            return status;
        }

        HANDLE map = ::CreateFileMappingA(h, nullptr, PAGE_READONLY, 0, 0,
                                          nullptr);
        if (!map) {
            return ImageStatus::Io;
        }
        m->map_handle = static_cast<void*>(map);
        void* p       = ::MapViewOfFile(map, FILE_MAP_READ, 0, 0, 0);
        if (!p) {
            return ImageStatus::Io;
        }
        m->data = static_cast<const std::byte*>(p);
        m->size = static_cast<size_t>(size_u64);
        return ImageStatus::Ok;
    }
#else
    static ImageStatus open_mapping(const char* path, uint64_t max_file_bytes,
                                    Mapping* m) noexcept
    {
        m->fd = ::open(path, O_RDONLY);
        if (m->fd < 0) {
            return ImageStatus::Io;
        }

        struct stat st {};
        if (::fstat(m->fd, &st) != 0 || st.st_size < 0) {
            return ImageStatus::Io;
        }
        const uint64_t size_u64  = static_cast<uint64_t>(st.st_size);
        const ImageStatus status = check_size(size_u64, max_file_bytes);
        if (status != ImageStatus::Ok || size_u64 == 0U) {
            return status;
        }

        void* p = ::mmap(nullptr, static_cast<size_t>(size_u64), PROT_READ,
                         MAP_PRIVATE, m->fd, 0);
        if (p == MAP_FAILED) {
            return ImageStatus::Io;
        }
        m->data = static_cast<const std::byte*>(p);
        m->size = static_cast<size_t>(size_u64);
        return ImageStatus::Ok;
    }
#endif

}  // namespace

ImageStatus
map_file(const char* path, uint64_t max_file_bytes, SharedBytes* out)
{
    if (!path || !*path) {
        return ImageStatus::Io;
    }

    auto mapping             = std::make_shared<Mapping>();
    const ImageStatus status = open_mapping(path, max_file_bytes,
                                            mapping.get());
    if (status != ImageStatus::Ok) {
        return status;
    }
    if (mapping->size == 0U) {
        *out = SharedBytes();
        return ImageStatus::Ok;
    }

    const std::span<const std::byte> view(mapping->data, mapping->size);
    *out = SharedBytes(std::shared_ptr<const void>(std::move(mapping)), view);
    return ImageStatus::Ok;
}


bool
same_file(const char* a, const char* b)
{
    if (!a || !b || !*a || !*b) {
        return false;
    }
    std::error_code ec;
    const bool same = std::filesystem::equivalent(a, b, ec);
    return !ec && same;
}


FileSink::FileSink(std::FILE* file) noexcept
    : file_(file)
{
}


bool
FileSink::write(std::span<const std::byte> bytes)
{
    if (bytes.empty()) {
        return true;
    }
    return std::fwrite(bytes.data(), 1, bytes.size(), file_) == bytes.size();
}


ImageStatus
write_file(const char* path, const FragmentSource& source)
{
    std::FILE* file = std::fopen(path, "wb");
    if (!file) {
        return ImageStatus::Io;
    }
    FileSink sink(file);
    ImageStatus status = write_fragments(source, sink);
    if (std::fclose(file) != 0 && status == ImageStatus::Ok) {
        status = ImageStatus::Io;
    }
    return status;
}

}  // namespace metasplice
