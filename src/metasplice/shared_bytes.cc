#include "metasplice/shared_bytes.h"

#include <cstring>
#include <utility>

namespace metasplice {

SharedBytes::SharedBytes(std::shared_ptr<const void> owner,
                         std::span<const std::byte> view) noexcept
    : owner_(std::move(owner))
    , data_(view.data())
    , size_(view.size())
{
}


SharedBytes
SharedBytes::copy_of(std::span<const std::byte> bytes)
{
    return from_vector(std::vector<std::byte>(bytes.begin(), bytes.end()));
}


SharedBytes
SharedBytes::from_string(std::string_view text)
{
    return copy_of(as_bytes(text));
}


SharedBytes
SharedBytes::from_vector(std::vector<std::byte> bytes)
{
    if (bytes.empty()) {
        return SharedBytes();
    }
    auto storage = std::make_shared<const std::vector<std::byte>>(
        std::move(bytes));
    const std::span<const std::byte> view(storage->data(), storage->size());
    return SharedBytes(std::move(storage), view);
}


SharedBytes
SharedBytes::from_static(std::span<const std::byte> bytes) noexcept
{
    return SharedBytes(nullptr, bytes);
}


std::span<const std::byte>
SharedBytes::span() const noexcept
{
    return std::span<const std::byte>(data_, size_);
}


SharedBytes
SharedBytes::slice(size_t offset, size_t size) const noexcept
{
    if (offset >= size_) {
        return SharedBytes();
    }
    const size_t room = size_ - offset;
    SharedBytes out;
    out.owner_ = owner_;
    out.data_  = data_ + offset;
    out.size_  = (size < room) ? size : room;
    return out;
}


SharedBytes
SharedBytes::slice_from(size_t offset) const noexcept
{
    if (offset >= size_) {
        return SharedBytes();
    }
    return slice(offset, size_ - offset);
}


bool
SharedBytes::starts_with(std::span<const std::byte> prefix) const noexcept
{
    if (prefix.size() > size_) {
        return false;
    }
    if (prefix.empty()) {
        return true;
    }
    return std::memcmp(data_, prefix.data(), prefix.size()) == 0;
}


bool
SharedBytes::starts_with(std::string_view prefix) const noexcept
{
    return starts_with(as_bytes(prefix));
}


bool
operator==(const SharedBytes& a, const SharedBytes& b) noexcept
{
    if (a.size() != b.size()) {
        return false;
    }
    if (a.size() == 0 || a.data() == b.data()) {
        return true;
    }
    return std::memcmp(a.data(), b.data(), a.size()) == 0;
}

}  // namespace metasplice
