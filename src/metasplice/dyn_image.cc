#include "metasplice/dyn_image.h"

#include <cstring>
#include <utility>

namespace metasplice {
namespace {

    static constexpr std::byte kPngSignature[] = {
        std::byte { 0x89 }, std::byte { 0x50 }, std::byte { 0x4E },
        std::byte { 0x47 }, std::byte { 0x0D }, std::byte { 0x0A },
        std::byte { 0x1A }, std::byte { 0x0A },
    };

    static bool match(std::span<const std::byte> bytes, size_t offset,
                      const char* s, size_t s_len) noexcept
    {
        if (offset + s_len > bytes.size()) {
            return false;
        }
        return std::memcmp(bytes.data() + offset, s, s_len) == 0;
    }

}  // namespace

ContainerFormat
detect_format(std::span<const std::byte> bytes) noexcept
{
    if (bytes.size() >= 2 && bytes[0] == std::byte { 0xFF }
        && bytes[1] == std::byte { 0xD8 }) {
        return ContainerFormat::Jpeg;
    }
    if (bytes.size() >= sizeof(kPngSignature)
        && std::memcmp(bytes.data(), kPngSignature, sizeof(kPngSignature))
               == 0) {
        return ContainerFormat::Png;
    }
    if (bytes.size() >= 12 && match(bytes, 0, "RIFF", 4)
        && match(bytes, 8, "WEBP", 4)) {
        return ContainerFormat::Webp;
    }
    return ContainerFormat::Unknown;
}


const char*
format_name(ContainerFormat format) noexcept
{
    switch (format) {
    case ContainerFormat::Unknown: return "unknown";
    case ContainerFormat::Jpeg: return "jpeg";
    case ContainerFormat::Png: return "png";
    case ContainerFormat::Webp: return "webp";
    }
    return "unknown";
}


DynImage::DynImage(Jpeg image)
    : image_(std::move(image))
{
}


DynImage::DynImage(Png image)
    : image_(std::move(image))
{
}


DynImage::DynImage(WebP image)
    : image_(std::move(image))
{
}


ImageStatus
DynImage::parse(const SharedBytes& bytes, DynImage* out,
                const ReadLimits& limits)
{
    ImageStatus status = ImageStatus::Ok;
    switch (detect_format(bytes.span())) {
    case ContainerFormat::Jpeg: {
        Jpeg image;
        status = Jpeg::parse(bytes, &image);
        if (status == ImageStatus::Ok) {
            *out = DynImage(std::move(image));
        }
        break;
    }
    case ContainerFormat::Png: {
        Png image;
        status = Png::parse(bytes, &image);
        if (status == ImageStatus::Ok) {
            *out = DynImage(std::move(image));
        }
        break;
    }
    case ContainerFormat::Webp: {
        WebP image;
        status = WebP::parse(bytes, &image, limits);
        if (status == ImageStatus::Ok) {
            *out = DynImage(std::move(image));
        }
        break;
    }
    case ContainerFormat::Unknown: *out = DynImage(); break;
    }
    if (status == ImageStatus::Ok) {
        out->limits_ = limits;
    }
    return status;
}


ContainerFormat
DynImage::format() const noexcept
{
    switch (image_.index()) {
    case 1: return ContainerFormat::Jpeg;
    case 2: return ContainerFormat::Png;
    case 3: return ContainerFormat::Webp;
    default: return ContainerFormat::Unknown;
    }
}


bool
DynImage::icc_profile(SharedBytes* out) const
{
    if (const Jpeg* j = jpeg()) {
        return j->icc_profile(out);
    }
    if (const Png* p = png()) {
        return p->icc_profile(out, limits_);
    }
    if (const WebP* w = webp()) {
        return w->icc_profile(out);
    }
    return false;
}


ImageStatus
DynImage::set_icc_profile(const SharedBytes& profile,
                          const EditOptions& options)
{
    if (Jpeg* j = std::get_if<Jpeg>(&image_)) {
        return j->set_icc_profile(profile, options);
    }
    if (Png* p = std::get_if<Png>(&image_)) {
        return p->set_icc_profile(profile, options);
    }
    if (WebP* w = std::get_if<WebP>(&image_)) {
        return w->set_icc_profile(profile, options);
    }
    return ImageStatus::Unsupported;
}


ImageStatus
DynImage::remove_icc_profile()
{
    if (Jpeg* j = std::get_if<Jpeg>(&image_)) {
        j->remove_icc_profile();
        return ImageStatus::Ok;
    }
    if (Png* p = std::get_if<Png>(&image_)) {
        p->remove_icc_profile();
        return ImageStatus::Ok;
    }
    if (WebP* w = std::get_if<WebP>(&image_)) {
        return w->remove_icc_profile();
    }
    return ImageStatus::Ok;
}


bool
DynImage::exif(SharedBytes* out) const
{
    if (const Jpeg* j = jpeg()) {
        return j->exif(out);
    }
    if (const Png* p = png()) {
        return p->exif(out);
    }
    if (const WebP* w = webp()) {
        return w->exif(out);
    }
    return false;
}


ImageStatus
DynImage::set_exif(const SharedBytes& exif, const EditOptions& options)
{
    if (Jpeg* j = std::get_if<Jpeg>(&image_)) {
        return j->set_exif(exif, options);
    }
    if (Png* p = std::get_if<Png>(&image_)) {
        return p->set_exif(exif, options);
    }
    if (WebP* w = std::get_if<WebP>(&image_)) {
        return w->set_exif(exif, options);
    }
    return ImageStatus::Unsupported;
}


ImageStatus
DynImage::remove_exif()
{
    if (Jpeg* j = std::get_if<Jpeg>(&image_)) {
        j->remove_exif();
        return ImageStatus::Ok;
    }
    if (Png* p = std::get_if<Png>(&image_)) {
        p->remove_exif();
        return ImageStatus::Ok;
    }
    if (WebP* w = std::get_if<WebP>(&image_)) {
        return w->remove_exif();
    }
    return ImageStatus::Ok;
}


uint64_t
DynImage::encoded_size() const noexcept
{
    if (const Jpeg* j = jpeg()) {
        return j->encoded_size();
    }
    if (const Png* p = png()) {
        return p->encoded_size();
    }
    if (const WebP* w = webp()) {
        return w->encoded_size();
    }
    return 0;
}


bool
DynImage::encode_at(uint64_t* index, SharedBytes* out) const
{
    if (const Jpeg* j = jpeg()) {
        return j->encode_at(index, out);
    }
    if (const Png* p = png()) {
        return p->encode_at(index, out);
    }
    if (const WebP* w = webp()) {
        return w->encode_at(index, out);
    }
    return false;
}

}  // namespace metasplice
