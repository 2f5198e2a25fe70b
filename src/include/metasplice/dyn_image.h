#pragma once

#include "metasplice/fragment_encoder.h"
#include "metasplice/image_options.h"
#include "metasplice/image_status.h"
#include "metasplice/jpeg.h"
#include "metasplice/png.h"
#include "metasplice/shared_bytes.h"
#include "metasplice/webp.h"

#include <cstdint>
#include <span>
#include <variant>

/**
 * \file dyn_image.h
 * \brief Format sniffing and a single handle over any supported container.
 */

namespace metasplice {

/// Container formats recognized by \ref detect_format.
enum class ContainerFormat : uint8_t {
    Unknown,
    Jpeg,
    Png,
    Webp,
};

/// Sniffs the leading bytes: JPEG SOI, PNG signature, then `RIFF....WEBP`.
ContainerFormat
detect_format(std::span<const std::byte> bytes) noexcept;

/// Short lowercase name for listings ("jpeg", "png", "webp", "unknown").
const char*
format_name(ContainerFormat format) noexcept;

/**
 * \brief One of \ref Jpeg, \ref Png or \ref WebP, or nothing.
 *
 * An empty handle (unrecognized input) reports \ref ContainerFormat::Unknown,
 * encodes to zero bytes and has no metadata. Edits on it return
 * \ref ImageStatus::Unsupported.
 */
class DynImage final : public FragmentSource {
public:
    using Variant = std::variant<std::monostate, Jpeg, Png, WebP>;

    DynImage() = default;
    explicit DynImage(Jpeg image);
    explicit DynImage(Png image);
    explicit DynImage(WebP image);

    /// Dispatches on \ref detect_format. Unrecognized input is \ref ImageStatus::Ok
    /// with an empty handle.
    static ImageStatus parse(const SharedBytes& bytes, DynImage* out,
                             const ReadLimits& limits = ReadLimits());

    ContainerFormat format() const noexcept;
    bool empty() const noexcept { return format() == ContainerFormat::Unknown; }

    const Variant& image() const noexcept { return image_; }
    Variant& image_mut() noexcept { return image_; }

    const Jpeg* jpeg() const noexcept { return std::get_if<Jpeg>(&image_); }
    const Png* png() const noexcept { return std::get_if<Png>(&image_); }
    const WebP* webp() const noexcept { return std::get_if<WebP>(&image_); }

    bool icc_profile(SharedBytes* out) const;
    ImageStatus set_icc_profile(const SharedBytes& profile,
                                const EditOptions& options = EditOptions());
    ImageStatus remove_icc_profile();

    bool exif(SharedBytes* out) const;
    ImageStatus set_exif(const SharedBytes& exif,
                         const EditOptions& options = EditOptions());
    ImageStatus remove_exif();

    bool encode_at(uint64_t* index, SharedBytes* out) const override;
    uint64_t encoded_size() const noexcept override;

private:
    Variant image_;
    ReadLimits limits_;
};

}  // namespace metasplice
