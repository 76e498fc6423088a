#pragma once

#include "copyexif/byte_source.h"
#include "copyexif/exif_orientation.h"
#include "copyexif/jpeg_exif_segment.h"

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

/**
 * \file image_header.h
 * \brief Container sniffing and Exif extraction for a single image stream.
 */

namespace copyexif {

/// Container type detected from the stream's magic bytes.
enum class ImageType : uint8_t {
    Gif,
    Jpeg,
    /// PNG whose colour type may carry transparency (>= 3).
    PngAlpha,
    Png,
    Unknown,
};

inline constexpr uint32_t kPngHeader = 0x89504E47;
/// "GIF" in the top three bytes of the first four.
inline constexpr uint32_t kGifHeader = 0x474946;
/// Offset of the IHDR colour-type byte from the stream start.
inline constexpr uint32_t kPngColorTypeOffset = 25;

/// Returns true when images of \p type may contain transparent pixels.
constexpr bool
image_type_has_alpha(ImageType type) noexcept
{
    switch (type) {
    case ImageType::Gif: return true;
    case ImageType::Jpeg: return false;
    case ImageType::PngAlpha: return true;
    case ImageType::Png: return false;
    case ImageType::Unknown: return false;
    }
    return false;
}

constexpr const char*
image_type_name(ImageType type) noexcept
{
    switch (type) {
    case ImageType::Gif: return "gif";
    case ImageType::Jpeg: return "jpeg";
    case ImageType::PngAlpha: return "png_alpha";
    case ImageType::Png: return "png";
    case ImageType::Unknown: return "unknown";
    }
    return "unknown";
}

struct ImageHeaderOptions final {
    ExifWalkLimits limits;
};

/**
 * \brief Parsed header of one image stream.
 *
 * The whole parse happens in the constructor: the container type is sniffed
 * and, for JPEG, the first APP1 segment is copied out. The object is
 * immutable afterwards. Malformed or truncated input never throws; it yields
 * \ref ImageType::Unknown and/or an absent Exif block.
 *
 * The source is only read from; it is not closed.
 */
class ImageHeader final {
public:
    explicit ImageHeader(ByteSource& source,
                         const ImageHeaderOptions& options = {});
    explicit ImageHeader(std::span<const std::byte> bytes,
                         const ImageHeaderOptions& options = {});

    ImageType type() const noexcept;
    bool has_alpha() const noexcept;

    /// First two stream bytes, big-endian (0 when the stream was shorter).
    uint16_t magic() const noexcept;

    bool has_exif() const noexcept;
    /// Normalized APP1 block (`FF E1 len16 payload...`), empty if absent.
    std::span<const std::byte> exif_block() const noexcept;
    /// Block bytes `[4, size - 1)`; see \ref exif_content.
    std::span<const std::byte> exif_content() const noexcept;
    /// Offset of the APP1 0xFF byte in the stream. Only meaningful with \ref has_exif.
    uint64_t exif_start_offset() const noexcept;

    /// Outcome of the marker walk (JPEG only; `Truncated` with no segments otherwise).
    const ExifWalkResult& walk_result() const noexcept;

    /// Orientation tag value, or \ref kOrientationUnknown.
    int orientation() const noexcept;
    OrientationResult decode_orientation() const noexcept;

private:
    void parse(ByteSource& source, const ImageHeaderOptions& options);

    ImageType type_  = ImageType::Unknown;
    uint16_t magic_  = 0;
    ExifWalkResult walk_;
    std::vector<std::byte> exif_block_;
};

}  // namespace copyexif
