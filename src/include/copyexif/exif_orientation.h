#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

/**
 * \file exif_orientation.h
 * \brief Decoder for the TIFF orientation tag (0x0112) of an Exif block.
 */

namespace copyexif {

inline constexpr uint16_t kTiffOrientationTag = 0x0112;
/// "MM"
inline constexpr uint16_t kTiffBigEndianMarker = 0x4D4D;
/// "II"
inline constexpr uint16_t kTiffLittleEndianMarker = 0x4949;

/// Sentinel returned when no orientation could be decoded.
inline constexpr int kOrientationUnknown = -1;

enum class OrientationStatus : uint8_t {
    Ok,
    /// The stream magic is not one the decoder handles.
    NotApplicable,
    /// No Exif block, or the block has no content.
    NoExif,
    /// The content does not start with "Exif\0\0".
    BadPreamble,
    /// A TIFF header field or IFD entry lies outside the content.
    Malformed,
    /// IFD0 was walked without a usable orientation entry.
    NotFound,
};

/// Non-fatal anomalies seen while walking IFD0.
enum class OrientationIssue : uint8_t {
    None = 0,
    /// Byte order was neither "MM" nor "II"; big-endian was assumed.
    UnknownByteOrder = 1U << 0U,
    /// An orientation entry had a format code outside [1, 12].
    InvalidFormatCode = 1U << 1U,
    /// An orientation entry had a negative component count.
    NegativeComponentCount = 1U << 2U,
    /// An orientation entry's value did not fit inline.
    ValueNotInline = 1U << 3U,
    /// An orientation entry's value lay outside the content.
    ValueOutOfRange = 1U << 4U,
};

constexpr OrientationIssue
operator|(OrientationIssue a, OrientationIssue b) noexcept
{
    return static_cast<OrientationIssue>(static_cast<uint8_t>(a)
                                         | static_cast<uint8_t>(b));
}

constexpr OrientationIssue
operator&(OrientationIssue a, OrientationIssue b) noexcept
{
    return static_cast<OrientationIssue>(static_cast<uint8_t>(a)
                                         & static_cast<uint8_t>(b));
}

constexpr OrientationIssue&
operator|=(OrientationIssue& a, OrientationIssue b) noexcept
{
    a = a | b;
    return a;
}

/// Returns true if any bits in \p test are present in \p issues.
constexpr bool
any(OrientationIssue issues, OrientationIssue test) noexcept
{
    return static_cast<uint8_t>(issues & test) != 0;
}

struct OrientationResult final {
    OrientationStatus status = OrientationStatus::NotFound;
    /// Decoded value, or \ref kOrientationUnknown.
    int orientation         = kOrientationUnknown;
    OrientationIssue issues = OrientationIssue::None;
    /// True once the TIFF byte-order field has been read.
    bool byte_order_read = false;
    bool big_endian      = true;
    /// IFD0 entries looked at before the walk ended.
    uint32_t entries_scanned = 0;
};

/**
 * \brief Returns true for magics the orientation decoder accepts.
 *
 * The JPEG test is a bitmask (`(magic & 0xFFD8) == 0xFFD8`) and therefore
 * also accepts other values with those bits set. TIFF byte-order markers
 * are accepted as well.
 */
constexpr bool
orientation_applies(uint16_t magic) noexcept
{
    return (magic & 0xFFD8U) == 0xFFD8U || magic == kTiffBigEndianMarker
           || magic == kTiffLittleEndianMarker;
}

/**
 * \brief Returns the Exif content view of a normalized block.
 *
 * The view spans block bytes `[4, size - 1)`: the marker and length are
 * dropped, and so is the final byte. Empty when the block has 4 bytes or
 * fewer.
 */
std::span<const std::byte>
exif_content(std::span<const std::byte> exif_block) noexcept;

/**
 * \brief Decodes the orientation tag from IFD0 of an Exif content view.
 *
 * Only inline values are supported. The first qualifying entry wins and
 * its first 16-bit value is returned as a signed short.
 *
 * \param content Bytes from \ref exif_content (preamble + TIFF data).
 */
OrientationResult
decode_exif_orientation(std::span<const std::byte> content) noexcept;

/**
 * \brief Applicability check + \ref exif_content + \ref decode_exif_orientation.
 *
 * \param magic First two bytes of the stream, big-endian.
 * \param exif_block Normalized APP1 block (may be empty).
 */
OrientationResult
decode_orientation(uint16_t magic,
                   std::span<const std::byte> exif_block) noexcept;

}  // namespace copyexif
