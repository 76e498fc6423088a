#include "copyexif/exif_orientation.h"

#include "copyexif/jpeg_exif_segment.h"

#include <array>
#include <cstring>

namespace copyexif {
namespace {

    static constexpr std::array<char, 6> kExifPreamble = {
        'E', 'x', 'i', 'f', '\0', '\0',
    };

    // Indexed by TIFF format code (1..12).
    static constexpr std::array<int64_t, 13> kBytesPerFormat = {
        0, 1, 1, 2, 4, 8, 1, 1, 2, 4, 8, 4, 8,
    };

    // Random-access view over the Exif content with a switchable byte order.
    struct TiffView final {
        std::span<const std::byte> bytes;
        bool big_endian = true;

        bool read_s16(int64_t offset, int16_t* out) const noexcept
        {
            if (offset < 0
                || static_cast<uint64_t>(offset) + 2U > bytes.size()) {
                return false;
            }
            const size_t o   = static_cast<size_t>(offset);
            const uint16_t a = static_cast<uint8_t>(bytes[o + 0]);
            const uint16_t b = static_cast<uint8_t>(bytes[o + 1]);
            const uint16_t v = big_endian ? static_cast<uint16_t>((a << 8) | b)
                                          : static_cast<uint16_t>((b << 8) | a);
            *out = static_cast<int16_t>(v);
            return true;
        }

        bool read_s32(int64_t offset, int32_t* out) const noexcept
        {
            if (offset < 0
                || static_cast<uint64_t>(offset) + 4U > bytes.size()) {
                return false;
            }
            const size_t o = static_cast<size_t>(offset);
            uint32_t v     = 0;
            for (uint32_t i = 0; i < 4; ++i) {
                const uint32_t idx = big_endian ? i : (3U - i);
                v = (v << 8) | static_cast<uint8_t>(bytes[o + idx]);
            }
            *out = static_cast<int32_t>(v);
            return true;
        }

        int64_t size() const noexcept
        {
            return static_cast<int64_t>(bytes.size());
        }
    };


    static bool has_exif_preamble(std::span<const std::byte> content) noexcept
    {
        if (content.size() <= kExifPreamble.size()) {
            return false;
        }
        return std::memcmp(content.data(), kExifPreamble.data(),
                           kExifPreamble.size())
               == 0;
    }


    static int64_t tag_entry_offset(int64_t ifd_offset, int32_t index) noexcept
    {
        return ifd_offset + 2 + 12 * static_cast<int64_t>(index);
    }

}  // namespace

std::span<const std::byte>
exif_content(std::span<const std::byte> exif_block) noexcept
{
    if (exif_block.size() <= kExifBlockHeaderSize) {
        return {};
    }
    return exif_block.subspan(kExifBlockHeaderSize,
                              exif_block.size() - kExifBlockHeaderSize - 1U);
}


OrientationResult
decode_exif_orientation(std::span<const std::byte> content) noexcept
{
    OrientationResult res;
    if (content.empty()) {
        res.status = OrientationStatus::NoExif;
        return res;
    }
    if (!has_exif_preamble(content)) {
        res.status = OrientationStatus::BadPreamble;
        return res;
    }

    const int64_t header_size = static_cast<int64_t>(kExifPreamble.size());

    TiffView view;
    view.bytes = content;

    int16_t byte_order = 0;
    if (!view.read_s16(header_size, &byte_order)) {
        res.status = OrientationStatus::Malformed;
        return res;
    }
    if (static_cast<uint16_t>(byte_order) == kTiffBigEndianMarker) {
        view.big_endian = true;
    } else if (static_cast<uint16_t>(byte_order) == kTiffLittleEndianMarker) {
        view.big_endian = false;
    } else {
        view.big_endian = true;
        res.issues |= OrientationIssue::UnknownByteOrder;
    }
    res.byte_order_read = true;
    res.big_endian      = view.big_endian;

    // Skip the byte order and the 42 identifier.
    int32_t first_ifd = 0;
    if (!view.read_s32(header_size + 4, &first_ifd)) {
        res.status = OrientationStatus::Malformed;
        return res;
    }
    const int64_t ifd0 = static_cast<int64_t>(first_ifd) + header_size;

    int16_t tag_count = 0;
    if (!view.read_s16(ifd0, &tag_count)) {
        res.status = OrientationStatus::Malformed;
        return res;
    }

    for (int32_t i = 0; i < tag_count; ++i) {
        const int64_t entry = tag_entry_offset(ifd0, i);
        res.entries_scanned += 1;

        int16_t tag = 0;
        if (!view.read_s16(entry, &tag)) {
            res.status = OrientationStatus::Malformed;
            return res;
        }
        if (static_cast<uint16_t>(tag) != kTiffOrientationTag) {
            continue;
        }

        int16_t format = 0;
        if (!view.read_s16(entry + 2, &format)) {
            res.status = OrientationStatus::Malformed;
            return res;
        }
        if (format < 1 || format > 12) {
            res.issues |= OrientationIssue::InvalidFormatCode;
            continue;
        }

        int32_t components = 0;
        if (!view.read_s32(entry + 4, &components)) {
            res.status = OrientationStatus::Malformed;
            return res;
        }
        if (components < 0) {
            res.issues |= OrientationIssue::NegativeComponentCount;
            continue;
        }

        // Sum, not product: kept for compatibility with existing callers.
        const int64_t byte_count = static_cast<int64_t>(components)
                                   + kBytesPerFormat[static_cast<size_t>(
                                       format)];
        if (byte_count > 4) {
            res.issues |= OrientationIssue::ValueNotInline;
            continue;
        }

        const int64_t value_offset = entry + 8;
        if (value_offset > view.size()
            || value_offset + byte_count > view.size()) {
            res.issues |= OrientationIssue::ValueOutOfRange;
            continue;
        }

        int16_t value = 0;
        if (!view.read_s16(value_offset, &value)) {
            res.issues |= OrientationIssue::ValueOutOfRange;
            continue;
        }
        res.status      = OrientationStatus::Ok;
        res.orientation = static_cast<int>(value);
        return res;
    }

    res.status = OrientationStatus::NotFound;
    return res;
}


OrientationResult
decode_orientation(uint16_t magic,
                   std::span<const std::byte> exif_block) noexcept
{
    if (!orientation_applies(magic)) {
        OrientationResult res;
        res.status = OrientationStatus::NotApplicable;
        return res;
    }
    return decode_exif_orientation(exif_content(exif_block));
}

}  // namespace copyexif
