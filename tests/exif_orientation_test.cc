#include "copyexif/exif_orientation.h"

#include "copyexif/image_header.h"

#include <gtest/gtest.h>

#include <cstdint>
#include <string_view>
#include <vector>

namespace copyexif {
namespace {

    static void append_bytes(std::vector<std::byte>* out, std::string_view s)
    {
        out->insert(out->end(), reinterpret_cast<const std::byte*>(s.data()),
                    reinterpret_cast<const std::byte*>(s.data() + s.size()));
    }

    static void append_u16(std::vector<std::byte>* out, uint16_t v, bool be)
    {
        if (be) {
            out->push_back(std::byte { static_cast<uint8_t>((v >> 8) & 0xFF) });
            out->push_back(std::byte { static_cast<uint8_t>((v >> 0) & 0xFF) });
        } else {
            out->push_back(std::byte { static_cast<uint8_t>((v >> 0) & 0xFF) });
            out->push_back(std::byte { static_cast<uint8_t>((v >> 8) & 0xFF) });
        }
    }

    static void append_u32(std::vector<std::byte>* out, uint32_t v, bool be)
    {
        if (be) {
            append_u16(out, static_cast<uint16_t>(v >> 16), true);
            append_u16(out, static_cast<uint16_t>(v & 0xFFFF), true);
        } else {
            append_u16(out, static_cast<uint16_t>(v & 0xFFFF), false);
            append_u16(out, static_cast<uint16_t>(v >> 16), false);
        }
    }

    struct TestEntry final {
        uint16_t tag;
        uint16_t format;
        uint32_t count;
        uint16_t value;
    };

    // "Exif\0\0" + TIFF header + IFD0 with the given entries.
    static std::vector<std::byte>
    make_exif_payload(bool be, std::span<const TestEntry> entries)
    {
        std::vector<std::byte> p;
        append_bytes(&p, "Exif");
        p.push_back(std::byte { 0x00 });
        p.push_back(std::byte { 0x00 });
        append_bytes(&p, be ? "MM" : "II");
        append_u16(&p, 42, be);
        append_u32(&p, 8, be);
        append_u16(&p, static_cast<uint16_t>(entries.size()), be);
        for (const TestEntry& e : entries) {
            append_u16(&p, e.tag, be);
            append_u16(&p, e.format, be);
            append_u32(&p, e.count, be);
            append_u16(&p, e.value, be);
            append_u16(&p, 0, be);
        }
        append_u32(&p, 0, be);
        return p;
    }

    // Normalized APP1 block around a payload.
    static std::vector<std::byte>
    make_block(std::span<const std::byte> payload)
    {
        std::vector<std::byte> block;
        block.push_back(std::byte { 0xFF });
        block.push_back(std::byte { 0xE1 });
        append_u16(&block, static_cast<uint16_t>(payload.size() + 2), true);
        block.insert(block.end(), payload.begin(), payload.end());
        return block;
    }

    static std::vector<std::byte>
    make_jpeg(std::span<const std::byte> payload)
    {
        std::vector<std::byte> jpeg;
        append_u16(&jpeg, 0xFFD8, true);
        const std::vector<std::byte> block = make_block(payload);
        jpeg.insert(jpeg.end(), block.begin(), block.end());
        append_u16(&jpeg, 0xFFD9, true);
        return jpeg;
    }


    TEST(ExifOrientation, BigEndian)
    {
        const TestEntry entries[] = {
            { 0x010F, 2, 4, 0x4142 },
            { 0x0112, 3, 1, 6 },
        };
        const ImageHeader header(make_jpeg(make_exif_payload(true, entries)));
        EXPECT_EQ(header.orientation(), 6);

        const OrientationResult res = header.decode_orientation();
        EXPECT_EQ(res.status, OrientationStatus::Ok);
        EXPECT_TRUE(res.byte_order_read);
        EXPECT_TRUE(res.big_endian);
        EXPECT_EQ(res.entries_scanned, 2U);
        EXPECT_EQ(res.issues, OrientationIssue::None);
    }


    TEST(ExifOrientation, LittleEndian)
    {
        const TestEntry entries[] = { { 0x0112, 3, 1, 8 } };
        const ImageHeader header(make_jpeg(make_exif_payload(false, entries)));
        const OrientationResult res = header.decode_orientation();
        EXPECT_EQ(res.status, OrientationStatus::Ok);
        EXPECT_TRUE(res.byte_order_read);
        EXPECT_FALSE(res.big_endian);
        EXPECT_EQ(res.orientation, 8);
    }


    TEST(ExifOrientation, MissingTag)
    {
        const TestEntry entries[] = { { 0x0110, 2, 4, 0 } };
        const ImageHeader header(make_jpeg(make_exif_payload(true, entries)));
        const OrientationResult res = header.decode_orientation();
        EXPECT_EQ(res.status, OrientationStatus::NotFound);
        EXPECT_EQ(res.orientation, kOrientationUnknown);
    }


    TEST(ExifOrientation, InvalidFormatCodeSkipsEntry)
    {
        const TestEntry entries[] = {
            { 0x0112, 13, 1, 3 },
            { 0x0112, 0, 1, 4 },
            { 0x0112, 3, 1, 5 },
        };
        const std::vector<std::byte> block = make_block(
            make_exif_payload(true, entries));
        const OrientationResult res = decode_orientation(0xFFD8, block);
        EXPECT_EQ(res.status, OrientationStatus::Ok);
        EXPECT_EQ(res.orientation, 5);
        EXPECT_TRUE(any(res.issues, OrientationIssue::InvalidFormatCode));
    }


    TEST(ExifOrientation, NegativeComponentCountSkipsEntry)
    {
        const TestEntry entries[] = {
            { 0x0112, 3, 0xFFFFFFFFU, 3 },
            { 0x0112, 3, 1, 7 },
        };
        const std::vector<std::byte> block = make_block(
            make_exif_payload(true, entries));
        const OrientationResult res = decode_orientation(0xFFD8, block);
        EXPECT_EQ(res.orientation, 7);
        EXPECT_TRUE(any(res.issues, OrientationIssue::NegativeComponentCount));
    }


    TEST(ExifOrientation, ByteCountIsCountPlusFormatSize)
    {
        // SHORT with 2 components: 2 + 2 <= 4, accepted.
        const TestEntry two_shorts[] = { { 0x0112, 3, 2, 3 } };
        EXPECT_EQ(decode_orientation(
                      0xFFD8, make_block(make_exif_payload(true, two_shorts)))
                      .orientation,
                  3);

        // SHORT with 3 components: 3 + 2 > 4, treated as out-of-line.
        const TestEntry three_shorts[] = { { 0x0112, 3, 3, 3 } };
        const OrientationResult res = decode_orientation(
            0xFFD8, make_block(make_exif_payload(true, three_shorts)));
        EXPECT_EQ(res.orientation, kOrientationUnknown);
        EXPECT_EQ(res.status, OrientationStatus::NotFound);
        EXPECT_TRUE(any(res.issues, OrientationIssue::ValueNotInline));

        // LONG with 1 component: 1 + 4 > 4.
        const TestEntry one_long[] = { { 0x0112, 4, 1, 3 } };
        EXPECT_EQ(decode_orientation(
                      0xFFD8, make_block(make_exif_payload(true, one_long)))
                      .orientation,
                  kOrientationUnknown);
    }


    TEST(ExifOrientation, ValueIsSignedShort)
    {
        const TestEntry entries[] = { { 0x0112, 3, 1, 0xFFFE } };
        EXPECT_EQ(decode_orientation(
                      0xFFD8, make_block(make_exif_payload(true, entries)))
                      .orientation,
                  -2);
    }


    TEST(ExifOrientation, UnknownByteOrderDefaultsToBigEndian)
    {
        const TestEntry entries[] = { { 0x0112, 3, 1, 6 } };
        std::vector<std::byte> payload = make_exif_payload(true, entries);
        payload[6] = std::byte { 'X' };
        payload[7] = std::byte { 'X' };
        const OrientationResult res = decode_orientation(0xFFD8,
                                                         make_block(payload));
        EXPECT_EQ(res.status, OrientationStatus::Ok);
        EXPECT_EQ(res.orientation, 6);
        EXPECT_TRUE(res.big_endian);
        EXPECT_TRUE(any(res.issues, OrientationIssue::UnknownByteOrder));
    }


    TEST(ExifOrientation, BadPreamble)
    {
        const TestEntry entries[] = { { 0x0112, 3, 1, 6 } };
        std::vector<std::byte> payload = make_exif_payload(true, entries);
        payload[0] = std::byte { 'e' };
        const OrientationResult res = decode_orientation(0xFFD8,
                                                         make_block(payload));
        EXPECT_EQ(res.status, OrientationStatus::BadPreamble);
        EXPECT_EQ(res.orientation, kOrientationUnknown);
        EXPECT_FALSE(res.byte_order_read);
    }


    TEST(ExifOrientation, PreambleOnlyDegrades)
    {
        std::vector<std::byte> payload;
        append_bytes(&payload, "Exif");
        payload.push_back(std::byte { 0x00 });
        payload.push_back(std::byte { 0x00 });
        const ImageHeader header(make_jpeg(payload));
        EXPECT_EQ(header.orientation(), kOrientationUnknown);

        // Enough bytes to pass the preamble check, not enough for a TIFF header.
        payload.push_back(std::byte { 'M' });
        payload.push_back(std::byte { 'M' });
        const OrientationResult res = decode_orientation(0xFFD8,
                                                         make_block(payload));
        EXPECT_EQ(res.status, OrientationStatus::Malformed);
        EXPECT_EQ(res.orientation, kOrientationUnknown);
        EXPECT_FALSE(res.byte_order_read);
    }


    TEST(ExifOrientation, IfdOffsetOutOfRange)
    {
        const TestEntry entries[] = { { 0x0112, 3, 1, 6 } };
        std::vector<std::byte> payload = make_exif_payload(true, entries);
        payload[10] = std::byte { 0x7F };
        EXPECT_EQ(decode_orientation(0xFFD8, make_block(payload)).status,
                  OrientationStatus::Malformed);

        payload[10] = std::byte { 0xFF };
        EXPECT_EQ(decode_orientation(0xFFD8, make_block(payload)).status,
                  OrientationStatus::Malformed);
    }


    TEST(ExifOrientation, TrailingByteIsNotPartOfContent)
    {
        const TestEntry entries[] = { { 0x0112, 3, 1, 6 } };
        std::vector<std::byte> payload = make_exif_payload(true, entries);
        // Drop the next-IFD offset; the entry value now ends at the block end.
        payload.resize(payload.size() - 6);
        const std::vector<std::byte> block = make_block(payload);
        EXPECT_EQ(exif_content(block).size(), block.size() - 5);

        // The final byte is trimmed, so the value check fails.
        const OrientationResult res = decode_orientation(0xFFD8, block);
        EXPECT_EQ(res.orientation, kOrientationUnknown);
        EXPECT_TRUE(any(res.issues, OrientationIssue::ValueOutOfRange));
    }


    TEST(ExifOrientation, ApplicabilityMask)
    {
        EXPECT_TRUE(orientation_applies(0xFFD8));
        EXPECT_TRUE(orientation_applies(0xFFD9));
        EXPECT_TRUE(orientation_applies(0xFFFF));
        EXPECT_TRUE(orientation_applies(0x4D4D));
        EXPECT_TRUE(orientation_applies(0x4949));
        EXPECT_FALSE(orientation_applies(0x8950));
        EXPECT_FALSE(orientation_applies(0x4749));
        EXPECT_FALSE(orientation_applies(0xFFD0));

        const TestEntry entries[] = { { 0x0112, 3, 1, 6 } };
        const std::vector<std::byte> block = make_block(
            make_exif_payload(true, entries));
        EXPECT_EQ(decode_orientation(0xFFFF, block).orientation, 6);
        EXPECT_EQ(decode_orientation(0x8950, block).status,
                  OrientationStatus::NotApplicable);
    }


    TEST(ExifOrientation, NonJpegHeaderHasNoOrientation)
    {
        std::vector<std::byte> tiff;
        append_bytes(&tiff, "MM");
        append_u16(&tiff, 42, true);
        append_u32(&tiff, 8, true);
        const ImageHeader header(tiff);
        EXPECT_EQ(header.type(), ImageType::Unknown);
        const OrientationResult res = header.decode_orientation();
        EXPECT_EQ(res.status, OrientationStatus::NoExif);
        EXPECT_EQ(res.orientation, kOrientationUnknown);
    }


    TEST(ExifOrientation, ShortBlocksHaveNoContent)
    {
        EXPECT_TRUE(exif_content({}).empty());
        const std::vector<std::byte> header_only = make_block({});
        EXPECT_TRUE(exif_content(header_only).empty());
        EXPECT_EQ(decode_orientation(0xFFD8, header_only).status,
                  OrientationStatus::NoExif);
    }

}  // namespace
}  // namespace copyexif
