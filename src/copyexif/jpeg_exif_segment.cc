#include "copyexif/jpeg_exif_segment.h"

namespace copyexif {
namespace {

    static void put_u16be(std::vector<std::byte>* out, size_t offset,
                          uint16_t v) noexcept
    {
        (*out)[offset + 0] = std::byte { static_cast<uint8_t>((v >> 8) & 0xFF) };
        (*out)[offset + 1] = std::byte { static_cast<uint8_t>((v >> 0) & 0xFF) };
    }

}  // namespace

ExifWalkResult
find_jpeg_exif_segment(ForwardReader& reader, const ExifWalkLimits& limits,
                       std::vector<std::byte>* out_block)
{
    ExifWalkResult res;
    out_block->clear();

    // Offset of the current segment's 0xFF, measured from the SOI.
    uint64_t offset = 2;
    for (;;) {
        if (limits.max_segments != 0U && res.segments >= limits.max_segments) {
            res.status = ExifWalkStatus::LimitExceeded;
            return res;
        }

        uint8_t segment_id = 0;
        if (!reader.read_u8(&segment_id)) {
            res.status = ExifWalkStatus::Truncated;
            return res;
        }
        res.segments += 1;
        if (segment_id != kJpegMarkerPrefix) {
            res.status = ExifWalkStatus::BadMarker;
            return res;
        }

        uint8_t segment_type = 0;
        if (!reader.read_u8(&segment_type)) {
            res.status = ExifWalkStatus::Truncated;
            return res;
        }
        res.last_marker = segment_type;
        if (segment_type == kJpegMarkerSos) {
            res.status = ExifWalkStatus::StartOfScan;
            return res;
        }
        if (segment_type == kJpegMarkerEoi) {
            res.status = ExifWalkStatus::EndOfImage;
            return res;
        }

        // The length field counts itself.
        uint16_t segment_length = 0;
        if (!reader.read_u16be(&segment_length)) {
            res.status = ExifWalkStatus::Truncated;
            return res;
        }
        if (segment_length < 2) {
            res.status = ExifWalkStatus::Malformed;
            return res;
        }
        const uint64_t payload_length = static_cast<uint64_t>(segment_length)
                                        - 2U;

        if (segment_type != kJpegMarkerApp1) {
            const uint64_t skipped = reader.skip(payload_length);
            if (skipped != payload_length) {
                res.status = ExifWalkStatus::Truncated;
                return res;
            }
            offset += 4U + payload_length;
            continue;
        }

        if (limits.max_exif_bytes != 0U
            && payload_length + kExifBlockHeaderSize > limits.max_exif_bytes) {
            res.status = ExifWalkStatus::LimitExceeded;
            return res;
        }

        out_block->resize(kExifBlockHeaderSize
                          + static_cast<size_t>(payload_length));
        const size_t read = reader.read_exact(
            std::span<std::byte>(*out_block).subspan(kExifBlockHeaderSize));
        out_block->resize(kExifBlockHeaderSize + read);

        (*out_block)[0] = std::byte { kJpegMarkerPrefix };
        (*out_block)[1] = std::byte { kJpegMarkerApp1 };
        put_u16be(out_block, 2, static_cast<uint16_t>(read + 2U));

        res.status            = ExifWalkStatus::Found;
        res.exif_offset       = offset;
        res.truncated_payload = (read != payload_length);
        return res;
    }
}

}  // namespace copyexif
