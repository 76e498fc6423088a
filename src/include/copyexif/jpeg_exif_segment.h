#pragma once

#include "copyexif/forward_reader.h"

#include <cstddef>
#include <cstdint>
#include <vector>

/**
 * \file jpeg_exif_segment.h
 * \brief Locates the first APP1 (Exif) segment of a JPEG marker stream.
 */

namespace copyexif {

inline constexpr uint8_t kJpegMarkerPrefix = 0xFF;
inline constexpr uint8_t kJpegMarkerApp1   = 0xE1;
inline constexpr uint8_t kJpegMarkerSos    = 0xDA;
inline constexpr uint8_t kJpegMarkerEoi    = 0xD9;
inline constexpr uint16_t kJpegSoi         = 0xFFD8;

/// Size of the normalized segment header: marker (2) + length (2).
inline constexpr size_t kExifBlockHeaderSize = 4;

/// Why the marker walk stopped.
enum class ExifWalkStatus : uint8_t {
    /// An APP1 segment was found and copied out.
    Found,
    /// A byte where a 0xFF marker prefix was expected.
    BadMarker,
    /// Start-of-scan reached; image data follows.
    StartOfScan,
    /// End-of-image reached.
    EndOfImage,
    /// The stream ended inside the marker headers or a skipped segment.
    Truncated,
    /// A segment length field smaller than the field itself.
    Malformed,
    /// \ref ExifWalkLimits were exceeded.
    LimitExceeded,
};

/// Bounds for hostile inputs. 0 means unlimited.
struct ExifWalkLimits final {
    uint32_t max_segments   = 0;
    uint64_t max_exif_bytes = 0;
};

struct ExifWalkResult final {
    ExifWalkStatus status = ExifWalkStatus::Truncated;
    /// Offset of the APP1 0xFF byte from the stream start (if found).
    uint64_t exif_offset = 0;
    /// Marker segments examined, including the one that ended the walk.
    uint32_t segments = 0;
    /// Second marker byte of the last segment examined (0 if none).
    uint8_t last_marker = 0;
    /// The APP1 payload was shorter than its length field announced.
    bool truncated_payload = false;
};

/**
 * \brief Walks JPEG marker segments looking for the first APP1 segment.
 *
 * \p reader must be positioned right after the 2-byte SOI marker. The first
 * APP1 is accepted without looking at its payload. On success
 * \p out_block holds `FF E1 <len16be> payload...` where `len` is the number
 * of payload bytes actually read plus 2.
 *
 * \param out_block Receives the normalized block; cleared when not found.
 */
ExifWalkResult
find_jpeg_exif_segment(ForwardReader& reader, const ExifWalkLimits& limits,
                       std::vector<std::byte>* out_block);

}  // namespace copyexif
