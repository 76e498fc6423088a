#pragma once

#include "copyexif/image_header.h"

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

/**
 * \file exif_clone.h
 * \brief Copies the Exif (APP1) segment of one JPEG buffer into another.
 */

namespace copyexif {

enum class ExifCloneStatus : uint8_t {
    Ok,
    /// Output buffer was too small; \ref ExifCloneResult::needed reports required size.
    OutputTruncated,
    /// The source or the destination buffer is empty; there is no result.
    EmptyInput,
};

/// How the result relates to the destination buffer.
enum class ExifCloneMode : uint8_t {
    /// The source had no usable Exif block; the result is the destination.
    Unchanged,
    /// The destination's Exif block was replaced by the source's.
    Replaced,
    /// The source's block was inserted right after the destination's SOI.
    Inserted,
};

struct ExifCloneOptions final {
    ImageHeaderOptions header;
};

struct ExifCloneResult final {
    ExifCloneStatus status = ExifCloneStatus::Ok;
    ExifCloneMode mode     = ExifCloneMode::Unchanged;
    uint64_t written       = 0;
    uint64_t needed        = 0;
    /// Offset of the spliced block in the result (Replaced/Inserted).
    uint64_t exif_offset = 0;
    /// Size of the source block copied in.
    uint64_t src_exif_bytes = 0;
    /// Size of the destination block that was dropped (Replaced).
    uint64_t removed_exif_bytes = 0;
};

/**
 * \brief Splices the source's Exif block into the destination JPEG.
 *
 * - destination with a block of length L at offset O:
 *   `dest[0, O) + src_block + dest[O + L, end)`;
 * - destination without a block: `dest[0, 2) + src_block + dest[2, end)`;
 * - source without a block (or with an empty payload): a copy of `dest`.
 *
 * Neither input is modified. Callers provide the output buffer; when it is
 * too small nothing is written and \ref ExifCloneResult::needed reports the
 * required size.
 */
ExifCloneResult
clone_exif(std::span<const std::byte> src, std::span<const std::byte> dest,
           std::span<std::byte> out, const ExifCloneOptions& options = {});

/**
 * \brief Convenience form of \ref clone_exif that sizes \p out itself.
 *
 * \p out is cleared when the status is \ref ExifCloneStatus::EmptyInput.
 */
ExifCloneResult
clone_exif(std::span<const std::byte> src, std::span<const std::byte> dest,
           std::vector<std::byte>* out, const ExifCloneOptions& options = {});

}  // namespace copyexif
