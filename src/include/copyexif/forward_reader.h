#pragma once

#include "copyexif/byte_source.h"

#include <cstddef>
#include <cstdint>
#include <span>

/**
 * \file forward_reader.h
 * \brief Single-pass big-endian reader over a \ref ByteSource.
 */

namespace copyexif {

/**
 * \brief Sequential reader used while sniffing container headers.
 *
 * Every read advances the source. There is no way back. Failures of the
 * source show up as a `false` return or a short count.
 */
class ForwardReader final {
public:
    explicit ForwardReader(ByteSource& source) noexcept;

    ForwardReader(const ForwardReader&)            = delete;
    ForwardReader& operator=(const ForwardReader&) = delete;

    /// Reads two bytes as a big-endian value.
    bool read_u16be(uint16_t* out) noexcept;
    bool read_u8(uint8_t* out) noexcept;

    /**
     * \brief Skips \p count bytes, best effort.
     *
     * Partial skips are retried. When the source skips nothing, a single
     * byte is read to tell a stalled source from an exhausted one.
     *
     * \return Bytes actually skipped; less than \p count only at end of data.
     */
    uint64_t skip(uint64_t count) noexcept;

    /// Fills \p out unless the data ends first. Returns bytes read.
    size_t read_exact(std::span<std::byte> out) noexcept;

    /// Bytes consumed from the source so far.
    uint64_t position() const noexcept;

private:
    ByteSource* source_ = nullptr;
    uint64_t position_  = 0;
};

}  // namespace copyexif
