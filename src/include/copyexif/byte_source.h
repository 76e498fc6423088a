#pragma once

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <span>

/**
 * \file byte_source.h
 * \brief Forward-only byte sources consumed by the header parser.
 */

namespace copyexif {

/**
 * \brief A sequential source of bytes (file, memory, network stream).
 *
 * Implementations never throw. A failure of the underlying medium is
 * reported the same way as end of data.
 */
class ByteSource {
public:
    virtual ~ByteSource() = default;

    /// Reads up to `out.size()` bytes. Returns 0 only at end of data.
    virtual size_t read(std::span<std::byte> out) noexcept = 0;

    /// Skips up to \p count bytes. May skip fewer, including none.
    virtual uint64_t skip(uint64_t count) noexcept = 0;
};

/// Byte source over caller-owned memory.
class MemoryByteSource final : public ByteSource {
public:
    explicit MemoryByteSource(std::span<const std::byte> bytes) noexcept;

    size_t read(std::span<std::byte> out) noexcept override;
    uint64_t skip(uint64_t count) noexcept override;

    /// Bytes not yet consumed.
    uint64_t remaining() const noexcept;

private:
    std::span<const std::byte> bytes_;
    uint64_t offset_ = 0;
};

/**
 * \brief Byte source over a caller-owned stdio stream.
 *
 * The stream is never closed here. Skips are performed by reading, so
 * pipes and other non-seekable streams work too.
 */
class StdioByteSource final : public ByteSource {
public:
    explicit StdioByteSource(std::FILE* file) noexcept;

    size_t read(std::span<std::byte> out) noexcept override;
    uint64_t skip(uint64_t count) noexcept override;

private:
    std::FILE* file_ = nullptr;
};

}  // namespace copyexif
