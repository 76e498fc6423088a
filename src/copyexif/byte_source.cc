#include "copyexif/byte_source.h"

#include <array>
#include <cstring>

namespace copyexif {

MemoryByteSource::MemoryByteSource(std::span<const std::byte> bytes) noexcept
    : bytes_(bytes)
{
}


size_t
MemoryByteSource::read(std::span<std::byte> out) noexcept
{
    const uint64_t avail = remaining();
    const size_t n       = (out.size() < avail) ? out.size()
                                                : static_cast<size_t>(avail);
    if (n == 0) {
        return 0;
    }
    std::memcpy(out.data(), bytes_.data() + static_cast<size_t>(offset_), n);
    offset_ += n;
    return n;
}


uint64_t
MemoryByteSource::skip(uint64_t count) noexcept
{
    const uint64_t avail = remaining();
    const uint64_t n     = (count < avail) ? count : avail;
    offset_ += n;
    return n;
}


uint64_t
MemoryByteSource::remaining() const noexcept
{
    return static_cast<uint64_t>(bytes_.size()) - offset_;
}


StdioByteSource::StdioByteSource(std::FILE* file) noexcept
    : file_(file)
{
}


size_t
StdioByteSource::read(std::span<std::byte> out) noexcept
{
    if (!file_ || out.empty()) {
        return 0;
    }
    return std::fread(out.data(), 1, out.size(), file_);
}


uint64_t
StdioByteSource::skip(uint64_t count) noexcept
{
    if (!file_) {
        return 0;
    }
    std::array<std::byte, 4096> scratch;
    uint64_t skipped = 0;
    while (skipped < count) {
        const uint64_t want = count - skipped;
        const size_t chunk  = (want < scratch.size())
                                  ? static_cast<size_t>(want)
                                  : scratch.size();
        const size_t n = std::fread(scratch.data(), 1, chunk, file_);
        skipped += n;
        if (n < chunk) {
            break;
        }
    }
    return skipped;
}

}  // namespace copyexif
