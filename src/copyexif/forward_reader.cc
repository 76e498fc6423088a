#include "copyexif/forward_reader.h"

namespace copyexif {

ForwardReader::ForwardReader(ByteSource& source) noexcept
    : source_(&source)
{
}


bool
ForwardReader::read_u16be(uint16_t* out) noexcept
{
    std::byte buf[2] = {};
    if (read_exact(std::span<std::byte>(buf, 2)) != 2) {
        return false;
    }
    *out = static_cast<uint16_t>(
        (static_cast<uint16_t>(static_cast<uint8_t>(buf[0])) << 8)
        | static_cast<uint16_t>(static_cast<uint8_t>(buf[1])));
    return true;
}


bool
ForwardReader::read_u8(uint8_t* out) noexcept
{
    std::byte b {};
    if (read_exact(std::span<std::byte>(&b, 1)) != 1) {
        return false;
    }
    *out = static_cast<uint8_t>(b);
    return true;
}


uint64_t
ForwardReader::skip(uint64_t count) noexcept
{
    uint64_t to_skip = count;
    while (to_skip > 0) {
        uint64_t skipped = source_->skip(to_skip);
        if (skipped > to_skip) {
            skipped = to_skip;
        }
        if (skipped > 0) {
            to_skip -= skipped;
            position_ += skipped;
            continue;
        }
        // A zero skip does not mean end of data; a read does.
        std::byte probe {};
        if (source_->read(std::span<std::byte>(&probe, 1)) == 0) {
            break;
        }
        to_skip -= 1;
        position_ += 1;
    }
    return count - to_skip;
}


size_t
ForwardReader::read_exact(std::span<std::byte> out) noexcept
{
    size_t filled = 0;
    while (filled < out.size()) {
        const size_t n = source_->read(out.subspan(filled));
        if (n == 0) {
            break;
        }
        filled += n;
    }
    position_ += filled;
    return filled;
}


uint64_t
ForwardReader::position() const noexcept
{
    return position_;
}

}  // namespace copyexif
