#include "copyexif/image_header.h"

#include "copyexif/forward_reader.h"

namespace copyexif {

ImageHeader::ImageHeader(ByteSource& source, const ImageHeaderOptions& options)
{
    parse(source, options);
}


ImageHeader::ImageHeader(std::span<const std::byte> bytes,
                         const ImageHeaderOptions& options)
{
    MemoryByteSource source(bytes);
    parse(source, options);
}


void
ImageHeader::parse(ByteSource& source, const ImageHeaderOptions& options)
{
    ForwardReader reader(source);

    uint16_t magic = 0;
    if (!reader.read_u16be(&magic)) {
        return;
    }
    magic_ = magic;

    if (magic == kJpegSoi) {
        type_ = ImageType::Jpeg;
        walk_ = find_jpeg_exif_segment(reader, options.limits, &exif_block_);
        if (walk_.status != ExifWalkStatus::Found) {
            exif_block_.clear();
        }
        return;
    }

    // Bytes past the end of the stream read as 0xFF, so "GIF" alone still
    // matches the three-byte signature.
    uint8_t hi = 0xFF;
    uint8_t lo = 0xFF;
    if (reader.read_u8(&hi)) {
        (void)reader.read_u8(&lo);
    }
    const uint32_t first_four = (static_cast<uint32_t>(magic) << 16)
                                | (static_cast<uint32_t>(hi) << 8)
                                | static_cast<uint32_t>(lo);

    if (first_four == kPngHeader) {
        // A header cut short before the colour type is a PNG without alpha.
        type_                  = ImageType::Png;
        const uint64_t to_skip = kPngColorTypeOffset - 4U;
        if (reader.skip(to_skip) != to_skip) {
            return;
        }
        uint8_t color_type = 0;
        if (!reader.read_u8(&color_type)) {
            return;
        }
        // Indexed PNGs can carry transparency through tRNS as well.
        if (color_type >= 3) {
            type_ = ImageType::PngAlpha;
        }
        return;
    }
    if ((first_four >> 8) == kGifHeader) {
        type_ = ImageType::Gif;
        return;
    }
}


ImageType
ImageHeader::type() const noexcept
{
    return type_;
}


bool
ImageHeader::has_alpha() const noexcept
{
    return image_type_has_alpha(type_);
}


uint16_t
ImageHeader::magic() const noexcept
{
    return magic_;
}


bool
ImageHeader::has_exif() const noexcept
{
    return !exif_block_.empty();
}


std::span<const std::byte>
ImageHeader::exif_block() const noexcept
{
    return std::span<const std::byte>(exif_block_.data(), exif_block_.size());
}


std::span<const std::byte>
ImageHeader::exif_content() const noexcept
{
    return copyexif::exif_content(exif_block());
}


uint64_t
ImageHeader::exif_start_offset() const noexcept
{
    return has_exif() ? walk_.exif_offset : 0U;
}


const ExifWalkResult&
ImageHeader::walk_result() const noexcept
{
    return walk_;
}


int
ImageHeader::orientation() const noexcept
{
    return decode_orientation().orientation;
}


OrientationResult
ImageHeader::decode_orientation() const noexcept
{
    return copyexif::decode_orientation(magic_, exif_block());
}

}  // namespace copyexif
