#include "copyexif/exif_clone.h"

#include "fuzztest/fuzztest.h"
#include "gtest/gtest.h"

#include <algorithm>
#include <cstdint>
#include <string>
#include <vector>

namespace copyexif {

static std::vector<std::byte>
to_bytes(const std::string& s)
{
    std::vector<std::byte> out;
    out.reserve(s.size());
    for (char c : s) {
        out.push_back(std::byte { static_cast<uint8_t>(c) });
    }
    return out;
}


static void
append_u16be(std::vector<std::byte>* out, uint16_t v)
{
    out->push_back(std::byte { static_cast<uint8_t>((v >> 8) & 0xFF) });
    out->push_back(std::byte { static_cast<uint8_t>((v >> 0) & 0xFF) });
}


// SOI, then an APP1 carrying `payload`, then EOI.
static std::vector<std::byte>
make_exif_jpeg(const std::string& payload)
{
    std::vector<std::byte> out;
    append_u16be(&out, 0xFFD8);
    append_u16be(&out, 0xFFE1);
    append_u16be(&out, static_cast<uint16_t>(payload.size() + 2U));
    const std::vector<std::byte> p = to_bytes(payload);
    out.insert(out.end(), p.begin(), p.end());
    append_u16be(&out, 0xFFD9);
    return out;
}


static void
clone_exif_sizes_add_up(const std::string& src_raw, const std::string& dest_raw)
{
    const std::vector<std::byte> src  = to_bytes(src_raw);
    const std::vector<std::byte> dest = to_bytes(dest_raw);

    std::vector<std::byte> out;
    const ExifCloneResult res = clone_exif(src, dest, &out);
    if (src.empty() || dest.empty()) {
        ASSERT_EQ(res.status, ExifCloneStatus::EmptyInput);
        ASSERT_TRUE(out.empty());
        return;
    }
    ASSERT_EQ(res.status, ExifCloneStatus::Ok);
    ASSERT_EQ(res.written, out.size());

    const ImageHeader src_header(src);
    const uint64_t src_block = src_header.exif_block().size();
    switch (res.mode) {
    case ExifCloneMode::Unchanged:
        ASSERT_LE(src_block, kExifBlockHeaderSize);
        ASSERT_EQ(out, dest);
        break;
    case ExifCloneMode::Replaced:
        ASSERT_EQ(res.src_exif_bytes, src_block);
        ASSERT_EQ(out.size(),
                  dest.size() - res.removed_exif_bytes + src_block);
        break;
    case ExifCloneMode::Inserted:
        ASSERT_EQ(res.src_exif_bytes, src_block);
        ASSERT_EQ(out.size(), dest.size() + src_block);
        break;
    }
}


static void
clone_exif_round_trips_block(const std::string& src_payload,
                             const std::string& dest_raw)
{
    const std::vector<std::byte> src  = make_exif_jpeg(src_payload);
    std::vector<std::byte> dest;
    append_u16be(&dest, 0xFFD8);
    const std::vector<std::byte> tail = to_bytes(dest_raw);
    dest.insert(dest.end(), tail.begin(), tail.end());

    std::vector<std::byte> out;
    const ExifCloneResult res = clone_exif(src, dest, &out);
    ASSERT_EQ(res.status, ExifCloneStatus::Ok);
    if (src_payload.empty()) {
        ASSERT_EQ(res.mode, ExifCloneMode::Unchanged);
        return;
    }

    const ImageHeader src_header(src);
    const ImageHeader reparsed(out);
    ASSERT_TRUE(reparsed.has_exif());
    ASSERT_EQ(reparsed.exif_start_offset(), res.exif_offset);
    ASSERT_TRUE(std::equal(reparsed.exif_block().begin(),
                           reparsed.exif_block().end(),
                           src_header.exif_block().begin(),
                           src_header.exif_block().end()));
}


FUZZ_TEST(ExifCloneFuzz, clone_exif_sizes_add_up)
    .WithDomains(fuzztest::String().WithMaxSize(512),
                 fuzztest::String().WithMaxSize(512));

FUZZ_TEST(ExifCloneFuzz, clone_exif_round_trips_block)
    .WithDomains(fuzztest::String().WithMaxSize(256),
                 fuzztest::String().WithMaxSize(256));

}  // namespace copyexif
