#include "copyexif/build_info.h"
#include "copyexif/byte_source.h"
#include "copyexif/exif_clone.h"
#include "copyexif/exif_orientation.h"
#include "copyexif/image_header.h"

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <span>
#include <string>
#include <vector>

namespace copyexif {
namespace {

    static void usage(const char* argv0)
    {
        std::printf(
            "usage:\n"
            "  %s info [--hex-bytes N] [--max-segments N] <file>...\n"
            "  %s clone [--force] <src.jpg> <dest.jpg> <out.jpg>\n"
            "  %s --version\n"
            "\n"
            "info   prints container type, Exif block location and orientation\n"
            "clone  copies the Exif segment of <src.jpg> into <dest.jpg>\n",
            argv0, argv0, argv0);
    }


    static const char* walk_status_name(ExifWalkStatus status) noexcept
    {
        switch (status) {
        case ExifWalkStatus::Found: return "found";
        case ExifWalkStatus::BadMarker: return "bad_marker";
        case ExifWalkStatus::StartOfScan: return "start_of_scan";
        case ExifWalkStatus::EndOfImage: return "end_of_image";
        case ExifWalkStatus::Truncated: return "truncated";
        case ExifWalkStatus::Malformed: return "malformed";
        case ExifWalkStatus::LimitExceeded: return "limit_exceeded";
        }
        return "unknown";
    }


    static const char* orientation_status_name(OrientationStatus status) noexcept
    {
        switch (status) {
        case OrientationStatus::Ok: return "ok";
        case OrientationStatus::NotApplicable: return "not_applicable";
        case OrientationStatus::NoExif: return "no_exif";
        case OrientationStatus::BadPreamble: return "bad_preamble";
        case OrientationStatus::Malformed: return "malformed";
        case OrientationStatus::NotFound: return "not_found";
        }
        return "unknown";
    }


    static const char* clone_mode_name(ExifCloneMode mode) noexcept
    {
        switch (mode) {
        case ExifCloneMode::Unchanged: return "unchanged";
        case ExifCloneMode::Replaced: return "replaced";
        case ExifCloneMode::Inserted: return "inserted";
        }
        return "unknown";
    }


    static void print_issues(OrientationIssue issues)
    {
        if (issues == OrientationIssue::None) {
            std::fputs("none", stdout);
            return;
        }
        struct Named final {
            OrientationIssue issue;
            const char* name;
        };
        static constexpr Named kNames[] = {
            { OrientationIssue::UnknownByteOrder, "unknown_byte_order" },
            { OrientationIssue::InvalidFormatCode, "invalid_format_code" },
            { OrientationIssue::NegativeComponentCount,
              "negative_component_count" },
            { OrientationIssue::ValueNotInline, "value_not_inline" },
            { OrientationIssue::ValueOutOfRange, "value_out_of_range" },
        };
        bool first = true;
        for (const Named& n : kNames) {
            if (!any(issues, n.issue)) {
                continue;
            }
            if (!first) {
                std::putchar(',');
            }
            std::fputs(n.name, stdout);
            first = false;
        }
    }


    static void print_hex(std::span<const std::byte> bytes, uint32_t max_bytes)
    {
        const uint32_t n = (bytes.size() < max_bytes)
                               ? static_cast<uint32_t>(bytes.size())
                               : max_bytes;
        for (uint32_t i = 0; i < n; ++i) {
            const unsigned v = static_cast<unsigned>(
                static_cast<uint8_t>(bytes[i]));
            std::printf("%02X", v);
        }
        if (n < bytes.size()) {
            std::fputs("...", stdout);
        }
    }


    static bool parse_u32_arg(const char* s, uint32_t* out) noexcept
    {
        if (!s || !*s || !out) {
            return false;
        }
        char* end               = nullptr;
        const unsigned long val = std::strtoul(s, &end, 10);
        if (!end || *end != '\0') {
            return false;
        }
        if (val > 0xFFFFFFFFUL) {
            return false;
        }
        *out = static_cast<uint32_t>(val);
        return true;
    }


    static bool read_file_bytes(const char* path, std::vector<std::byte>* out)
    {
        out->clear();
        std::FILE* f = std::fopen(path, "rb");
        if (!f) {
            return false;
        }

        if (std::fseek(f, 0, SEEK_END) != 0) {
            std::fclose(f);
            return false;
        }
        const long end = std::ftell(f);
        if (end < 0) {
            std::fclose(f);
            return false;
        }
        if (std::fseek(f, 0, SEEK_SET) != 0) {
            std::fclose(f);
            return false;
        }

        const size_t size = static_cast<size_t>(end);
        out->resize(size);
        if (size > 0) {
            const size_t read = std::fread(out->data(), 1, size, f);
            if (read != size) {
                std::fclose(f);
                out->clear();
                return false;
            }
        }
        std::fclose(f);
        return true;
    }


    static bool write_file_bytes(const char* path,
                                 std::span<const std::byte> bytes)
    {
        std::FILE* f = std::fopen(path, "wb");
        if (!f) {
            return false;
        }
        bool ok = true;
        if (!bytes.empty()) {
            ok = std::fwrite(bytes.data(), 1, bytes.size(), f) == bytes.size();
        }
        if (std::fclose(f) != 0) {
            ok = false;
        }
        return ok;
    }


    static bool file_exists(const char* path) noexcept
    {
        std::FILE* f = std::fopen(path, "rb");
        if (!f) {
            return false;
        }
        std::fclose(f);
        return true;
    }


    static void print_header(const ImageHeader& header, uint32_t hex_bytes)
    {
        std::printf("type=%s has_alpha=%s magic=0x%04X\n",
                    image_type_name(header.type()),
                    header.has_alpha() ? "true" : "false",
                    static_cast<unsigned>(header.magic()));

        if (header.type() == ImageType::Jpeg) {
            const ExifWalkResult& walk = header.walk_result();
            std::printf("walk=%s segments=%u last_marker=0x%02X%s\n",
                        walk_status_name(walk.status), walk.segments,
                        static_cast<unsigned>(walk.last_marker),
                        walk.truncated_payload ? " truncated_payload" : "");
        }

        if (header.has_exif()) {
            std::printf("exif offset=%llu size=%zu bytes=",
                        static_cast<unsigned long long>(
                            header.exif_start_offset()),
                        header.exif_block().size());
            print_hex(header.exif_block(), hex_bytes);
            std::putchar('\n');
        } else {
            std::printf("exif=absent\n");
        }

        const OrientationResult o = header.decode_orientation();
        std::printf("orientation=%d status=%s byte_order=%s entries=%u issues=",
                    o.orientation, orientation_status_name(o.status),
                    !o.byte_order_read ? "-" : (o.big_endian ? "MM" : "II"),
                    o.entries_scanned);
        print_issues(o.issues);
        std::putchar('\n');
    }


    static int run_info(int argc, char** argv, int first)
    {
        uint32_t hex_bytes = 32;
        ImageHeaderOptions options;

        int i = first;
        for (; i < argc; ++i) {
            const char* arg = argv[i];
            if (std::strcmp(arg, "--hex-bytes") == 0 && i + 1 < argc) {
                if (!parse_u32_arg(argv[i + 1], &hex_bytes)) {
                    std::fprintf(stderr,
                                 "copyexif: invalid --hex-bytes value\n");
                    return 2;
                }
                i += 1;
                continue;
            }
            if (std::strcmp(arg, "--max-segments") == 0 && i + 1 < argc) {
                if (!parse_u32_arg(argv[i + 1],
                                   &options.limits.max_segments)) {
                    std::fprintf(stderr,
                                 "copyexif: invalid --max-segments value\n");
                    return 2;
                }
                i += 1;
                continue;
            }
            break;
        }
        if (i >= argc) {
            usage(argv[0]);
            return 2;
        }

        int exit_code = 0;
        for (; i < argc; ++i) {
            const char* path = argv[i];
            std::FILE* f     = std::fopen(path, "rb");
            if (!f) {
                std::fprintf(stderr, "copyexif: failed to open `%s`\n", path);
                exit_code = 1;
                continue;
            }

            std::printf("== %s\n", path);
            StdioByteSource source(f);
            const ImageHeader header(source, options);
            std::fclose(f);
            print_header(header, hex_bytes);
        }
        return exit_code;
    }


    static int run_clone(int argc, char** argv, int first)
    {
        bool force = false;
        int i      = first;
        if (i < argc && std::strcmp(argv[i], "--force") == 0) {
            force = true;
            i += 1;
        }
        if (argc - i != 3) {
            usage(argv[0]);
            return 2;
        }
        const char* src_path  = argv[i + 0];
        const char* dest_path = argv[i + 1];
        const char* out_path  = argv[i + 2];

        if (!force && file_exists(out_path)) {
            std::fprintf(stderr,
                         "copyexif: `%s` exists (use --force to overwrite)\n",
                         out_path);
            return 1;
        }

        std::vector<std::byte> src;
        if (!read_file_bytes(src_path, &src)) {
            std::fprintf(stderr, "copyexif: failed to read `%s`\n", src_path);
            return 1;
        }
        std::vector<std::byte> dest;
        if (!read_file_bytes(dest_path, &dest)) {
            std::fprintf(stderr, "copyexif: failed to read `%s`\n", dest_path);
            return 1;
        }

        std::vector<std::byte> out;
        const ExifCloneResult res = clone_exif(src, dest, &out);
        if (res.status == ExifCloneStatus::EmptyInput) {
            std::fprintf(stderr, "copyexif: empty input file\n");
            return 1;
        }

        if (!write_file_bytes(out_path, out)) {
            std::fprintf(stderr, "copyexif: failed to write `%s`\n", out_path);
            return 1;
        }

        std::printf(
            "mode=%s src_exif=%llu removed_exif=%llu exif_offset=%llu size=%llu\n",
            clone_mode_name(res.mode),
            static_cast<unsigned long long>(res.src_exif_bytes),
            static_cast<unsigned long long>(res.removed_exif_bytes),
            static_cast<unsigned long long>(res.exif_offset),
            static_cast<unsigned long long>(res.written));
        return 0;
    }

}  // namespace
}  // namespace copyexif

int
main(int argc, char** argv)
{
    using namespace copyexif;

    if (argc < 2) {
        usage(argv[0]);
        return 2;
    }

    const char* cmd = argv[1];
    if (std::strcmp(cmd, "--help") == 0 || std::strcmp(cmd, "-h") == 0) {
        usage(argv[0]);
        return 0;
    }
    if (std::strcmp(cmd, "--version") == 0) {
        std::string line1;
        std::string line2;
        format_build_info_lines(&line1, &line2);
        std::printf("%s\n%s\n", line1.c_str(), line2.c_str());
        return 0;
    }
    if (std::strcmp(cmd, "info") == 0) {
        return run_info(argc, argv, 2);
    }
    if (std::strcmp(cmd, "clone") == 0) {
        return run_clone(argc, argv, 2);
    }

    std::fprintf(stderr, "copyexif: unknown command `%s`\n", cmd);
    usage(argv[0]);
    return 2;
}
