#include "copyexif/build_info.h"
#include "copyexif/exif_clone.h"
#include "copyexif/exif_orientation.h"
#include "copyexif/image_header.h"

#include <nanobind/nanobind.h>
#include <nanobind/stl/pair.h>
#include <nanobind/stl/string.h>

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <utility>
#include <vector>

namespace nb = nanobind;
using namespace nb::literals;

namespace copyexif {
namespace {

    static std::span<const std::byte> bytes_view(const nb::bytes& b) noexcept
    {
        return std::span<const std::byte>(
            reinterpret_cast<const std::byte*>(b.c_str()), b.size());
    }


    static nb::bytes to_py_bytes(std::span<const std::byte> bytes)
    {
        return nb::bytes(reinterpret_cast<const char*>(bytes.data()),
                         bytes.size());
    }


    static nb::dict read_header_to_python(const nb::bytes& data,
                                          uint32_t max_segments,
                                          uint64_t max_exif_bytes)
    {
        ImageHeaderOptions options;
        options.limits.max_segments   = max_segments;
        options.limits.max_exif_bytes = max_exif_bytes;

        const ImageHeader header(bytes_view(data), options);
        const OrientationResult orientation = header.decode_orientation();

        nb::dict d;
        d["type"]        = header.type();
        d["has_alpha"]   = header.has_alpha();
        d["magic"]       = header.magic();
        d["walk_status"] = header.walk_result().status;
        if (header.has_exif()) {
            d["exif_block"]        = to_py_bytes(header.exif_block());
            d["exif_start_offset"] = header.exif_start_offset();
        } else {
            d["exif_block"]        = nb::none();
            d["exif_start_offset"] = nb::none();
        }
        d["orientation"]        = orientation.orientation;
        d["orientation_status"] = orientation.status;
        return d;
    }


    static nb::object clone_exif_to_python(const nb::bytes& src,
                                           const nb::bytes& dest)
    {
        std::vector<std::byte> out;
        ExifCloneResult res;
        {
            nb::gil_scoped_release gil_release;
            res = clone_exif(bytes_view(src), bytes_view(dest), &out);
        }
        if (res.status != ExifCloneStatus::Ok) {
            return nb::none();
        }
        return to_py_bytes(out);
    }


    static std::pair<std::string, std::string> info_lines()
    {
        std::string line1;
        std::string line2;
        format_build_info_lines(&line1, &line2);
        return { std::move(line1), std::move(line2) };
    }

}  // namespace
}  // namespace copyexif

NB_MODULE(_copyexif, m)
{
    using namespace copyexif;

    m.doc() = "CopyExif JPEG Exif transplant bindings (nanobind).";
    m.attr("__version__") = std::string(build_info().version);

    nb::enum_<ImageType>(m, "ImageType")
        .value("Gif", ImageType::Gif)
        .value("Jpeg", ImageType::Jpeg)
        .value("PngAlpha", ImageType::PngAlpha)
        .value("Png", ImageType::Png)
        .value("Unknown", ImageType::Unknown);

    nb::enum_<ExifWalkStatus>(m, "ExifWalkStatus")
        .value("Found", ExifWalkStatus::Found)
        .value("BadMarker", ExifWalkStatus::BadMarker)
        .value("StartOfScan", ExifWalkStatus::StartOfScan)
        .value("EndOfImage", ExifWalkStatus::EndOfImage)
        .value("Truncated", ExifWalkStatus::Truncated)
        .value("Malformed", ExifWalkStatus::Malformed)
        .value("LimitExceeded", ExifWalkStatus::LimitExceeded);

    nb::enum_<OrientationStatus>(m, "OrientationStatus")
        .value("Ok", OrientationStatus::Ok)
        .value("NotApplicable", OrientationStatus::NotApplicable)
        .value("NoExif", OrientationStatus::NoExif)
        .value("BadPreamble", OrientationStatus::BadPreamble)
        .value("Malformed", OrientationStatus::Malformed)
        .value("NotFound", OrientationStatus::NotFound);

    nb::enum_<ExifCloneStatus>(m, "ExifCloneStatus")
        .value("Ok", ExifCloneStatus::Ok)
        .value("OutputTruncated", ExifCloneStatus::OutputTruncated)
        .value("EmptyInput", ExifCloneStatus::EmptyInput);

    nb::enum_<ExifCloneMode>(m, "ExifCloneMode")
        .value("Unchanged", ExifCloneMode::Unchanged)
        .value("Replaced", ExifCloneMode::Replaced)
        .value("Inserted", ExifCloneMode::Inserted);

    m.def("image_type_has_alpha", &image_type_has_alpha, "type"_a);

    m.def("read_header", &read_header_to_python, "data"_a,
          "max_segments"_a = 0U, "max_exif_bytes"_a = 0ULL,
          "Sniffs the container type and extracts the first JPEG APP1 block.");

    m.def("clone_exif", &clone_exif_to_python, "src"_a, "dest"_a,
          "Returns `dest` with the Exif segment of `src` spliced in, or None "
          "when either input is empty.");

    m.def(
        "orientation",
        [](const nb::bytes& data) {
            return ImageHeader(bytes_view(data)).orientation();
        },
        "data"_a, "Returns the Exif orientation tag value, or -1.");

    m.def("info", &info_lines);
}
