#include "copyexif/build_info.h"

#include "copyexif/build_info_generated.h"

namespace copyexif {
namespace {

#if defined(COPYEXIF_BUILD_LINKAGE_STATIC) && COPYEXIF_BUILD_LINKAGE_STATIC
    inline constexpr BuildLinkage kLinkage = BuildLinkage::Static;
#elif defined(COPYEXIF_BUILD_LINKAGE_SHARED) && COPYEXIF_BUILD_LINKAGE_SHARED
    inline constexpr BuildLinkage kLinkage = BuildLinkage::Shared;
#else
    inline constexpr BuildLinkage kLinkage = BuildLinkage::Unknown;
#endif

    static BuildInfo make_build_info() noexcept
    {
        BuildInfo bi;
        bi.version              = COPYEXIF_BUILDINFO_VERSION;
        bi.version_major        = COPYEXIF_BUILDINFO_VERSION_MAJOR;
        bi.version_minor        = COPYEXIF_BUILDINFO_VERSION_MINOR;
        bi.version_patch        = COPYEXIF_BUILDINFO_VERSION_PATCH;
        bi.build_timestamp_utc  = COPYEXIF_BUILDINFO_BUILD_TIMESTAMP_UTC;
        bi.build_type           = COPYEXIF_BUILDINFO_BUILD_TYPE;
        bi.cmake_generator      = COPYEXIF_BUILDINFO_CMAKE_GENERATOR;
        bi.system_name          = COPYEXIF_BUILDINFO_SYSTEM_NAME;
        bi.system_processor     = COPYEXIF_BUILDINFO_SYSTEM_PROCESSOR;
        bi.cxx_compiler_id      = COPYEXIF_BUILDINFO_CXX_COMPILER_ID;
        bi.cxx_compiler_version = COPYEXIF_BUILDINFO_CXX_COMPILER_VERSION;
        bi.linkage              = kLinkage;
        return bi;
    }


    static void append_view(std::string* out, std::string_view s)
    {
        out->append(s.data(), s.size());
    }

}  // namespace

const BuildInfo&
build_info() noexcept
{
    static const BuildInfo info = make_build_info();
    return info;
}


void
format_build_info_lines(const BuildInfo& info, std::string* line1,
                        std::string* line2) noexcept
{
    if (line1) {
        line1->assign("CopyExif v");
        append_view(line1, info.version);
        line1->push_back(' ');
        append_view(line1, info.build_type);
        line1->push_back(' ');
        line1->append(build_linkage_name(info.linkage));
    }
    if (!line2) {
        return;
    }

    line2->assign("built with ");
    append_view(line2, info.cxx_compiler_id);
    line2->push_back('-');
    append_view(line2, info.cxx_compiler_version);
    line2->append(" for ");
    append_view(line2, info.system_name);
    line2->push_back('/');
    append_view(line2, info.system_processor);
    if (!info.build_timestamp_utc.empty()) {
        line2->append(" (");
        append_view(line2, info.build_timestamp_utc);
        line2->push_back(')');
    }
}


void
format_build_info_lines(std::string* line1, std::string* line2) noexcept
{
    format_build_info_lines(build_info(), line1, line2);
}

}  // namespace copyexif
