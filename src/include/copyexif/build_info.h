#pragma once

#include <cstdint>
#include <string>
#include <string_view>

/**
 * \file build_info.h
 * \brief Version and toolchain of the linked CopyExif library.
 */

namespace copyexif {

enum class BuildLinkage : uint8_t {
    Unknown,
    Static,
    Shared,
};

constexpr const char*
build_linkage_name(BuildLinkage linkage) noexcept
{
    switch (linkage) {
    case BuildLinkage::Unknown: return "unknown";
    case BuildLinkage::Static: return "static";
    case BuildLinkage::Shared: return "shared";
    }
    return "unknown";
}

/**
 * \brief Configure-time facts compiled into the library.
 *
 * All string views point at static storage.
 */
struct BuildInfo final {
    /// "MAJOR.MINOR.PATCH".
    std::string_view version;
    uint32_t version_major = 0;
    uint32_t version_minor = 0;
    uint32_t version_patch = 0;

    /// ISO-8601 UTC, empty when the build did not record one.
    std::string_view build_timestamp_utc;
    /// CMAKE_BUILD_TYPE, or "multi-config".
    std::string_view build_type;
    std::string_view cmake_generator;

    std::string_view system_name;
    std::string_view system_processor;
    std::string_view cxx_compiler_id;
    std::string_view cxx_compiler_version;

    BuildLinkage linkage = BuildLinkage::Unknown;
};

const BuildInfo&
build_info() noexcept;

/**
 * \brief Renders \p info as the two-line banner printed by `--version`.
 *
 * - `CopyExif vX.Y.Z <build_type> <linkage>`
 * - `built with <compiler>-<version> for <system>/<arch> (<timestamp>)`
 *
 * Null output pointers are skipped.
 */
void
format_build_info_lines(const BuildInfo& info, std::string* line1,
                        std::string* line2) noexcept;

/// Same as above for \ref build_info().
void
format_build_info_lines(std::string* line1, std::string* line2) noexcept;

}  // namespace copyexif
