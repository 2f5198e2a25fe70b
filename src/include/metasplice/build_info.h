#pragma once

#include <string>
#include <string_view>

/**
 * \file build_info.h
 * \brief Version and toolchain details recorded when metasplice was built.
 */

namespace metasplice {

/// Configure-time facts baked into the library.
struct BuildInfo final {
    std::string_view version;              ///< Project version, "X.Y.Z".
    std::string_view build_timestamp_utc;  ///< ISO-8601 UTC, may be empty.
    std::string_view build_type;           ///< CMake build type.
    std::string_view system_name;          ///< Target OS name.
    std::string_view system_processor;     ///< Target CPU name.
    std::string_view cxx_compiler_id;      ///< e.g. "GNU", "Clang".
    std::string_view cxx_compiler_version;
    std::string_view zlib;  ///< zlib headers used for CRC and iCCP.
    bool linkage_static = false;
};

/// Build details of the linked library.
const BuildInfo&
build_info() noexcept;

/**
 * \brief Renders \p info as the two lines printed by `metasplice --version`.
 *
 * \p line1 gets `metasplice vX.Y.Z <build_type> [zlib V] <static|shared>`,
 * \p line2 gets `built with <compiler>-<version> for <os>/<cpu> (<time>)`.
 * Either pointer may be null.
 */
void
format_build_info_lines(const BuildInfo& info, std::string* line1,
                        std::string* line2);

void
format_build_info_lines(std::string* line1, std::string* line2);

}  // namespace metasplice
