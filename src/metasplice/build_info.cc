#include "metasplice/build_info.h"

#include "metasplice/build_info_generated.h"

#include <string>

#include <zlib.h>

namespace metasplice {
namespace {

#if defined(METASPLICE_BUILD_LINKAGE_STATIC) && METASPLICE_BUILD_LINKAGE_STATIC
    static constexpr bool kLinkageStatic = true;
#else
    static constexpr bool kLinkageStatic = false;
#endif

    static constexpr BuildInfo kBuildInfo = {
        METASPLICE_BUILDINFO_VERSION,
        METASPLICE_BUILDINFO_BUILD_TIMESTAMP_UTC,
        METASPLICE_BUILDINFO_BUILD_TYPE,
        METASPLICE_BUILDINFO_SYSTEM_NAME,
        METASPLICE_BUILDINFO_SYSTEM_PROCESSOR,
        METASPLICE_BUILDINFO_CXX_COMPILER_ID,
        METASPLICE_BUILDINFO_CXX_COMPILER_VERSION,
        ZLIB_VERSION,
        kLinkageStatic,
    };

}  // namespace

const BuildInfo&
build_info() noexcept
{
    return kBuildInfo;
}


void
format_build_info_lines(const BuildInfo& info, std::string* line1,
                        std::string* line2)
{
    if (line1) {
        *line1 = "metasplice v";
        *line1 += info.version;
        *line1 += ' ';
        *line1 += info.build_type;
        *line1 += " [zlib ";
        *line1 += info.zlib;
        *line1 += info.linkage_static ? "] static" : "] shared";
    }
    if (line2) {
        *line2 = "built with ";
        *line2 += info.cxx_compiler_id;
        *line2 += '-';
        *line2 += info.cxx_compiler_version;
        *line2 += " for ";
        *line2 += info.system_name;
        *line2 += '/';
        *line2 += info.system_processor;
        if (!info.build_timestamp_utc.empty()) {
            *line2 += " (";
            *line2 += info.build_timestamp_utc;
            *line2 += ')';
        }
    }
}


void
format_build_info_lines(std::string* line1, std::string* line2)
{
    format_build_info_lines(build_info(), line1, line2);
}

}  // namespace metasplice
