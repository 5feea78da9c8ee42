#include "platform/os_family.hpp"

#if defined(__APPLE__)
#include <TargetConditionals.h>
#endif

namespace platform {

OsFamily current_os_family() {
#if defined(__ANDROID__)
    return OsFamily::Android;
#elif defined(__APPLE__)
#if TARGET_OS_IPHONE
    return OsFamily::Ios;
#else
    return OsFamily::Macos;
#endif
#elif defined(_WIN32)
    return OsFamily::Windows;
#else
    return OsFamily::Linux;
#endif
}

const char *os_family_name(OsFamily family) {
    switch (family) {
    case OsFamily::Linux:
        return "linux";
    case OsFamily::Macos:
        return "macos";
    case OsFamily::Windows:
        return "windows";
    case OsFamily::Android:
        return "android";
    case OsFamily::Ios:
        return "ios";
    }
    return "linux";
}

const std::set<OsFamily> &all_os_families() {
    static const std::set<OsFamily> families = {
        OsFamily::Linux, OsFamily::Macos, OsFamily::Windows, OsFamily::Android, OsFamily::Ios,
    };
    return families;
}

bool is_desktop(OsFamily family) {
    return family == OsFamily::Linux || family == OsFamily::Macos || family == OsFamily::Windows;
}

} // namespace platform
