#ifndef CAPBRIDGE_OS_FAMILY_HPP
#define CAPBRIDGE_OS_FAMILY_HPP

// OS families a capability contract can declare support for.

#include <set>

namespace platform {

enum class OsFamily {
    Linux,
    Macos,
    Windows,
    Android,
    Ios
};

// OS family this binary was compiled for.
OsFamily current_os_family();

// Lowercase identifier ("linux", "macos", "windows", "android", "ios").
const char *os_family_name(OsFamily family);

// Every known family.
const std::set<OsFamily> &all_os_families();

// Desktop families (Linux, macOS, Windows).
bool is_desktop(OsFamily family);

} // namespace platform

#endif // CAPBRIDGE_OS_FAMILY_HPP
