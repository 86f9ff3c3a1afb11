#pragma once

// File metadata goes through the POSIX API where available; other
// platforms fall back to std::filesystem with coarser fidelity.
#ifdef _WIN32
    #define STRATA_PLATFORM_WINDOWS
#else
    #define STRATA_PLATFORM_POSIX
    #include <sys/stat.h>
    #include <unistd.h>
#endif

namespace strata::platform {

#ifdef STRATA_PLATFORM_POSIX
inline constexpr const char* kName = "POSIX";
inline constexpr bool kPreservesPermissionBits = true;
inline constexpr bool kNanosecondTimes = true;
#else
inline constexpr const char* kName = "Windows";
inline constexpr bool kPreservesPermissionBits = false;
inline constexpr bool kNanosecondTimes = false;
#endif

inline const char* name() {
    return kName;
}

} // namespace strata::platform
