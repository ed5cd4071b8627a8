#pragma once

#include <string>

namespace keylightd::buildinfo {

inline std::string version() {
#ifdef KEYLIGHTD_VERSION
    return std::string(KEYLIGHTD_VERSION);
#else
    return "0.0.0";
#endif
}

inline std::string git_commit() {
#ifdef KEYLIGHTD_GIT_COMMIT
    return std::string(KEYLIGHTD_GIT_COMMIT);
#else
    return "unknown";
#endif
}

inline std::string build_time_utc_approx() {
    // Compile time of this translation unit (local clock).
    return std::string(__DATE__) + " " + std::string(__TIME__);
}

} // namespace keylightd::buildinfo
