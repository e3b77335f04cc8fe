#pragma once

#include <string>

namespace qecloop::buildinfo {

inline std::string git_commit() {
#ifdef QECLOOP_GIT_COMMIT
    return std::string(QECLOOP_GIT_COMMIT);
#else
    return "unknown";
#endif
}

inline std::string build_time_utc_approx() {
    // Compiler-local time, not UTC.
    return std::string(__DATE__) + " " + std::string(__TIME__);
}

} // namespace qecloop::buildinfo
