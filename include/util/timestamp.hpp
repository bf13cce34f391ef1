#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace hs::util {

inline std::string timestampToString(const std::time_t ts) {
    std::tm tm{};
    gmtime_r(&ts, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ"); // RFC 3339, UTC
    return oss.str();
}

inline std::string nowRfc3339() {
    return timestampToString(std::chrono::system_clock::to_time_t(std::chrono::system_clock::now()));
}

} // namespace hs::util
