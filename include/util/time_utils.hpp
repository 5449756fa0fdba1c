#pragma once

/**
 * Time utilities
 *
 * Bar and trade timestamps are UTC seconds since the Unix epoch.
 */

#include <chrono>
#include <cstdint>
#include <ctime>
#include <string>

namespace fxsig {
namespace util {

/**
 * Wall-clock nanoseconds since the Unix epoch.
 */
inline uint64_t wall_clock_ns() {
    auto now = std::chrono::system_clock::now();
    return std::chrono::duration_cast<std::chrono::nanoseconds>(now.time_since_epoch()).count();
}

inline int64_t wall_clock_seconds() {
    return static_cast<int64_t>(wall_clock_ns() / 1'000'000'000ULL);
}

inline std::tm utc_tm(int64_t epoch_seconds) {
    std::time_t secs = static_cast<std::time_t>(epoch_seconds);
    std::tm tm{};
    gmtime_r(&secs, &tm);
    return tm;
}

// "2024-03-01 14:00" style, for logs and messages
inline std::string format_utc(int64_t epoch_seconds) {
    std::tm tm = utc_tm(epoch_seconds);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M", &tm);
    return buf;
}

} // namespace util
} // namespace fxsig
