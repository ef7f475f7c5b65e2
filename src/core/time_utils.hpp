#pragma once
#include <chrono>
#include <ctime>
#include <string>

namespace lhm {
using WallClock = std::chrono::system_clock;
using WallTime = WallClock::time_point;

// RFC 3339 in UTC, second precision.
inline std::string format_rfc3339(WallTime tp) {
    auto t = WallClock::to_time_t(tp);
    std::tm tm{};
    ::gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%FT%TZ", &tm);
    return std::string(buf);
}

// Longest duration seconds_to_duration will produce; well inside int64 ns.
constexpr double kMaxDurationSeconds = 1e9;

// Fractional seconds as a steady_clock duration, clamped to
// [0, kMaxDurationSeconds]. NaN maps to zero.
inline std::chrono::steady_clock::duration seconds_to_duration(double s) {
    if (!(s > 0)) s = 0;
    if (s > kMaxDurationSeconds) s = kMaxDurationSeconds;
    return std::chrono::duration_cast<std::chrono::steady_clock::duration>(
        std::chrono::duration<double>(s));
}
}  // namespace lhm
