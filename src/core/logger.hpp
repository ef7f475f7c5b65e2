#pragma once
#include <atomic>
#include <cstdio>
#include <mutex>
#include <string>

#include "time_utils.hpp"

namespace lhm {
enum class LogLevel { DEBUG, INFO, WARN, ERROR };

inline const char* level_name(LogLevel lvl) {
    switch (lvl) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
    }
    return "?";
}

inline std::atomic<int>& min_log_level() {
    static std::atomic<int> lvl{static_cast<int>(LogLevel::INFO)};
    return lvl;
}

inline void set_log_level(LogLevel lvl) {
    min_log_level().store(static_cast<int>(lvl));
}

// Accepts debug/info/warn/error (any case).
inline bool parse_log_level(const std::string& s, LogLevel& out) {
    std::string l;
    for (char c : s) l += static_cast<char>((c >= 'A' && c <= 'Z') ? c - 'A' + 'a' : c);
    if (l == "debug") out = LogLevel::DEBUG;
    else if (l == "info") out = LogLevel::INFO;
    else if (l == "warn" || l == "warning") out = LogLevel::WARN;
    else if (l == "error") out = LogLevel::ERROR;
    else return false;
    return true;
}

inline void log(LogLevel lvl, const std::string& msg) {
    if (static_cast<int>(lvl) < min_log_level().load()) return;
    static std::mutex mu;
    std::string ts = format_rfc3339(WallClock::now());
    std::lock_guard<std::mutex> lock(mu);
    std::fprintf(stderr, "[%s] %s: %s\n", ts.c_str(), level_name(lvl), msg.c_str());
}
}  // namespace lhm
