#pragma once
#include <chrono>
#include <cstdio>
#include <ctime>
#include <string>

namespace udplogd {
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

// Minimum level written to stderr. Lowered to DEBUG by --verbose.
inline LogLevel& log_threshold() {
    static LogLevel threshold = LogLevel::INFO;
    return threshold;
}

inline void set_log_threshold(LogLevel lvl) {
    log_threshold() = lvl;
}

inline bool log_enabled(LogLevel lvl) {
    return static_cast<int>(lvl) >= static_cast<int>(log_threshold());
}

inline void log(LogLevel lvl, const std::string& msg) {
    if (!log_enabled(lvl)) return;
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    std::tm tm_utc{};
    ::gmtime_r(&t, &tm_utc);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%FT%TZ", &tm_utc);
    std::fprintf(stderr, "[%s] %s: %s\n", buf, level_name(lvl), msg.c_str());
}
}  // namespace udplogd
