#pragma once

/**
 * Leveled logging for the blackhole server.
 *
 * Writes timestamped, colour-tagged lines to stderr. The threshold is taken
 * from the log section of the settings file and can be raised with -v.
 */

#include <string>
#include <iostream>
#include <iomanip>
#include <chrono>
#include <sstream>
#include <atomic>
#include <mutex>
#include <algorithm>
#include <cctype>
#include <ctime>

namespace blackhole {

enum class LogLevel {
    Trace = 0,
    Debug,
    Info,
    Warn,
    Error,
    Off
};

inline std::atomic<int> g_log_level{static_cast<int>(LogLevel::Info)};

// Serializes whole lines from concurrent request threads.
inline std::mutex g_log_mutex;

inline void set_log_level(LogLevel level) {
    g_log_level.store(static_cast<int>(level));
}

inline LogLevel log_level() {
    return static_cast<LogLevel>(g_log_level.load());
}

inline bool log_enabled(LogLevel level) {
    return static_cast<int>(level) >= g_log_level.load();
}

/**
 * Parses a level name (trace, debug, info, warn, error, off).
 * Unknown names fall back to info.
 */
inline LogLevel parse_log_level(std::string name) {
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    if (name == "trace") return LogLevel::Trace;
    if (name == "debug") return LogLevel::Debug;
    if (name == "info") return LogLevel::Info;
    if (name == "warn" || name == "warning") return LogLevel::Warn;
    if (name == "error") return LogLevel::Error;
    if (name == "off") return LogLevel::Off;
    return LogLevel::Info;
}

/**
 * Get current timestamp as string.
 */
inline std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_now;
    localtime_r(&time_t_now, &tm_now);

    std::ostringstream oss;
    oss << std::put_time(&tm_now, "%H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

inline void log_line(LogLevel level, const std::string& category, const std::string& message) {
    if (!log_enabled(level)) return;

    const char* color = "\033[36m";
    const char* tag = "";
    switch (level) {
        case LogLevel::Trace: color = "\033[90m"; tag = " TRACE"; break;
        case LogLevel::Debug: color = "\033[34m"; tag = " DEBUG"; break;
        case LogLevel::Info:  color = "\033[36m"; break;
        case LogLevel::Warn:  color = "\033[33m"; tag = " WARN"; break;
        case LogLevel::Error: color = "\033[31m"; tag = " ERR"; break;
        case LogLevel::Off:   return;
    }

    std::lock_guard<std::mutex> lock(g_log_mutex);
    std::cerr << "\033[90m[" << timestamp() << "] " << color << "[" << category << tag << "]\033[0m "
              << message << std::endl;
}

inline void log_trace(const std::string& category, const std::string& message) {
    log_line(LogLevel::Trace, category, message);
}

inline void log_debug(const std::string& category, const std::string& message) {
    log_line(LogLevel::Debug, category, message);
}

inline void log_info(const std::string& category, const std::string& message) {
    log_line(LogLevel::Info, category, message);
}

inline void log_warn(const std::string& category, const std::string& message) {
    log_line(LogLevel::Warn, category, message);
}

inline void log_error(const std::string& category, const std::string& message) {
    log_line(LogLevel::Error, category, message);
}

} // namespace blackhole
