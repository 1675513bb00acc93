#pragma once

#include <string>
#include <fstream>
#include <iostream>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <filesystem>
#include <core/types.hpp>
#include <core/constants.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>

enum class LogLevel { DEBUG, INFO, WARNING, ERROR };

struct LogSettings {
    std::string path;
    bool echo_all = false;          // mirror every line to stderr (-d)
    bool echo_problems = false;     // mirror warnings and errors to stderr
};

inline LogSettings& xstage_log_settings() {
    static LogSettings settings;
    return settings;
}

inline std::string xstage_log_path() {
    auto& s = xstage_log_settings();
    if (s.path.empty()) {
        s.path = (platform::temp_dir() / DEFAULT_LOG_FILE).string();
    }
    return s.path;
}

inline void set_xstage_log_path(const std::string& path) {
    xstage_log_settings().path = path;
}

inline const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG:   return "DEBUG";
        case LogLevel::INFO:    return "INFO";
        case LogLevel::WARNING: return "WARNING";
        case LogLevel::ERROR:   return "ERROR";
    }
    return "INFO";
}

inline void xstage_log(LogLevel level, const std::string& msg) {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);

    char ts[32];
    std::snprintf(ts, sizeof(ts), "%02d:%02d:%02d.%03d",
                  tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                  static_cast<int>(ms.count()));
    std::string line = fmt::format("[{}] {:<7} {}", ts, log_level_name(level), msg);

    const auto& s = xstage_log_settings();
    if (s.echo_all || (s.echo_problems && level >= LogLevel::WARNING)) {
        std::cerr << line << "\n";
    }

    std::ofstream out(xstage_log_path(), std::ios::app);
    if (!out) return;
    out << line << "\n";
}

inline void xstage_log(const std::string& msg) { xstage_log(LogLevel::INFO, msg); }
inline void xstage_debug(const std::string& msg) { xstage_log(LogLevel::DEBUG, msg); }
inline void xstage_warn(const std::string& msg) { xstage_log(LogLevel::WARNING, msg); }
inline void xstage_error(const std::string& msg) { xstage_log(LogLevel::ERROR, msg); }

inline void xstage_log_command(const std::string& label, const std::string& cmd,
                               const CommandResult& r) {
    xstage_log(fmt::format("{} CMD: {}", label, cmd));
    xstage_log(fmt::format("{} exit={}{} stdout({})={}", label, r.exit_code,
                           r.timed_out ? " (timed out)" : "",
                           r.stdout_data.size(), r.stdout_data.substr(0, LOG_OUTPUT_TRUNCATE)));
    if (!r.stderr_data.empty())
        xstage_log(fmt::format("{} stderr={}", label, r.stderr_data.substr(0, LOG_OUTPUT_TRUNCATE)));
}
