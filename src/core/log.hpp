#pragma once

#include <string>
#include <fstream>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <platform/platform.hpp>
#include <core/constants.hpp>

// Debug log location. Defaults to <tmp>/lifeline_debug.log; the CLI points it
// elsewhere when lifeline.yaml sets log_file.
inline std::string& lifeline_log_path() {
    static std::string path = (platform::temp_dir() / DEBUG_LOG_FILE).string();
    return path;
}

inline void set_lifeline_log_path(const std::string& path) {
    lifeline_log_path() = path;
}

inline void lifeline_log(const std::string& msg) {
    std::ofstream out(lifeline_log_path(), std::ios::app);
    if (!out) return;

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
    out << "[" << ts << "] [" << platform::current_pid() << "] " << msg << "\n";
}
