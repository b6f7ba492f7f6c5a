#pragma once

#include <string>
#include <fstream>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <platform/platform.hpp>
#include <fmt/format.h>

// Debug log location. Defaults to <temp>/prettify_debug.log; an empty path
// turns logging off.
inline std::string& prettify_log_path_ref() {
    static std::string path = (platform::temp_dir() / "prettify_debug.log").string();
    return path;
}

inline const std::string& prettify_log_path() {
    return prettify_log_path_ref();
}

inline void set_prettify_log_path(const std::string& path) {
    prettify_log_path_ref() = path;
}

inline void prettify_log(const std::string& msg) {
    const std::string& path = prettify_log_path();
    if (path.empty()) return;

    std::ofstream out(path, std::ios::app);
    if (!out) return;

    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &t);
#else
    localtime_r(&t, &tm_buf);
#endif

    char ts[32];
    std::snprintf(ts, sizeof(ts), "%02d:%02d:%02d.%03d",
                  tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                  static_cast<int>(ms.count()));
    out << "[" << ts << "] " << msg << "\n";
}
