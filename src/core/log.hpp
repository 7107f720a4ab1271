#pragma once

#include <string>
#include <fstream>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <core/constants.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>

inline std::string g5k_log_path() {
    static std::string path = (platform::temp_dir() / "g5kctl_debug.log").string();
    return path;
}

inline void g5k_log(const std::string& msg) {
    std::ofstream out(g5k_log_path(), std::ios::app);
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

// One request/response exchange. Bodies are truncated.
inline void g5k_log_http(const std::string& method, const std::string& url,
                         int status, const std::string& body) {
    g5k_log(fmt::format("{} {} -> {}", method, url, status));
    if (!body.empty())
        g5k_log(fmt::format("{} body({})={}", method, body.size(),
                            body.substr(0, LOG_BODY_MAX)));
}
