#include "time_utils.hpp"
#include <fmt/format.h>
#include <cctype>
#include <cstdio>
#include <iomanip>
#include <sstream>

// Cross-platform local timestamp parsing with the given strptime-style format
static bool parse_local(const std::string& s, const char* format, struct tm* out) {
    *out = {};
    std::istringstream ss(s);
    ss >> std::get_time(out, format);
    return !ss.fail();
}

static bool all_digits(const std::string& s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

std::string format_walltime(std::chrono::seconds walltime) {
    long total = static_cast<long>(walltime.count());
    if (total < 0) total = 0;
    long hours = total / 3600;
    long mins = (total % 3600) / 60;
    long secs = total % 60;
    return fmt::format("{}:{:02}:{:02}", hours, mins, secs);
}

long parse_walltime_secs(const std::string& text) {
    if (text.empty()) return -1;

    if (text.find(':') != std::string::npos) {
        long h = 0, m = 0, s = 0;
        char extra = 0;
        int n = std::sscanf(text.c_str(), "%ld:%ld:%ld%c", &h, &m, &s, &extra);
        if (n == 3) {
            if (h < 0 || m < 0 || m > 59 || s < 0 || s > 59) return -1;
            return h * 3600 + m * 60 + s;
        }
        n = std::sscanf(text.c_str(), "%ld:%ld%c", &h, &m, &extra);
        if (n == 2) {
            if (h < 0 || m < 0 || m > 59) return -1;
            return h * 3600 + m * 60;
        }
        return -1;
    }

    if (all_digits(text)) {
        try {
            return std::stol(text);
        } catch (const std::exception&) {
            return -1;
        }
    }

    // Unit suffix: 90s, 30m, 2h, 1d
    std::string number = text.substr(0, text.size() - 1);
    if (!all_digits(number)) return -1;
    long value = 0;
    try {
        value = std::stol(number);
    } catch (const std::exception&) {
        return -1;
    }
    switch (std::tolower(static_cast<unsigned char>(text.back()))) {
        case 's': return value;
        case 'm': return value * 60;
        case 'h': return value * 3600;
        case 'd': return value * 86400;
        default:  return -1;
    }
}

std::time_t parse_start_time(const std::string& text) {
    if (text.empty()) return 0;

    if (all_digits(text)) {
        try {
            return static_cast<std::time_t>(std::stoll(text));
        } catch (const std::exception&) {
            return 0;
        }
    }

    struct tm tm_buf = {};
    if (parse_local(text, "%Y-%m-%d %H:%M:%S", &tm_buf) ||
        parse_local(text, "%Y-%m-%dT%H:%M:%S", &tm_buf)) {
        tm_buf.tm_isdst = -1;
        return mktime(&tm_buf);
    }
    return 0;
}

std::string format_epoch(std::time_t t) {
    if (t == 0) return "-";
    struct tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &t);
#else
    localtime_r(&t, &tm_buf);
#endif
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm_buf);
    return std::string(buf);
}

std::string format_duration(long seconds) {
    if (seconds < 0) seconds = 0;
    long hours = seconds / 3600;
    long mins = (seconds % 3600) / 60;
    long secs = seconds % 60;

    if (hours > 0) {
        return fmt::format("{}h{}m", hours, mins);
    } else if (mins > 0) {
        return fmt::format("{}m{}s", mins, secs);
    } else {
        return fmt::format("{}s", secs);
    }
}
