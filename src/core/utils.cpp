#include "utils.hpp"
#include <cstdlib>

std::string resolve_username(const std::string& configured) {
    if (!configured.empty()) return configured;
    const char* user = std::getenv("USER");
    if (user && *user) return user;
    return "unknown";
}

int safe_stoi(const std::string& s, int fallback) {
    try {
        return std::stoi(s);
    } catch (const std::exception&) {
        return fallback;
    }
}

static std::string strip_slashes(const std::string& s) {
    auto start = s.find_first_not_of('/');
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of('/');
    return s.substr(start, end - start + 1);
}

std::string join_path(const std::string& a, const std::string& b) {
    std::string left = strip_slashes(a);
    std::string right = strip_slashes(b);
    if (left.empty()) return right;
    if (right.empty()) return left;
    return left + "/" + right;
}

std::string join(const std::vector<std::string>& items, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < items.size(); i++) {
        if (i > 0) out += sep;
        out += items[i];
    }
    return out;
}
