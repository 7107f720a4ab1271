#pragma once

#include <string>
#include <vector>

// Platform user name: configured user if non-empty, else $USER, else "unknown".
std::string resolve_username(const std::string& configured = "");

// Safe integer parse: returns fallback on failure (no exceptions).
int safe_stoi(const std::string& s, int fallback = 0);

// Join path segments with single slashes, dropping leading/trailing slashes
// of each segment: ("sid", "/sites/nancy/") -> "sid/sites/nancy".
std::string join_path(const std::string& a, const std::string& b);

// Comma-separated list for display.
std::string join(const std::vector<std::string>& items, const std::string& sep = ", ");

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}
