#pragma once

#include <chrono>
#include <ctime>
#include <string>

// Format a walltime as the OAR "H:MM:SS" grammar (hours unpadded).
// 1800s -> "0:30:00", 93909s -> "26:05:09". Negative values clamp to 0.
std::string format_walltime(std::chrono::seconds walltime);

// Parse a walltime into seconds. Accepts "H:MM:SS", "H:MM", plain seconds
// ("3600") and unit suffixes ("90s", "30m", "2h", "1d").
// Returns -1 on parse failure.
long parse_walltime_secs(const std::string& text);

// Parse an earliest-start time: "YYYY-MM-DD HH:MM:SS", "YYYY-MM-DDTHH:MM:SS"
// (local time) or epoch seconds. Returns 0 on failure.
std::time_t parse_start_time(const std::string& text);

// Format an epoch as local "YYYY-MM-DD HH:MM:SS". Returns "-" for 0.
std::string format_epoch(std::time_t t);

// Human-readable span: "2h35m", "14m22s", "8s". Negative values read as "0s".
std::string format_duration(long seconds);
