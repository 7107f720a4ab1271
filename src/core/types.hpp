#pragma once

#include <string>
#include <optional>
#include <vector>
#include <map>
#include <functional>
#include <cstdint>

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Configuration structures
struct ApiConfig {
    std::string uri;
    std::string version;
    std::string user;
    std::optional<std::string> password;
    int timeout = 15;                      // seconds per HTTP request
    int retries = 3;                       // GET retries on transport timeout
};

struct WaitConfig {
    int poll_interval = 5;                 // seconds between job/deploy polls
    int job_timeout = 36000;               // wait_until_running bound (10h)
    int deploy_timeout = 3600;             // deployment bound
    int release_timeout = 20;              // release_all bound
};

struct ReservationDefaults {
    std::string site;
    std::string name;
    std::string walltime;                  // "H:MM:SS"
};

// Status callback for operations
using StatusCallback = std::function<void(const std::string&)>;
