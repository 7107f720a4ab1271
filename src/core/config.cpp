#include "config.hpp"
#include "constants.hpp"
#include "time_utils.hpp"
#include "utils.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

bool global_config_exists() {
    return fs::exists(get_global_config_path());
}

fs::path get_global_config_dir() {
    return platform::home_dir() / ".g5kctl";
}

fs::path get_global_config_path() {
    return get_global_config_dir() / "config.yaml";
}

Result<void> create_default_global_config() {
    fs::path config_path = get_global_config_path();

    // Don't overwrite existing config
    if (fs::exists(config_path)) {
        return Result<void>::Ok();
    }

    fs::create_directories(config_path.parent_path());

    const char* default_config = R"(# g5kctl configuration

api:
  uri: "https://api.grid5000.fr"
  version: "sid"
  user: ""                  # Falls back to $USER / G5K_USER
  # password: ""            # Prefer G5K_PASSWORD; omit inside the platform
  timeout: 15               # Seconds per HTTP request
  retries: 3                # GET retries on transport timeout

wait:
  poll_interval: 5          # Seconds between job/deployment polls
  job_timeout: 36000        # Max seconds to wait for a job to run
  deploy_timeout: 3600      # Max seconds to wait for a deployment
  release_timeout: 20       # Max seconds for release-all

# Defaults for reservation files
defaults:
  site: ""
  name: "g5kctl job"
  walltime: "1:00:00"
)";

    try {
        std::ofstream out(config_path);
        if (!out) {
            return Result<void>::Err("Failed to create config file at " + config_path.string());
        }
        out << default_config;
        out.close();
        return Result<void>::Ok();
    } catch (const std::exception& e) {
        return Result<void>::Err("Failed to write config file: " + std::string(e.what()));
    }
}

static ApiConfig parse_api_config(const YAML::Node& node) {
    ApiConfig api;
    api.uri = node["uri"].as<std::string>(DEFAULT_API_URI);
    api.version = node["version"].as<std::string>(DEFAULT_API_VERSION);
    api.user = node["user"].as<std::string>("");
    api.timeout = node["timeout"].as<int>(HTTP_TIMEOUT_SECS);
    api.retries = node["retries"].as<int>(HTTP_MAX_RETRIES);

    if (node["password"]) {
        std::string pass = node["password"].as<std::string>("");
        if (!pass.empty()) api.password = pass;
    }

    return api;
}

static WaitConfig parse_wait_config(const YAML::Node& node) {
    WaitConfig wait;
    wait.poll_interval = node["poll_interval"].as<int>(JOB_POLL_SECS);
    wait.job_timeout = node["job_timeout"].as<int>(JOB_WAIT_TIMEOUT_SECS);
    wait.deploy_timeout = node["deploy_timeout"].as<int>(DEPLOY_WAIT_TIMEOUT_SECS);
    wait.release_timeout = node["release_timeout"].as<int>(RELEASE_ALL_TIMEOUT_SECS);
    return wait;
}

static ReservationDefaults parse_reservation_defaults(const YAML::Node& node) {
    ReservationDefaults d;
    d.site = node["site"].as<std::string>("");
    d.name = node["name"].as<std::string>(DEFAULT_JOB_NAME);
    d.walltime = node["walltime"].as<std::string>(DEFAULT_WALLTIME);
    return d;
}

static std::string validate(const Config& config) {
    const auto& w = config.wait();
    if (w.poll_interval <= 0) return "wait.poll_interval must be positive";
    if (w.job_timeout <= 0) return "wait.job_timeout must be positive";
    if (w.deploy_timeout <= 0) return "wait.deploy_timeout must be positive";
    if (w.release_timeout <= 0) return "wait.release_timeout must be positive";
    if (config.api().retries < 0) return "api.retries must not be negative";
    if (config.api().timeout <= 0) return "api.timeout must be positive";
    if (config.api().uri.empty()) return "api.uri must not be empty";
    if (parse_walltime_secs(config.reservation().walltime) <= 0) {
        return fmt::format("defaults.walltime '{}' is not a valid walltime",
                           config.reservation().walltime);
    }
    return "";
}

Config Config::defaults() {
    Config config;
    config.api_ = parse_api_config(YAML::Node());
    config.wait_ = parse_wait_config(YAML::Node());
    config.reservation_ = parse_reservation_defaults(YAML::Node());
    return config;
}

Result<Config> Config::parse(const std::string& yaml_text) {
    try {
        YAML::Node root = YAML::Load(yaml_text);

        Config config;
        config.api_ = parse_api_config(root["api"] ? root["api"] : YAML::Node());
        config.wait_ = parse_wait_config(root["wait"] ? root["wait"] : YAML::Node());
        config.reservation_ = parse_reservation_defaults(
            root["defaults"] ? root["defaults"] : YAML::Node());

        std::string err = validate(config);
        if (!err.empty()) {
            return Result<Config>::Err("Invalid config: " + err);
        }
        return Result<Config>::Ok(config);
    } catch (const std::exception& e) {
        return Result<Config>::Err(std::string("Failed to parse config: ") + e.what());
    }
}

Result<Config> Config::load_file(const fs::path& path) {
    std::ifstream in(path);
    if (!in) {
        return Result<Config>::Err("Config not found at " + path.string());
    }
    std::stringstream ss;
    ss << in.rdbuf();

    auto result = parse(ss.str());
    if (result.is_ok()) {
        result.value.apply_env_overrides();
    }
    return result;
}

Result<Config> Config::load() {
    if (!global_config_exists()) {
        Config config = defaults();
        config.apply_env_overrides();
        return Result<Config>::Ok(config);
    }
    return load_file(get_global_config_path());
}

void Config::apply_env_overrides() {
    std::string uri = platform::env_or_empty("G5K_API");
    if (!uri.empty()) api_.uri = uri;

    std::string user = platform::env_or_empty("G5K_USER");
    if (!user.empty()) api_.user = user;

    std::string pass = platform::env_or_empty("G5K_PASSWORD");
    if (!pass.empty()) api_.password = pass;
}

std::string Config::user() const {
    return resolve_username(api_.user);
}
