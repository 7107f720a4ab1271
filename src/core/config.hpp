#pragma once

#include <string>
#include <optional>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

class Config {
public:
    // Load ~/.g5kctl/config.yaml, then apply G5K_* environment overrides.
    // A missing file is not an error: built-in defaults are used.
    static Result<Config> load();

    // Load a specific file (must exist), then apply environment overrides.
    static Result<Config> load_file(const fs::path& path);

    // Parse YAML text without touching the environment.
    static Result<Config> parse(const std::string& yaml_text);

    // Built-in defaults only.
    static Config defaults();

    // G5K_API, G5K_USER, G5K_PASSWORD override the api section.
    void apply_env_overrides();

    // Accessors
    const ApiConfig& api() const { return api_; }
    const WaitConfig& wait() const { return wait_; }
    const ReservationDefaults& reservation() const { return reservation_; }

    // Configured user, or $USER when none is configured.
    std::string user() const;

public:
    Config() = default;

private:
    ApiConfig api_;
    WaitConfig wait_;
    ReservationDefaults reservation_;
};

// Helper to check if the config exists
bool global_config_exists();

// Get paths
fs::path get_global_config_dir();
fs::path get_global_config_path();

// Create default global config
Result<void> create_default_global_config();
