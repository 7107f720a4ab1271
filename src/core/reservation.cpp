#include "reservation.hpp"
#include "errors.hpp"
#include "time_utils.hpp"
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <set>
#include <sstream>

static std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

AllocationMode parse_allocation_mode(const std::string& text) {
    std::string t = lower(text);
    if (t == "normal") return AllocationMode::Normal;
    if (t == "deploy") return AllocationMode::Deploy;
    throw ConfigurationError(
        fmt::format("Type must be either deploy or normal, got '{}'", text));
}

VlanMode parse_vlan_mode(const std::string& text) {
    std::string t = lower(text);
    if (t == "none" || t == "false") return VlanMode::None;
    if (t == "routed") return VlanMode::Routed;
    if (t == "isolated" || t == "true") return VlanMode::Isolated;
    throw ConfigurationError(fmt::format("Option for vlan not recognized: {}", text));
}

const char* to_string(AllocationMode mode) {
    switch (mode) {
        case AllocationMode::Normal: return "normal";
        case AllocationMode::Deploy: return "deploy";
    }
    return "normal";
}

const char* to_string(VlanMode mode) {
    switch (mode) {
        case VlanMode::None:     return "none";
        case VlanMode::Routed:   return "routed";
        case VlanMode::Isolated: return "isolated";
    }
    return "none";
}

static const std::set<std::string>& known_keys() {
    static const std::set<std::string> keys = {
        "site", "cluster", "nodes", "hosts", "ignore_dead", "time", "walltime",
        "at", "type", "vlan", "slash", "slash_22", "slash_18", "switches",
        "cmd", "command", "name", "async", "env", "environment", "keys",
        "resources",
    };
    return keys;
}

static std::chrono::seconds parse_walltime_field(const YAML::Node& node) {
    std::string text = node.as<std::string>();
    long secs = parse_walltime_secs(text);
    if (secs <= 0) {
        throw ConfigurationError(fmt::format("Invalid walltime '{}'", text));
    }
    return std::chrono::seconds(secs);
}

static int parse_int_field(const YAML::Node& node, const char* key) {
    try {
        return node.as<int>();
    } catch (const YAML::Exception&) {
        throw ConfigurationError(fmt::format("Option '{}' must be an integer", key));
    }
}

static ReservationRequest build_request(const YAML::Node& root,
                                        const ReservationDefaults& defaults) {
    ReservationRequest req;
    req.site = defaults.site;
    if (!defaults.name.empty()) req.name = defaults.name;
    if (!defaults.walltime.empty()) {
        long secs = parse_walltime_secs(defaults.walltime);
        if (secs > 0) req.walltime = std::chrono::seconds(secs);
    }

    if (!root || root.IsNull()) return req;
    if (!root.IsMap()) {
        throw ConfigurationError("Reservation request must be a mapping");
    }

    for (const auto& kv : root) {
        std::string key = kv.first.as<std::string>();
        if (!known_keys().count(key)) {
            throw ConfigurationError(fmt::format("Unknown reservation option '{}'", key));
        }
    }

    if (root["site"]) req.site = root["site"].as<std::string>();
    if (root["cluster"]) req.cluster = root["cluster"].as<std::string>();

    // nodes: a count, or a host list (same meaning as hosts:)
    if (root["nodes"]) {
        if (root["nodes"].IsSequence()) {
            req.hosts = root["nodes"].as<std::vector<std::string>>();
        } else {
            req.nodes = parse_int_field(root["nodes"], "nodes");
        }
    }
    if (root["hosts"]) {
        if (!req.hosts.empty()) {
            throw ConfigurationError("Give the host list as either 'nodes' or 'hosts', not both");
        }
        req.hosts = root["hosts"].as<std::vector<std::string>>();
    }
    req.ignore_dead = root["ignore_dead"].as<bool>(false);

    if (root["walltime"]) {
        req.walltime = parse_walltime_field(root["walltime"]);
    } else if (root["time"]) {
        req.walltime = parse_walltime_field(root["time"]);
    }

    if (root["at"]) {
        std::string at = root["at"].as<std::string>();
        std::time_t t = parse_start_time(at);
        if (t == 0) {
            throw ConfigurationError(fmt::format("Invalid start time '{}'", at));
        }
        req.start_at = t;
    }

    if (root["type"]) req.mode = parse_allocation_mode(root["type"].as<std::string>());
    if (root["vlan"]) req.vlan = parse_vlan_mode(root["vlan"].as<std::string>());

    if (root["slash"]) req.subnet.slash_bits = parse_int_field(root["slash"], "slash");
    if (root["slash_22"]) req.subnet.slash_22 = parse_int_field(root["slash_22"], "slash_22");
    if (root["slash_18"]) req.subnet.slash_18 = parse_int_field(root["slash_18"], "slash_18");
    if (root["switches"]) req.switches = parse_int_field(root["switches"], "switches");

    if (root["command"]) {
        req.command = root["command"].as<std::string>();
    } else if (root["cmd"]) {
        req.command = root["cmd"].as<std::string>();
    }
    if (root["name"]) req.name = root["name"].as<std::string>();
    req.async = root["async"].as<bool>(false);

    if (root["environment"]) {
        req.environment = root["environment"].as<std::string>();
    } else if (root["env"]) {
        req.environment = root["env"].as<std::string>();
    }
    if (root["keys"]) req.ssh_key = root["keys"].as<std::string>();
    if (root["resources"]) req.raw_resources = root["resources"].as<std::string>();

    return req;
}

Result<ReservationRequest> parse_reservation_yaml(const std::string& text,
                                                  const ReservationDefaults& defaults) {
    try {
        YAML::Node root = YAML::Load(text);
        return Result<ReservationRequest>::Ok(build_request(root, defaults));
    } catch (const ConfigurationError& e) {
        return Result<ReservationRequest>::Err(e.what());
    } catch (const YAML::Exception& e) {
        return Result<ReservationRequest>::Err(
            std::string("Failed to parse reservation: ") + e.what());
    }
}

Result<ReservationRequest> load_reservation(const fs::path& path,
                                            const ReservationDefaults& defaults) {
    std::ifstream in(path);
    if (!in) {
        return Result<ReservationRequest>::Err("Cannot read reservation file " + path.string());
    }
    std::stringstream ss;
    ss << in.rdbuf();
    return parse_reservation_yaml(ss.str(), defaults);
}
