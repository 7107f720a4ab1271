#include "resource_spec.hpp"
#include "errors.hpp"
#include "time_utils.hpp"
#include "utils.hpp"
#include <fmt/format.h>
#include <algorithm>

static void validate(const ReservationRequest& request) {
    if (request.nodes.has_value() && !request.hosts.empty()) {
        throw ConfigurationError("Give either a node count or a host list, not both");
    }
    if (request.nodes.has_value() && request.nodes.value() < 1) {
        throw ConfigurationError(
            fmt::format("Nodes must be a positive integer, got {}", request.nodes.value()));
    }
    if (request.walltime.count() <= 0) {
        throw ConfigurationError("Walltime must be positive");
    }
    if (request.switches.has_value() && request.switches.value() < 1) {
        throw ConfigurationError(
            fmt::format("Switches must be a positive integer, got {}", request.switches.value()));
    }

    const auto& subnet = request.subnet;
    if (subnet.slash_bits.has_value() &&
        (subnet.slash_bits.value() < 1 || subnet.slash_bits.value() > 32)) {
        throw ConfigurationError(
            fmt::format("Option slash must be a bit count in 1..32, got {}", subnet.slash_bits.value()));
    }
    if (subnet.slash_22.has_value() && subnet.slash_22.value() < 1) {
        throw ConfigurationError("Option slash_22 must be a positive count");
    }
    if (subnet.slash_18.has_value() && subnet.slash_18.value() < 1) {
        throw ConfigurationError("Option slash_18 must be a positive count");
    }
    if (request.vlan != VlanMode::None && !subnet.empty()) {
        throw ConfigurationError("Options vlan and slash are mutually exclusive");
    }

    if (request.raw_resources.has_value()) {
        bool generated = request.nodes.has_value() || !request.hosts.empty() ||
                         request.cluster.has_value() || request.switches.has_value() ||
                         request.vlan != VlanMode::None || !subnet.empty();
        if (generated) {
            throw ConfigurationError(
                "Option resources cannot be combined with nodes, hosts, cluster, switches, vlan or slash");
        }
        if (request.raw_resources->empty()) {
            throw ConfigurationError("Option resources is empty");
        }
    }
}

std::string format_slash_clause(const SubnetRequest& subnet) {
    if (subnet.slash_bits.has_value()) {
        return fmt::format("slash_{}=1", subnet.slash_bits.value());
    }
    if (subnet.slash_22.has_value()) {
        return fmt::format("slash_{}={}", SLASH_22_BITS, subnet.slash_22.value());
    }
    if (subnet.slash_18.has_value()) {
        return fmt::format("slash_{}={}", SLASH_18_BITS, subnet.slash_18.value());
    }
    return "";
}

std::string format_host_filter(const std::vector<std::string>& hosts) {
    std::vector<std::string> quoted;
    quoted.reserve(hosts.size());
    for (const auto& h : hosts) {
        std::string escaped;
        for (char c : h) {
            if (c == '\'') escaped += '\'';
            escaped += c;
        }
        quoted.push_back(fmt::format("'{}'", escaped));
    }
    std::sort(quoted.begin(), quoted.end());
    return fmt::format("host in ({})", join(quoted, ","));
}

std::vector<std::string> submission_types(AllocationMode mode) {
    if (mode == AllocationMode::Deploy) return {JOB_TYPE_DEPLOY};
    return {JOB_TYPE_NORMAL};
}

std::string default_command(const ReservationRequest& request) {
    return fmt::format("sleep {}", request.walltime.count());
}

CompiledResourceSpec compile_request(const ReservationRequest& request,
                                     const std::set<std::string>& dead_hosts) {
    validate(request);

    CompiledResourceSpec spec;
    std::string walltime = format_walltime(request.walltime);

    if (request.raw_resources.has_value()) {
        spec.resources = request.raw_resources.value();
        if (spec.resources.find("walltime=") == std::string::npos) {
            spec.resources += fmt::format(",walltime={}", walltime);
        }
        return spec;
    }

    int count = request.nodes.value_or(1);
    if (!request.hosts.empty()) {
        std::vector<std::string> alive;
        for (const auto& h : request.hosts) {
            if (request.ignore_dead && dead_hosts.count(h)) {
                spec.removed_hosts.push_back(h);
            } else {
                alive.push_back(h);
            }
        }
        spec.properties = format_host_filter(alive);
        count = static_cast<int>(alive.size());
    }
    spec.node_count = count;

    std::string resources = fmt::format("/nodes={},walltime={}", count, walltime);
    if (request.switches.has_value()) {
        resources = fmt::format("/switch={}", request.switches.value()) + resources;
    }
    if (request.cluster.has_value()) {
        resources = fmt::format("{{cluster='{}'}}", request.cluster.value()) + resources;
    }
    if (request.vlan != VlanMode::None) {
        const char* kind = request.vlan == VlanMode::Isolated ? KAVLAN_ISOLATED : KAVLAN_ROUTED;
        resources = fmt::format("{{type='{}'}}/vlan=1+", kind) + resources;
    }
    std::string slash = format_slash_clause(request.subnet);
    if (!slash.empty()) {
        resources = slash + "+" + resources;
    }

    spec.resources = resources;
    return spec;
}

nlohmann::json build_submission(const ReservationRequest& request,
                                const CompiledResourceSpec& spec) {
    nlohmann::json payload = {
        {"resources", spec.resources},
        {"name", request.name},
        {"command", request.command.value_or(default_command(request))},
        {"types", submission_types(request.mode)},
    };
    if (spec.properties.has_value()) {
        payload["properties"] = spec.properties.value();
    }
    if (request.start_at.has_value()) {
        payload["reservation"] = static_cast<long long>(request.start_at.value());
    }
    return payload;
}
