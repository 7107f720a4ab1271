#include "site_catalog.hpp"
#include <core/errors.hpp>
#include <fmt/format.h>

SiteCatalog::SiteCatalog(RestClient& client) : client_(client) {
}

std::vector<Site> SiteCatalog::sites() {
    std::vector<Site> out;
    auto doc = client_.get_json(client_.api_path("sites"));
    for (const auto& item : collection_items(doc)) {
        out.push_back(parse_site(item));
    }
    return out;
}

std::vector<Cluster> SiteCatalog::clusters(const std::string& site) {
    std::vector<Cluster> out;
    auto doc = client_.get_json(client_.api_path(fmt::format("sites/{}/clusters", site)));
    for (const auto& item : collection_items(doc)) {
        out.push_back(parse_cluster(item));
    }
    return out;
}

nlohmann::json SiteCatalog::site_status(const std::string& site) {
    return client_.get_json(client_.api_path(fmt::format("sites/{}/status", site)));
}

std::map<std::string, NodeStatus> SiteCatalog::nodes_status(const std::string& site) {
    return parse_node_statuses(site_status(site));
}

std::set<std::string> SiteCatalog::dead_hosts(const std::string& site) {
    std::set<std::string> dead;
    for (const auto& [name, status] : nodes_status(site)) {
        if (!status.dead()) continue;
        dead.insert(name);
        auto dot = name.find('.');
        if (dot != std::string::npos) dead.insert(name.substr(0, dot));
    }
    return dead;
}

std::vector<SwitchInfo> SiteCatalog::switches(const std::string& site) {
    std::vector<SwitchInfo> out;
    auto doc = client_.get_json(
        client_.api_path(fmt::format("sites/{}/network_equipments", site)));
    for (const auto& item : collection_items(doc)) {
        auto sw = parse_switch(item, site);
        if (sw) out.push_back(*sw);
    }
    return out;
}

SwitchInfo SiteCatalog::switch_info(const std::string& site, const std::string& name) {
    for (const auto& sw : switches(site)) {
        if (sw.uid == name) return sw;
    }
    throw NotFoundError(fmt::format("Unknown switch '{}' on site {}", name, site), "");
}

std::vector<Environment> SiteCatalog::environments(const std::string& site) {
    std::vector<Environment> out;
    auto doc = client_.get_json(client_.api_path(fmt::format("sites/{}/environments", site)));
    for (const auto& item : collection_items(doc)) {
        out.push_back(parse_environment(item));
    }
    return out;
}
