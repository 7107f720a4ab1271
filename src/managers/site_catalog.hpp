#pragma once

#include <map>
#include <set>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include <api/records.hpp>
#include <api/rest_client.hpp>

// Read-only platform reference data: sites, clusters, node status,
// switches and deployable environments.
class SiteCatalog {
public:
    explicit SiteCatalog(RestClient& client);

    std::vector<Site> sites();

    std::vector<Cluster> clusters(const std::string& site);

    nlohmann::json site_status(const std::string& site);
    std::map<std::string, NodeStatus> nodes_status(const std::string& site);

    // Hosts whose hard state is dead or absent, both as FQDN and short name.
    std::set<std::string> dead_hosts(const std::string& site);

    std::vector<SwitchInfo> switches(const std::string& site);

    // Throws NotFoundError for an unknown switch.
    SwitchInfo switch_info(const std::string& site, const std::string& name);

    std::vector<Environment> environments(const std::string& site);

private:
    RestClient& client_;
};
