#include "records.hpp"
#include "rest_client.hpp"
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <fmt/format.h>
#include <limits>

using nlohmann::json;

// Scalar as string: numbers (job uids) are rendered, null/absent -> "".
static std::string str_field(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return "";
    if (it->is_string()) return it->get<std::string>();
    if (it->is_number_integer()) return std::to_string(it->get<long long>());
    if (it->is_number()) return fmt::format("{}", it->get<double>());
    if (it->is_boolean()) return it->get<bool>() ? "true" : "false";
    return it->dump();
}

static std::vector<std::string> str_list(const json& j, const char* key) {
    std::vector<std::string> out;
    auto it = j.find(key);
    if (it == j.end() || !it->is_array()) return out;
    for (const auto& v : *it) {
        if (v.is_string()) out.push_back(v.get<std::string>());
    }
    return out;
}

static void require_object(const json& j, const char* what) {
    if (!j.is_object()) {
        throw G5kError(fmt::format("Expected a {} record, got {}", what, j.type_name()));
    }
}

JobState parse_job_state(const std::string& text) {
    if (text == "waiting")    return JobState::Waiting;
    if (text == "launching")  return JobState::Launching;
    if (text == "running")    return JobState::Running;
    if (text == "hold")       return JobState::Hold;
    if (text == "error")      return JobState::Error;
    if (text == "finishing")  return JobState::Finishing;
    if (text == "terminated") return JobState::Terminated;
    return JobState::Unknown;
}

bool is_terminal(JobState state) {
    return state == JobState::Error || state == JobState::Finishing ||
           state == JobState::Terminated;
}

std::string site_from_href(const std::string& href) {
    const std::string marker = "sites/";
    auto pos = href.find(marker);
    if (pos == std::string::npos) return "";
    pos += marker.size();
    auto end = href.find('/', pos);
    return href.substr(pos, end == std::string::npos ? std::string::npos : end - pos);
}

std::vector<Link> parse_links(const json& j) {
    std::vector<Link> links;
    auto it = j.find("links");
    if (it == j.end() || !it->is_array()) return links;
    for (const auto& l : *it) {
        if (!l.is_object()) continue;
        links.push_back({str_field(l, "rel"), str_field(l, "href")});
    }
    return links;
}

static std::string find_rel(const std::vector<Link>& links, const std::string& r,
                            const std::string& owner) {
    for (const auto& l : links) {
        if (l.rel == r) return l.href;
    }
    throw G5kError(fmt::format("{} has no '{}' link", owner, r));
}

// ── Deployment ─────────────────────────────────────────────

bool Deployment::processing() const {
    return status == DEPLOY_PROCESSING;
}

std::string Deployment::rel_self() const {
    return find_rel(links, "self", fmt::format("Deployment {}", uid));
}

Deployment Deployment::refresh(RestClient& client) const {
    return parse_deployment(client.get_json(rel_self()), site);
}

Deployment parse_deployment(const json& j, const std::string& site) {
    require_object(j, "deployment");
    Deployment d;
    d.uid = str_field(j, "uid");
    d.status = str_field(j, "status");
    d.user = str_field(j, "user_uid");
    d.environment = str_field(j, "environment");
    d.nodes = str_list(j, "nodes");
    d.links = parse_links(j);
    d.site = site.empty() ? str_field(j, "site_uid") : site;
    if (d.site.empty()) {
        for (const auto& l : d.links) {
            if (l.rel == "self") d.site = site_from_href(l.href);
        }
    }

    auto res = j.find("result");
    if (res != j.end() && res->is_object()) {
        for (auto it = res->begin(); it != res->end(); ++it) {
            if (it.value().is_object()) {
                d.result[it.key()] = str_field(it.value(), "state");
            } else if (it.value().is_string()) {
                d.result[it.key()] = it.value().get<std::string>();
            }
        }
    }
    return d;
}

// ── Job ────────────────────────────────────────────────────

std::string Job::rel(const std::string& r) const {
    return find_rel(links, r, fmt::format("Job {}", uid));
}

std::string Job::rel_self() const {
    return rel("self");
}

Job Job::refresh(RestClient& client) const {
    return parse_job(client.get_json(rel_self()), site);
}

Job parse_job(const json& j, const std::string& site) {
    require_object(j, "job");
    Job job;

    auto uid = j.find("uid");
    if (uid != j.end() && uid->is_number_integer()) {
        long long value = uid->get<long long>();
        if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max()) {
            throw G5kError(fmt::format("Job uid {} out of range", value));
        }
        job.uid = static_cast<int>(value);
    } else {
        try {
            job.uid = std::stoi(str_field(j, "uid"));
        } catch (const std::exception&) {
            throw G5kError("Job record has no numeric uid");
        }
    }

    job.state = str_field(j, "state");
    job.name = str_field(j, "name");
    job.user = str_field(j, "user_uid");
    if (job.user.empty()) job.user = str_field(j, "user");
    job.assigned_nodes = str_list(j, "assigned_nodes");
    job.types = str_list(j, "types");
    job.links = parse_links(j);

    auto sched = j.find("scheduled_at");
    if (sched != j.end() && sched->is_number()) {
        job.scheduled_at = static_cast<std::time_t>(sched->get<long long>());
    }

    job.site = site;
    if (job.site.empty()) {
        for (const auto& l : job.links) {
            if (l.rel == "self") job.site = site_from_href(l.href);
        }
    }

    auto dep = j.find("deploy");
    if (dep != j.end() && dep->is_array()) {
        for (const auto& d : *dep) {
            if (d.is_object()) job.deploy.push_back(parse_deployment(d, job.site));
        }
    }
    return job;
}

// ── Catalog records ────────────────────────────────────────

Site parse_site(const json& j) {
    require_object(j, "site");
    return {str_field(j, "uid"), str_field(j, "name"), str_field(j, "description")};
}

Cluster parse_cluster(const json& j) {
    require_object(j, "cluster");
    std::string queue;
    auto queues = str_list(j, "queues");
    if (!queues.empty()) queue = queues.front();
    return {str_field(j, "uid"), str_field(j, "model"), queue};
}

Environment parse_environment(const json& j) {
    require_object(j, "environment");
    return {str_field(j, "uid"), str_field(j, "name"), str_field(j, "version"),
            str_field(j, "description")};
}

std::map<std::string, NodeStatus> parse_node_statuses(const json& status) {
    std::map<std::string, NodeStatus> out;
    auto nodes = status.find("nodes");
    if (nodes == status.end() || !nodes->is_object()) return out;
    for (auto it = nodes->begin(); it != nodes->end(); ++it) {
        NodeStatus ns;
        ns.uid = it.key();
        if (it.value().is_object()) {
            ns.soft = str_field(it.value(), "soft");
            ns.hard = str_field(it.value(), "hard");
        }
        out[ns.uid] = ns;
    }
    return out;
}

std::optional<SwitchInfo> parse_switch(const json& j, const std::string& site) {
    if (!j.is_object() || str_field(j, "kind") != "switch") return std::nullopt;

    auto cards = j.find("linecards");
    if (cards == j.end() || !cards->is_array()) return std::nullopt;

    // first linecard cabled to nodes; IB switches have none
    const json* node_card = nullptr;
    for (const auto& c : *cards) {
        if (c.is_object() && str_field(c, "kind") == "node") {
            node_card = &c;
            break;
        }
    }
    if (!node_card) return std::nullopt;

    SwitchInfo sw;
    sw.uid = str_field(j, "uid");
    sw.kind = "switch";
    auto ports = node_card->find("ports");
    if (ports != node_card->end() && ports->is_array()) {
        for (const auto& p : *ports) {
            if (!p.is_object() || p.empty()) continue;
            std::string port_uid = str_field(p, "uid");
            if (port_uid.empty()) continue;
            sw.nodes.push_back(fmt::format("{}.{}.grid5000.fr", port_uid, site));
        }
    }
    return sw;
}

json collection_items(const json& doc) {
    auto it = doc.find("items");
    if (it == doc.end() || !it->is_array()) return json::array();
    return *it;
}
