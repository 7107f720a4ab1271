#pragma once

#include <ctime>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

class RestClient;

struct Link {
    std::string rel;
    std::string href;
};

// Job states as reported by the scheduler. Only running, error, finishing
// and terminated carry local meaning; anything unrecognized is Unknown.
enum class JobState {
    Waiting,
    Launching,
    Running,
    Hold,
    Error,
    Finishing,
    Terminated,
    Unknown,
};

JobState parse_job_state(const std::string& text);

// A job in this state will never reach running.
bool is_terminal(JobState state);

struct Deployment {
    std::string uid;
    std::string site;
    std::string status;                          // processing, terminated, canceled, error
    std::string user;
    std::string environment;
    std::vector<std::string> nodes;
    std::map<std::string, std::string> result;   // node -> state ("OK", "KO", ...)
    std::vector<Link> links;

    bool processing() const;
    std::string rel_self() const;

    // Fetch the current record through the self link.
    Deployment refresh(RestClient& client) const;
};

struct Job {
    int uid = 0;
    std::string site;
    std::string state;                           // raw state string
    std::string name;
    std::string user;
    std::optional<std::time_t> scheduled_at;
    std::vector<std::string> assigned_nodes;
    std::vector<std::string> types;
    std::vector<Deployment> deploy;
    std::vector<Link> links;

    JobState job_state() const { return parse_job_state(state); }

    // href of the link with the given rel. Throws G5kError if absent.
    std::string rel(const std::string& r) const;
    std::string rel_self() const;

    // Fetch the current record through the self link. Never mutates *this.
    Job refresh(RestClient& client) const;
};

struct Site {
    std::string uid;
    std::string name;
    std::string description;
};

struct Cluster {
    std::string uid;
    std::string model;
    std::string queue;
};

struct NodeStatus {
    std::string uid;
    std::string soft;        // free, busy, besteffort, unknown
    std::string hard;        // alive, dead, absent, suspected

    bool dead() const { return hard == "dead" || hard == "absent"; }
};

struct SwitchInfo {
    std::string uid;
    std::string kind;
    std::vector<std::string> nodes;   // FQDNs of nodes cabled to this switch
};

struct Environment {
    std::string uid;
    std::string name;
    std::string version;
    std::string description;
};

// Deserialization. Missing optional fields are left empty; a record that is
// not a JSON object throws G5kError.
std::vector<Link> parse_links(const nlohmann::json& j);
Job parse_job(const nlohmann::json& j, const std::string& site = "");
Deployment parse_deployment(const nlohmann::json& j, const std::string& site = "");
Site parse_site(const nlohmann::json& j);
Cluster parse_cluster(const nlohmann::json& j);
Environment parse_environment(const nlohmann::json& j);

// Site status document -> node name -> status.
std::map<std::string, NodeStatus> parse_node_statuses(const nlohmann::json& status);

// Network equipment -> switch with its node ports resolved to
// "<port uid>.<site>.grid5000.fr". Returns nullopt for non-switches and
// switches without a node linecard.
std::optional<SwitchInfo> parse_switch(const nlohmann::json& j, const std::string& site);

// The "items" array of a collection document (empty if missing).
nlohmann::json collection_items(const nlohmann::json& doc);

// Site uid from a self href like "/sid/sites/nancy/jobs/42", or "".
std::string site_from_href(const std::string& href);
