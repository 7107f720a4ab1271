#include "deploy_manager.hpp"
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

bool DeploymentOutcome::all_ok() const {
    for (const auto& [node, r] : nodes) {
        if (!r.ok) return false;
    }
    return true;
}

std::map<std::string, std::string> DeploymentOutcome::failures() const {
    std::map<std::string, std::string> out;
    for (const auto& [node, r] : nodes) {
        if (!r.ok) out[node] = r.state;
    }
    return out;
}

DeploymentOutcome summarize_deployment(const Deployment& deployment) {
    DeploymentOutcome outcome;
    outcome.deployment_uid = deployment.uid;
    outcome.status = deployment.status;

    for (const auto& [node, state] : deployment.result) {
        outcome.nodes[node] = {state == NODE_RESULT_OK, state};
    }
    for (const auto& node : deployment.nodes) {
        if (!outcome.nodes.count(node)) {
            outcome.nodes[node] = {false, "missing"};
        }
    }
    return outcome;
}

DeployManager::DeployManager(RestClient& client, PollClock& clock)
    : client_(client), clock_(clock) {
}

std::string DeployManager::read_public_key(const std::string& path) {
    fs::path p(path);
    if (p.extension() != ".pub" && fs::exists(path + ".pub")) {
        p = path + ".pub";
    }
    std::ifstream in(p);
    if (!in) {
        throw ConfigurationError(fmt::format("Cannot read public key {}", p.string()));
    }
    std::stringstream ss;
    ss << in.rdbuf();
    std::string key = ss.str();
    trim(key);
    if (key.empty()) {
        throw ConfigurationError(fmt::format("Public key {} is empty", p.string()));
    }
    return key;
}

Deployment DeployManager::submit_deployment(const Job& job, const std::string& environment,
                                            const std::vector<std::string>& nodes,
                                            const std::optional<std::string>& ssh_key) {
    if (environment.empty()) {
        throw ConfigurationError("An environment is required to deploy");
    }
    std::vector<std::string> targets = nodes.empty() ? job.assigned_nodes : nodes;
    if (targets.empty()) {
        throw ConfigurationError(
            fmt::format("Job {} has no assigned nodes to deploy", job.uid));
    }
    if (job.site.empty()) {
        throw ConfigurationError(fmt::format("Job {} has no site", job.uid));
    }

    nlohmann::json payload = {
        {"nodes", targets},
        {"environment", environment},
    };
    if (ssh_key.has_value()) {
        payload["key"] = read_public_key(ssh_key.value());
    }

    g5k_log(fmt::format("deploy: job={} env={} nodes={}", job.uid, environment, join(targets)));
    auto doc = client_.post_json(
        client_.api_path(fmt::format("sites/{}/deployments", job.site)), payload);
    Deployment d = parse_deployment(doc, job.site);
    if (d.nodes.empty()) d.nodes = targets;
    return d;
}

Deployment DeployManager::wait_for_deployment(const Deployment& deployment,
                                              const WaitOptions& opts) {
    WaitContext ctx(clock_, opts);
    ctx.report(fmt::format("Waiting for deployment {}", deployment.uid));

    Deployment current = deployment;
    while (true) {
        Deployment fresh = current.refresh(client_);
        if (fresh.nodes.empty()) fresh.nodes = current.nodes;
        current = fresh;

        if (!current.processing()) {
            ctx.report(fmt::format("Deployment {} finished ({})", current.uid, current.status));
            return current;
        }

        if (ctx.expired()) {
            throw TimedOutError(
                fmt::format("Timed out waiting for deployment {} after {}s (last status: {})",
                            current.uid, ctx.elapsed_secs(), current.status),
                "deployment " + current.uid, current.status);
        }
        if (!ctx.suspend()) {
            throw WaitCancelled(
                fmt::format("Wait for deployment {} cancelled (last status: {})",
                            current.uid, current.status),
                "deployment " + current.uid, current.status);
        }
    }
}

DeploymentOutcome DeployManager::deploy(const Job& job, const std::string& environment,
                                        const std::vector<std::string>& nodes,
                                        const WaitOptions& opts,
                                        const std::optional<std::string>& ssh_key) {
    Deployment submitted = submit_deployment(job, environment, nodes, ssh_key);
    Deployment done = wait_for_deployment(submitted, opts);
    DeploymentOutcome outcome = summarize_deployment(done);

    if (done.status == DEPLOY_ERROR || !outcome.all_ok()) {
        auto failures = outcome.failures();
        throw DeploymentFailedError(
            fmt::format("Deployment {} of {} failed (status: {}, failed nodes: {})",
                        done.uid, environment, done.status, failures.size()),
            done.uid, failures);
    }
    return outcome;
}

std::vector<Deployment> DeployManager::deploy_status(const Job& job) {
    return job.refresh(client_).deploy;
}

std::vector<Deployment> DeployManager::get_deployments(const std::string& site,
                                                       const std::string& user) {
    std::string path = fmt::format("sites/{}/deployments", site);
    if (!user.empty()) path += "?user=" + user;

    std::vector<Deployment> out;
    auto doc = client_.get_json(client_.api_path(path));
    for (const auto& item : collection_items(doc)) {
        out.push_back(parse_deployment(item, site));
    }
    return out;
}
