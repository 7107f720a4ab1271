#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>
#include <api/records.hpp>
#include <api/rest_client.hpp>
#include <core/wait.hpp>

struct NodeResult {
    bool ok = false;
    std::string state;      // "OK", "KO", or "missing" when absent from the result
};

struct DeploymentOutcome {
    std::string deployment_uid;
    std::string status;
    std::map<std::string, NodeResult> nodes;

    bool all_ok() const;

    // node -> state for every node that did not report OK
    std::map<std::string, std::string> failures() const;
};

// Per-node outcome of a finished deployment. Nodes that were requested but
// are absent from the result map count as failed.
DeploymentOutcome summarize_deployment(const Deployment& deployment);

// OS image deployment on the nodes of a running deploy-type job.
class DeployManager {
public:
    DeployManager(RestClient& client, PollClock& clock);

    // Deploy environment on nodes (the job's assigned nodes when empty) and
    // wait for completion. Throws DeploymentFailedError if the deployment
    // ends in error or any node is not OK; TimedOutError on deadline.
    DeploymentOutcome deploy(const Job& job, const std::string& environment,
                             const std::vector<std::string>& nodes,
                             const WaitOptions& opts,
                             const std::optional<std::string>& ssh_key = std::nullopt);

    // POST the deployment and return its initial record.
    Deployment submit_deployment(const Job& job, const std::string& environment,
                                 const std::vector<std::string>& nodes,
                                 const std::optional<std::string>& ssh_key = std::nullopt);

    // Poll until the deployment leaves "processing".
    Deployment wait_for_deployment(const Deployment& deployment, const WaitOptions& opts);

    // Deployment attempts attached to the job's current record.
    std::vector<Deployment> deploy_status(const Job& job);

    std::vector<Deployment> get_deployments(const std::string& site,
                                            const std::string& user = "");

private:
    // Public key contents for the deployment payload.
    static std::string read_public_key(const std::string& path);

    RestClient& client_;
    PollClock& clock_;
};
