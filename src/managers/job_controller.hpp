#pragma once

#include <string>
#include <vector>
#include <api/records.hpp>
#include <api/rest_client.hpp>
#include <core/reservation.hpp>
#include <core/resource_spec.hpp>
#include <core/wait.hpp>
#include "deploy_manager.hpp"
#include "site_catalog.hpp"

struct ReserveOptions {
    WaitOptions job_wait;
    WaitOptions deploy_wait{std::chrono::seconds(DEPLOY_WAIT_TIMEOUT_SECS),
                            std::chrono::seconds(DEPLOY_POLL_SECS), nullptr, nullptr};
};

// Drives a reservation from submission to a usable (running) job.
// Holds no job state: every poll re-reads the job from the service.
class JobController {
public:
    JobController(RestClient& client, PollClock& clock);

    // Create the remote job and return its first fetched state.
    // Not idempotent: two calls create two jobs.
    Job submit(const std::string& site, const CompiledResourceSpec& spec,
               const ReservationRequest& request, StatusCallback cb = nullptr);

    // Compile, submit, then (unless async) wait for running and deploy
    // request.environment if one is given.
    Job reserve(const ReservationRequest& request, const ReserveOptions& opts);

    // Poll until the job is running. Throws JobFailedError when the job
    // reaches error/finishing/terminated first, TimedOutError when the
    // deadline passes (the job is left in place), WaitCancelled on cancel.
    Job wait_until_running(const Job& job, const WaitOptions& opts);

    Job get_job(const std::string& site, int uid);

    // Jobs on a site, optionally filtered by user and state.
    std::vector<Job> get_jobs(const std::string& site, const std::string& user = "",
                              const std::string& state = "");

    std::vector<Job> my_jobs(const std::string& site, const std::string& user,
                             const std::string& state = STATE_RUNNING);

    // Poll outcome for a single job refresh
    struct WaitOutcome {
        enum Status { RUNNING, DEAD, PENDING } status;
        Job job;
    };

private:
    // Single poll iteration for wait_until_running
    WaitOutcome check_job_state(const Job& job, WaitContext& ctx);

    RestClient& client_;
    PollClock& clock_;
    SiteCatalog catalog_;
    DeployManager deployer_;
};
