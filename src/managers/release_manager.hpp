#pragma once

#include <chrono>
#include <string>
#include <api/records.hpp>
#include <api/rest_client.hpp>
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <core/wait.hpp>
#include "job_controller.hpp"

// Cancels jobs. A job the service reports as already killed counts as
// released, so releasing twice never fails.
class ReleaseManager {
public:
    ReleaseManager(RestClient& client, JobController& jobs, PollClock& clock);

    void release(const Job& job, StatusCallback cb = nullptr);

    // Release every running job of user on site. All jobs are attempted;
    // the first error other than "already killed" is rethrown afterwards.
    // Throws TimedOutError once the deadline passes.
    void release_all(const std::string& site, const std::string& user,
                     std::chrono::seconds deadline = std::chrono::seconds(RELEASE_ALL_TIMEOUT_SECS),
                     StatusCallback cb = nullptr);

private:
    // Returns false when the job had already been killed.
    bool release_job(const Job& job);

    // Self link, or the canonical job path when the record carries no links.
    std::string job_path(const Job& job) const;

    RestClient& client_;
    JobController& jobs_;
    PollClock& clock_;
};

// True when a server error says the job was already killed.
bool is_already_killed(const RequestError& e);
