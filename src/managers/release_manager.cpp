#include "release_manager.hpp"
#include <core/log.hpp>
#include <fmt/format.h>
#include <exception>

bool is_already_killed(const RequestError& e) {
    return e.body().find(ALREADY_KILLED) != std::string::npos;
}

ReleaseManager::ReleaseManager(RestClient& client, JobController& jobs, PollClock& clock)
    : client_(client), jobs_(jobs), clock_(clock) {
}

std::string ReleaseManager::job_path(const Job& job) const {
    if (job.links.empty() && !job.site.empty()) {
        return client_.api_path(fmt::format("sites/{}/jobs/{}", job.site, job.uid));
    }
    return job.rel_self();
}

bool ReleaseManager::release_job(const Job& job) {
    try {
        client_.delete_json(job_path(job));
        return true;
    } catch (const RequestError& e) {
        if (!is_already_killed(e)) throw;
        g5k_log(fmt::format("release: job {} already killed", job.uid));
        return false;
    }
}

void ReleaseManager::release(const Job& job, StatusCallback cb) {
    if (release_job(job)) {
        if (cb) cb(fmt::format("Released job {}", job.uid));
    } else {
        if (cb) cb(fmt::format("Job {} was already terminated", job.uid));
    }
}

void ReleaseManager::release_all(const std::string& site, const std::string& user,
                                 std::chrono::seconds deadline, StatusCallback cb) {
    WaitOptions opts;
    opts.timeout = deadline;
    WaitContext ctx(clock_, opts);

    auto running = jobs_.my_jobs(site, user, STATE_RUNNING);
    if (running.empty()) {
        if (cb) cb(fmt::format("No running jobs for {} on {}", user, site));
        return;
    }

    std::exception_ptr first_error;
    std::string first_failure;
    for (const auto& job : running) {
        if (ctx.expired()) {
            std::string msg = fmt::format("Timed out releasing jobs on {} after {}s",
                                          site, ctx.elapsed_secs());
            if (!first_failure.empty()) msg += fmt::format(" (earlier failure: {})", first_failure);
            throw TimedOutError(msg, fmt::format("job {}", job.uid), job.state);
        }
        try {
            release(job, cb);
        } catch (const G5kError& e) {
            g5k_log(fmt::format("release_all: job {} failed: {}", job.uid, e.what()));
            if (cb) cb(fmt::format("Failed to release job {}: {}", job.uid, e.what()));
            if (!first_error) {
                first_error = std::current_exception();
                first_failure = fmt::format("job {}: {}", job.uid, e.what());
            }
        }
    }

    if (first_error) std::rethrow_exception(first_error);
}
