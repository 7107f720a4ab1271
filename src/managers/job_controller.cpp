#include "job_controller.hpp"
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <core/log.hpp>
#include <core/time_utils.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <chrono>

JobController::JobController(RestClient& client, PollClock& clock)
    : client_(client), clock_(clock), catalog_(client), deployer_(client, clock) {
}

Job JobController::submit(const std::string& site, const CompiledResourceSpec& spec,
                          const ReservationRequest& request, StatusCallback cb) {
    if (site.empty()) {
        throw ConfigurationError("A site is required to submit a job");
    }

    auto payload = build_submission(request, spec);
    if (cb) cb(fmt::format("Reserving resources: {} (type: {}) (in {})",
                           spec.resources, to_string(request.mode), site));
    if (request.start_at.has_value() && cb) {
        cb(fmt::format("Starting this reservation at {}", format_epoch(request.start_at.value())));
    }

    nlohmann::json created;
    try {
        created = client_.post_json(client_.api_path(fmt::format("sites/{}/jobs", site)), payload);
    } catch (const G5kError& e) {
        g5k_log(fmt::format("submit: POST failed: {}", e.what()));
        throw;
    }

    Job job = parse_job(created, site);
    g5k_log(fmt::format("submit: job {} created on {} ({})", job.uid, site, spec.resources));
    return job.refresh(client_);
}

Job JobController::reserve(const ReservationRequest& request, const ReserveOptions& opts) {
    ReservationRequest req = request;
    if (req.environment.has_value()) {
        if (req.async) {
            throw ConfigurationError("Cannot deploy an environment on an async reservation");
        }
        req.mode = AllocationMode::Deploy;
    }
    if (req.site.empty()) {
        throw ConfigurationError("A site is required to reserve nodes");
    }

    std::set<std::string> dead;
    if (req.ignore_dead && !req.hosts.empty()) {
        dead = catalog_.dead_hosts(req.site);
    }

    CompiledResourceSpec spec = compile_request(req, dead);
    if (!spec.removed_hosts.empty() && opts.job_wait.cb) {
        opts.job_wait.cb(fmt::format("Ignored nodes {}.", join(spec.removed_hosts)));
    }

    Job job = submit(req.site, spec, req, opts.job_wait.cb);
    if (req.async) return job;

    job = wait_until_running(job, opts.job_wait);

    if (req.environment.has_value()) {
        deployer_.deploy(job, req.environment.value(), {}, opts.deploy_wait, req.ssh_key);
        job = job.refresh(client_);
    }
    return job;
}

JobController::WaitOutcome JobController::check_job_state(const Job& job, WaitContext& ctx) {
    Job fresh = job.refresh(client_);

    if (fresh.scheduled_at.has_value()) {
        auto now = std::chrono::system_clock::to_time_t(clock_.now());
        long secs = static_cast<long>(fresh.scheduled_at.value() - now);
        if (secs < 0) secs = 0;
        ctx.report(fmt::format("Reservation {} should be available at {} ({} s)",
                               fresh.uid, format_epoch(fresh.scheduled_at.value()), secs));
    }

    JobState state = fresh.job_state();
    if (state == JobState::Running) {
        return {WaitOutcome::RUNNING, fresh};
    }
    if (is_terminal(state)) {
        return {WaitOutcome::DEAD, fresh};
    }
    return {WaitOutcome::PENDING, fresh};
}

Job JobController::wait_until_running(const Job& job, const WaitOptions& opts) {
    WaitContext ctx(clock_, opts);
    ctx.report(fmt::format("Waiting for reservation {}", job.uid));

    Job current = job;
    while (true) {
        auto outcome = check_job_state(current, ctx);
        current = outcome.job;

        switch (outcome.status) {
            case WaitOutcome::RUNNING:
                ctx.report(fmt::format("Reservation {} ready", current.uid));
                return current;
            case WaitOutcome::DEAD:
                g5k_log(fmt::format("wait: job {} ended in state {}", current.uid, current.state));
                throw JobFailedError(
                    fmt::format("Job {} on {} ended without running (state: {})",
                                current.uid, current.site, current.state),
                    current.uid, current.state);
            case WaitOutcome::PENDING:
                break;
        }

        if (ctx.expired()) {
            throw TimedOutError(
                fmt::format("Timed out waiting for job {} after {}s (last state: {})",
                            current.uid, ctx.elapsed_secs(), current.state),
                fmt::format("job {}", current.uid), current.state);
        }
        if (!ctx.suspend()) {
            throw WaitCancelled(
                fmt::format("Wait for job {} cancelled (last state: {})",
                            current.uid, current.state),
                fmt::format("job {}", current.uid), current.state);
        }
    }
}

Job JobController::get_job(const std::string& site, int uid) {
    auto doc = client_.get_json(client_.api_path(fmt::format("sites/{}/jobs/{}", site, uid)));
    return parse_job(doc, site);
}

std::vector<Job> JobController::get_jobs(const std::string& site, const std::string& user,
                                         const std::string& state) {
    std::string path = fmt::format("sites/{}/jobs", site);
    std::string query;
    if (!state.empty()) query += "state=" + state;
    if (!user.empty()) query += (query.empty() ? "" : "&") + std::string("user=") + user;
    if (!query.empty()) path += "?" + query;

    std::vector<Job> jobs;
    auto doc = client_.get_json(client_.api_path(path));
    for (const auto& item : collection_items(doc)) {
        jobs.push_back(parse_job(item, site));
    }
    return jobs;
}

std::vector<Job> JobController::my_jobs(const std::string& site, const std::string& user,
                                        const std::string& state) {
    return get_jobs(site, user, state);
}
