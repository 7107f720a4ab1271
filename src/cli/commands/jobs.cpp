#include "../g5k_cli.hpp"
#include "../theme.hpp"
#include <core/errors.hpp>
#include <core/reservation.hpp>
#include <core/resource_spec.hpp>
#include <core/time_utils.hpp>
#include <core/utils.hpp>
#include <algorithm>
#include <iostream>
#include <map>
#include <fmt/format.h>

// ── Helpers ─────────────────────────────────────────────

// Positional args and "--flag [value]" pairs. Flags listed in valued take
// the next argument.
struct ParsedArgs {
    std::vector<std::string> positional;
    std::map<std::string, std::string> flags;

    bool has(const std::string& f) const { return flags.count(f) > 0; }
};

static ParsedArgs split_args(const G5kCLI::Args& args,
                             const std::vector<std::string>& valued = {}) {
    ParsedArgs out;
    for (size_t i = 0; i < args.size(); i++) {
        const auto& a = args[i];
        if (a.rfind("--", 0) != 0) {
            out.positional.push_back(a);
            continue;
        }
        bool takes_value = std::find(valued.begin(), valued.end(), a) != valued.end();
        if (takes_value && i + 1 < args.size()) {
            out.flags[a] = args[++i];
        } else {
            out.flags[a] = "";
        }
    }
    return out;
}

static int parse_job_uid(const std::string& text) {
    int uid = safe_stoi(text, -1);
    if (uid <= 0) {
        throw ConfigurationError("Invalid job id: " + text);
    }
    return uid;
}

static ReservationDefaults reservation_defaults(const G5kCLI& cli) {
    return cli.config ? cli.config->reservation() : Config::defaults().reservation();
}

static void print_job(const Job& job) {
    std::cout << theme::kv("Job", std::to_string(job.uid));
    std::cout << theme::kv("Site", job.site);
    std::cout << theme::kv("State", job.state);
    if (!job.name.empty()) std::cout << theme::kv("Name", job.name);
    if (!job.types.empty()) std::cout << theme::kv("Types", join(job.types));
    if (job.scheduled_at.has_value()) {
        std::cout << theme::kv("Start", format_epoch(job.scheduled_at.value()));
    }
    if (!job.assigned_nodes.empty()) {
        std::cout << theme::kv("Nodes", join(job.assigned_nodes));
    }
}

static std::string state_colored(const std::string& state) {
    JobState s = parse_job_state(state);
    if (s == JobState::Running) return theme::green(state);
    if (is_terminal(s)) return theme::red(state);
    return theme::yellow(state);
}

// ── Commands ────────────────────────────────────────────

static int do_compile(G5kCLI& cli, const G5kCLI::Args& args) {
    if (!require_args(args, 1, "compile <request.yaml>")) return 1;

    auto loaded = load_reservation(args[0], reservation_defaults(cli));
    if (loaded.is_err()) {
        std::cout << theme::fail(loaded.error);
        return 1;
    }
    const auto& req = loaded.value;
    auto spec = compile_request(req);

    std::cout << theme::section("Resource request");
    std::cout << theme::kv("Site", req.site.empty() ? "-" : req.site);
    std::cout << theme::kv("Resources", spec.resources);
    if (spec.properties.has_value()) {
        std::cout << theme::kv("Properties", spec.properties.value());
    }
    std::cout << theme::kv("Types", join(submission_types(req.mode)));
    std::cout << theme::kv("Command", req.command.value_or(default_command(req)));
    std::cout << "\n" << build_submission(req, spec).dump(2) << "\n\n";
    return 0;
}

static int do_reserve(G5kCLI& cli, const G5kCLI::Args& args) {
    auto parsed = split_args(args, {"--site"});
    if (!require_args(parsed.positional, 1, "reserve <request.yaml> [--site S] [--async]")) return 1;
    if (!cli.require_config()) return 1;

    auto loaded = load_reservation(parsed.positional[0], reservation_defaults(cli));
    if (loaded.is_err()) {
        std::cout << theme::fail(loaded.error);
        return 1;
    }
    ReservationRequest req = loaded.value;
    if (parsed.has("--site")) req.site = parsed.flags["--site"];
    if (parsed.has("--async")) req.async = true;

    if (!cli.require_connection()) return 1;

    ReserveOptions opts;
    opts.job_wait = cli.job_wait();
    opts.deploy_wait = cli.deploy_wait();

    Job job = cli.jobs->reserve(req, opts);
    std::cout << theme::section(req.async ? "Reservation submitted" : "Reservation ready");
    print_job(job);
    std::cout << "\n";
    return 0;
}

static int do_wait(G5kCLI& cli, const G5kCLI::Args& args) {
    if (!require_args(args, 2, "wait <site> <job>")) return 1;
    int uid = parse_job_uid(args[1]);
    if (!cli.require_connection()) return 1;

    Job job = cli.jobs->get_job(args[0], uid);
    job = cli.jobs->wait_until_running(job, cli.job_wait());
    std::cout << theme::section("Reservation ready");
    print_job(job);
    std::cout << "\n";
    return 0;
}

static int do_jobs(G5kCLI& cli, const G5kCLI::Args& args) {
    auto parsed = split_args(args, {"--state"});
    if (!require_args(parsed.positional, 1, "jobs <site> [--all] [--state S]")) return 1;
    if (!cli.require_connection()) return 1;

    const auto& site = parsed.positional[0];
    std::string user = parsed.has("--all") ? "" : cli.config->user();
    std::string state = parsed.has("--state") ? parsed.flags["--state"] : "";
    auto jobs = cli.jobs->get_jobs(site, user, state);

    if (jobs.empty()) {
        std::cout << theme::dim("  No jobs.") << "\n";
        return 0;
    }

    std::cout << "\n" << theme::color::DIM
              << fmt::format("  {:<10} {:<12} {:<12} {:<20} {}\n",
                             "JOB", "USER", "STATE", "START", "NAME")
              << theme::color::RESET;
    for (const auto& j : jobs) {
        std::string start = j.scheduled_at ? format_epoch(j.scheduled_at.value()) : "-";
        std::cout << fmt::format("  {:<10} {:<12} ", j.uid, j.user)
                  << state_colored(j.state)
                  << std::string(j.state.size() < 12 ? 12 - j.state.size() : 0, ' ')
                  << fmt::format(" {:<20} {}\n", start, j.name);
    }
    std::cout << "\n";
    return 0;
}

static int do_release(G5kCLI& cli, const G5kCLI::Args& args) {
    if (!require_args(args, 2, "release <site> <job>")) return 1;
    int uid = parse_job_uid(args[1]);
    if (!cli.require_connection()) return 1;

    Job job = cli.jobs->get_job(args[0], uid);
    cli.releaser->release(job, [](const std::string& msg) {
        std::cout << theme::ok(msg);
    });
    return 0;
}

static int do_release_all(G5kCLI& cli, const G5kCLI::Args& args) {
    if (!require_args(args, 1, "release-all <site>")) return 1;
    if (!cli.require_connection()) return 1;

    auto deadline = std::chrono::seconds(cli.config->wait().release_timeout);
    cli.releaser->release_all(args[0], cli.config->user(), deadline,
                              [](const std::string& msg) { std::cout << theme::ok(msg); });
    return 0;
}

static int do_deploy(G5kCLI& cli, const G5kCLI::Args& args) {
    auto parsed = split_args(args, {"--key"});
    if (!require_args(parsed.positional, 3, "deploy <site> <job> <env> [--key path] [node...]")) {
        return 1;
    }
    int uid = parse_job_uid(parsed.positional[1]);
    if (!cli.require_connection()) return 1;

    std::vector<std::string> nodes(parsed.positional.begin() + 3, parsed.positional.end());
    std::optional<std::string> key;
    if (parsed.has("--key")) key = parsed.flags["--key"];

    Job job = cli.jobs->get_job(parsed.positional[0], uid);
    auto outcome = cli.deployer->deploy(job, parsed.positional[2], nodes, cli.deploy_wait(), key);

    std::cout << theme::section("Deployment " + outcome.deployment_uid);
    for (const auto& [node, result] : outcome.nodes) {
        std::cout << theme::kv(node, result.ok ? theme::green(result.state) : theme::red(result.state));
    }
    std::cout << "\n";
    return 0;
}

static int do_deployments(G5kCLI& cli, const G5kCLI::Args& args) {
    auto parsed = split_args(args);
    if (!require_args(parsed.positional, 1, "deployments <site> [--all]")) return 1;
    if (!cli.require_connection()) return 1;

    std::string user = parsed.has("--all") ? "" : cli.config->user();
    auto list = cli.deployer->get_deployments(parsed.positional[0], user);
    if (list.empty()) {
        std::cout << theme::dim("  No deployments.") << "\n";
        return 0;
    }

    std::cout << "\n" << theme::color::DIM
              << fmt::format("  {:<38} {:<12} {:<24} {}\n", "UID", "STATUS", "ENVIRONMENT", "NODES")
              << theme::color::RESET;
    for (const auto& d : list) {
        std::cout << fmt::format("  {:<38} {:<12} {:<24} {}\n",
                                 d.uid, d.status, d.environment, d.nodes.size());
    }
    std::cout << "\n";
    return 0;
}

void register_job_commands(G5kCLI& cli) {
    cli.add_command("compile", do_compile, "compile <request.yaml>", "Show the OAR request for a file");
    cli.add_command("reserve", do_reserve, "reserve <request.yaml> [--async]", "Reserve nodes and wait");
    cli.add_command("wait", do_wait, "wait <site> <job>", "Wait until a job is running");
    cli.add_command("jobs", do_jobs, "jobs <site> [--all]", "List jobs");
    cli.add_command("release", do_release, "release <site> <job>", "Cancel a job");
    cli.add_command("release-all", do_release_all, "release-all <site>", "Cancel all my running jobs");
    cli.add_command("deploy", do_deploy, "deploy <site> <job> <env>", "Deploy an image on a job's nodes");
    cli.add_command("deployments", do_deployments, "deployments <site> [--all]", "List deployments");
}
