#include "g5k_cli.hpp"
#include "theme.hpp"
#include <core/errors.hpp>
#include <iostream>
#include <fmt/format.h>

G5kCLI::G5kCLI() {
    auto config_result = Config::load();
    if (config_result.is_ok()) {
        config = config_result.value;
    } else {
        config_error = config_result.error;
    }
    register_catalog_commands(*this);
    register_job_commands(*this);
}

void G5kCLI::add_command(const std::string& name, CommandHandler handler,
                         const std::string& usage, const std::string& help) {
    commands_[name] = {handler, usage, help};
}

bool G5kCLI::require_config() {
    if (!config.has_value()) {
        std::cout << theme::fail(config_error.empty() ? "No configuration loaded." : config_error);
        std::cout << theme::step("Run 'g5kctl init' to create ~/.g5kctl/config.yaml");
        return false;
    }
    return true;
}

bool G5kCLI::require_connection() {
    if (!require_config()) {
        return false;
    }
    if (client) return true;

    auto transport = std::make_unique<CurlTransport>(config->api());
    client = std::make_unique<RestClient>(config->api(), std::move(transport), clock);
    client->check_connection();

    catalog = std::make_unique<SiteCatalog>(*client);
    jobs = std::make_unique<JobController>(*client, clock);
    deployer = std::make_unique<DeployManager>(*client, clock);
    releaser = std::make_unique<ReleaseManager>(*client, *jobs, clock);
    return true;
}

bool require_args(const G5kCLI::Args& args, size_t n, const std::string& usage) {
    if (args.size() >= n) return true;
    std::cout << theme::fail("Missing arguments.");
    std::cout << theme::step("Usage: g5kctl " + usage);
    return false;
}

void G5kCLI::print_status(const std::string& msg) {
    std::cout << theme::log(msg);
}

WaitOptions G5kCLI::job_wait() const {
    WaitOptions opts;
    if (config) {
        opts.timeout = std::chrono::seconds(config->wait().job_timeout);
        opts.poll_interval = std::chrono::seconds(config->wait().poll_interval);
    }
    opts.cb = print_status;
    return opts;
}

WaitOptions G5kCLI::deploy_wait() const {
    WaitOptions opts;
    opts.timeout = std::chrono::seconds(DEPLOY_WAIT_TIMEOUT_SECS);
    opts.poll_interval = std::chrono::seconds(DEPLOY_POLL_SECS);
    if (config) {
        opts.timeout = std::chrono::seconds(config->wait().deploy_timeout);
        opts.poll_interval = std::chrono::seconds(config->wait().poll_interval);
    }
    opts.cb = print_status;
    return opts;
}

int G5kCLI::run(const Args& args) {
    if (args.empty()) {
        print_help();
        return 1;
    }

    auto it = commands_.find(args[0]);
    if (it == commands_.end()) {
        std::cout << theme::fail("Unknown command: " + args[0]);
        std::cout << theme::step("Run 'g5kctl --help' for available commands.");
        return 1;
    }

    Args rest(args.begin() + 1, args.end());
    try {
        return it->second.handler(*this, rest);
    } catch (const DeploymentFailedError& e) {
        std::cout << theme::fail(e.what());
        for (const auto& [node, state] : e.failures()) {
            std::cout << theme::kv(node, state);
        }
        return 1;
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}

void G5kCLI::print_help() const {
    std::vector<std::pair<std::string, std::vector<std::string>>> categories = {
        {"Platform", {"sites", "clusters", "nodes", "switches", "environments"}},
        {"Jobs",     {"compile", "reserve", "wait", "jobs", "release", "release-all"}},
        {"Deploy",   {"deploy", "deployments"}},
        {"Setup",    {"init"}},
    };

    std::cout << theme::section("Usage");
    for (const auto& [cat_name, cmd_names] : categories) {
        std::cout << theme::color::ORANGE << theme::color::BOLD
                  << "  " << cat_name << theme::color::RESET << "\n";

        for (const auto& name : cmd_names) {
            auto it = commands_.find(name);
            if (it == commands_.end()) continue;
            std::cout << theme::color::BLUE
                      << fmt::format("    {:<34}", it->second.usage)
                      << theme::color::RESET
                      << theme::color::DIM
                      << it->second.help
                      << theme::color::RESET << "\n";
        }
        std::cout << "\n";
    }
    std::cout << theme::color::DIM
              << "    g5kctl --version      Show version\n"
              << "    g5kctl --help         Show this help"
              << theme::color::RESET << "\n\n";
}
