#pragma once

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <api/rest_client.hpp>
#include <core/config.hpp>
#include <core/wait.hpp>
#include <managers/deploy_manager.hpp>
#include <managers/job_controller.hpp>
#include <managers/release_manager.hpp>
#include <managers/site_catalog.hpp>

class G5kCLI {
public:
    G5kCLI();

    using Args = std::vector<std::string>;
    using CommandHandler = std::function<int(G5kCLI&, const Args&)>;

    void add_command(const std::string& name, CommandHandler handler,
                     const std::string& usage, const std::string& help);

    // Dispatch argv[1..]. Returns the process exit code.
    int run(const Args& args);

    void print_help() const;

    bool require_config();

    // Build the REST client and managers on first use.
    bool require_connection();

    WaitOptions job_wait() const;
    WaitOptions deploy_wait() const;

    // Progress printer for StatusCallback parameters
    static void print_status(const std::string& msg);

    // Public state
    std::optional<Config> config;
    std::string config_error;
    SystemClock clock;
    std::unique_ptr<RestClient> client;
    std::unique_ptr<SiteCatalog> catalog;
    std::unique_ptr<JobController> jobs;
    std::unique_ptr<DeployManager> deployer;
    std::unique_ptr<ReleaseManager> releaser;

private:
    struct Command {
        CommandHandler handler;
        std::string usage;
        std::string help;
    };
    std::map<std::string, Command> commands_;
};

// Prints usage and returns false when fewer than n arguments were given.
bool require_args(const G5kCLI::Args& args, size_t n, const std::string& usage);

// Command registration, one file per group
void register_catalog_commands(G5kCLI& cli);
void register_job_commands(G5kCLI& cli);
