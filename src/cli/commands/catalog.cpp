#include "../g5k_cli.hpp"
#include "../theme.hpp"
#include <core/config.hpp>
#include <algorithm>
#include <iostream>
#include <fmt/format.h>

static int do_sites(G5kCLI& cli, const G5kCLI::Args&) {
    if (!cli.require_connection()) return 1;
    std::cout << theme::section("Sites");
    for (const auto& s : cli.catalog->sites()) {
        std::cout << theme::kv(s.uid, s.description.empty() ? s.name : s.description);
    }
    std::cout << "\n";
    return 0;
}

static int do_clusters(G5kCLI& cli, const G5kCLI::Args& args) {
    if (!require_args(args, 1, "clusters <site>")) return 1;
    if (!cli.require_connection()) return 1;
    std::cout << theme::section("Clusters on " + args[0]);
    for (const auto& c : cli.catalog->clusters(args[0])) {
        std::string detail = c.model;
        if (!c.queue.empty()) detail += theme::dim(" (" + c.queue + ")");
        std::cout << theme::kv(c.uid, detail);
    }
    std::cout << "\n";
    return 0;
}

static int do_nodes(G5kCLI& cli, const G5kCLI::Args& args) {
    if (!require_args(args, 1, "nodes <site>")) return 1;
    if (!cli.require_connection()) return 1;

    auto statuses = cli.catalog->nodes_status(args[0]);
    if (statuses.empty()) {
        std::cout << theme::dim("  No nodes reported.") << "\n";
        return 0;
    }

    size_t w = 4;
    for (const auto& [name, st] : statuses) w = std::max(w, name.size());

    std::cout << "\n" << theme::color::DIM
              << fmt::format("  {:<{}} {:<12} {}\n", "NODE", w + 2, "SOFT", "HARD")
              << theme::color::RESET;
    for (const auto& [name, st] : statuses) {
        std::string hard = st.dead() ? theme::red(st.hard) : st.hard;
        std::cout << fmt::format("  {:<{}} {:<12} ", name, w + 2, st.soft) << hard << "\n";
    }
    std::cout << "\n";
    return 0;
}

static int do_switches(G5kCLI& cli, const G5kCLI::Args& args) {
    if (!require_args(args, 1, "switches <site> [switch]")) return 1;
    if (!cli.require_connection()) return 1;

    std::vector<SwitchInfo> list;
    if (args.size() >= 2) {
        list.push_back(cli.catalog->switch_info(args[0], args[1]));
    } else {
        list = cli.catalog->switches(args[0]);
    }

    std::cout << theme::section("Switches on " + args[0]);
    for (const auto& sw : list) {
        std::cout << theme::kv(sw.uid, fmt::format("{} node(s)", sw.nodes.size()));
        if (args.size() >= 2) {
            for (const auto& n : sw.nodes) std::cout << theme::dim("      " + n) << "\n";
        }
    }
    std::cout << "\n";
    return 0;
}

static int do_environments(G5kCLI& cli, const G5kCLI::Args& args) {
    if (!require_args(args, 1, "environments <site>")) return 1;
    if (!cli.require_connection()) return 1;
    std::cout << theme::section("Environments on " + args[0]);
    for (const auto& e : cli.catalog->environments(args[0])) {
        std::cout << theme::kv(e.uid, e.description);
    }
    std::cout << "\n";
    return 0;
}

static int do_init(G5kCLI&, const G5kCLI::Args&) {
    if (global_config_exists()) {
        std::cout << theme::info("Config already exists at " + get_global_config_path().string());
        return 0;
    }
    auto result = create_default_global_config();
    if (result.is_err()) {
        std::cout << theme::fail(result.error);
        return 1;
    }
    std::cout << theme::ok("Wrote " + get_global_config_path().string());
    return 0;
}

void register_catalog_commands(G5kCLI& cli) {
    cli.add_command("sites", do_sites, "sites", "List sites");
    cli.add_command("clusters", do_clusters, "clusters <site>", "List clusters of a site");
    cli.add_command("nodes", do_nodes, "nodes <site>", "Node states of a site");
    cli.add_command("switches", do_switches, "switches <site> [switch]", "Switches and cabled nodes");
    cli.add_command("environments", do_environments, "environments <site>", "Deployable images");
    cli.add_command("init", do_init, "init", "Create ~/.g5kctl/config.yaml");
}
