#include <iostream>
#include <vector>
#include <string>
#include "cli/g5k_cli.hpp"
#include "cli/theme.hpp"

int main(int argc, char** argv) {
    try {
        G5kCLI cli;

        if (argc == 1) {
            cli.print_help();
            return 0;
        }

        std::string cmd = argv[1];
        if (cmd == "--version") {
            std::cout << theme::color::ORANGE << theme::color::BOLD << "g5kctl"
                      << theme::color::RESET << theme::color::DIM
                      << " version 0.1.0" << theme::color::RESET << "\n";
            return 0;
        } else if (cmd == "--help" || cmd == "help") {
            cli.print_help();
            return 0;
        }

        std::vector<std::string> args(argv + 1, argv + argc);
        return cli.run(args);
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
