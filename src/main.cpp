#include <iostream>
#include <vector>
#include <string>
#include "cli/hostmux_cli.hpp"
#include "cli/theme.hpp"

void print_usage(const HostmuxCLI& cli) {
    std::cout << theme::banner();
    cli.print_help();
    std::cout << theme::color::DIM
              << "    Targets are user@host or user@host:port. Commands that take an\n"
              << "    optional target fall back to the last connected one.\n\n"
              << "    hostmux --version                  Show version\n"
              << "    hostmux --help                     Show this help"
              << theme::color::RESET << "\n\n";
}

int main(int argc, char** argv) {
    try {
        HostmuxCLI cli;

        if (argc == 1) {
            print_usage(cli);
            return 1;
        }

        std::string cmd = argv[1];
        if (cmd == "--version") {
            std::cout << theme::color::BROWN << theme::color::BOLD << "hostmux"
                      << theme::color::RESET << theme::color::DIM
                      << " version " << theme::VERSION << theme::color::RESET << "\n";
            return 0;
        }
        if (cmd == "--help" || cmd == "help") {
            print_usage(cli);
            return 0;
        }

        std::vector<std::string> args(argv + 2, argv + argc);
        return cli.execute_command(cmd, args);
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
