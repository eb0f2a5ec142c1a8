#include <iostream>
#include <vector>
#include <string>
#include "cli/fleet_cli.hpp"
#include "cli/theme.hpp"
#include <core/config.hpp>

static void print_usage(const FleetCLI& cli) {
    std::cout << theme::banner();
    std::cout << theme::section("Usage");
    std::cout << theme::color::SLATE << "    fleetsh "
              << theme::color::RESET << theme::color::AMBER << "[--config <path>] <command> [args]"
              << theme::color::RESET << "\n";
    cli.print_help();
}

int main(int argc, char** argv) {
    try {
        std::vector<std::string> args(argv + 1, argv + argc);

        auto config_path = Config::get_config_path_default();
        if (!args.empty() && args[0] == "--config") {
            if (args.size() < 2) {
                std::cout << theme::fail("--config needs a path.");
                return 1;
            }
            config_path = args[1];
            args.erase(args.begin(), args.begin() + 2);
        }

        FleetCLI cli(config_path);
        register_host_commands(cli);
        register_script_commands(cli);
        register_reboot_commands(cli);
        register_transfer_commands(cli);
        register_log_commands(cli);
        register_setup_commands(cli);

        if (args.empty() || args[0] == "--help" || args[0] == "help") {
            print_usage(cli);
            return args.empty() ? 1 : 0;
        }
        if (args[0] == "--version") {
            std::cout << theme::color::AMBER << theme::color::BOLD << "fleetsh"
                      << theme::color::RESET << theme::color::DIM
                      << " version " FLEETSH_VERSION << theme::color::RESET << "\n";
            return 0;
        }

        std::string cmd = args[0];
        args.erase(args.begin());
        return cli.execute(cmd, args);
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
