#include "../fleet_cli.hpp"
#include "../theme.hpp"
#include <iostream>
#include <fmt/format.h>
#include <core/constants.hpp>
#include <core/utils.hpp>

static int do_logs(FleetCLI& cli, std::vector<std::string>& args) {
    if (!cli.require_config()) return 1;
    std::string type = args.size() > 0 ? args[0] : "main";
    int lines = args.size() > 1 ? safe_stoi(args[1], -1) : DEFAULT_LOG_TAIL_LINES;
    if (lines < 0) {
        std::cout << theme::fail("Line count must be a number: " + args[1]);
        return 1;
    }

    auto path = log_file_path(cli.config().settings(), type);
    if (!path) {
        std::cout << theme::fail("Unknown log type: " + type);
        std::cout << theme::step("Use main, error or remote.");
        return 1;
    }

    auto text = tail_log(*path, lines);
    if (text.is_err()) {
        std::cout << theme::fail(text.error);
        return 1;
    }
    std::cout << theme::section(fmt::format("{} (last {} lines)", path->filename().string(), lines));
    std::cout << text.value;
    if (!text.value.empty() && text.value.back() != '\n') std::cout << "\n";
    return 0;
}

static int do_clear_logs(FleetCLI& cli, std::vector<std::string>& args) {
    if (!cli.require_config()) return 1;
    std::string type = args.empty() ? "all" : args[0];

    auto cleared = clear_logs(cli.config().settings(), type);
    if (cleared.is_err()) {
        std::cout << theme::fail(cleared.error);
        return 1;
    }
    std::cout << theme::ok(fmt::format("Cleared {} log file(s)", cleared.value));
    return 0;
}

void register_log_commands(FleetCLI& cli) {
    cli.add_command("logs", do_logs, "logs [main|error|remote] [lines]",
                    "Show the tail of a log file (default main, 50 lines)");
    cli.add_command("clear-logs", do_clear_logs, "clear-logs [main|error|remote|all]",
                    "Truncate log files (all also removes rotations)");
}
