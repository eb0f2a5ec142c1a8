#include "../fleet_cli.hpp"
#include "../theme.hpp"
#include <iostream>
#include <fmt/format.h>
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <managers/reboot_orchestrator.hpp>
#include <ssh/connection_manager.hpp>

// "--wait" alone means the default; "--wait N" takes N seconds.
static int take_wait(std::vector<std::string>& args) {
    for (size_t i = 0; i < args.size(); i++) {
        if (args[i] != "--wait") continue;
        int secs = REBOOT_DEFAULT_WAIT_SECS;
        if (i + 1 < args.size()) {
            int n = safe_stoi(args[i + 1], -1);
            if (n > 0 && std::to_string(n) == args[i + 1]) {
                secs = n;
                args.erase(args.begin() + i + 1);
            }
        }
        args.erase(args.begin() + i);
        return secs;
    }
    return 0;
}

static int do_reboot(FleetCLI& cli, std::vector<std::string>& args) {
    int wait_secs = take_wait(args);
    if (args.empty()) {
        std::cout << theme::fail("Usage: fleetsh reboot <alias> [--wait [N]]");
        return 1;
    }
    if (!cli.require_ready(false)) return 1;
    auto host = cli.require_host(args[0]);
    if (!host) return 1;
    if (auto rc = cli.run_if_hooked("reboot", *host, {args.begin() + 1, args.end()})) return *rc;

    Logger& log = cli.logger();
    ConnectionManager manager(log);
    auto port = manager.resolve_port(host->profile);
    if (port.is_err()) {
        log.error(port.error);
        return 1;
    }

    // The session only lives long enough to send the command
    RebootIssuer issue = [&]() -> Result<void> {
        auto connected = cli.connect(*host, port.value);
        if (connected.is_err()) {
            return Result<void>::Err("SSH connection failed: " + connected.error, connected.kind);
        }
        return issue_reboot(*connected.value.host, log);
    };

    SystemClock clock;
    RebootOrchestrator orchestrator(log, manager.probe(), clock);
    auto result = orchestrator.reboot(host->profile.host, port.value, issue, wait_secs);
    return result.is_ok() ? 0 : 1;
}

void register_reboot_commands(FleetCLI& cli) {
    cli.add_command("reboot", do_reboot, "reboot <alias> [--wait [N]]",
                    "Reboot the host, optionally waiting up to N seconds (180) for it");
}
