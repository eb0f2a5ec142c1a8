#include "../fleet_cli.hpp"
#include "../theme.hpp"
#include <iostream>
#include <fmt/format.h>
#include <core/utils.hpp>
#include <managers/host_tools.hpp>
#include <platform/platform.hpp>
#include <platform/terminal.hpp>
#include <ssh/channel_multiplexer.hpp>
#include <ssh/connection_manager.hpp>

static const char* auth_probe_name(AuthProbe auth) {
    switch (auth) {
    case AuthProbe::Key:      return "SSH key";
    case AuthProbe::Password: return "password";
    case AuthProbe::Unknown:  return "unknown";
    }
    return "unknown";
}

static int do_status(FleetCLI& cli, std::vector<std::string>& args) {
    auto port_arg = take_option(args, "--port");
    if (args.empty()) {
        std::cout << theme::fail("Usage: fleetsh status <alias> [--port N]");
        return 1;
    }
    if (!cli.require_ready(false)) return 1;
    auto host = cli.require_host(args[0]);
    if (!host) return 1;
    if (auto rc = cli.run_if_hooked("status", *host, {args.begin() + 1, args.end()})) return *rc;

    Logger& log = cli.logger();
    int port = 0;
    if (port_arg) {
        port = safe_stoi(*port_arg, -1);
        if (port < 1 || port > 65535) {
            log.error("Invalid port: " + *port_arg);
            return 1;
        }
    } else {
        ConnectionManager manager(log);
        auto resolved = manager.resolve_port(host->profile);
        port = resolved.is_ok() ? resolved.value : host->profile.port;
    }

    log.info(fmt::format("Checking status of {} ({}:{})", host->alias, host->profile.host, port));
    auto status = check_host_status(host->profile, port, host->key_path,
                                    cli.config().settings().connect_timeout, log);

    std::cout << theme::section("Status: " + host->alias);
    std::string where = fmt::format("{}@{}", host->profile.user, host->profile.host);
    if (!status.ip.empty() && status.ip != host->profile.host) where += " (" + status.ip + ")";
    std::cout << theme::kv("Host", where);
    std::cout << theme::kv("Port", std::to_string(port));
    if (!status.reachable) {
        std::cout << theme::kv("Reachable", theme::red("no"));
        std::cout << "\n";
        log.error(fmt::format("Port {} not reachable on {}", port, host->profile.host));
        return 1;
    }
    std::cout << theme::kv("Reachable", theme::green("yes"));
    std::cout << theme::kv("Auth", auth_probe_name(status.auth));
    for (const auto& line : status.system_info) {
        std::cout << theme::kv("", line);
    }
    std::cout << "\n";
    return 0;
}

static int do_login(FleetCLI& cli, std::vector<std::string>& args) {
    if (args.empty()) {
        std::cout << theme::fail("Usage: fleetsh login <alias>");
        return 1;
    }
    if (!cli.require_ready(false)) return 1;
    auto host = cli.require_host(args[0]);
    if (!host) return 1;
    if (auto rc = cli.run_if_hooked("login", *host, {args.begin() + 1, args.end()})) return *rc;

    auto connected = cli.connect(*host);
    if (connected.is_err()) {
        cli.logger().error("SSH connection failed: " + connected.error);
        return 1;
    }

    ChannelMultiplexer mux(cli.logger(), cli.poller(), host->alias, "login");
    ChannelRequest request;
    request.pty = true;
    MuxOptions opts;
    opts.interactive = true;
    opts.raw_terminal = platform::stdin_is_tty();
    opts.log_lines = false;

    auto rc = mux.run(*connected.value.host, request, opts);
    if (rc.is_err()) {
        if (rc.kind == ErrorKind::Cancelled) {
            std::cout << "\n" << theme::dim("    Session interrupted.") << "\n";
            return 130;
        }
        cli.logger().error(rc.error);
        return 1;
    }
    cli.logger().info(fmt::format("Session to {} closed (exit {})", host->alias, rc.value));
    return rc.value;
}

static int do_reset_hostkey(FleetCLI& cli, std::vector<std::string>& args) {
    if (args.empty()) {
        std::cout << theme::fail("Usage: fleetsh reset-hostkey <alias>");
        return 1;
    }
    if (!cli.require_config()) return 1;
    auto host = cli.require_host(args[0]);
    if (!host) return 1;

    auto known_hosts = platform::home_dir() / ".ssh" / "known_hosts";
    auto removed = remove_known_host(known_hosts, host->profile.host, host->profile.port);
    if (removed.is_err()) {
        cli.logger().error(removed.error);
        return 1;
    }
    if (removed.value == 0) {
        cli.logger().info("No known_hosts entries for " + host->profile.host);
    } else {
        cli.logger().success(fmt::format("Removed {} known_hosts entr{} for {}", removed.value,
                                         removed.value == 1 ? "y" : "ies", host->profile.host));
    }
    return 0;
}

void register_host_commands(FleetCLI& cli) {
    cli.add_command("status", do_status, "status <alias> [--port N]",
                    "Reachability, working credentials and uptime");
    cli.add_command("login", do_login, "login <alias>", "Interactive shell on the host");
    cli.add_command("reset-hostkey", do_reset_hostkey, "reset-hostkey <alias>",
                    "Forget the host's key in ~/.ssh/known_hosts");
}
