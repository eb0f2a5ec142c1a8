#include "../fleet_cli.hpp"
#include "../theme.hpp"
#include <iostream>
#include <fmt/format.h>
#include <core/utils.hpp>
#include <transfer/transfer_engine.hpp>

namespace fs = std::filesystem;

static void print_report(Logger& log, const TransferReport& report, const std::string& verb) {
    for (const auto& path : report.transferred) {
        std::cout << theme::ok(path);
    }
    for (const auto& path : report.skipped) {
        std::cout << theme::log("skipped " + path);
    }
    for (const auto& failure : report.failed) {
        std::cout << theme::fail(fmt::format("{}: {}", failure.first, failure.second));
    }
    if (report.ok()) {
        log.success(fmt::format("{} {} item(s)", verb, report.transferred.size()));
    } else {
        log.error(fmt::format("{} {} item(s), {} failed", verb, report.transferred.size(),
                              report.failed.size()));
    }
}

static int do_ls(FleetCLI& cli, std::vector<std::string>& args) {
    if (args.empty()) {
        std::cout << theme::fail("Usage: fleetsh ls <alias> [path]");
        return 1;
    }
    if (!cli.require_ready(false)) return 1;
    auto host = cli.require_host(args[0]);
    if (!host) return 1;
    std::string path = args.size() > 1 ? args[1] : "~";

    auto connected = cli.connect(*host);
    if (connected.is_err()) {
        cli.logger().error("SSH connection failed: " + connected.error);
        return 1;
    }
    auto remote_fs = open_remote_fs(*connected.value.host, cli.logger());
    if (remote_fs.is_err()) {
        cli.logger().error(remote_fs.error);
        return 1;
    }

    TransferEngine engine(*remote_fs.value, cli.logger());
    auto listing = engine.list(path);
    if (listing.is_err()) {
        cli.logger().error(listing.error);
        return 1;
    }

    std::cout << theme::section(fmt::format("{}:{}", host->alias, listing.value.path));
    if (listing.value.raw) {
        std::cout << listing.value.raw_text;
        if (!listing.value.raw_text.empty() && listing.value.raw_text.back() != '\n') std::cout << "\n";
        return 0;
    }
    for (const auto& entry : listing.value.entries) {
        if (entry.is_dir()) {
            std::cout << fmt::format("    {:>9}  ", "-") << theme::slate(entry.name + "/") << "\n";
        } else {
            std::cout << fmt::format("    {:>9}  {}\n", human_size(static_cast<int64_t>(entry.size)), entry.name);
        }
    }
    std::cout << "\n";
    return 0;
}

static int do_get(FleetCLI& cli, std::vector<std::string>& args) {
    bool recursive = take_flag(args, "-r");
    if (args.size() < 3) {
        std::cout << theme::fail("Usage: fleetsh get <alias> <remote>... <localdir> [-r]");
        return 1;
    }
    if (!cli.require_ready(false)) return 1;
    auto host = cli.require_host(args[0]);
    if (!host) return 1;

    fs::path local_dir(args.back());
    std::vector<std::string> remote_paths(args.begin() + 1, args.end() - 1);

    auto connected = cli.connect(*host);
    if (connected.is_err()) {
        cli.logger().error("SSH connection failed: " + connected.error);
        return 1;
    }
    auto remote_fs = open_remote_fs(*connected.value.host, cli.logger());
    if (remote_fs.is_err()) {
        cli.logger().error(remote_fs.error);
        return 1;
    }

    TransferEngine engine(*remote_fs.value, cli.logger());
    auto report = engine.download(remote_paths, local_dir, recursive);
    print_report(cli.logger(), report, "Downloaded");
    return report.ok() ? 0 : 1;
}

static int do_put(FleetCLI& cli, std::vector<std::string>& args) {
    bool recursive = take_flag(args, "-r");
    if (args.size() < 3) {
        std::cout << theme::fail("Usage: fleetsh put <alias> <local>... <remotedir> [-r]");
        return 1;
    }
    if (!cli.require_ready(false)) return 1;
    auto host = cli.require_host(args[0]);
    if (!host) return 1;

    std::string remote_dir = args.back();
    std::vector<fs::path> local_paths(args.begin() + 1, args.end() - 1);

    auto connected = cli.connect(*host);
    if (connected.is_err()) {
        cli.logger().error("SSH connection failed: " + connected.error);
        return 1;
    }
    auto remote_fs = open_remote_fs(*connected.value.host, cli.logger());
    if (remote_fs.is_err()) {
        cli.logger().error(remote_fs.error);
        return 1;
    }

    TransferEngine engine(*remote_fs.value, cli.logger());
    auto report = engine.upload(local_paths, remote_dir, recursive);
    print_report(cli.logger(), report, "Uploaded");
    return report.ok() ? 0 : 1;
}

void register_transfer_commands(FleetCLI& cli) {
    cli.add_command("ls", do_ls, "ls <alias> [path]", "List a remote directory (default ~)");
    cli.add_command("get", do_get, "get <alias> <remote>... <localdir> [-r]",
                    "Download files (and directories with -r)");
    cli.add_command("put", do_put, "put <alias> <local>... <remotedir> [-r]",
                    "Upload files (and directories with -r)");
}
