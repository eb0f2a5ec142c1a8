#include "../fleet_cli.hpp"
#include "../theme.hpp"
#include <iostream>
#include <fmt/format.h>
#include <core/utils.hpp>
#include <platform/terminal.hpp>

namespace fs = std::filesystem;

static ScriptRunOptions run_options(FleetCLI& cli, const HostContext& host,
                                    std::vector<std::string>& args) {
    const auto& settings = cli.config().settings();
    ScriptRunOptions opts;
    opts.tty = settings.force_tty;
    if (take_flag(args, "--tty")) opts.tty = true;
    if (take_flag(args, "--no-tty")) opts.tty = false;
    opts.exit_on_error = settings.script_exit_on_error;
    opts.delay_secs = settings.script_delay;
    opts.key_path = host.key_path;
    return opts;
}

static ScriptRunner make_runner(FleetCLI& cli, const HostContext& host) {
    HostConnector connector = [&cli, host]() { return cli.connect(host); };
    return ScriptRunner(cli.logger(), cli.poller(), connector,
                        cli.config().settings().scripts_dir);
}

static void print_available(const ScriptRunner& runner) {
    auto names = runner.available_scripts();
    if (names.empty()) {
        std::cout << theme::dim("    (no *.sh files in the scripts directory)") << "\n";
        return;
    }
    std::cout << theme::step("Available scripts:");
    for (const auto& name : names) {
        std::cout << "      " << name << "\n";
    }
}

static int do_run_scripts(FleetCLI& cli, std::vector<std::string>& args) {
    if (args.empty()) {
        std::cout << theme::fail("Usage: fleetsh run-scripts <alias> [--tty|--no-tty]");
        return 1;
    }
    if (!cli.require_ready(true)) return 1;
    auto host = cli.require_host(args[0]);
    if (!host) return 1;
    auto opts = run_options(cli, *host, args);
    if (auto rc = cli.run_if_hooked("run-scripts", *host, {args.begin() + 1, args.end()})) return *rc;

    const auto& scripts = host->profile.scripts;
    std::cout << theme::section(fmt::format("Running {} script{} on {}", scripts.size(),
                                            scripts.size() == 1 ? "" : "s", host->alias));
    std::cout << theme::kv("Host", fmt::format("{}@{}:{}", host->profile.user,
                                               host->profile.host, host->profile.port));
    std::cout << theme::kv("Scripts", scripts.empty() ? "(none)" : shell_join(scripts));
    std::cout << theme::kv("TTY", opts.tty ? "yes" : "no");
    std::cout << "\n";

    auto runner = make_runner(cli, *host);
    // The runner and deployer log every failure themselves
    auto rc = runner.run_all(host->profile, host->alias, opts);
    if (rc.is_err()) return rc.kind == ErrorKind::Cancelled ? 130 : 1;
    return rc.value;
}

static int do_run_script(FleetCLI& cli, std::vector<std::string>& args) {
    auto passthrough = take_passthrough(args);
    if (args.size() < 2) {
        std::cout << theme::fail("Usage: fleetsh run-script <alias> <script> [--tty|--no-tty] [-- args...]");
        return 1;
    }
    if (!cli.require_ready(true)) return 1;
    auto host = cli.require_host(args[0]);
    if (!host) return 1;
    auto opts = run_options(cli, *host, args);
    std::string script = args[1];

    auto runner = make_runner(cli, *host);
    auto rc = runner.run_one(host->profile, host->alias, script, passthrough, opts);
    if (rc.is_err()) {
        if (rc.kind == ErrorKind::PathNotFound) print_available(runner);
        return rc.kind == ErrorKind::Cancelled ? 130 : 1;
    }
    return rc.value;
}

static int do_list_scripts(FleetCLI& cli, std::vector<std::string>& args) {
    if (args.empty()) {
        std::cout << theme::fail("Usage: fleetsh list-scripts <alias>");
        return 1;
    }
    if (!cli.require_config()) return 1;
    auto host = cli.require_host(args[0]);
    if (!host) return 1;

    std::cout << theme::section("Scripts for " + host->alias);
    const auto& profile = host->profile;
    if (profile.scripts.empty()) {
        std::cout << theme::dim("    (none configured)") << "\n";
    }
    fs::path dir(cli.config().settings().scripts_dir);
    for (size_t i = 0; i < profile.scripts.size(); i++) {
        const auto& name = profile.scripts[i];
        const auto& script_args = profile.args_for(name);
        std::string line = fmt::format("{}. {}", i + 1, name);
        if (!script_args.empty()) line += " " + theme::dim(shell_join(script_args));
        if (!fs::is_regular_file(dir / name)) line += " " + theme::red("(missing)");
        std::cout << "    " << line << "\n";
    }
    std::cout << "\n";

    auto runner = make_runner(cli, *host);
    print_available(runner);
    std::cout << "\n";
    return 0;
}

void register_script_commands(FleetCLI& cli) {
    cli.add_command("run-scripts", do_run_scripts, "run-scripts <alias> [--tty|--no-tty]",
                    "Run the host's configured scripts in order, stop at the first failure");
    cli.add_command("run-script", do_run_script,
                    "run-script <alias> <script> [--tty|--no-tty] [-- args]",
                    "Upload and run one script");
    cli.add_command("list-scripts", do_list_scripts, "list-scripts <alias>",
                    "Configured scripts and what is in the scripts directory");
}
