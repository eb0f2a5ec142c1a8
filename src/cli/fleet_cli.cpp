#include "fleet_cli.hpp"
#include "preflight.hpp"
#include "theme.hpp"
#include <ssh/connection_manager.hpp>
#include <iostream>
#include <fmt/format.h>

namespace fs = std::filesystem;

static const std::string kSuccessPrefix = "SUCCESS: ";
static const std::string kProgressPrefix = "PROGRESS: ";

static bool starts_with(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

// Console echo for the logging context; stderr so captured script output
// on stdout stays clean.
static void themed_console(LogLevel level, const std::string& msg) {
    switch (level) {
    case LogLevel::Error:
        std::cerr << theme::fail(msg);
        break;
    case LogLevel::Warn:
        std::cerr << theme::warn(msg);
        break;
    default:
        if (starts_with(msg, kSuccessPrefix))
            std::cerr << theme::ok(msg.substr(kSuccessPrefix.size()));
        else if (starts_with(msg, kProgressPrefix))
            std::cerr << theme::step(msg.substr(kProgressPrefix.size()));
        else
            std::cerr << theme::info(msg);
        break;
    }
}

FleetCLI::FleetCLI(fs::path config_path)
    : config_path_(std::move(config_path)),
      logger_(std::make_unique<Logger>(Logger::disabled())),
      poller_(make_default_poller()) {
    logger_->set_console(themed_console);
}

void FleetCLI::add_command(const std::string& name, CommandHandler handler,
                           const std::string& usage, const std::string& help) {
    if (!commands_.count(name)) order_.push_back(name);
    commands_[name] = {std::move(handler), usage, help};
}

int FleetCLI::execute(const std::string& command, std::vector<std::string> args) {
    auto it = commands_.find(command);
    if (it == commands_.end()) {
        std::cout << theme::fail("Unknown command: " + command);
        std::cout << theme::step("Run 'fleetsh --help' for available commands.");
        return 1;
    }

    if (take_flag(args, "--help") || take_flag(args, "-h")) {
        std::cout << theme::section("Usage");
        std::cout << theme::kv("", "fleetsh " + it->second.usage);
        std::cout << theme::kv("", it->second.help) << "\n";
        return 0;
    }

    return it->second.handler(*this, args);
}

void FleetCLI::print_help() const {
    std::cout << theme::section("Commands");
    for (const auto& name : order_) {
        const auto& cmd = commands_.at(name);
        std::cout << theme::color::SLATE
                  << fmt::format("    {:<44}", cmd.usage)
                  << theme::color::RESET
                  << theme::color::DIM << cmd.help
                  << theme::color::RESET << "\n";
    }
    std::cout << "\n" << theme::color::DIM
              << "    fleetsh --config <path> <command>   Use another config file\n"
              << "    fleetsh --version                   Show version\n"
              << "    fleetsh --help                      Show this help"
              << theme::color::RESET << "\n\n";
}

bool FleetCLI::require_config() {
    if (config_) return true;

    auto loaded = Config::load(config_path_);
    if (loaded.is_err()) {
        std::cout << theme::fail(loaded.error);
        if (loaded.kind == ErrorKind::ConfigMissing && !config_exists(config_path_)) {
            std::cout << theme::step("Run 'fleetsh init' to write a starter config.");
        }
        return false;
    }
    config_ = std::move(loaded.value);
    for (const auto& w : config_->warnings()) {
        std::cout << theme::warn(w);
    }
    init_logger();
    return true;
}

bool FleetCLI::require_ready(bool needs_scripts) {
    auto issues = run_preflight_checks(config_path_, needs_scripts);
    if (!issues.empty()) {
        for (const auto& issue : issues) {
            std::cout << theme::fail(issue.message);
            std::cout << theme::step(issue.fix);
        }
        return false;
    }
    return require_config();
}

void FleetCLI::init_logger() {
    logger_ = std::make_unique<Logger>(config_->settings());
    logger_->set_console(themed_console);
}

std::optional<HostContext> FleetCLI::require_host(const std::string& alias) {
    auto found = config_->find(alias);
    if (found.is_err()) {
        logger_->error(found.error);
        return std::nullopt;
    }
    HostContext ctx;
    ctx.alias = alias;
    ctx.profile = found.value;
    ctx.key_path = config_->keyfile_for(found.value);
    if (ctx.key_path) {
        logger_->debug("Using key file " + ctx.key_path->string());
    }
    return ctx;
}

Result<ConnectedHost> FleetCLI::connect(const HostContext& host, std::optional<int> forced_port) {
    ConnectionManager manager(*logger_);

    int port = 0;
    if (forced_port) {
        port = *forced_port;
    } else {
        auto resolved = manager.resolve_port(host.profile);
        if (resolved.is_err()) {
            return Result<ConnectedHost>::Err(resolved.error, resolved.kind);
        }
        port = resolved.value;
    }

    auto target = ConnectionManager::target_for(host.profile, port, host.key_path,
                                                config_->settings().connect_timeout);
    auto session = manager.connect(target);
    if (session.is_err()) {
        return Result<ConnectedHost>::Err(session.error, session.kind);
    }
    logger_->success(fmt::format("SSH connection established to {}:{}", host.profile.host, port));

    ConnectedHost connected;
    connected.host = std::move(session.value);
    connected.port = port;
    return Result<ConnectedHost>::Ok(std::move(connected));
}

std::optional<int> FleetCLI::run_if_hooked(const std::string& operation, const HostContext& host,
                                           const std::vector<std::string>& args) {
    OperationStrategy strategy = resolve_strategy(config_->settings(), operation);
    const auto* hook = std::get_if<ExternalHook>(&strategy);
    if (!hook) return std::nullopt;

    logger_->info(fmt::format("Delegating {} to {}", operation, hook->path.string()));
    auto env = hook_environment(host.profile, host.profile.port, host.alias, host.key_path);
    auto rc = run_hook(*hook, args, env);
    if (rc.is_err()) {
        logger_->error(rc.error);
        return 1;
    }
    if (rc.value != 0) {
        logger_->error(fmt::format("Hook for {} exited with {}", operation, rc.value));
    }
    return rc.value;
}

// ── Argument helpers ────────────────────────────────────

bool take_flag(std::vector<std::string>& args, const std::string& flag) {
    for (auto it = args.begin(); it != args.end(); ++it) {
        if (*it == "--") break;
        if (*it == flag) {
            args.erase(it);
            return true;
        }
    }
    return false;
}

std::optional<std::string> take_option(std::vector<std::string>& args, const std::string& name) {
    for (size_t i = 0; i < args.size(); i++) {
        if (args[i] == "--") break;
        if (args[i] != name) continue;
        std::string value;
        if (i + 1 < args.size() && args[i + 1] != "--") {
            value = args[i + 1];
            args.erase(args.begin() + i + 1);
        }
        args.erase(args.begin() + i);
        return value;
    }
    return std::nullopt;
}

std::optional<std::vector<std::string>> take_passthrough(std::vector<std::string>& args) {
    for (size_t i = 0; i < args.size(); i++) {
        if (args[i] == "--") {
            std::vector<std::string> rest(args.begin() + i + 1, args.end());
            args.erase(args.begin() + i, args.end());
            return rest;
        }
    }
    return std::nullopt;
}
