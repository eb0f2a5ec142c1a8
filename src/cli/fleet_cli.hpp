#pragma once

#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <core/config.hpp>
#include <core/logger.hpp>
#include <managers/operation_strategy.hpp>
#include <managers/script_runner.hpp>
#include <ssh/poller.hpp>

// A profile picked by alias, with the key file that goes with it.
struct HostContext {
    std::string alias;
    HostProfile profile;
    std::optional<std::filesystem::path> key_path;
};

// One fleetsh invocation: the loaded config, the logging context and the
// command table. Owns everything it creates; nothing outlives it.
class FleetCLI {
public:
    using CommandHandler = std::function<int(FleetCLI&, std::vector<std::string>&)>;

    explicit FleetCLI(std::filesystem::path config_path);

    void add_command(const std::string& name, CommandHandler handler,
                     const std::string& usage, const std::string& help);

    // Runs a command and returns the process exit status.
    int execute(const std::string& command, std::vector<std::string> args);
    void print_help() const;
    bool has_command(const std::string& name) const { return commands_.count(name) > 0; }

    // Config only (logs, clear-logs, list-scripts).
    bool require_config();
    // Full preflight plus config and logger (everything that connects).
    bool require_ready(bool needs_scripts);

    std::optional<HostContext> require_host(const std::string& alias);

    // Resolve the port (unless forced) and open an authenticated session.
    Result<ConnectedHost> connect(const HostContext& host,
                                  std::optional<int> forced_port = std::nullopt);

    // If <hooks_dir>/<op>/hook.sh takes over this operation, run it and
    // return its exit status; nullopt means use the built-in behaviour.
    std::optional<int> run_if_hooked(const std::string& operation, const HostContext& host,
                                     const std::vector<std::string>& args);

    const std::filesystem::path& config_path() const { return config_path_; }
    const Config& config() const { return *config_; }
    Logger& logger() { return *logger_; }
    ReadinessPoller& poller() { return *poller_; }

private:
    struct Command {
        CommandHandler handler;
        std::string usage;
        std::string help;
    };

    std::filesystem::path config_path_;
    std::optional<Config> config_;
    std::unique_ptr<Logger> logger_;
    std::unique_ptr<ReadinessPoller> poller_;
    std::map<std::string, Command> commands_;
    std::vector<std::string> order_;

    void init_logger();
};

// ── Argument helpers ────────────────────────────────────

// Remove `flag` from args; true if it was there.
bool take_flag(std::vector<std::string>& args, const std::string& flag);

// Remove "name value" from args and return value. A missing value after
// the name gives an empty string.
std::optional<std::string> take_option(std::vector<std::string>& args, const std::string& name);

// Split at "--": everything after it is returned and removed from args.
std::optional<std::vector<std::string>> take_passthrough(std::vector<std::string>& args);

// Command registration (cli/commands/*.cpp)
void register_host_commands(FleetCLI& cli);
void register_script_commands(FleetCLI& cli);
void register_reboot_commands(FleetCLI& cli);
void register_transfer_commands(FleetCLI& cli);
void register_log_commands(FleetCLI& cli);
void register_setup_commands(FleetCLI& cli);
