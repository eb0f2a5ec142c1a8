#pragma once

#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <core/logger.hpp>
#include <core/types.hpp>
#include <ssh/channel_multiplexer.hpp>
#include <ssh/poller.hpp>
#include <ssh/remote_host.hpp>

// A freshly connected host plus the port actually used.
struct ConnectedHost {
    std::unique_ptr<RemoteHost> host;
    int port = 22;
};

// Opens one session per script; the runner drops it when the script ends.
using HostConnector = std::function<Result<ConnectedHost>()>;

struct ScriptRunOptions {
    bool tty = false;
    bool exit_on_error = true;
    int delay_secs = 3;
    std::optional<std::filesystem::path> key_path;
};

// Runs configured scripts in order, stopping at the first failure.
class ScriptRunner {
public:
    using Sleeper = std::function<void(int secs)>;

    ScriptRunner(Logger& logger, ReadinessPoller& poller, HostConnector connect,
                 std::filesystem::path scripts_dir, Sleeper sleeper = nullptr);

    void set_line_sink(LineSink sink) { sink_ = std::move(sink); }

    // Every script in profile.scripts. Returns 0, or the exit status of the
    // first script that failed; later scripts are not attempted.
    Result<int> run_all(const HostProfile& profile, const std::string& alias,
                        const ScriptRunOptions& opts);

    // One script. args_override replaces the configured arguments.
    Result<int> run_one(const HostProfile& profile, const std::string& alias,
                        const std::string& script,
                        const std::optional<std::vector<std::string>>& args_override,
                        const ScriptRunOptions& opts);

    // *.sh files in the scripts directory, sorted.
    std::vector<std::string> available_scripts() const;

private:
    Logger& logger_;
    ReadinessPoller& poller_;
    HostConnector connect_;
    std::filesystem::path scripts_dir_;
    Sleeper sleeper_;
    LineSink sink_;
};
