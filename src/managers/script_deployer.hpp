#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <core/logger.hpp>
#include <core/types.hpp>
#include <ssh/channel_multiplexer.hpp>
#include <ssh/poller.hpp>
#include <ssh/remote_host.hpp>

struct DeployRequest {
    std::filesystem::path local_script;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
    bool tty = false;
    bool exit_on_error = true;
    std::string alias;
};

// Variables every script receives: SSH_PORT, ACTUAL_PORT, ADMIN_USER,
// SSH_KEY_PATH and SSH_PUBLIC_KEY (empty when there is no key).
std::map<std::string, std::string> script_environment(const HostProfile& profile, int actual_port,
                                                      const std::optional<std::filesystem::path>& key_path);

// cd ~, chmod +x, run through shell, remove the file, exit with the
// script's own status.
std::string build_exec_command(const std::string& shell, const std::string& remote_path,
                               const std::vector<std::string>& args, bool exit_on_error);

// Upload -> detect shell -> execute -> clean up, on one host session.
class ScriptDeployer {
public:
    ScriptDeployer(RemoteHost& host, Logger& logger, ReadinessPoller& poller);

    // Captured-mode line handler (default: print to stdout/stderr).
    void set_line_sink(LineSink sink) { sink_ = std::move(sink); }

    // Returns the script's exit status. Errors are for failures around
    // the script (upload, channel, interrupt), never for its exit code.
    Result<int> deploy_and_run(const DeployRequest& request);

    // Copy the script under ~/.fleetsh_scripts. Returns the remote path.
    Result<std::string> upload(const std::filesystem::path& local_script);

    // "bash" unless the host only has a plain sh.
    std::string detect_shell();

private:
    RemoteHost& host_;
    Logger& logger_;
    ReadinessPoller& poller_;
    LineSink sink_;

    void remove_artifact(const std::string& remote_path);
};
