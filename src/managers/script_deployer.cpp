#include "script_deployer.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <transfer/remote_path.hpp>
#include <transfer/transfer_engine.hpp>
#include <fmt/format.h>
#include <fstream>

namespace fs = std::filesystem;

std::map<std::string, std::string> script_environment(const HostProfile& profile, int actual_port,
                                                      const std::optional<fs::path>& key_path) {
    std::map<std::string, std::string> env = {
        {"SSH_PORT", std::to_string(profile.port)},
        {"ACTUAL_PORT", std::to_string(actual_port)},
        {"ADMIN_USER", profile.user},
        {"SSH_KEY_PATH", ""},
        {"SSH_PUBLIC_KEY", ""},
    };
    if (!key_path) return env;

    std::string base = key_path->string();
    const std::string pub_suffix = ".pub";
    if (base.size() > pub_suffix.size() &&
        base.compare(base.size() - pub_suffix.size(), pub_suffix.size(), pub_suffix) == 0) {
        base.erase(base.size() - pub_suffix.size());
    }
    env["SSH_KEY_PATH"] = base;

    std::ifstream pub(base + pub_suffix);
    if (pub) {
        env["SSH_PUBLIC_KEY"] = std::string((std::istreambuf_iterator<char>(pub)),
                                           std::istreambuf_iterator<char>());
    }
    return env;
}

std::string build_exec_command(const std::string& shell, const std::string& remote_path,
                               const std::vector<std::string>& args, bool exit_on_error) {
    std::string path = shell_quote(remote_path);
    std::string invoke = shell + (exit_on_error ? " -e " : " ") + path;
    if (!args.empty()) invoke += " " + shell_join(args);
    return fmt::format("cd ~ && chmod +x {0} && {1} ; rc=$?; rm -f {0}; exit $rc", path, invoke);
}

ScriptDeployer::ScriptDeployer(RemoteHost& host, Logger& logger, ReadinessPoller& poller)
    : host_(host), logger_(logger), poller_(poller) {
}

Result<std::string> ScriptDeployer::upload(const fs::path& local_script) {
    if (!fs::is_regular_file(local_script)) {
        return Result<std::string>::Err("Script not found: " + local_script.string(),
                                        ErrorKind::PathNotFound);
    }

    auto rfs = open_remote_fs(host_, logger_);
    if (rfs.is_err()) return Result<std::string>::Err(rfs.error, rfs.kind);
    RemoteFs& remote = *rfs.value;

    auto home = remote.home();
    if (home.is_err()) return home;

    std::string dir = remote_join(home.value, REMOTE_WORK_DIR);
    auto made = remote.mkdir_p(dir);
    if (made.is_err()) return Result<std::string>::Err(made.error, made.kind);

    std::string target = remote_join(dir, local_script.filename().string());
    auto sent = remote.upload(local_script, target);
    if (sent.is_err()) {
        // A backend may have left part of the script under its real name
        remove_artifact(target);
        return Result<std::string>::Err(sent.error, sent.kind);
    }

    logger_.debug(fmt::format("Uploaded {} to {} via {}", local_script.string(), target,
                              remote.backend()));
    return Result<std::string>::Ok(target);
}

std::string ScriptDeployer::detect_shell() {
    auto r = run_command(host_, SHELL_PROBE_CMD, "", SHELL_PROBE_TIMEOUT_SECS);
    std::string out = r.stdout_data;
    trim(out);
    if (r.success() && out == "sh") return "sh";
    return "bash";
}

void ScriptDeployer::remove_artifact(const std::string& remote_path) {
    auto r = run_command(host_, "rm -f " + shell_quote(remote_path), "", SHELL_PROBE_TIMEOUT_SECS);
    if (r.failed()) {
        logger_.warn(fmt::format("Could not remove {}: {}", remote_path,
                                 r.stderr_data.empty() ? "connection lost" : r.stderr_data));
    }
}

Result<int> ScriptDeployer::deploy_and_run(const DeployRequest& request) {
    std::string name = request.local_script.filename().string();

    logger_.progress(fmt::format("Uploading {} to server...", name));
    auto uploaded = upload(request.local_script);
    if (uploaded.is_err()) {
        logger_.error(fmt::format("Upload of {} failed: {}", name, uploaded.error));
        return Result<int>::Err(uploaded.error, uploaded.kind);
    }
    logger_.success("Script uploaded successfully");

    std::string shell = detect_shell();
    logger_.debug(fmt::format("Remote shell: {}", shell));

    ChannelRequest channel;
    channel.command = build_exec_command(shell, uploaded.value, request.args, request.exit_on_error);
    channel.pty = request.tty;
    channel.env = request.env;

    MuxOptions opts;
    opts.interactive = request.tty;
    opts.raw_terminal = request.tty;

    logger_.progress(fmt::format("Executing {}...", name));
    ChannelMultiplexer mux(logger_, poller_, request.alias, name);
    if (sink_) mux.set_line_sink(sink_);
    auto result = mux.run(host_, channel, opts);

    if (result.is_err()) {
        // The wrapper never ran to its rm; clean up here
        logger_.error(fmt::format("{} did not complete: {}", name, result.error));
        remove_artifact(uploaded.value);
        return result;
    }

    if (result.value == 0) {
        logger_.success(fmt::format("Script executed successfully: {}", name));
    } else {
        logger_.error(fmt::format("Script execution failed: {} (exit {})", name, result.value));
    }
    return result;
}
