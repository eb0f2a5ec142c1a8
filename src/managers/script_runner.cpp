#include "script_runner.hpp"
#include "script_deployer.hpp"
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <algorithm>

namespace fs = std::filesystem;

ScriptRunner::ScriptRunner(Logger& logger, ReadinessPoller& poller, HostConnector connect,
                           fs::path scripts_dir, Sleeper sleeper)
    : logger_(logger), poller_(poller), connect_(std::move(connect)),
      scripts_dir_(std::move(scripts_dir)), sleeper_(std::move(sleeper)) {
    if (!sleeper_) {
        sleeper_ = [](int secs) { platform::sleep_ms(secs * 1000); };
    }
}

std::vector<std::string> ScriptRunner::available_scripts() const {
    std::vector<std::string> names;
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(scripts_dir_, ec)) {
        if (entry.path().extension() == ".sh" && entry.is_regular_file(ec)) {
            names.push_back(entry.path().filename().string());
        }
    }
    std::sort(names.begin(), names.end());
    return names;
}

Result<int> ScriptRunner::run_one(const HostProfile& profile, const std::string& alias,
                                  const std::string& script,
                                  const std::optional<std::vector<std::string>>& args_override,
                                  const ScriptRunOptions& opts) {
    fs::path local = scripts_dir_ / script;
    if (!fs::is_regular_file(local)) {
        logger_.error("Script not found: " + local.string());
        return Result<int>::Err("Script not found: " + local.string(), ErrorKind::PathNotFound);
    }

    auto connected = connect_();
    if (connected.is_err()) {
        logger_.error("SSH connection failed: " + connected.error);
        return Result<int>::Err(connected.error, connected.kind);
    }

    DeployRequest request;
    request.local_script = local;
    request.args = args_override ? *args_override : profile.args_for(script);
    request.env = script_environment(profile, connected.value.port, opts.key_path);
    request.tty = opts.tty;
    request.exit_on_error = opts.exit_on_error;
    request.alias = alias;

    ScriptDeployer deployer(*connected.value.host, logger_, poller_);
    if (sink_) deployer.set_line_sink(sink_);
    // The session closes when connected goes out of scope
    return deployer.deploy_and_run(request);
}

Result<int> ScriptRunner::run_all(const HostProfile& profile, const std::string& alias,
                                  const ScriptRunOptions& opts) {
    if (profile.scripts.empty()) {
        logger_.warn("No scripts defined for host-alias: " + alias);
        return Result<int>::Ok(0);
    }

    size_t total = profile.scripts.size();
    for (size_t i = 0; i < total; i++) {
        const std::string& script = profile.scripts[i];
        logger_.info(fmt::format("[{}/{}] Processing: {}", i + 1, total, script));

        auto rc = run_one(profile, alias, script, std::nullopt, opts);
        if (rc.is_err()) return rc;
        if (rc.value != 0) {
            logger_.error(fmt::format("Stopping: {} exited with {}", script, rc.value));
            return rc;
        }

        if (i + 1 < total && opts.delay_secs > 0) {
            logger_.info(fmt::format("Waiting {} seconds before next script...", opts.delay_secs));
            sleeper_(opts.delay_secs);
        }
    }

    logger_.success(fmt::format("Script execution completed for {}", alias));
    return Result<int>::Ok(0);
}
