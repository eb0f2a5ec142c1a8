#include "preflight.hpp"
#include <ssh/session.hpp>
#include <fstream>

namespace fs = std::filesystem;

std::vector<PreflightIssue> check_config(const fs::path& config_path) {
    std::vector<PreflightIssue> issues;

    if (!config_exists(config_path)) {
        issues.push_back({
            "Config not found at " + config_path.string(),
            "Run 'fleetsh init' to write a starter config, or pass --config <path>"
        });
        return issues;
    }

    auto result = Config::load(config_path);
    if (result.is_err()) {
        issues.push_back({"Failed to parse config: " + result.error,
                          "Check YAML syntax and host entries in " + config_path.string()});
    }
    return issues;
}

std::vector<PreflightIssue> check_ssh_library() {
    std::vector<PreflightIssue> issues;
    if (!ssh_library_init()) {
        issues.push_back({"libssh2 failed to initialise",
                          "Check the libssh2 and crypto libraries fleetsh was built against"});
    }
    return issues;
}

std::vector<PreflightIssue> check_log_dir(const GlobalSettings& settings) {
    std::vector<PreflightIssue> issues;
    if (!settings.enable_logging) return issues;

    fs::path dir(settings.log_dir);
    std::error_code ec;
    fs::create_directories(dir, ec);
    fs::path probe = dir / ".fleetsh-write-test";
    {
        std::ofstream out(probe, std::ios::trunc);
        if (ec || !out) {
            issues.push_back({"Log directory not writable: " + dir.string(),
                              "Fix its permissions, set settings.log_dir, or set enable_logging: false"});
            return issues;
        }
    }
    fs::remove(probe, ec);
    return issues;
}

std::vector<PreflightIssue> check_scripts_dir(const GlobalSettings& settings) {
    std::vector<PreflightIssue> issues;
    if (!fs::is_directory(settings.scripts_dir)) {
        issues.push_back({
            "Scripts directory not found: " + settings.scripts_dir,
            "Create it and add your *.sh files, or set settings.scripts_dir"
        });
    }
    return issues;
}

std::vector<PreflightIssue> run_preflight_checks(const fs::path& config_path, bool needs_scripts) {
    std::vector<PreflightIssue> all;

    // No point checking anything else without a usable config
    auto config_issues = check_config(config_path);
    all.insert(all.end(), config_issues.begin(), config_issues.end());
    if (!all.empty()) return all;

    auto ssh_issues = check_ssh_library();
    all.insert(all.end(), ssh_issues.begin(), ssh_issues.end());

    auto cfg = Config::load(config_path);
    auto log_issues = check_log_dir(cfg.value.settings());
    all.insert(all.end(), log_issues.begin(), log_issues.end());

    if (needs_scripts) {
        auto script_issues = check_scripts_dir(cfg.value.settings());
        all.insert(all.end(), script_issues.begin(), script_issues.end());
    }
    return all;
}
