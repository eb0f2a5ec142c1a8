#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include <core/config.hpp>
#include <core/types.hpp>

struct PreflightIssue {
    std::string message;
    std::string fix;
};

// Everything a host command needs, checked before any connection is made.
// Nothing is installed or created on demand except the log directory.
// Returns an empty vector if everything is good.
std::vector<PreflightIssue> run_preflight_checks(const std::filesystem::path& config_path,
                                                 bool needs_scripts);

// Individual checks (for granular use)
std::vector<PreflightIssue> check_config(const std::filesystem::path& config_path);
std::vector<PreflightIssue> check_ssh_library();
std::vector<PreflightIssue> check_log_dir(const GlobalSettings& settings);
std::vector<PreflightIssue> check_scripts_dir(const GlobalSettings& settings);
