#pragma once

#include <string>
#include <optional>
#include <filesystem>
#include <map>
#include <vector>
#include "types.hpp"

namespace fs = std::filesystem;

class Config {
public:
    // Load from a YAML file (default: $FLEETSH_CONFIG or ~/.fleetsh/config.yaml)
    static Result<Config> load(const fs::path& path = get_config_path_default());

    // Parse YAML text. Relative paths in settings resolve against base_dir.
    static Result<Config> parse(const std::string& yaml_text, const fs::path& base_dir);

    // Accessors
    const GlobalSettings& settings() const { return settings_; }
    const std::vector<HostProfile>& hosts() const { return hosts_; }
    const fs::path& config_dir() const { return config_dir_; }
    const std::vector<std::string>& warnings() const { return warnings_; }

    // Look up a profile by any of its aliases.
    Result<HostProfile> find(const std::string& alias) const;

    // Key file for a profile: explicit keyfile if it exists, else
    // <keys_dir>/<alias>_key for the first alias that has one.
    std::optional<fs::path> keyfile_for(const HostProfile& profile) const;

    static fs::path get_config_path_default();

public:
    Config() = default;

private:
    GlobalSettings settings_;
    std::vector<HostProfile> hosts_;
    std::map<std::string, size_t> by_alias_;
    fs::path config_dir_;
    std::vector<std::string> warnings_;
};

// Get paths
fs::path get_config_dir();
fs::path get_config_path();

bool config_exists(const fs::path& path = get_config_path());

// Write a commented starter config (no-op if one exists)
Result<void> create_default_config(const fs::path& path = get_config_path());
