#include "config.hpp"
#include "utils.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <set>

namespace fs = std::filesystem;

fs::path get_config_dir() {
    return platform::home_dir() / ".fleetsh";
}

fs::path get_config_path() {
    return get_config_dir() / "config.yaml";
}

fs::path Config::get_config_path_default() {
    const char* env = std::getenv("FLEETSH_CONFIG");
    if (env && *env) return fs::path(env);
    return get_config_path();
}

bool config_exists(const fs::path& path) {
    return fs::exists(path);
}

Result<void> create_default_config(const fs::path& path) {
    // Don't overwrite existing config
    if (fs::exists(path)) {
        return Result<void>::Ok();
    }

    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);

    const char* default_config = R"(# fleetsh configuration

settings:
  log_level: INFO           # DEBUG, INFO, WARN, ERROR
  enable_logging: true
  max_log_size: 10M         # K/M/G
  max_log_files: 5
  script_exit_on_error: true
  force_tty: true
  # log_dir: logs
  # scripts_dir: scripts
  # keys_dir: ssh
  # hooks_dir: hooks

hosts:
  # - aliases: [pmx, proxmox]
  #   host: 192.168.1.10
  #   user: root
  #   port: 22
  #   keyfile: ssh/pmx_key
  #   scripts: [update.sh, harden.sh]
  #   script_args:
  #     update.sh: [--full]
  #   default_args: []
)";

    std::ofstream out(path);
    if (!out) {
        return Result<void>::Err("Failed to create config file at " + path.string());
    }
    out << default_config;
    return Result<void>::Ok();
}

// ── Parsing helpers ───────────────────────────────────────────

static std::string resolve_dir(const std::string& value, const fs::path& base,
                               const std::string& fallback) {
    if (value.empty()) return (base / fallback).string();
    fs::path p(value);
    if (value[0] == '~') {
        p = platform::home_dir() / value.substr(value.size() > 1 ? 2 : 1);
    }
    return p.is_absolute() ? p.string() : (base / p).string();
}

static bool parse_log_level(const std::string& s, LogLevel& out) {
    std::string up = s;
    std::transform(up.begin(), up.end(), up.begin(),
                   [](unsigned char c) { return std::toupper(c); });
    if (up == "DEBUG") { out = LogLevel::Debug; return true; }
    if (up == "INFO")  { out = LogLevel::Info;  return true; }
    if (up == "WARN" || up == "WARNING") { out = LogLevel::Warn; return true; }
    if (up == "ERROR") { out = LogLevel::Error; return true; }
    return false;
}

// A scalar or a sequence of scalars, as a list of non-empty strings.
static std::vector<std::string> string_list(const YAML::Node& node) {
    std::vector<std::string> out;
    if (!node) return out;
    if (node.IsScalar()) {
        // "a, b, c" shorthand
        std::string s = node.as<std::string>();
        size_t start = 0;
        while (start <= s.size()) {
            size_t comma = s.find(',', start);
            std::string item = s.substr(start, comma == std::string::npos ? std::string::npos
                                                                          : comma - start);
            trim(item);
            if (!item.empty()) out.push_back(item);
            if (comma == std::string::npos) break;
            start = comma + 1;
        }
    } else if (node.IsSequence()) {
        for (const auto& item : node) {
            std::string s = item.as<std::string>("");
            trim(s);
            if (!s.empty()) out.push_back(s);
        }
    }
    return out;
}

static GlobalSettings parse_settings(const YAML::Node& node, const fs::path& base,
                                     std::vector<std::string>& warnings) {
    GlobalSettings s;
    std::string log_dir, scripts_dir, keys_dir, hooks_dir;

    if (node && node.IsMap()) {
        for (const auto& kv : node) {
            std::string key = kv.first.as<std::string>();
            const YAML::Node& v = kv.second;
            if (key == "log_dir") {
                log_dir = v.as<std::string>("");
            } else if (key == "log_level") {
                if (!parse_log_level(v.as<std::string>(""), s.log_level))
                    warnings.push_back("Invalid log_level: " + v.as<std::string>(""));
            } else if (key == "enable_logging") {
                s.enable_logging = v.as<bool>(true);
            } else if (key == "max_log_size") {
                s.max_log_size = v.as<std::string>("10M");
            } else if (key == "max_log_files") {
                s.max_log_files = std::max(1, v.as<int>(5));
            } else if (key == "script_exit_on_error") {
                s.script_exit_on_error = v.as<bool>(true);
            } else if (key == "force_tty") {
                s.force_tty = v.as<bool>(true);
            } else if (key == "scripts_dir") {
                scripts_dir = v.as<std::string>("");
            } else if (key == "keys_dir") {
                keys_dir = v.as<std::string>("");
            } else if (key == "hooks_dir") {
                hooks_dir = v.as<std::string>("");
            } else if (key == "connect_timeout") {
                s.connect_timeout = std::max(1, v.as<int>(5));
            } else if (key == "script_delay") {
                s.script_delay = std::max(0, v.as<int>(3));
            } else {
                warnings.push_back("Unknown settings key: " + key);
            }
        }
    }

    s.log_dir = resolve_dir(log_dir, base, "logs");
    s.scripts_dir = resolve_dir(scripts_dir, base, "scripts");
    s.keys_dir = resolve_dir(keys_dir, base, "ssh");
    s.hooks_dir = resolve_dir(hooks_dir, base, "hooks");
    return s;
}

static Result<HostProfile> parse_host(const YAML::Node& node, size_t index) {
    HostProfile p;
    p.aliases = string_list(node["aliases"]);
    if (p.aliases.empty()) p.aliases = string_list(node["alias"]);
    if (p.aliases.empty()) {
        return Result<HostProfile>::Err(
            fmt::format("hosts[{}]: at least one alias is required", index),
            ErrorKind::ConfigMissing);
    }

    std::string label = p.aliases.front();
    p.host = node["host"].as<std::string>("");
    p.user = node["user"].as<std::string>("");
    trim(p.host);
    trim(p.user);
    if (p.host.empty() || p.user.empty()) {
        return Result<HostProfile>::Err(
            fmt::format("host '{}': both host and user are required", label),
            ErrorKind::ConfigMissing);
    }

    if (node["password"]) {
        std::string pw = node["password"].as<std::string>("");
        if (!pw.empty()) p.password = pw;
    }
    if (node["keyfile"]) {
        std::string kf = node["keyfile"].as<std::string>("");
        if (!kf.empty()) p.keyfile = kf;
    }

    if (node["port"]) {
        int port = safe_stoi(node["port"].as<std::string>(""), -1);
        if (port < 1 || port > 65535) {
            return Result<HostProfile>::Err(
                fmt::format("host '{}': port must be in 1-65535", label),
                ErrorKind::ConfigMissing);
        }
        p.port = port;
    }

    p.scripts = string_list(node["scripts"]);
    p.default_args = string_list(node["default_args"]);

    const YAML::Node& sa = node["script_args"];
    if (sa && sa.IsMap()) {
        for (const auto& kv : sa) {
            std::vector<std::string> args;
            if (kv.second.IsSequence()) {
                for (const auto& a : kv.second) args.push_back(a.as<std::string>(""));
            } else if (kv.second.IsScalar()) {
                args.push_back(kv.second.as<std::string>());
            }
            p.script_args[kv.first.as<std::string>()] = args;
        }
    }

    return Result<HostProfile>::Ok(p);
}

// ── Config ────────────────────────────────────────────────────

Result<Config> Config::parse(const std::string& yaml_text, const fs::path& base_dir) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml_text);
    } catch (const YAML::Exception& e) {
        return Result<Config>::Err(std::string("Invalid YAML: ") + e.what(),
                                   ErrorKind::ConfigMissing);
    }

    Config cfg;
    cfg.config_dir_ = base_dir;

    try {
        cfg.settings_ = parse_settings(root["settings"], base_dir, cfg.warnings_);

        // "hosts:" with only commented entries loads as Null: no hosts yet
        const YAML::Node& hosts = root["hosts"];
        if (hosts && !hosts.IsNull() && !hosts.IsSequence()) {
            return Result<Config>::Err("'hosts' must be a list", ErrorKind::ConfigMissing);
        }
        if (hosts && hosts.IsSequence()) {
            for (size_t i = 0; i < hosts.size(); i++) {
                auto host = parse_host(hosts[i], i);
                if (host.is_err()) {
                    return Result<Config>::Err(host.error, host.kind);
                }
                size_t idx = cfg.hosts_.size();
                for (const auto& alias : host.value.aliases) {
                    if (cfg.by_alias_.count(alias)) {
                        return Result<Config>::Err(
                            fmt::format("alias '{}' is defined more than once", alias),
                            ErrorKind::ConfigMissing);
                    }
                    cfg.by_alias_[alias] = idx;
                }
                cfg.hosts_.push_back(std::move(host.value));
            }
        }
    } catch (const YAML::Exception& e) {
        return Result<Config>::Err(std::string("Invalid configuration: ") + e.what(),
                                   ErrorKind::ConfigMissing);
    }

    return Result<Config>::Ok(cfg);
}

Result<Config> Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        return Result<Config>::Err("Configuration file not found: " + path.string(),
                                   ErrorKind::ConfigMissing);
    }

    std::ifstream in(path);
    if (!in) {
        return Result<Config>::Err("Cannot read " + path.string(), ErrorKind::Io);
    }
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

    return parse(text, fs::absolute(path).parent_path());
}

Result<HostProfile> Config::find(const std::string& alias) const {
    auto it = by_alias_.find(alias);
    if (it == by_alias_.end()) {
        return Result<HostProfile>::Err("Unknown host-alias: " + alias, ErrorKind::ConfigMissing);
    }
    return Result<HostProfile>::Ok(hosts_[it->second]);
}

std::optional<fs::path> Config::keyfile_for(const HostProfile& profile) const {
    if (profile.keyfile) {
        fs::path p(*profile.keyfile);
        if (!p.is_absolute()) p = config_dir_ / p;
        if (fs::exists(p)) return p;
    }
    for (const auto& alias : profile.aliases) {
        fs::path p = fs::path(settings_.keys_dir) / (alias + "_key");
        if (fs::exists(p)) return p;
    }
    return std::nullopt;
}
