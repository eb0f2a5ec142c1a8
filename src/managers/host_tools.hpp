#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <core/logger.hpp>
#include <core/types.hpp>
#include <ssh/connection_manager.hpp>

enum class AuthProbe { Key, Password, Unknown };

struct HostStatus {
    std::string host;
    std::string ip;                         // empty when the name does not resolve
    int port = 22;
    bool reachable = false;
    AuthProbe auth = AuthProbe::Unknown;
    std::vector<std::string> system_info;   // "uname -a && uptime" lines
};

// Reachability, then which credentials work (key first, then password,
// each on its own connection), then basic system info over the key session.
HostStatus check_host_status(const HostProfile& profile, int port,
                             const std::optional<std::filesystem::path>& key_path,
                             int timeout_secs, Logger& logger);

// Drop "host", "[host]:port" and "[host]:22" entries from a known_hosts
// file. Returns how many lines were removed. Hashed entries are left alone.
Result<int> remove_known_host(const std::filesystem::path& known_hosts,
                              const std::string& host, int port);
