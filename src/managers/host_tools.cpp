#include "host_tools.hpp"
#include <core/utils.hpp>
#include <platform/socket_util.hpp>
#include <fmt/format.h>
#include <fstream>
#include <set>
#include <sstream>

namespace fs = std::filesystem;

HostStatus check_host_status(const HostProfile& profile, int port,
                             const std::optional<fs::path>& key_path,
                             int timeout_secs, Logger& logger) {
    HostStatus status;
    status.host = profile.host;
    status.port = port;
    status.ip = platform::resolve_host_ip(profile.host).value_or("");
    status.reachable = platform::port_open(profile.host, port, timeout_secs * 1000);
    if (!status.reachable) return status;

    auto log_status = [&logger](const std::string& msg) { logger.debug(msg); };
    SessionTarget target = ConnectionManager::target_for(profile, port, key_path, timeout_secs);

    {
        Session session(target);
        if (session.open(log_status).is_ok() &&
            session.authenticate(AuthMode::KeysOrAgent, log_status).is_ok()) {
            status.auth = AuthProbe::Key;
            auto r = run_command(session, "uname -a && uptime", "", timeout_secs);
            if (r.success()) status.system_info = split_lines(r.stdout_data);
        }
    }

    if (status.auth == AuthProbe::Unknown && profile.password) {
        Session session(target);
        if (session.open(log_status).is_ok() &&
            session.authenticate(AuthMode::PasswordOnly, log_status).is_ok()) {
            status.auth = AuthProbe::Password;
        }
    }
    return status;
}

// True if any comma-separated pattern of the host field names one of ours
static bool names_match(const std::string& field, const std::set<std::string>& names) {
    std::istringstream in(field);
    std::string pattern;
    while (std::getline(in, pattern, ',')) {
        if (names.count(pattern)) return true;
    }
    return false;
}

Result<int> remove_known_host(const fs::path& known_hosts, const std::string& host, int port) {
    std::ifstream in(known_hosts);
    if (!in) {
        return Result<int>::Err("No known_hosts file at " + known_hosts.string(),
                                ErrorKind::PathNotFound);
    }

    std::set<std::string> names = {
        host,
        fmt::format("[{}]:{}", host, port),
        fmt::format("[{}]:22", host),
    };

    std::vector<std::string> kept;
    int removed = 0;
    std::string line;
    while (std::getline(in, line)) {
        std::string field;
        std::istringstream fields(line);
        fields >> field;
        // "@cert-authority host ..." style markers put the hosts second
        if (!field.empty() && field[0] == '@') fields >> field;

        if (!field.empty() && field[0] != '#' && names_match(field, names)) {
            removed++;
            continue;
        }
        kept.push_back(line);
    }
    in.close();

    if (removed == 0) return Result<int>::Ok(0);

    // Write a sibling file and swap it in
    fs::path tmp = known_hosts;
    tmp += ".fleetsh.tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) {
            return Result<int>::Err("Cannot write " + tmp.string(), ErrorKind::Io);
        }
        for (const auto& l : kept) out << l << "\n";
        if (!out) {
            return Result<int>::Err("Write error on " + tmp.string(), ErrorKind::Io);
        }
    }
    std::error_code ec;
    fs::rename(tmp, known_hosts, ec);
    if (ec) {
        fs::remove(tmp, ec);
        return Result<int>::Err("Cannot replace " + known_hosts.string(), ErrorKind::Io);
    }
    return Result<int>::Ok(removed);
}
