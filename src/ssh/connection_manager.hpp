#pragma once

#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <core/constants.hpp>
#include <core/logger.hpp>
#include <core/types.hpp>
#include "session.hpp"

// Reachability check for host:port.
using PortProbe = std::function<bool(const std::string& host, int port)>;

// Probe by opening a TCP connection.
PortProbe tcp_port_probe(int timeout_ms = PORT_PROBE_TIMEOUT_MS);

// The configured port if reachable; else 22 if reachable and the configured
// port is not 22; else PortUnreachable.
Result<int> resolve_port(int configured_port, const std::string& host, const PortProbe& probe);

// Key/agent authentication first. Only when that fails with AuthFailed and
// a password exists, a second attempt with password auth alone.
template <typename Attempt>
Result<void> authenticate_with_fallback(bool has_password, Attempt&& attempt) {
    Result<void> first = attempt(AuthMode::KeysOrAgent);
    if (first.is_ok() || first.kind != ErrorKind::AuthFailed || !has_password) {
        return first;
    }
    Result<void> second = attempt(AuthMode::PasswordOnly);
    if (second.is_ok()) return second;
    return Result<void>::Err(first.error + "; " + second.error, ErrorKind::AuthFailed);
}

// Owns session establishment for one invocation.
class ConnectionManager {
public:
    explicit ConnectionManager(Logger& logger, PortProbe probe = tcp_port_probe());

    Result<int> resolve_port(const HostProfile& profile) const;

    // Connect and authenticate. The returned session is closed when it is
    // destroyed; close() may also be called explicitly any number of times.
    Result<std::unique_ptr<Session>> connect(const SessionTarget& target);

    static SessionTarget target_for(const HostProfile& profile, int port,
                                    const std::optional<std::filesystem::path>& key_path,
                                    int timeout_secs);

    const PortProbe& probe() const { return probe_; }

private:
    Logger& logger_;
    PortProbe probe_;
};
