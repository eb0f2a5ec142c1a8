#include "connection_manager.hpp"
#include <platform/socket_util.hpp>
#include <fmt/format.h>

PortProbe tcp_port_probe(int timeout_ms) {
    return [timeout_ms](const std::string& host, int port) {
        return platform::port_open(host, port, timeout_ms);
    };
}

Result<int> resolve_port(int configured_port, const std::string& host, const PortProbe& probe) {
    if (probe(host, configured_port)) {
        return Result<int>::Ok(configured_port);
    }
    if (configured_port != DEFAULT_SSH_PORT && probe(host, DEFAULT_SSH_PORT)) {
        return Result<int>::Ok(DEFAULT_SSH_PORT);
    }
    if (configured_port != DEFAULT_SSH_PORT) {
        return Result<int>::Err(
            fmt::format("Cannot connect to {} on port {} or {}", host, configured_port, DEFAULT_SSH_PORT),
            ErrorKind::PortUnreachable);
    }
    return Result<int>::Err(fmt::format("Cannot connect to {} on port {}", host, configured_port),
                            ErrorKind::PortUnreachable);
}

ConnectionManager::ConnectionManager(Logger& logger, PortProbe probe)
    : logger_(logger), probe_(std::move(probe)) {
}

Result<int> ConnectionManager::resolve_port(const HostProfile& profile) const {
    auto port = ::resolve_port(profile.port, profile.host, probe_);
    if (port.is_ok() && port.value != profile.port) {
        logger_.warn(fmt::format("Port {} not reachable on {}; falling back to {}",
                                 profile.port, profile.host, port.value));
    } else if (port.is_ok()) {
        logger_.debug(fmt::format("Port {} reachable on {}", port.value, profile.host));
    }
    return port;
}

Result<std::unique_ptr<Session>> ConnectionManager::connect(const SessionTarget& target) {
    using R = Result<std::unique_ptr<Session>>;

    auto session = std::make_unique<Session>(target);
    auto status = [this](const std::string& msg) { logger_.debug(msg); };

    logger_.info(fmt::format("Attempting SSH connection to {}:{}...", target.host, target.port));
    auto opened = session->open(status);
    if (opened.is_err()) {
        return R::Err(opened.error, opened.kind);
    }

    Session& s = *session;
    auto auth = authenticate_with_fallback(target.password.has_value(), [&](AuthMode mode) {
        if (mode == AuthMode::PasswordOnly) {
            logger_.info("Key authentication failed; retrying with password");
        }
        return s.authenticate(mode, status);
    });
    if (auth.is_err()) {
        session->close();
        return R::Err(auth.error, auth.kind);
    }

    return R::Ok(std::move(session));
}

SessionTarget ConnectionManager::target_for(const HostProfile& profile, int port,
                                            const std::optional<std::filesystem::path>& key_path,
                                            int timeout_secs) {
    SessionTarget t;
    t.host = profile.host;
    t.port = port;
    t.user = profile.user;
    t.password = profile.password;
    t.key_path = key_path;
    t.timeout = timeout_secs;
    return t;
}
