#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <core/types.hpp>
#include <platform/socket_util.hpp>
#include "remote_host.hpp"

// libssh2 forward declarations
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;
typedef struct _LIBSSH2_KNOWNHOSTS LIBSSH2_KNOWNHOSTS;
struct libssh2_knownhost;

struct SessionTarget {
    std::string host;
    int port = 22;
    std::string user;
    std::optional<std::string> password;
    std::optional<std::filesystem::path> key_path;
    int timeout = 5;                          // seconds, TCP connect + handshake
    std::filesystem::path known_hosts;        // empty = ~/.ssh/known_hosts
};

enum class AuthMode {
    KeysOrAgent,    // agent, then key files; never sends the password
    PasswordOnly,   // password / keyboard-interactive; keys disabled
};

// One authenticated SSH connection (libssh2 over a non-blocking socket).
// Exclusively owned by the operation that created it; close() runs on
// destruction and is idempotent.
class Session : public RemoteHost {
public:
    explicit Session(SessionTarget target);
    ~Session() override;

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    // TCP connect, SSH handshake and host key check.
    Result<void> open(StatusCallback callback = nullptr);

    // User authentication on an open session. May be called again with
    // another mode after an AuthFailed.
    Result<void> authenticate(AuthMode mode, StatusCallback callback = nullptr);

    void close();
    bool is_active() const { return authenticated_; }

    // ── RemoteHost ──────────────────────────────────────────
    Result<std::unique_ptr<ChannelIO>> open_exec(const std::string& command,
                                                 const ExecOptions& opts = {}) override;
    Result<std::unique_ptr<ChannelIO>> open_shell(const ExecOptions& opts) override;
    Result<std::unique_ptr<RemoteFs>> open_sftp() override;
    std::string label() const override;

    LIBSSH2_SESSION* raw() const { return session_; }
    socket_t socket() const { return sock_; }
    const SessionTarget& target() const { return target_; }

private:
    SessionTarget target_;
    LIBSSH2_SESSION* session_ = nullptr;
    socket_t sock_ = FLEETSH_INVALID_SOCKET;
    bool authenticated_ = false;

    Result<void> verify_host_key(StatusCallback callback);
    Result<void> load_known_hosts(LIBSSH2_KNOWNHOSTS* hosts);
    bool append_known_host(LIBSSH2_KNOWNHOSTS* hosts, struct libssh2_knownhost* entry);
    Result<void> auth_keys(StatusCallback callback);
    Result<void> auth_password(StatusCallback callback);
    Result<std::unique_ptr<ChannelIO>> open_channel(const std::string* command,
                                                    const ExecOptions& opts);
};

// Initialise libssh2 once per process. Returns false if the library
// cannot be initialised.
bool ssh_library_init();

// known_hosts lines that may hold a host entry: comments, blank lines and
// @marker lines are left out. A missing file yields no lines; an
// unreadable one is an error.
Result<std::vector<std::string>> known_host_entries(const std::filesystem::path& path);

// Append one entry, keeping every existing line untouched.
Result<void> append_known_hosts_line(const std::filesystem::path& path, const std::string& line);
