#include "session.hpp"
#include "exec_channel.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <transfer/sftp_fs.hpp>
#include <libssh2.h>
#include <libssh2_sftp.h>
#include <fmt/format.h>
#include <chrono>
#include <cstring>
#include <fstream>
#include <mutex>
#include <vector>

namespace fs = std::filesystem;

bool ssh_library_init() {
    static std::once_flag once;
    static int rc = -1;
    std::call_once(once, [] {
        platform::init_networking();
        rc = libssh2_init(0);
    });
    return rc == 0;
}

// Retry a non-blocking libssh2 call while it reports EAGAIN.
template <typename Fn>
static int retry_eagain(Fn fn, int timeout_secs = CHANNEL_OPEN_TIMEOUT_SECS) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(timeout_secs);
    int rc;
    while ((rc = fn()) == LIBSSH2_ERROR_EAGAIN) {
        if (std::chrono::steady_clock::now() >= deadline) break;
        platform::sleep_ms(10);
    }
    return rc;
}

static std::string last_error(LIBSSH2_SESSION* session) {
    char* msg = nullptr;
    libssh2_session_last_error(session, &msg, nullptr, 0);
    return msg ? std::string(msg) : std::string("unknown error");
}

// Password for the keyboard-interactive callback, via the session abstract pointer
struct KbdAuthData {
    std::string password;
    int prompt_round = 0;
};

// libssh2 keyboard-interactive callback: answer every prompt with the password
static void kbd_callback(const char* /*name*/, int /*name_len*/,
                         const char* /*instruction*/, int /*instruction_len*/,
                         int num_prompts,
                         const LIBSSH2_USERAUTH_KBDINT_PROMPT* /*prompts*/,
                         LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses,
                         void** abstract) {
    KbdAuthData* data = static_cast<KbdAuthData*>(*abstract);
    for (int i = 0; i < num_prompts; i++) {
        responses[i].text = strdup(data->password.c_str());
        responses[i].length = static_cast<unsigned int>(data->password.length());
    }
    data->prompt_round++;
}

Session::Session(SessionTarget target) : target_(std::move(target)) {
    if (target_.known_hosts.empty()) {
        target_.known_hosts = platform::home_dir() / ".ssh" / "known_hosts";
    }
}

Session::~Session() {
    close();
}

std::string Session::label() const {
    return fmt::format("{}@{}:{}", target_.user, target_.host, target_.port);
}

// ── Connect ──────────────────────────────────────────────────

Result<void> Session::open(StatusCallback callback) {
    if (!ssh_library_init()) {
        return Result<void>::Err("Failed to initialize libssh2", ErrorKind::ChannelFailed);
    }

    if (callback) callback(fmt::format("Connecting to {}:{}...", target_.host, target_.port));

    auto sock = platform::connect_tcp(target_.host, target_.port, target_.timeout * 1000);
    if (sock.is_err()) {
        return Result<void>::Err(sock.error, sock.kind);
    }
    sock_ = sock.value;

    session_ = libssh2_session_init();
    if (!session_) {
        close();
        return Result<void>::Err("Failed to create SSH session", ErrorKind::ChannelFailed);
    }
    libssh2_session_set_blocking(session_, 0);

    int rc = retry_eagain([&] { return libssh2_session_handshake(session_, sock_); },
                          target_.timeout);
    if (rc != 0) {
        std::string why = rc == LIBSSH2_ERROR_EAGAIN ? "timed out" : last_error(session_);
        close();
        return Result<void>::Err("SSH handshake failed: " + why,
                                 rc == LIBSSH2_ERROR_EAGAIN ? ErrorKind::Timeout
                                                            : ErrorKind::PortUnreachable);
    }

    libssh2_keepalive_config(session_, 1, 30);

    auto hk = verify_host_key(callback);
    if (hk.is_err()) {
        close();
        return hk;
    }
    return Result<void>::Ok();
}

// Accept-new policy: unknown hosts are added to known_hosts, a changed key
// is refused.
Result<void> Session::verify_host_key(StatusCallback callback) {
    size_t key_len = 0;
    int key_type = 0;
    const char* key = libssh2_session_hostkey(session_, &key_len, &key_type);
    if (!key) {
        return Result<void>::Err("Server did not provide a host key", ErrorKind::AuthFailed);
    }

    int type_mask = LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW;
    switch (key_type) {
    case LIBSSH2_HOSTKEY_TYPE_RSA: type_mask |= LIBSSH2_KNOWNHOST_KEY_SSHRSA; break;
    case LIBSSH2_HOSTKEY_TYPE_DSS: type_mask |= LIBSSH2_KNOWNHOST_KEY_SSHDSS; break;
#ifdef LIBSSH2_HOSTKEY_TYPE_ECDSA_256
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_256: type_mask |= LIBSSH2_KNOWNHOST_KEY_ECDSA_256; break;
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_384: type_mask |= LIBSSH2_KNOWNHOST_KEY_ECDSA_384; break;
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_521: type_mask |= LIBSSH2_KNOWNHOST_KEY_ECDSA_521; break;
#endif
#ifdef LIBSSH2_HOSTKEY_TYPE_ED25519
    case LIBSSH2_HOSTKEY_TYPE_ED25519: type_mask |= LIBSSH2_KNOWNHOST_KEY_ED25519; break;
#endif
    default: type_mask |= LIBSSH2_KNOWNHOST_KEY_UNKNOWN; break;
    }

    LIBSSH2_KNOWNHOSTS* hosts = libssh2_knownhost_init(session_);
    if (!hosts) {
        return Result<void>::Err("Failed to initialize known_hosts", ErrorKind::ChannelFailed);
    }

    auto loaded = load_known_hosts(hosts);
    if (loaded.is_err()) {
        libssh2_knownhost_free(hosts);
        return loaded;
    }

    struct libssh2_knownhost* entry = nullptr;
    int check = libssh2_knownhost_checkp(hosts, target_.host.c_str(), target_.port,
                                         key, key_len, type_mask, &entry);

    Result<void> result = Result<void>::Ok();
    if (check == LIBSSH2_KNOWNHOST_CHECK_MISMATCH) {
        result = Result<void>::Err(
            fmt::format("Host key for {} has changed; run 'fleetsh reset-hostkey' if this is expected",
                        target_.host),
            ErrorKind::AuthFailed);
    } else if (check != LIBSSH2_KNOWNHOST_CHECK_MATCH) {
        std::string name = target_.port == DEFAULT_SSH_PORT
            ? target_.host
            : fmt::format("[{}]:{}", target_.host, target_.port);
        struct libssh2_knownhost* added = nullptr;
        int rc = libssh2_knownhost_addc(hosts, name.c_str(), nullptr, key, key_len,
                                        nullptr, 0, type_mask, &added);
        bool recorded = rc == 0 && append_known_host(hosts, added);
        if (callback) {
            callback(recorded ? "Added " + name + " to known_hosts"
                              : "Could not record host key for " + name);
        }
    }

    libssh2_knownhost_free(hosts);
    return result;
}

// Line by line so one unparseable line (comment, @marker) does not hide
// the entries after it. A missing file is fine: everything is new.
Result<void> Session::load_known_hosts(LIBSSH2_KNOWNHOSTS* hosts) {
    auto lines = known_host_entries(target_.known_hosts);
    if (lines.is_err()) return Result<void>::Err(lines.error, lines.kind);
    for (const auto& line : lines.value) {
        libssh2_knownhost_readline(hosts, line.c_str(), line.size(),
                                   LIBSSH2_KNOWNHOST_FILE_OPENSSH);
    }
    return Result<void>::Ok();
}

bool Session::append_known_host(LIBSSH2_KNOWNHOSTS* hosts, struct libssh2_knownhost* entry) {
    if (!entry) return false;
    char buf[4096];
    size_t len = 0;
    if (libssh2_knownhost_writeline(hosts, entry, buf, sizeof(buf), &len,
                                    LIBSSH2_KNOWNHOST_FILE_OPENSSH) != 0) {
        return false;
    }
    return append_known_hosts_line(target_.known_hosts, std::string(buf, len)).is_ok();
}

Result<std::vector<std::string>> known_host_entries(const fs::path& path) {
    std::vector<std::string> lines;
    std::error_code ec;
    if (!fs::exists(path, ec)) return Result<std::vector<std::string>>::Ok(lines);

    std::ifstream in(path);
    if (!in) {
        return Result<std::vector<std::string>>::Err(
            "Cannot read " + path.string() + "; refusing to trust an unverified host key",
            ErrorKind::AuthFailed);
    }
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        std::string trimmed = line;
        trim(trimmed);
        if (trimmed.empty() || trimmed[0] == '#' || trimmed[0] == '@') continue;
        lines.push_back(line);
    }
    return Result<std::vector<std::string>>::Ok(lines);
}

Result<void> append_known_hosts_line(const fs::path& path, const std::string& line) {
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);

    bool needs_newline = false;
    if (fs::exists(path, ec) && fs::file_size(path, ec) > 0 && !ec) {
        std::ifstream tail(path, std::ios::binary);
        tail.seekg(-1, std::ios::end);
        char last = '\n';
        needs_newline = tail.get(last) && last != '\n';
    }

    std::ofstream out(path, std::ios::binary | std::ios::app);
    if (!out) return Result<void>::Err("Cannot write " + path.string(), ErrorKind::Io);
    if (needs_newline) out << '\n';
    out << line;
    if (line.empty() || line.back() != '\n') out << '\n';
    if (!out) return Result<void>::Err("Write error on " + path.string(), ErrorKind::Io);
    return Result<void>::Ok();
}

// ── Authentication ───────────────────────────────────────────

Result<void> Session::authenticate(AuthMode mode, StatusCallback callback) {
    if (!session_) {
        return Result<void>::Err("Session is not open", ErrorKind::ChannelFailed);
    }
    if (authenticated_) return Result<void>::Ok();

    auto result = mode == AuthMode::KeysOrAgent ? auth_keys(callback) : auth_password(callback);
    if (result.is_ok()) {
        authenticated_ = true;
        if (callback) callback("Authentication successful");
    }
    return result;
}

Result<void> Session::auth_keys(StatusCallback callback) {
    const std::string& user = target_.user;

    // Some servers accept "none"; listing also tells us what is allowed
    char* auth_list = nullptr;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(target_.timeout);
    while ((auth_list = libssh2_userauth_list(session_, user.c_str(),
                                              static_cast<unsigned int>(user.length()))) == nullptr) {
        if (libssh2_session_last_errno(session_) != LIBSSH2_ERROR_EAGAIN ||
            std::chrono::steady_clock::now() >= deadline) {
            break;
        }
        platform::sleep_ms(10);
    }
    if (libssh2_userauth_authenticated(session_)) return Result<void>::Ok();

    std::string methods = auth_list ? auth_list : "";
    if (!methods.empty() && methods.find("publickey") == std::string::npos) {
        return Result<void>::Err("Server does not accept public keys", ErrorKind::AuthFailed);
    }

    // Agent first
    LIBSSH2_AGENT* agent = libssh2_agent_init(session_);
    if (agent) {
        if (libssh2_agent_connect(agent) == 0 && libssh2_agent_list_identities(agent) == 0) {
            struct libssh2_agent_publickey* identity = nullptr;
            struct libssh2_agent_publickey* prev = nullptr;
            while (libssh2_agent_get_identity(agent, &identity, prev) == 0) {
                int rc = retry_eagain([&] {
                    return libssh2_agent_userauth(agent, user.c_str(), identity);
                });
                if (rc == 0) break;
                prev = identity;
            }
            libssh2_agent_disconnect(agent);
        }
        libssh2_agent_free(agent);
        if (libssh2_userauth_authenticated(session_)) {
            if (callback) callback("Authenticated with ssh-agent");
            return Result<void>::Ok();
        }
    }

    // Then key files: the configured one, or the usual defaults
    std::vector<fs::path> keys;
    if (target_.key_path) {
        keys.push_back(*target_.key_path);
    } else {
        fs::path ssh_dir = platform::home_dir() / ".ssh";
        for (const char* name : {"id_ed25519", "id_ecdsa", "id_rsa"}) {
            if (fs::exists(ssh_dir / name)) keys.push_back(ssh_dir / name);
        }
    }

    for (const auto& key : keys) {
        std::string priv = key.string();
        std::string pub = priv + ".pub";
        bool have_pub = fs::exists(pub);
        int rc = retry_eagain([&] {
            return libssh2_userauth_publickey_fromfile_ex(
                session_, user.c_str(), static_cast<unsigned int>(user.length()),
                have_pub ? pub.c_str() : nullptr, priv.c_str(), nullptr);
        });
        if (rc == 0) {
            if (callback) callback("Authenticated with key " + priv);
            return Result<void>::Ok();
        }
    }

    return Result<void>::Err(fmt::format("Key authentication failed for {}", label()),
                             ErrorKind::AuthFailed);
}

Result<void> Session::auth_password(StatusCallback callback) {
    if (!target_.password) {
        return Result<void>::Err("No password configured", ErrorKind::AuthFailed);
    }
    const std::string& user = target_.user;
    const std::string& password = *target_.password;

    char* auth_list = nullptr;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(target_.timeout);
    while ((auth_list = libssh2_userauth_list(session_, user.c_str(),
                                              static_cast<unsigned int>(user.length()))) == nullptr) {
        if (libssh2_session_last_errno(session_) != LIBSSH2_ERROR_EAGAIN ||
            std::chrono::steady_clock::now() >= deadline) {
            break;
        }
        platform::sleep_ms(10);
    }
    std::string methods = auth_list ? auth_list : "";

    if (methods.empty() || methods.find("password") != std::string::npos) {
        if (callback) callback("Using password auth...");
        int rc = retry_eagain([&] {
            return libssh2_userauth_password(session_, user.c_str(), password.c_str());
        });
        if (rc == 0) return Result<void>::Ok();
    }

    if (methods.find("keyboard-interactive") != std::string::npos) {
        if (callback) callback("Using keyboard-interactive auth...");
        KbdAuthData kbd_data;
        kbd_data.password = password;
        *libssh2_session_abstract(session_) = &kbd_data;
        int rc = retry_eagain([&] {
            return libssh2_userauth_keyboard_interactive(session_, user.c_str(), kbd_callback);
        });
        *libssh2_session_abstract(session_) = nullptr;
        if (rc == 0) return Result<void>::Ok();
    }

    return Result<void>::Err(fmt::format("Password authentication failed for {}", label()),
                             ErrorKind::AuthFailed);
}

// ── Channels ─────────────────────────────────────────────────

Result<std::unique_ptr<ChannelIO>> Session::open_channel(const std::string* command,
                                                         const ExecOptions& opts) {
    using R = Result<std::unique_ptr<ChannelIO>>;
    if (!authenticated_) {
        return R::Err("Session is not authenticated", ErrorKind::ChannelFailed);
    }

    LIBSSH2_CHANNEL* raw = nullptr;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(CHANNEL_OPEN_TIMEOUT_SECS);
    while ((raw = libssh2_channel_open_session(session_)) == nullptr) {
        if (libssh2_session_last_errno(session_) != LIBSSH2_ERROR_EAGAIN) {
            return R::Err("Failed to open channel: " + last_error(session_), ErrorKind::ChannelFailed);
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return R::Err("Timed out opening channel", ErrorKind::Timeout);
        }
        platform::sleep_ms(10);
    }
    auto channel = std::make_unique<ExecChannel>(raw, session_, sock_);

    // Servers commonly refuse env requests (AcceptEnv); those variables are
    // exported in front of the command instead.
    std::string exports;
    for (const auto& kv : opts.env) {
        int rc = retry_eagain([&] {
            return libssh2_channel_setenv_ex(raw, kv.first.c_str(),
                                             static_cast<unsigned int>(kv.first.size()),
                                             kv.second.c_str(),
                                             static_cast<unsigned int>(kv.second.size()));
        });
        if (rc != 0) {
            exports += fmt::format("export {}={}; ", kv.first, shell_quote(kv.second));
        }
    }

    if (opts.pty) {
        int rc = retry_eagain([&] {
            return libssh2_channel_request_pty_ex(raw, DEFAULT_TERM,
                                                  static_cast<unsigned int>(std::strlen(DEFAULT_TERM)),
                                                  nullptr, 0, opts.cols, opts.rows, 0, 0);
        });
        if (rc != 0) {
            return R::Err("PTY request failed: " + last_error(session_), ErrorKind::ChannelFailed);
        }
        channel->has_pty_ = true;
    }

    int rc;
    if (command) {
        std::string full = exports + *command;
        rc = retry_eagain([&] { return libssh2_channel_exec(raw, full.c_str()); });
    } else {
        rc = retry_eagain([&] { return libssh2_channel_shell(raw); });
    }
    if (rc != 0) {
        return R::Err(std::string(command ? "exec" : "shell") + " request failed: " + last_error(session_),
                      ErrorKind::ChannelFailed);
    }

    return R::Ok(std::move(channel));
}

Result<std::unique_ptr<ChannelIO>> Session::open_exec(const std::string& command,
                                                      const ExecOptions& opts) {
    return open_channel(&command, opts);
}

Result<std::unique_ptr<ChannelIO>> Session::open_shell(const ExecOptions& opts) {
    return open_channel(nullptr, opts);
}

Result<std::unique_ptr<RemoteFs>> Session::open_sftp() {
    using R = Result<std::unique_ptr<RemoteFs>>;
    if (!authenticated_) {
        return R::Err("Session is not authenticated", ErrorKind::ChannelFailed);
    }

    LIBSSH2_SFTP* sftp = nullptr;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(CHANNEL_OPEN_TIMEOUT_SECS);
    while ((sftp = libssh2_sftp_init(session_)) == nullptr) {
        if (libssh2_session_last_errno(session_) != LIBSSH2_ERROR_EAGAIN ||
            std::chrono::steady_clock::now() >= deadline) {
            return R::Err("SFTP unavailable: " + last_error(session_), ErrorKind::ProtocolUnavailable);
        }
        platform::sleep_ms(10);
    }
    return R::Ok(std::make_unique<SftpFs>(sftp, session_));
}

// ── Teardown ─────────────────────────────────────────────────

void Session::close() {
    authenticated_ = false;

    if (session_) {
        retry_eagain([&] { return libssh2_session_disconnect(session_, "Normal disconnection"); }, 2);
        retry_eagain([&] { return libssh2_session_free(session_); }, 2);
        session_ = nullptr;
    }

    if (sock_ != FLEETSH_INVALID_SOCKET) {
        platform::close_socket(sock_);
        sock_ = FLEETSH_INVALID_SOCKET;
    }
}
