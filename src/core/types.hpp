#pragma once

#include <string>
#include <optional>
#include <vector>
#include <map>
#include <functional>
#include <cstdint>

// Failure categories surfaced by operations. None means success.
enum class ErrorKind {
    None,
    PortUnreachable,
    AuthFailed,
    Timeout,
    PathNotFound,
    ProtocolUnavailable,   // recoverable: caller switches to the fallback path
    NonZeroExit,
    RebootTimeout,
    ConfigMissing,
    ChannelFailed,
    Io,
    Cancelled,
};

const char* error_kind_name(ErrorKind kind);

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;
    ErrorKind kind = ErrorKind::None;

    static Result<T> Ok(T val) {
        return {true, std::move(val), "", ErrorKind::None};
    }

    static Result<T> Err(const std::string& err, ErrorKind kind = ErrorKind::Io) {
        return {false, T{}, err, kind};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;
    ErrorKind kind = ErrorKind::None;

    static Result<void> Ok() {
        return {true, "", ErrorKind::None};
    }

    static Result<void> Err(const std::string& err, ErrorKind kind = ErrorKind::Io) {
        return {false, err, kind};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Remote command execution result
struct SSHResult {
    int exit_code;
    std::string stdout_data;
    std::string stderr_data;

    bool success() const { return exit_code == 0; }
    bool failed() const { return exit_code != 0; }
};

// One named host entry from the configuration. Immutable once loaded.
struct HostProfile {
    std::vector<std::string> aliases;
    std::string host;
    std::string user;
    std::optional<std::string> password;
    int port = 22;
    std::optional<std::string> keyfile;
    std::vector<std::string> scripts;                              // execution order
    std::map<std::string, std::vector<std::string>> script_args;   // per-script override
    std::vector<std::string> default_args;

    // Arguments for a script: its own mapping if present, else the defaults.
    const std::vector<std::string>& args_for(const std::string& script) const {
        auto it = script_args.find(script);
        return it != script_args.end() ? it->second : default_args;
    }
};

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3 };

struct GlobalSettings {
    std::string log_dir;
    LogLevel log_level = LogLevel::Info;
    bool enable_logging = true;
    std::string max_log_size = "10M";
    int max_log_files = 5;
    bool script_exit_on_error = true;
    bool force_tty = true;
    std::string scripts_dir;
    std::string keys_dir;
    std::string hooks_dir;
    int connect_timeout = 5;
    int script_delay = 3;
};

// Status callback for operations
using StatusCallback = std::function<void(const std::string&)>;
