#pragma once

#include <map>
#include <memory>
#include <string>
#include <core/constants.hpp>
#include <core/types.hpp>
#include "channel_io.hpp"

class RemoteFs;

struct ExecOptions {
    bool pty = false;
    int cols = DEFAULT_TERM_COLS;
    int rows = DEFAULT_TERM_ROWS;
    std::map<std::string, std::string> env;
};

// What an operation needs from an authenticated session. Owned by exactly
// one operation at a time.
class RemoteHost {
public:
    virtual ~RemoteHost() = default;

    virtual Result<std::unique_ptr<ChannelIO>> open_exec(const std::string& command,
                                                         const ExecOptions& opts = {}) = 0;
    virtual Result<std::unique_ptr<ChannelIO>> open_shell(const ExecOptions& opts) = 0;

    // Structured file access. Fails with ProtocolUnavailable when the host
    // does not offer it; callers then switch to the shell fallback.
    virtual Result<std::unique_ptr<RemoteFs>> open_sftp() = 0;

    // "user@host:port" for messages.
    virtual std::string label() const = 0;
};

// Run a command to completion on a fresh exec channel, optionally feeding
// stdin_data and closing its input. exit_code is -1 when the channel could
// not be opened or the timeout expired (stderr_data then holds the reason).
SSHResult run_command(RemoteHost& host, const std::string& command,
                      const std::string& stdin_data = "",
                      int timeout_secs = SSH_CMD_TIMEOUT_SECS);

// Same, on a channel that is already running its command.
SSHResult run_channel(ChannelIO& channel, const std::string& stdin_data, int timeout_secs);
