#include "remote_host.hpp"
#include <platform/platform.hpp>
#include <platform/socket_util.hpp>
#include <chrono>

SSHResult run_command(RemoteHost& host, const std::string& command,
                      const std::string& stdin_data, int timeout_secs) {
    auto opened = host.open_exec(command);
    if (opened.is_err()) {
        return SSHResult{-1, "", opened.error};
    }
    return run_channel(*opened.value, stdin_data, timeout_secs);
}

SSHResult run_channel(ChannelIO& ch, const std::string& stdin_data, int timeout_secs) {
    // Write all data to stdin, then EOF so the remote command sees the end
    size_t sent = 0;
    int write_retries = 0;
    while (sent < stdin_data.size()) {
        int w = ch.write(stdin_data.data() + sent, stdin_data.size() - sent);
        if (w == ChannelIO::kAgain) {
            if (++write_retries > 3000) {
                ch.close();
                return SSHResult{-1, "", "Write stalled sending data to channel"};
            }
            platform::sleep_ms(10);
            continue;
        }
        if (w < 0) {
            ch.close();
            return SSHResult{-1, "", "Channel write error sending data"};
        }
        write_retries = 0;
        sent += static_cast<size_t>(w);
    }
    ch.send_eof();

    std::string out, err;
    char buf[SSH_READ_BUF_SIZE];
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(timeout_secs);

    for (;;) {
        bool progressed = false;
        int n;
        while ((n = ch.read_stdout(buf, sizeof(buf))) > 0) {
            out.append(buf, static_cast<size_t>(n));
            progressed = true;
        }
        while ((n = ch.read_stderr(buf, sizeof(buf))) > 0) {
            err.append(buf, static_cast<size_t>(n));
            progressed = true;
        }
        if (ch.eof()) break;
        if (progressed) continue;

        if (std::chrono::steady_clock::now() >= deadline) {
            ch.close();
            return SSHResult{-1, out, "Command timed out after " + std::to_string(timeout_secs) + "s"};
        }
        int fd = ch.wait_fd();
        if (fd >= 0) {
            platform::poll_socket(static_cast<socket_t>(fd), POLLIN, 10);
        } else {
            platform::sleep_ms(10);
        }
    }

    // Anything that arrived between the last read and the EOF check
    int n;
    while ((n = ch.read_stdout(buf, sizeof(buf))) > 0) out.append(buf, static_cast<size_t>(n));
    while ((n = ch.read_stderr(buf, sizeof(buf))) > 0) err.append(buf, static_cast<size_t>(n));

    int code = ch.exit_status();
    ch.close();
    return SSHResult{code, out, err};
}
