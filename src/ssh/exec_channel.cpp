#include "exec_channel.hpp"
#include <core/constants.hpp>
#include <platform/platform.hpp>
#include <libssh2.h>
#include <chrono>

ExecChannel::ExecChannel(LIBSSH2_CHANNEL* ch, LIBSSH2_SESSION* session, socket_t sock)
    : ch_(ch), session_(session), sock_(sock) {
}

ExecChannel::~ExecChannel() {
    close();
}

static int map_io(ssize_t n) {
    if (n == LIBSSH2_ERROR_EAGAIN) return ChannelIO::kAgain;
    if (n < 0 && n == ChannelIO::kAgain) return -1;  // keep kAgain unambiguous
    return static_cast<int>(n);
}

int ExecChannel::read_stdout(char* buf, size_t len) {
    if (!ch_) return 0;
    return map_io(libssh2_channel_read(ch_, buf, len));
}

int ExecChannel::read_stderr(char* buf, size_t len) {
    if (!ch_) return 0;
    return map_io(libssh2_channel_read_stderr(ch_, buf, len));
}

int ExecChannel::write(const char* data, size_t len) {
    if (!ch_) return -1;
    return map_io(libssh2_channel_write(ch_, data, len));
}

void ExecChannel::send_eof() {
    if (!ch_ || eof_sent_) return;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(CHANNEL_OPEN_TIMEOUT_SECS);
    while (libssh2_channel_send_eof(ch_) == LIBSSH2_ERROR_EAGAIN &&
           std::chrono::steady_clock::now() < deadline) {
        platform::sleep_ms(10);
    }
    eof_sent_ = true;
}

bool ExecChannel::eof() {
    if (!ch_) return true;
    return libssh2_channel_eof(ch_) != 0;
}

int ExecChannel::exit_status() {
    if (exit_known_) return exit_code_;
    if (!ch_) return -1;

    // Close our side and wait for the remote close so the status has arrived
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(SHELL_PROBE_TIMEOUT_SECS);
    int rc;
    while ((rc = libssh2_channel_close(ch_)) == LIBSSH2_ERROR_EAGAIN &&
           std::chrono::steady_clock::now() < deadline) {
        platform::sleep_ms(10);
    }
    if (rc == 0) {
        while (libssh2_channel_wait_closed(ch_) == LIBSSH2_ERROR_EAGAIN &&
               std::chrono::steady_clock::now() < deadline) {
            platform::sleep_ms(10);
        }
    }

    char* signal_name = nullptr;
    libssh2_channel_get_exit_signal(ch_, &signal_name, nullptr, nullptr, nullptr,
                                    nullptr, nullptr);
    if (signal_name) {
        // Killed by a signal: no numeric status, report a generic failure
        libssh2_free(session_, signal_name);
        exit_code_ = 255;
    } else {
        exit_code_ = libssh2_channel_get_exit_status(ch_);
    }
    exit_known_ = true;
    return exit_code_;
}

void ExecChannel::resize(int cols, int rows) {
    if (!ch_ || !has_pty_) return;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(1);
    while (libssh2_channel_request_pty_size(ch_, cols, rows) == LIBSSH2_ERROR_EAGAIN &&
           std::chrono::steady_clock::now() < deadline) {
        platform::sleep_ms(1);
    }
}

int ExecChannel::wait_fd() const {
    return static_cast<int>(sock_);
}

void ExecChannel::close() {
    if (!ch_) return;

    // Bounded: on a dead connection these never leave EAGAIN
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (libssh2_channel_close(ch_) == LIBSSH2_ERROR_EAGAIN &&
           std::chrono::steady_clock::now() < deadline) {
        platform::sleep_ms(10);
    }
    while (libssh2_channel_free(ch_) == LIBSSH2_ERROR_EAGAIN &&
           std::chrono::steady_clock::now() < deadline) {
        platform::sleep_ms(10);
    }
    ch_ = nullptr;
}
