#pragma once

#include "channel_io.hpp"
#include <platform/socket_util.hpp>

// libssh2 forward declarations
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;
typedef struct _LIBSSH2_CHANNEL LIBSSH2_CHANNEL;

// RAII handle for one libssh2 exec or shell channel.
// Owns the channel and closes+frees it on destruction. The session must
// outlive it.
class ExecChannel : public ChannelIO {
public:
    ExecChannel(LIBSSH2_CHANNEL* ch, LIBSSH2_SESSION* session, socket_t sock);
    ~ExecChannel() override;

    ExecChannel(const ExecChannel&) = delete;
    ExecChannel& operator=(const ExecChannel&) = delete;

    int read_stdout(char* buf, size_t len) override;
    int read_stderr(char* buf, size_t len) override;
    int write(const char* data, size_t len) override;
    void send_eof() override;
    bool eof() override;
    int exit_status() override;
    void resize(int cols, int rows) override;
    int wait_fd() const override;
    void close() override;

    LIBSSH2_CHANNEL* raw() const { return ch_; }

private:
    LIBSSH2_CHANNEL* ch_;
    LIBSSH2_SESSION* session_;
    socket_t sock_;
    bool has_pty_ = false;
    bool eof_sent_ = false;
    int exit_code_ = -1;
    bool exit_known_ = false;

    friend class Session;
};
