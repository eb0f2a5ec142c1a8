#pragma once

#include <cstddef>

// One open remote execution or shell channel.
//
// All calls are non-blocking. Reads and writes return the byte count,
// kAgain when nothing can be done right now, 0 once the stream is
// exhausted, or another negative value on error.
class ChannelIO {
public:
    static constexpr int kAgain = -2;

    virtual ~ChannelIO() = default;

    virtual int read_stdout(char* buf, size_t len) = 0;
    virtual int read_stderr(char* buf, size_t len) = 0;
    virtual int write(const char* data, size_t len) = 0;

    // Signal end of input to the remote command.
    virtual void send_eof() = 0;

    // True once the remote side has finished sending on both streams.
    virtual bool eof() = 0;

    // Exit status of the remote command. Only meaningful after eof();
    // waits briefly for the remote close. -1 when unavailable.
    virtual int exit_status() = 0;

    // Resize the remote PTY (no-op without one).
    virtual void resize(int cols, int rows) = 0;

    // Descriptor that turns readable when the channel may have data,
    // or -1 if the channel cannot be polled.
    virtual int wait_fd() const = 0;

    // Release the channel. Safe to call more than once.
    virtual void close() = 0;
};
