#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <core/logger.hpp>
#include <core/types.hpp>
#include "channel_io.hpp"
#include "poller.hpp"
#include "remote_host.hpp"

enum class MuxState { Opening, Streaming, Draining, Closed };

const char* mux_state_name(MuxState state);

// Splits a byte stream into lines. "\n" ends a line and a "\r" right before
// it is dropped; bytes after the last newline wait for more data.
class LineBuffer {
public:
    std::vector<std::string> feed(const char* data, size_t len);

    // The unterminated tail, if any.
    std::optional<std::string> flush();

private:
    std::string pending_;
};

struct ChannelRequest {
    std::optional<std::string> command;        // nullopt = login shell
    bool pty = false;
    std::map<std::string, std::string> env;
};

struct MuxOptions {
    bool interactive = false;    // forward local input, raw bytes to output
    bool raw_terminal = false;   // local tty in raw mode while streaming
    bool log_lines = true;       // complete lines go to the remote log
    int input_fd = 0;
    int output_fd = 1;
    int error_fd = 2;
    int timeout_secs = 0;        // 0 = until the remote side ends
};

// Line handler for captured mode. Without one, lines are written to the
// output/error descriptors.
using LineSink = std::function<void(bool from_stderr, const std::string& line)>;

// Bridges one remote channel to the local terminal (interactive) or to a
// line sink (captured).
//
//   Opening    channel created, PTY sized to the local terminal, env attached
//   Streaming  remote stdout/stderr and local input moved as they are ready
//   Draining   remote finished; both streams read until exhausted
//   Closed     exit status collected, channel released
//
// A local interrupt ends Streaming, force-closes the channel and fails with
// Cancelled. The remote command may keep running.
class ChannelMultiplexer {
public:
    ChannelMultiplexer(Logger& logger, ReadinessPoller& poller,
                       std::string alias, std::string tag);

    void set_line_sink(LineSink sink) { sink_ = std::move(sink); }
    void set_state_observer(std::function<void(MuxState)> obs) { observer_ = std::move(obs); }

    // Open a channel on host and stream it. Returns the remote exit status.
    Result<int> run(RemoteHost& host, const ChannelRequest& request, const MuxOptions& opts);

    // Stream an already open channel.
    Result<int> pump(ChannelIO& channel, const MuxOptions& opts);

    MuxState state() const { return state_; }

private:
    Logger& logger_;
    ReadinessPoller& poller_;
    std::string alias_;
    std::string tag_;
    LineSink sink_;
    std::function<void(MuxState)> observer_;
    MuxState state_ = MuxState::Closed;
    LineBuffer out_lines_;
    LineBuffer err_lines_;

    void set_state(MuxState s);
    bool read_streams(ChannelIO& channel, const MuxOptions& opts);
    void handle_output(bool from_stderr, const char* data, size_t len, const MuxOptions& opts);
    void emit_line(bool from_stderr, const std::string& line, const MuxOptions& opts);
    void flush_lines(const MuxOptions& opts);
};
