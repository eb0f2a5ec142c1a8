#include "channel_multiplexer.hpp"
#include <core/constants.hpp>
#include <platform/platform.hpp>
#include <platform/terminal.hpp>
#include <fmt/format.h>
#include <chrono>
#include <memory>
#ifdef _WIN32
#  include <io.h>
#else
#  include <unistd.h>
#endif

const char* mux_state_name(MuxState state) {
    switch (state) {
    case MuxState::Opening:   return "opening";
    case MuxState::Streaming: return "streaming";
    case MuxState::Draining:  return "draining";
    case MuxState::Closed:    return "closed";
    }
    return "closed";
}

// ── LineBuffer ───────────────────────────────────────────────

std::vector<std::string> LineBuffer::feed(const char* data, size_t len) {
    std::vector<std::string> lines;
    pending_.append(data, len);
    size_t start = 0;
    size_t nl;
    while ((nl = pending_.find('\n', start)) != std::string::npos) {
        size_t end = nl;
        if (end > start && pending_[end - 1] == '\r') end--;
        lines.push_back(pending_.substr(start, end - start));
        start = nl + 1;
    }
    pending_.erase(0, start);
    return lines;
}

std::optional<std::string> LineBuffer::flush() {
    if (pending_.empty()) return std::nullopt;
    std::string tail;
    tail.swap(pending_);
    if (!tail.empty() && tail.back() == '\r') tail.pop_back();
    return tail;
}

// ── Helpers ──────────────────────────────────────────────────

static long fd_read(int fd, char* buf, size_t len) {
#ifdef _WIN32
    return _read(fd, buf, static_cast<unsigned int>(len));
#else
    return static_cast<long>(::read(fd, buf, len));
#endif
}

static long fd_write(int fd, const char* data, size_t len) {
#ifdef _WIN32
    return _write(fd, data, static_cast<unsigned int>(len));
#else
    return static_cast<long>(::write(fd, data, len));
#endif
}

static void write_all_fd(int fd, const char* data, size_t len) {
    size_t sent = 0;
    while (sent < len) {
        long w = fd_write(fd, data + sent, len - sent);
        if (w <= 0) return;
        sent += static_cast<size_t>(w);
    }
}

static bool write_all_channel(ChannelIO& channel, const char* data, size_t len) {
    size_t sent = 0;
    int retries = 0;
    while (sent < len) {
        int w = channel.write(data + sent, len - sent);
        if (w == ChannelIO::kAgain) {
            if (++retries > 3000) return false;
            platform::sleep_ms(1);
            continue;
        }
        if (w < 0) return false;
        retries = 0;
        sent += static_cast<size_t>(w);
    }
    return true;
}

// Resize notifications for the lifetime of one interactive bridge
struct ResizeWatch {
    explicit ResizeWatch(bool active) : active_(active) {
        if (active_) platform::on_terminal_resize([] {});
    }
    ~ResizeWatch() {
        if (active_) platform::remove_terminal_resize();
    }
    bool active_;
};

// ── ChannelMultiplexer ───────────────────────────────────────

ChannelMultiplexer::ChannelMultiplexer(Logger& logger, ReadinessPoller& poller,
                                       std::string alias, std::string tag)
    : logger_(logger), poller_(poller), alias_(std::move(alias)), tag_(std::move(tag)) {
}

void ChannelMultiplexer::set_state(MuxState s) {
    state_ = s;
    logger_.debug(fmt::format("[{}] channel {}: {}", alias_, tag_, mux_state_name(s)));
    if (observer_) observer_(s);
}

Result<int> ChannelMultiplexer::run(RemoteHost& host, const ChannelRequest& request,
                                    const MuxOptions& opts) {
    set_state(MuxState::Opening);

    ExecOptions exec;
    exec.pty = request.pty;
    exec.env = request.env;
    if (request.pty) {
        exec.cols = platform::term_width();
        exec.rows = platform::term_height();
    }

    auto opened = request.command ? host.open_exec(*request.command, exec)
                                  : host.open_shell(exec);
    if (opened.is_err()) {
        set_state(MuxState::Closed);
        return Result<int>::Err(opened.error, opened.kind);
    }
    return pump(*opened.value, opts);
}

Result<int> ChannelMultiplexer::pump(ChannelIO& channel, const MuxOptions& opts) {
    set_state(MuxState::Streaming);

    platform::InterruptGuard interrupt;
    std::unique_ptr<platform::RawModeGuard> raw;
    if (opts.interactive && opts.raw_terminal) {
        raw = std::make_unique<platform::RawModeGuard>();
    }
    ResizeWatch resize(opts.interactive && opts.raw_terminal);

    bool input_open = opts.interactive && opts.input_fd >= 0;
    if (!input_open) channel.send_eof();
    auto started = std::chrono::steady_clock::now();
    char buf[STDIN_READ_BUF_SIZE];

    for (;;) {
        if (platform::InterruptGuard::interrupted()) {
            channel.close();
            flush_lines(opts);
            set_state(MuxState::Closed);
            logger_.warn(fmt::format("[{}] {} interrupted; remote command may still be running",
                                     alias_, tag_));
            return Result<int>::Err("Interrupted", ErrorKind::Cancelled);
        }
        if (opts.timeout_secs > 0 &&
            std::chrono::steady_clock::now() - started > std::chrono::seconds(opts.timeout_secs)) {
            channel.close();
            flush_lines(opts);
            set_state(MuxState::Closed);
            return Result<int>::Err(fmt::format("{} timed out after {}s", tag_, opts.timeout_secs),
                                    ErrorKind::Timeout);
        }
        if (platform::take_resize()) {
            channel.resize(platform::term_width(), platform::term_height());
        }

        Readiness ready = poller_.wait(channel.wait_fd(), input_open ? opts.input_fd : -1,
                                       MUX_POLL_INTERVAL_MS);

        // local input → channel
        if (ready.input) {
            long n = fd_read(opts.input_fd, buf, sizeof(buf));
            if (n > 0) {
                if (!write_all_channel(channel, buf, static_cast<size_t>(n))) {
                    channel.close();
                    set_state(MuxState::Closed);
                    return Result<int>::Err("Channel write failed", ErrorKind::ChannelFailed);
                }
            } else {
                // Local input ended: pass the EOF on, keep reading output
                channel.send_eof();
                input_open = false;
            }
        }

        // channel → local output. Read even without readiness: libssh2 can
        // hold data it already pulled off the socket.
        read_streams(channel, opts);

        if (channel.eof()) break;
    }

    set_state(MuxState::Draining);
    while (read_streams(channel, opts)) {}
    flush_lines(opts);

    int code = channel.exit_status();
    channel.close();
    set_state(MuxState::Closed);
    return Result<int>::Ok(code);
}

// Read whatever is available on both streams. True if anything arrived.
bool ChannelMultiplexer::read_streams(ChannelIO& channel, const MuxOptions& opts) {
    char buf[SSH_READ_BUF_SIZE];
    bool any = false;
    int n;
    while ((n = channel.read_stdout(buf, sizeof(buf))) > 0) {
        handle_output(false, buf, static_cast<size_t>(n), opts);
        any = true;
    }
    while ((n = channel.read_stderr(buf, sizeof(buf))) > 0) {
        handle_output(true, buf, static_cast<size_t>(n), opts);
        any = true;
    }
    return any;
}

void ChannelMultiplexer::handle_output(bool from_stderr, const char* data, size_t len,
                                       const MuxOptions& opts) {
    if (opts.interactive) {
        write_all_fd(from_stderr ? opts.error_fd : opts.output_fd, data, len);
        if (!opts.log_lines) return;
    }
    auto& lines = from_stderr ? err_lines_ : out_lines_;
    for (const auto& line : lines.feed(data, len)) {
        emit_line(from_stderr, line, opts);
    }
}

void ChannelMultiplexer::emit_line(bool from_stderr, const std::string& line,
                                   const MuxOptions& opts) {
    if (opts.log_lines) {
        logger_.remote_line(alias_, tag_, line);
    }
    if (opts.interactive) return;  // already written raw

    if (sink_) {
        sink_(from_stderr, line);
    } else {
        std::string out = line + "\n";
        write_all_fd(from_stderr ? opts.error_fd : opts.output_fd, out.data(), out.size());
    }
}

void ChannelMultiplexer::flush_lines(const MuxOptions& opts) {
    if (auto tail = out_lines_.flush()) emit_line(false, *tail, opts);
    if (auto tail = err_lines_.flush()) emit_line(true, *tail, opts);
}
