#pragma once

#include <functional>

namespace platform {

// Get terminal dimensions (80x24 when they cannot be determined).
int term_width();
int term_height();

// True if stdin is attached to a terminal.
bool stdin_is_tty();

// RAII guard for raw terminal mode (cfmakeraw equivalent).
// Constructor saves current mode and enters raw mode.
// Destructor restores the saved mode. No-op when stdin is not a terminal.
struct RawModeGuard {
    RawModeGuard();
    ~RawModeGuard();

    RawModeGuard(const RawModeGuard&) = delete;
    RawModeGuard& operator=(const RawModeGuard&) = delete;

private:
#ifdef _WIN32
    unsigned long old_mode_ = 0;
#else
    struct Impl;
    Impl* impl_ = nullptr;
#endif
};

// Poll stdin for input readability with a timeout.
// Returns true if stdin has data to read.
bool poll_stdin(int timeout_ms);

// Window-resize notification. The callback runs from take_resize(), never
// from the signal handler itself.
using ResizeCallback = std::function<void()>;
void on_terminal_resize(ResizeCallback cb);
void remove_terminal_resize();

// Returns true (once) if a resize arrived since the last call, and runs
// the registered callback.
bool take_resize();

// RAII SIGINT capture. While alive, Ctrl-C sets a flag instead of killing
// the process; the previous handler is restored on destruction.
class InterruptGuard {
public:
    InterruptGuard();
    ~InterruptGuard();

    InterruptGuard(const InterruptGuard&) = delete;
    InterruptGuard& operator=(const InterruptGuard&) = delete;

    static bool interrupted();
    static void reset();
    // Raise the flag programmatically (used by tests and hooks).
    static void trigger();

private:
    struct Impl;
    Impl* impl_ = nullptr;
};

} // namespace platform
