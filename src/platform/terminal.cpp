#include "terminal.hpp"
#include <core/constants.hpp>
#include <atomic>
#include <csignal>

#ifdef _WIN32
#  define WIN32_LEAN_AND_MEAN
#  include <windows.h>
#  include <io.h>
#else
#  include <sys/ioctl.h>
#  include <termios.h>
#  include <unistd.h>
#  include <poll.h>
#  include <signal.h>
#endif

namespace platform {

// ── Terminal dimensions ──────────────────────────────────────

int term_width() {
#ifdef _WIN32
    CONSOLE_SCREEN_BUFFER_INFO csbi;
    if (GetConsoleScreenBufferInfo(GetStdHandle(STD_OUTPUT_HANDLE), &csbi))
        return csbi.srWindow.Right - csbi.srWindow.Left + 1;
    return DEFAULT_TERM_COLS;
#else
    struct winsize ws;
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0)
        return ws.ws_col;
    if (ioctl(STDIN_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0)
        return ws.ws_col;
    return DEFAULT_TERM_COLS;
#endif
}

int term_height() {
#ifdef _WIN32
    CONSOLE_SCREEN_BUFFER_INFO csbi;
    if (GetConsoleScreenBufferInfo(GetStdHandle(STD_OUTPUT_HANDLE), &csbi))
        return csbi.srWindow.Bottom - csbi.srWindow.Top + 1;
    return DEFAULT_TERM_ROWS;
#else
    struct winsize ws;
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_row > 0)
        return ws.ws_row;
    if (ioctl(STDIN_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_row > 0)
        return ws.ws_row;
    return DEFAULT_TERM_ROWS;
#endif
}

bool stdin_is_tty() {
#ifdef _WIN32
    return _isatty(_fileno(stdin)) != 0;
#else
    return isatty(STDIN_FILENO) != 0;
#endif
}

// ── RawModeGuard ─────────────────────────────────────────────

#ifdef _WIN32

RawModeGuard::RawModeGuard() {
    HANDLE h = GetStdHandle(STD_INPUT_HANDLE);
    GetConsoleMode(h, &old_mode_);
    DWORD new_mode = old_mode_;
    new_mode &= ~(ENABLE_LINE_INPUT | ENABLE_ECHO_INPUT | ENABLE_PROCESSED_INPUT);
    new_mode |= ENABLE_VIRTUAL_TERMINAL_INPUT;
    SetConsoleMode(h, new_mode);
}

RawModeGuard::~RawModeGuard() {
    SetConsoleMode(GetStdHandle(STD_INPUT_HANDLE), old_mode_);
}

#else // Unix

struct RawModeGuard::Impl {
    struct termios old_term;
};

RawModeGuard::RawModeGuard() {
    if (!isatty(STDIN_FILENO)) return;

    impl_ = new Impl;
    tcgetattr(STDIN_FILENO, &impl_->old_term);
    struct termios raw = impl_->old_term;
    cfmakeraw(&raw);
    tcsetattr(STDIN_FILENO, TCSAFLUSH, &raw);
}

RawModeGuard::~RawModeGuard() {
    if (impl_) {
        tcsetattr(STDIN_FILENO, TCSAFLUSH, &impl_->old_term);
        delete impl_;
    }
}

#endif

// ── poll_stdin ───────────────────────────────────────────────

bool poll_stdin(int timeout_ms) {
#ifdef _WIN32
    HANDLE h = GetStdHandle(STD_INPUT_HANDLE);
    DWORD result = WaitForSingleObject(h, timeout_ms);
    if (result == WAIT_OBJECT_0) {
        INPUT_RECORD rec;
        DWORD count;
        while (PeekConsoleInputW(h, &rec, 1, &count) && count > 0) {
            if (rec.EventType == KEY_EVENT && rec.Event.KeyEvent.bKeyDown)
                return true;
            ReadConsoleInputW(h, &rec, 1, &count);
        }
        return false;
    }
    return false;
#else
    struct pollfd pfd = {STDIN_FILENO, POLLIN, 0};
    return poll(&pfd, 1, timeout_ms) > 0 && (pfd.revents & POLLIN);
#endif
}

// ── Resize callback ──────────────────────────────────────────

static volatile sig_atomic_t g_resize_flag = 0;
static ResizeCallback g_resize_cb;

#ifdef _WIN32

// Console resize events come through ReadConsoleInput; callers re-query
// the dimensions instead.
void on_terminal_resize(ResizeCallback cb) { g_resize_cb = std::move(cb); }
void remove_terminal_resize() { g_resize_cb = nullptr; }

#else

static struct sigaction g_old_winch;

static void sigwinch_handler(int) {
    g_resize_flag = 1;
}

void on_terminal_resize(ResizeCallback cb) {
    g_resize_cb = std::move(cb);
    g_resize_flag = 0;

    struct sigaction sa;
    sa.sa_handler = sigwinch_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGWINCH, &sa, &g_old_winch);
}

void remove_terminal_resize() {
    sigaction(SIGWINCH, &g_old_winch, nullptr);
    g_resize_cb = nullptr;
}

#endif

bool take_resize() {
    if (!g_resize_flag) return false;
    g_resize_flag = 0;
    if (g_resize_cb) g_resize_cb();
    return true;
}

// ── InterruptGuard ───────────────────────────────────────────

static volatile sig_atomic_t g_interrupted = 0;

static void sigint_handler(int) {
    g_interrupted = 1;
}

#ifdef _WIN32

struct InterruptGuard::Impl {
    void (*old_handler)(int);
};

InterruptGuard::InterruptGuard() : impl_(new Impl) {
    g_interrupted = 0;
    impl_->old_handler = std::signal(SIGINT, sigint_handler);
}

InterruptGuard::~InterruptGuard() {
    std::signal(SIGINT, impl_->old_handler);
    delete impl_;
}

#else

struct InterruptGuard::Impl {
    struct sigaction old_sa;
};

InterruptGuard::InterruptGuard() : impl_(new Impl) {
    g_interrupted = 0;
    struct sigaction sa;
    sa.sa_handler = sigint_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, &impl_->old_sa);
}

InterruptGuard::~InterruptGuard() {
    sigaction(SIGINT, &impl_->old_sa, nullptr);
    delete impl_;
}

#endif

bool InterruptGuard::interrupted() { return g_interrupted != 0; }
void InterruptGuard::reset() { g_interrupted = 0; }
void InterruptGuard::trigger() { g_interrupted = 1; }

} // namespace platform
