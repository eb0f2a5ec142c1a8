#include "poller.hpp"
#include <core/constants.hpp>
#include <platform/platform.hpp>
#include <platform/terminal.hpp>
#include <algorithm>

#ifndef _WIN32
#  include <poll.h>
#  include <unistd.h>
#endif

Readiness PosixPoller::wait(int remote_fd, int input_fd, int timeout_ms) {
    Readiness r;
#ifdef _WIN32
    (void)remote_fd;
    (void)input_fd;
    platform::sleep_ms(timeout_ms);
    r.remote = true;
#else
    struct pollfd fds[2];
    nfds_t n = 0;
    int remote_idx = -1, input_idx = -1;
    if (remote_fd >= 0) {
        fds[n] = {remote_fd, POLLIN, 0};
        remote_idx = static_cast<int>(n++);
    }
    if (input_fd >= 0) {
        fds[n] = {input_fd, POLLIN, 0};
        input_idx = static_cast<int>(n++);
    }
    if (n == 0) {
        platform::sleep_ms(timeout_ms);
        return r;
    }
    if (poll(fds, n, timeout_ms) <= 0) return r;

    // HUP counts as readable: the following read reports the EOF
    if (remote_idx >= 0)
        r.remote = fds[remote_idx].revents & (POLLIN | POLLHUP | POLLERR);
    if (input_idx >= 0)
        r.input = fds[input_idx].revents & (POLLIN | POLLHUP | POLLERR);
#endif
    return r;
}

TickPoller::TickPoller(int tick_ms) : tick_ms_(tick_ms > 0 ? tick_ms : 1) {}

Readiness TickPoller::wait(int /*remote_fd*/, int input_fd, int timeout_ms) {
    Readiness r;
    int wait_ms = std::min(tick_ms_, std::max(timeout_ms, 0));
    if (input_fd >= 0) {
        r.input = platform::poll_stdin(wait_ms);
    } else {
        platform::sleep_ms(wait_ms);
    }
    r.remote = true;
    return r;
}

std::unique_ptr<ReadinessPoller> make_default_poller() {
#ifdef _WIN32
    return std::make_unique<TickPoller>(MUX_TICK_INTERVAL_MS);
#else
    return std::make_unique<PosixPoller>();
#endif
}
