#pragma once

#include <memory>

// What became ready during one wait.
struct Readiness {
    bool remote = false;
    bool input = false;
};

// Waits for the next suspension point of a channel bridge: remote output,
// local input, or the timeout. Implementations are interchangeable.
class ReadinessPoller {
public:
    virtual ~ReadinessPoller() = default;

    // input_fd < 0 means no local input is watched.
    virtual Readiness wait(int remote_fd, int input_fd, int timeout_ms) = 0;
};

// poll(2) on both descriptors.
class PosixPoller : public ReadinessPoller {
public:
    Readiness wait(int remote_fd, int input_fd, int timeout_ms) override;
};

// For consoles without a unified readiness primitive: sleeps a short tick
// and reports the remote side as ready every time, so non-blocking reads
// drain it. Local input is checked on its own.
class TickPoller : public ReadinessPoller {
public:
    explicit TickPoller(int tick_ms);
    Readiness wait(int remote_fd, int input_fd, int timeout_ms) override;

private:
    int tick_ms_;
};

// PosixPoller where poll(2) works on the console, TickPoller otherwise.
std::unique_ptr<ReadinessPoller> make_default_poller();
