#pragma once

#include <chrono>
#include <functional>
#include <string>
#include <core/constants.hpp>
#include <core/logger.hpp>
#include <core/types.hpp>
#include <ssh/connection_manager.hpp>
#include <ssh/remote_host.hpp>

// Time source for the liveness waits.
class Clock {
public:
    virtual ~Clock() = default;
    virtual std::chrono::steady_clock::time_point now() = 0;
    virtual void sleep_for(std::chrono::seconds duration) = 0;
};

class SystemClock : public Clock {
public:
    std::chrono::steady_clock::time_point now() override;
    void sleep_for(std::chrono::seconds duration) override;
};

struct RebootTiming {
    int down_timeout_secs = REBOOT_DOWN_TIMEOUT_SECS;
    int down_poll_secs = REBOOT_DOWN_POLL_SECS;
    int up_poll_secs = REBOOT_UP_POLL_SECS;
};

enum class RebootPhase { Issue, DownWait, UpWait, Done };

// Dispatches the reboot command. Fails only if it could not be sent.
using RebootIssuer = std::function<Result<void>()>;

// Send the reboot command on host. The connection dropping afterwards is
// expected and not an error.
Result<void> issue_reboot(RemoteHost& host, Logger& logger);

// Issue, then (when wait_secs > 0) wait for the port to close and reopen.
// Uses only the reachability probe, never a session.
class RebootOrchestrator {
public:
    RebootOrchestrator(Logger& logger, PortProbe probe, Clock& clock, RebootTiming timing = {});

    Result<void> reboot(const std::string& host, int port, const RebootIssuer& issue, int wait_secs);

    RebootPhase phase() const { return phase_; }
    bool observed_down() const { return observed_down_; }

private:
    Logger& logger_;
    PortProbe probe_;
    Clock& clock_;
    RebootTiming timing_;
    RebootPhase phase_ = RebootPhase::Issue;
    bool observed_down_ = false;

    void wait_down(const std::string& host, int port);
    Result<void> wait_up(const std::string& host, int port, int wait_secs);
};
