#include "reboot_orchestrator.hpp"
#include <fmt/format.h>
#include <thread>

std::chrono::steady_clock::time_point SystemClock::now() {
    return std::chrono::steady_clock::now();
}

void SystemClock::sleep_for(std::chrono::seconds duration) {
    std::this_thread::sleep_for(duration);
}

Result<void> issue_reboot(RemoteHost& host, Logger& logger) {
    auto opened = host.open_exec(REBOOT_COMMAND);
    if (opened.is_err()) {
        return Result<void>::Err("Could not send reboot command: " + opened.error, opened.kind);
    }
    // Whatever happens after dispatch (drop, timeout) still counts as issued
    auto r = run_channel(*opened.value, "", REBOOT_ISSUE_TIMEOUT_SECS);
    logger.info(fmt::format("Reboot command issued; exit code {} (disconnect expected)", r.exit_code));
    return Result<void>::Ok();
}

RebootOrchestrator::RebootOrchestrator(Logger& logger, PortProbe probe, Clock& clock,
                                       RebootTiming timing)
    : logger_(logger), probe_(std::move(probe)), clock_(clock), timing_(timing) {
}

Result<void> RebootOrchestrator::reboot(const std::string& host, int port,
                                        const RebootIssuer& issue, int wait_secs) {
    phase_ = RebootPhase::Issue;
    observed_down_ = false;

    logger_.info(fmt::format("Issuing reboot on {}:{}", host, port));
    auto issued = issue();
    if (issued.is_err()) {
        logger_.error(issued.error);
        return issued;
    }

    if (wait_secs <= 0) {
        phase_ = RebootPhase::Done;
        logger_.success("Reboot initiated on " + host);
        return Result<void>::Ok();
    }

    wait_down(host, port);
    auto up = wait_up(host, port, wait_secs);
    if (up.is_ok()) phase_ = RebootPhase::Done;
    return up;
}

// Not seeing the host go down is only a warning: it may have come back
// faster than we polled.
void RebootOrchestrator::wait_down(const std::string& host, int port) {
    phase_ = RebootPhase::DownWait;
    logger_.progress(fmt::format("Waiting for {} to go down...", host));

    auto start = clock_.now();
    while (probe_(host, port)) {
        clock_.sleep_for(std::chrono::seconds(timing_.down_poll_secs));
        if (clock_.now() - start >= std::chrono::seconds(timing_.down_timeout_secs)) {
            logger_.warn(fmt::format("{}:{} still reachable after {}s; continuing",
                                     host, port, timing_.down_timeout_secs));
            return;
        }
    }
    observed_down_ = true;
}

Result<void> RebootOrchestrator::wait_up(const std::string& host, int port, int wait_secs) {
    phase_ = RebootPhase::UpWait;
    logger_.progress(fmt::format("Waiting for {} to come back (up to {}s)...", host, wait_secs));

    auto start = clock_.now();
    while (!probe_(host, port)) {
        clock_.sleep_for(std::chrono::seconds(timing_.up_poll_secs));
        if (clock_.now() - start >= std::chrono::seconds(wait_secs)) {
            std::string msg = fmt::format("Timeout waiting for {}:{} to come back", host, port);
            logger_.error(msg);
            return Result<void>::Err(msg, ErrorKind::RebootTimeout);
        }
    }
    logger_.success(fmt::format("Server is back online: {}:{}", host, port));
    return Result<void>::Ok();
}
