#include "bootstrap.hpp"
#include "errors.hpp"

#include <csignal>
#include <iostream>

namespace gate {

const char* to_string(GateState state) {
    switch (state) {
    case GateState::Waiting: return "waiting";
    case GateState::Ready: return "ready";
    case GateState::Launched: return "launched";
    case GateState::TimedOut: return "timed out";
    case GateState::Interrupted: return "interrupted";
    case GateState::LaunchFailed: return "launch failed";
    }
    return "unknown";
}

Bootstrap::Bootstrap(asio::io_context& ioc, Prober& prober, GateConfig config)
    : ioc_(ioc)
    , gate_(ioc, prober)
    , config_(std::move(config))
    , state_(GateState::Waiting)
    , signal_number_(0)
{
}

int Bootstrap::run() {
    state_ = GateState::Waiting;

    switch (wait_for_dependencies()) {
    case GateOutcome::Ready:
        state_ = GateState::Ready;
        return launch();
    case GateOutcome::TimedOut:
        state_ = GateState::TimedOut;
        std::cerr << "[Bootstrap] Dependencies not ready, not starting "
                  << config_.launch.executable << std::endl;
        return exit_code::TIMED_OUT;
    case GateOutcome::Interrupted:
        state_ = GateState::Interrupted;
        std::cerr << "[Bootstrap] Interrupted while waiting" << std::endl;
        return exit_code::SIGNAL_BASE + (signal_number_ != 0 ? signal_number_ : SIGTERM);
    }
    return exit_code::FAILURE;
}

GateOutcome Bootstrap::wait_for_dependencies() {
    // Termination signals cut the wait short instead of exhausting the retry budget
    asio::signal_set signals(ioc_, SIGINT, SIGTERM);
    signals.async_wait([this](const boost::system::error_code& ec, int signal_number) {
        if (ec) {
            return;
        }
        std::cout << "[Bootstrap] Received signal " << signal_number << std::endl;
        signal_number_ = signal_number;
        gate_.interrupt();
    });

    if (config_.endpoints.empty()) {
        std::cout << "[Bootstrap] No endpoints to wait for" << std::endl;
    }
    auto outcome = gate_.wait_for(config_.endpoints, config_.policy);

    // A signal caught as the gate finished is still queued behind the stop
    ioc_.restart();
    ioc_.poll();
    if (signal_number_ != 0) {
        outcome = GateOutcome::Interrupted;
    }

    boost::system::error_code ignored;
    signals.cancel(ignored);
    return outcome;
}

int Bootstrap::launch() {
    try {
        if (config_.launch.mode == LaunchMode::Supervise) {
            state_ = GateState::Launched;
            return supervise_process(ioc_, config_.launch);
        }
        state_ = GateState::Launched;
        exec_process(config_.launch);
    } catch (const LaunchError& e) {
        state_ = GateState::LaunchFailed;
        std::cerr << "[Bootstrap] Launch failed: " << e.what() << std::endl;
        return e.exit_code();
    }
    return exit_code::FAILURE;
}

} // namespace gate
