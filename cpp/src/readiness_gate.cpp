#include "readiness_gate.hpp"

#include <algorithm>
#include <iostream>

namespace gate {

const char* to_string(GateOutcome outcome) {
    switch (outcome) {
    case GateOutcome::Ready: return "ready";
    case GateOutcome::TimedOut: return "timed out";
    case GateOutcome::Interrupted: return "interrupted";
    }
    return "unknown";
}

ReadinessGate::ReadinessGate(asio::io_context& ioc, Prober& prober)
    : ioc_(ioc)
    , prober_(prober)
    , timer_(ioc)
{
}

GateOutcome ReadinessGate::wait_for(const Endpoint& endpoint, const RetryPolicy& policy) {
    return wait_for(std::vector<Endpoint>{endpoint}, policy);
}

GateOutcome ReadinessGate::wait_for(const std::vector<Endpoint>& endpoints, const RetryPolicy& policy) {
    policy.validate();

    endpoints_ = endpoints;
    policy_ = policy;
    current_ = 0;
    attempts_ = 0;
    endpoint_attempts_ = 0;
    sleeps_ = 0;
    interrupted_ = false;
    elapsed_ = std::chrono::milliseconds(0);

    if (endpoints_.empty()) {
        outcome_ = GateOutcome::Ready;
        return outcome_;
    }

    std::cout << "[Gate] Waiting for " << endpoints_.size() << " endpoint(s), "
              << policy_.describe() << std::endl;

    done_ = false;
    start_ = std::chrono::steady_clock::now();
    if (policy_.timeout) {
        deadline_ = start_ + *policy_.timeout;
    }

    ioc_.restart();
    asio::post(ioc_, [this]() { attempt(); });
    ioc_.run();

    return outcome_;
}

void ReadinessGate::interrupt() {
    if (done_) {
        return;
    }
    interrupted_ = true;
    timer_.cancel();
    prober_.cancel();
}

void ReadinessGate::attempt() {
    ++attempts_;
    ++endpoint_attempts_;
    prober_.async_probe(
        endpoints_[current_],
        policy_.attempt_timeout(),
        [this](const boost::system::error_code& ec) {
            on_probe(ec);
        }
    );
}

void ReadinessGate::on_probe(const boost::system::error_code& ec) {
    if (done_) {
        return;
    }
    if (interrupted_) {
        finish(GateOutcome::Interrupted);
        return;
    }

    const Endpoint& endpoint = endpoints_[current_];
    if (!ec) {
        std::cout << "[Gate] " << endpoint.to_string() << " is ready (attempt "
                  << endpoint_attempts_ << ")" << std::endl;
        ++current_;
        endpoint_attempts_ = 0;
        if (current_ == endpoints_.size()) {
            finish(GateOutcome::Ready);
        } else {
            attempt();
        }
        return;
    }

    std::cout << "[Gate] " << endpoint.to_string() << " not ready (attempt "
              << endpoint_attempts_ << "): " << ec.message() << std::endl;

    if (policy_.bounded() && std::chrono::steady_clock::now() >= deadline_) {
        std::cerr << "[Gate] Gave up on " << endpoint.to_string() << " after "
                  << attempts_ << " attempt(s)" << std::endl;
        finish(GateOutcome::TimedOut);
        return;
    }
    schedule_retry();
}

void ReadinessGate::schedule_retry() {
    auto delay = policy_.interval;
    if (policy_.bounded()) {
        // The last sleep ends at the deadline so one final attempt runs there
        auto remaining = std::chrono::ceil<std::chrono::milliseconds>(
            deadline_ - std::chrono::steady_clock::now());
        delay = std::min(delay, remaining);
    }

    ++sleeps_;
    timer_.expires_after(delay);
    timer_.async_wait([this](const boost::system::error_code& ec) {
        if (done_) {
            return;
        }
        if (interrupted_ || ec == asio::error::operation_aborted) {
            finish(GateOutcome::Interrupted);
            return;
        }
        attempt();
    });
}

void ReadinessGate::finish(GateOutcome outcome) {
    if (done_) {
        return;
    }
    done_ = true;
    outcome_ = outcome;
    elapsed_ = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_);
    timer_.cancel();

    std::cout << "[Gate] Outcome: " << to_string(outcome) << " after "
              << elapsed_.count() << "ms" << std::endl;

    // Signal sets and other long-lived waits stay registered on the context
    ioc_.stop();
}

} // namespace gate
