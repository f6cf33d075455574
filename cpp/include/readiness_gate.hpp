#pragma once

#include <boost/asio.hpp>
#include <chrono>
#include <vector>

#include "endpoint.hpp"
#include "prober.hpp"
#include "retry_policy.hpp"

namespace asio = boost::asio;

namespace gate {

enum class GateOutcome {
    Ready,
    TimedOut,
    Interrupted
};

const char* to_string(GateOutcome outcome);

// Polls endpoints until they accept connections or the policy's deadline passes.
// Single-threaded: wait_for drives the io_context itself and returns once the
// outcome is known.
class ReadinessGate {
public:
    ReadinessGate(asio::io_context& ioc, Prober& prober);

    GateOutcome wait_for(const Endpoint& endpoint, const RetryPolicy& policy);

    // Waits for every endpoint in order under one shared deadline
    GateOutcome wait_for(const std::vector<Endpoint>& endpoints, const RetryPolicy& policy);

    // Stops a wait in progress; wait_for then returns Interrupted
    void interrupt();

    // Counters of the last wait
    int attempts() const { return attempts_; }
    int sleeps() const { return sleeps_; }
    std::chrono::milliseconds elapsed() const { return elapsed_; }

private:
    void attempt();
    void on_probe(const boost::system::error_code& ec);
    void schedule_retry();
    void finish(GateOutcome outcome);

    asio::io_context& ioc_;
    Prober& prober_;
    asio::steady_timer timer_;

    std::vector<Endpoint> endpoints_;
    RetryPolicy policy_;
    std::size_t current_ = 0;

    std::chrono::steady_clock::time_point start_;
    std::chrono::steady_clock::time_point deadline_;
    std::chrono::milliseconds elapsed_{0};

    int attempts_ = 0;
    int endpoint_attempts_ = 0;
    int sleeps_ = 0;
    bool interrupted_ = false;
    bool done_ = true;
    GateOutcome outcome_ = GateOutcome::TimedOut;
};

} // namespace gate
