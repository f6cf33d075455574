#pragma once

#include <boost/asio.hpp>

#include "config.hpp"
#include "prober.hpp"
#include "readiness_gate.hpp"

namespace asio = boost::asio;

namespace gate {

enum class GateState {
    Waiting,
    Ready,
    Launched,
    TimedOut,
    Interrupted,
    LaunchFailed
};

const char* to_string(GateState state);

// Waiting -> Ready -> Launched, or one of the terminal failures.
// run() returns the process exit code; in exec mode it only returns on failure.
class Bootstrap {
public:
    Bootstrap(asio::io_context& ioc, Prober& prober, GateConfig config);

    int run();

    GateState state() const { return state_; }
    const ReadinessGate& readiness_gate() const { return gate_; }

private:
    GateOutcome wait_for_dependencies();
    int launch();

    asio::io_context& ioc_;
    ReadinessGate gate_;
    GateConfig config_;
    GateState state_;
    int signal_number_;
};

} // namespace gate
