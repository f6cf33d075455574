#pragma once

#include <boost/asio.hpp>
#include <map>
#include <string>
#include <vector>

namespace asio = boost::asio;

namespace gate {

enum class LaunchMode {
    Exec,        // replace the process image, keeping the PID
    Supervise    // fork a child, forward signals, propagate its exit code
};

// The process control is handed to once the gate passes
struct LaunchSpec {
    std::string executable;
    std::vector<std::string> args;                   // arguments after argv[0]
    std::map<std::string, std::string> environment;  // overrides on top of the inherited environment
    LaunchMode mode = LaunchMode::Exec;

    std::string describe() const;
};

// Replaces the current process image. Only returns by throwing LaunchError.
void exec_process(const LaunchSpec& spec);

// Runs the command as a child, forwarding termination signals to it, and
// returns its exit code (128 + signal when it was killed).
// Throws LaunchError when the child cannot exec the command.
int supervise_process(asio::io_context& ioc, const LaunchSpec& spec);

} // namespace gate
