#pragma once

#include <stdexcept>
#include <string>

namespace gate {

// Process exit codes. Codes 69 and 78 follow sysexits.h, 126/127 follow the shell.
namespace exit_code {
    constexpr int OK = 0;
    constexpr int FAILURE = 1;
    constexpr int TIMED_OUT = 69;
    constexpr int CONFIG = 78;
    constexpr int NOT_EXECUTABLE = 126;
    constexpr int NOT_FOUND = 127;
    constexpr int SIGNAL_BASE = 128;
}

// Malformed or missing configuration, raised before any probing starts
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

// The target executable could not replace (or be spawned as) the process
class LaunchError : public std::runtime_error {
public:
    LaunchError(const std::string& executable, int error_number);

    int error_number() const { return errno_; }
    int exit_code() const;

private:
    int errno_;
};

} // namespace gate
