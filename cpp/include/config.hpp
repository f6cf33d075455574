#pragma once

#include <optional>
#include <string>
#include <vector>

#include "endpoint.hpp"
#include "env_file.hpp"
#include "launcher.hpp"
#include "retry_policy.hpp"

namespace gate {

// Raw command line, before the environment is consulted
struct CommandLine {
    std::vector<std::string> waits;
    std::optional<std::string> interval;
    std::optional<std::string> timeout;
    std::optional<std::string> connect_timeout;
    std::vector<std::string> env_overrides;
    std::optional<std::string> env_file;
    bool supervise = false;
    bool help = false;
    bool version = false;
    std::vector<std::string> command;
    std::string usage;
};

// Everything the bootstrap needs, fixed for the lifetime of the process
struct GateConfig {
    std::vector<Endpoint> endpoints;
    RetryPolicy policy;
    LaunchSpec launch;
    bool tls_verify = false;
};

// Throws ConfigError on unknown options or malformed values
CommandLine parse_command_line(int argc, const char* const argv[]);

// Path of the dotenv file to load; `required` is set when it was named explicitly
std::string env_file_path(const CommandLine& command_line, const EnvLookup& env, bool& required);

// Combines the command line with the environment. Command-line values win;
// --wait replaces the endpoints the environment would name.
GateConfig build_config(const CommandLine& command_line, const EnvLookup& env);

} // namespace gate
