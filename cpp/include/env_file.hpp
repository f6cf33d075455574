#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>

namespace gate {

// Reads one environment variable; nullopt when unset
using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

// Lookup backed by the real process environment
EnvLookup process_env();

// Lookup backed by a fixed map, for tests and overrides
EnvLookup map_env(std::map<std::string, std::string> values);

// Parses dotenv text: KEY=VALUE lines, "export " prefix, # comments, quoted values.
// Throws ConfigError naming the offending line.
std::map<std::string, std::string> parse_env_file(const std::string& content, const std::string& source);

// Loads a dotenv file into the process environment without overwriting
// variables that are already set. Returns the number of variables set.
// A missing file is an error only when `required` is true.
int load_env_file(const std::string& path, bool required);

} // namespace gate
