#include "config.hpp"
#include "errors.hpp"

#include <boost/program_options.hpp>

#include <algorithm>
#include <cctype>
#include <cstring>
#include <iostream>
#include <sstream>

namespace po = boost::program_options;

namespace {
    constexpr const char* DEFAULT_DB_PORT = "5432";
    constexpr const char* DEFAULT_ENV_FILE = ".env";

    std::string trim(const std::string& s) {
        auto begin = s.find_first_not_of(" \t");
        if (begin == std::string::npos) return "";
        auto end = s.find_last_not_of(" \t");
        return s.substr(begin, end - begin + 1);
    }

    std::string to_lower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    }

    // Set and not empty
    std::optional<std::string> non_empty(const gate::EnvLookup& env, const std::string& name) {
        auto value = env(name);
        if (!value || trim(*value).empty()) {
            return std::nullopt;
        }
        return trim(*value);
    }

    bool is_truthy(const std::string& value) {
        auto v = to_lower(value);
        return v == "1" || v == "true" || v == "yes" || v == "on";
    }

    void add_endpoint(std::vector<gate::Endpoint>& endpoints, const gate::Endpoint& endpoint) {
        if (std::find(endpoints.begin(), endpoints.end(), endpoint) == endpoints.end()) {
            endpoints.push_back(endpoint);
        }
    }

    // Endpoints named by DB_HOST/DB_PORT, DB_URL and WAIT_FOR.
    // Sets `file_database` when DB_URL points at a database without a server.
    std::vector<gate::Endpoint> endpoints_from_env(const gate::EnvLookup& env, bool& file_database) {
        std::vector<gate::Endpoint> endpoints;
        file_database = false;

        if (auto host = non_empty(env, "DB_HOST")) {
            gate::Endpoint endpoint;
            endpoint.host = *host;
            endpoint.port = gate::parse_port(non_empty(env, "DB_PORT").value_or(DEFAULT_DB_PORT));
            add_endpoint(endpoints, endpoint);
        } else if (auto url = non_empty(env, "DB_URL")) {
            auto endpoint = gate::endpoint_from_database_url(*url);
            if (endpoint) {
                add_endpoint(endpoints, *endpoint);
            } else {
                file_database = true;
                std::cout << "[Config] DB_URL names a file database, nothing to wait for" << std::endl;
            }
        }

        if (auto extra = non_empty(env, "WAIT_FOR")) {
            std::istringstream list(*extra);
            std::string item;
            while (std::getline(list, item, ',')) {
                item = trim(item);
                if (!item.empty()) {
                    add_endpoint(endpoints, gate::parse_endpoint(item));
                }
            }
        }
        return endpoints;
    }

    std::optional<std::string> pick(const std::optional<std::string>& cli,
                                    const gate::EnvLookup& env, const std::string& name) {
        if (cli) {
            return cli;
        }
        return non_empty(env, name);
    }
}

namespace gate {

CommandLine parse_command_line(int argc, const char* const argv[]) {
    CommandLine result;

    // Everything after "--" belongs to the command, untouched
    int option_count = argc;
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--") == 0) {
            option_count = i;
            break;
        }
    }

    po::options_description options("Options");
    options.add_options()
        ("help,h", "print this help and exit")
        ("version,V", "print the version and exit")
        ("wait,w", po::value<std::vector<std::string>>(&result.waits)->composing(),
            "endpoint to wait for: host:port, tcp://, http:// or https:// (repeatable)")
        ("interval,i", po::value<std::string>(), "retry interval in seconds")
        ("timeout,t", po::value<std::string>(), "overall timeout in seconds, 0 for none")
        ("connect-timeout,c", po::value<std::string>(), "per-attempt connect timeout in seconds")
        ("env,e", po::value<std::vector<std::string>>(&result.env_overrides)->composing(),
            "KEY=VALUE set in the command's environment (repeatable)")
        ("env-file", po::value<std::string>(), "dotenv file to load before reading the environment")
        ("supervise", po::bool_switch(&result.supervise),
            "stay the parent process and forward signals instead of exec");

    po::options_description hidden;
    hidden.add_options()
        ("command", po::value<std::vector<std::string>>(), "command to launch");

    po::options_description all;
    all.add(options).add(hidden);

    po::positional_options_description positional;
    positional.add("command", -1);

    std::ostringstream usage;
    usage << "Usage: launchgate [options] [--] command [args...]\n\n"
          << "Waits until the configured endpoints accept connections, then runs command.\n\n"
          << options;
    result.usage = usage.str();

    po::variables_map vm;
    try {
        po::store(po::command_line_parser(option_count, argv)
                      .options(all)
                      .positional(positional)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (const po::unknown_option& e) {
        throw ConfigError(std::string(e.what()) + " (options meant for the command go after --)");
    } catch (const po::error& e) {
        throw ConfigError(e.what());
    }

    result.help = vm.count("help") > 0;
    result.version = vm.count("version") > 0;
    if (vm.count("interval")) {
        result.interval = vm["interval"].as<std::string>();
    }
    if (vm.count("timeout")) {
        result.timeout = vm["timeout"].as<std::string>();
    }
    if (vm.count("connect-timeout")) {
        result.connect_timeout = vm["connect-timeout"].as<std::string>();
    }
    if (vm.count("env-file")) {
        result.env_file = vm["env-file"].as<std::string>();
    }
    if (vm.count("command")) {
        result.command = vm["command"].as<std::vector<std::string>>();
    }
    for (int i = option_count + 1; i < argc; ++i) {
        result.command.emplace_back(argv[i]);
    }
    return result;
}

std::string env_file_path(const CommandLine& command_line, const EnvLookup& env, bool& required) {
    if (command_line.env_file) {
        required = true;
        return *command_line.env_file;
    }
    if (auto path = non_empty(env, "ENV_FILE")) {
        required = true;
        return *path;
    }
    required = false;
    return DEFAULT_ENV_FILE;
}

GateConfig build_config(const CommandLine& command_line, const EnvLookup& env) {
    GateConfig config;

    bool file_database = false;
    if (!command_line.waits.empty()) {
        for (const auto& wait : command_line.waits) {
            add_endpoint(config.endpoints, parse_endpoint(wait));
        }
    } else {
        config.endpoints = endpoints_from_env(env, file_database);
    }
    if (config.endpoints.empty() && !file_database) {
        throw ConfigError("nothing to wait for: pass --wait or set DB_HOST, DB_URL or WAIT_FOR");
    }

    if (auto interval = pick(command_line.interval, env, "WAIT_INTERVAL_SECONDS")) {
        config.policy.interval = parse_seconds(*interval, "retry interval");
    }
    if (auto timeout = pick(command_line.timeout, env, "WAIT_TIMEOUT_SECONDS")) {
        config.policy.timeout = parse_timeout(*timeout, "timeout");
    }
    if (auto connect = pick(command_line.connect_timeout, env, "WAIT_CONNECT_TIMEOUT_SECONDS")) {
        config.policy.connect_timeout = parse_seconds(*connect, "connect timeout");
    }
    config.policy.validate();

    if (auto verify = non_empty(env, "WAIT_TLS_VERIFY")) {
        config.tls_verify = is_truthy(*verify);
    }

    if (command_line.command.empty()) {
        throw ConfigError("no command to launch");
    }
    config.launch.executable = command_line.command.front();
    config.launch.args.assign(command_line.command.begin() + 1, command_line.command.end());
    if (config.launch.executable.empty()) {
        throw ConfigError("empty command name");
    }

    for (const auto& entry : command_line.env_overrides) {
        auto eq = entry.find('=');
        if (eq == std::string::npos || eq == 0) {
            throw ConfigError("--env expects KEY=VALUE, got '" + entry + "'");
        }
        config.launch.environment[entry.substr(0, eq)] = entry.substr(eq + 1);
    }

    if (command_line.supervise) {
        config.launch.mode = LaunchMode::Supervise;
    } else if (auto mode = non_empty(env, "LAUNCH_MODE")) {
        auto lowered = to_lower(*mode);
        if (lowered == "exec") {
            config.launch.mode = LaunchMode::Exec;
        } else if (lowered == "supervise") {
            config.launch.mode = LaunchMode::Supervise;
        } else {
            throw ConfigError("LAUNCH_MODE must be exec or supervise, got '" + *mode + "'");
        }
    }

    return config;
}

} // namespace gate
