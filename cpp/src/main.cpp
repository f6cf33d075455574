#include <cstdlib>
#include <iostream>
#include <exception>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>

#include "bootstrap.hpp"
#include "config.hpp"
#include "env_file.hpp"
#include "errors.hpp"
#include "prober.hpp"
#include "version.hpp"

namespace asio = boost::asio;
namespace ssl = asio::ssl;

int main(int argc, char* argv[]) {
    try {
        auto command_line = gate::parse_command_line(argc, argv);
        if (command_line.help) {
            std::cout << command_line.usage << std::endl;
            return gate::exit_code::OK;
        }
        if (command_line.version) {
            std::cout << "launchgate " << gate::VERSION << std::endl;
            return gate::exit_code::OK;
        }

        // .env values fill in whatever the container did not set
        auto env = gate::process_env();
        bool env_file_required = false;
        auto env_file = gate::env_file_path(command_line, env, env_file_required);
        gate::load_env_file(env_file, env_file_required);

        auto config = gate::build_config(command_line, env);

        std::cout << "[launchgate " << gate::VERSION << "] Starting "
                  << config.launch.describe() << " once ready" << std::endl;

        // IO context for the probes, timers and signals
        asio::io_context ioc;

        // SSL context for https probes
        ssl::context ssl_ctx(ssl::context::tls_client);
        if (config.tls_verify) {
            ssl_ctx.set_default_verify_paths();
            ssl_ctx.set_verify_mode(ssl::verify_peer);
        } else {
            ssl_ctx.set_verify_mode(ssl::verify_none);
        }

        gate::NetworkProber prober(ioc, ssl_ctx, config.tls_verify);
        gate::Bootstrap bootstrap(ioc, prober, std::move(config));
        int code = bootstrap.run();

        // A name lookup abandoned at its deadline parks a resolver thread in
        // getaddrinfo, and destroying the io_context would join it
        std::cout.flush();
        std::cerr.flush();
        std::_Exit(code);

    } catch (const gate::ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return gate::exit_code::CONFIG;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return gate::exit_code::FAILURE;
    }
}
