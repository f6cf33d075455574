#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace gate {

enum class Scheme {
    Tcp,
    Http,
    Https
};

// A dependent service the gate waits for
struct Endpoint {
    Scheme scheme = Scheme::Tcp;
    std::string host;
    std::uint16_t port = 0;
    std::string path = "/";   // HTTP(S) only

    std::string port_string() const { return std::to_string(port); }
    std::string to_string() const;

    // IPv6 literals in brackets, as they appear in URLs
    std::string host_literal() const;

    // HTTP Host header value; the port is left out when it is the scheme default
    std::string host_header() const;

    bool operator==(const Endpoint& other) const {
        return scheme == other.scheme && host == other.host
            && port == other.port && path == other.path;
    }
    bool operator!=(const Endpoint& other) const { return !(*this == other); }
};

// Accepts "host:port", "[v6]:port", "tcp://host:port", "http(s)://host[:port][/path]".
// Throws ConfigError on malformed input.
Endpoint parse_endpoint(const std::string& text);

// Maps a database URL (postgresql://user:pw@db:5432/app, redis://cache, ...)
// to the TCP endpoint of its server. Returns nullopt for file databases (sqlite).
std::optional<Endpoint> endpoint_from_database_url(const std::string& url);

// Parses a decimal port in 1..65535. Throws ConfigError.
std::uint16_t parse_port(const std::string& text);

} // namespace gate
