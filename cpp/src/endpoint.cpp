#include "endpoint.hpp"
#include "errors.hpp"

#include <algorithm>
#include <cctype>
#include <map>

namespace {
    std::string to_lower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    }

    // Default server ports of the database URL schemes we know about
    const std::map<std::string, std::uint16_t>& database_ports() {
        static const std::map<std::string, std::uint16_t> ports = {
            {"postgresql", 5432},
            {"postgres", 5432},
            {"mysql", 3306},
            {"mariadb", 3306},
            {"redis", 6379},
            {"rediss", 6379},
            {"mongodb", 27017},
            {"mssql", 1433},
        };
        return ports;
    }

    struct Authority {
        std::string host;
        std::string port;   // empty when absent
    };

    // Splits "host", "host:port", "[v6]" or "[v6]:port"
    Authority split_authority(const std::string& text, const std::string& original) {
        Authority result;
        if (!text.empty() && text.front() == '[') {
            auto close = text.find(']');
            if (close == std::string::npos) {
                throw gate::ConfigError("unterminated IPv6 address in '" + original + "'");
            }
            result.host = text.substr(1, close - 1);
            auto rest = text.substr(close + 1);
            if (!rest.empty()) {
                if (rest.front() != ':') {
                    throw gate::ConfigError("unexpected text after IPv6 address in '" + original + "'");
                }
                result.port = rest.substr(1);
                if (result.port.empty()) {
                    throw gate::ConfigError("empty port in '" + original + "'");
                }
            }
        } else {
            auto colon = text.rfind(':');
            if (colon == std::string::npos) {
                result.host = text;
            } else {
                result.host = text.substr(0, colon);
                result.port = text.substr(colon + 1);
                if (result.port.empty()) {
                    throw gate::ConfigError("empty port in '" + original + "'");
                }
            }
        }
        if (result.host.empty()) {
            throw gate::ConfigError("missing host in '" + original + "'");
        }
        return result;
    }
}

namespace gate {

std::string Endpoint::host_literal() const {
    return host.find(':') != std::string::npos ? "[" + host + "]" : host;
}

std::string Endpoint::host_header() const {
    bool default_port = (scheme == Scheme::Http && port == 80)
        || (scheme == Scheme::Https && port == 443);
    return default_port ? host_literal() : host_literal() + ":" + port_string();
}

std::string Endpoint::to_string() const {
    std::string host_part = host_literal();
    switch (scheme) {
    case Scheme::Http:
        return "http://" + host_part + ":" + port_string() + path;
    case Scheme::Https:
        return "https://" + host_part + ":" + port_string() + path;
    case Scheme::Tcp:
        break;
    }
    return host_part + ":" + port_string();
}

std::uint16_t parse_port(const std::string& text) {
    if (text.empty() || text.size() > 5
        || !std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c); })) {
        throw ConfigError("invalid port '" + text + "'");
    }
    int value = std::stoi(text);
    if (value < 1 || value > 65535) {
        throw ConfigError("port " + text + " out of range 1-65535");
    }
    return static_cast<std::uint16_t>(value);
}

Endpoint parse_endpoint(const std::string& text) {
    Endpoint endpoint;
    std::string rest = text;

    auto sep = text.find("://");
    if (sep != std::string::npos) {
        std::string scheme = to_lower(text.substr(0, sep));
        if (scheme == "tcp") {
            endpoint.scheme = Scheme::Tcp;
        } else if (scheme == "http") {
            endpoint.scheme = Scheme::Http;
        } else if (scheme == "https") {
            endpoint.scheme = Scheme::Https;
        } else {
            throw ConfigError("unsupported endpoint scheme '" + scheme + "' in '" + text + "'");
        }
        rest = text.substr(sep + 3);
    }

    std::string authority = rest;
    if (endpoint.scheme != Scheme::Tcp) {
        auto slash = rest.find('/');
        if (slash != std::string::npos) {
            authority = rest.substr(0, slash);
            endpoint.path = rest.substr(slash);
        }
    } else if (rest.find('/') != std::string::npos) {
        throw ConfigError("unexpected path in TCP endpoint '" + text + "'");
    }

    Authority parts = split_authority(authority, text);
    endpoint.host = parts.host;
    if (!parts.port.empty()) {
        endpoint.port = parse_port(parts.port);
    } else if (endpoint.scheme == Scheme::Http) {
        endpoint.port = 80;
    } else if (endpoint.scheme == Scheme::Https) {
        endpoint.port = 443;
    } else {
        throw ConfigError("missing port in '" + text + "'");
    }
    return endpoint;
}

std::optional<Endpoint> endpoint_from_database_url(const std::string& url) {
    auto sep = url.find("://");
    if (sep == std::string::npos || sep == 0) {
        throw ConfigError("invalid database URL: expected scheme://[user[:password]@]host[:port][/database]");
    }

    // SQLAlchemy style "dialect+driver"
    std::string scheme = to_lower(url.substr(0, sep));
    auto plus = scheme.find('+');
    if (plus != std::string::npos) {
        scheme = scheme.substr(0, plus);
    }
    if (scheme == "sqlite") {
        return std::nullopt;
    }

    std::string rest = url.substr(sep + 3);
    auto end = rest.find_first_of("/?#");
    std::string authority = rest.substr(0, end);
    auto at = authority.rfind('@');
    if (at != std::string::npos) {
        authority = authority.substr(at + 1);
    }
    if (authority.empty()) {
        throw ConfigError("database URL for '" + scheme + "' names no host");
    }

    // Credentials are not echoed back in messages from here on
    std::string safe_url = scheme + "://" + authority;
    Authority parts = split_authority(authority, safe_url);

    Endpoint endpoint;
    endpoint.host = parts.host;
    if (!parts.port.empty()) {
        endpoint.port = parse_port(parts.port);
    } else {
        auto known = database_ports().find(scheme);
        if (known == database_ports().end()) {
            throw ConfigError("no default port for database scheme '" + scheme + "'");
        }
        endpoint.port = known->second;
    }
    return endpoint;
}

} // namespace gate
