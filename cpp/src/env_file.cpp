#include "env_file.hpp"
#include "errors.hpp"

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>

namespace {
    std::string trim(const std::string& s) {
        auto begin = s.find_first_not_of(" \t\r");
        if (begin == std::string::npos) return "";
        auto end = s.find_last_not_of(" \t\r");
        return s.substr(begin, end - begin + 1);
    }

    bool valid_key(const std::string& key) {
        if (key.empty() || std::isdigit(static_cast<unsigned char>(key.front()))) return false;
        for (unsigned char c : key) {
            if (!std::isalnum(c) && c != '_' && c != '.') return false;
        }
        return true;
    }

    std::string unescape(const std::string& s) {
        std::string out;
        out.reserve(s.size());
        for (std::size_t i = 0; i < s.size(); ++i) {
            if (s[i] != '\\' || i + 1 == s.size()) {
                out += s[i];
                continue;
            }
            char next = s[++i];
            switch (next) {
            case 'n': out += '\n'; break;
            case 't': out += '\t'; break;
            case 'r': out += '\r'; break;
            default: out += next; break;   // \" \\ and anything else literal
            }
        }
        return out;
    }
}

namespace gate {

EnvLookup process_env() {
    return [](const std::string& name) -> std::optional<std::string> {
        const char* value = std::getenv(name.c_str());
        if (value == nullptr) return std::nullopt;
        return std::string(value);
    };
}

EnvLookup map_env(std::map<std::string, std::string> values) {
    return [values = std::move(values)](const std::string& name) -> std::optional<std::string> {
        auto it = values.find(name);
        if (it == values.end()) return std::nullopt;
        return it->second;
    };
}

std::map<std::string, std::string> parse_env_file(const std::string& content, const std::string& source) {
    std::map<std::string, std::string> values;
    std::istringstream in(content);
    std::string raw;
    int line_no = 0;

    while (std::getline(in, raw)) {
        ++line_no;
        std::string line = trim(raw);
        if (line.empty() || line.front() == '#') {
            continue;
        }
        if (line.compare(0, 7, "export ") == 0) {
            line = trim(line.substr(7));
        }

        auto eq = line.find('=');
        if (eq == std::string::npos) {
            throw ConfigError(source + ":" + std::to_string(line_no) + ": expected KEY=VALUE");
        }
        std::string key = trim(line.substr(0, eq));
        if (!valid_key(key)) {
            throw ConfigError(source + ":" + std::to_string(line_no) + ": invalid variable name '" + key + "'");
        }

        std::string value = trim(line.substr(eq + 1));
        if (!value.empty() && (value.front() == '"' || value.front() == '\'')) {
            char quote = value.front();
            // Find the closing quote, skipping escaped ones inside double quotes
            std::size_t close = std::string::npos;
            for (std::size_t i = 1; i < value.size(); ++i) {
                if (quote == '"' && value[i] == '\\') {
                    ++i;
                    continue;
                }
                if (value[i] == quote) {
                    close = i;
                    break;
                }
            }
            if (close == std::string::npos) {
                throw ConfigError(source + ":" + std::to_string(line_no) + ": unterminated quoted value");
            }
            std::string inner = value.substr(1, close - 1);
            value = quote == '"' ? unescape(inner) : inner;
        } else {
            auto comment = value.find(" #");
            if (comment != std::string::npos) {
                value = trim(value.substr(0, comment));
            }
        }
        values[key] = value;
    }
    return values;
}

int load_env_file(const std::string& path, bool required) {
    std::ifstream file(path);
    if (!file) {
        if (required) {
            throw ConfigError("cannot open env file '" + path + "'");
        }
        return 0;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    auto values = parse_env_file(buffer.str(), path);

    int applied = 0;
    for (const auto& [key, value] : values) {
        if (std::getenv(key.c_str()) != nullptr) {
            continue;
        }
        if (::setenv(key.c_str(), value.c_str(), 0) != 0) {
            throw ConfigError("cannot set " + key + " from '" + path + "'");
        }
        ++applied;
    }
    std::cout << "[Config] Loaded " << applied << " variable(s) from " << path << std::endl;
    return applied;
}

} // namespace gate
