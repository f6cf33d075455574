#include "retry_policy.hpp"
#include "errors.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>

namespace {
    std::string format_seconds(std::chrono::milliseconds ms) {
        std::ostringstream oss;
        oss << static_cast<double>(ms.count()) / 1000.0 << "s";
        return oss.str();
    }
}

namespace gate {

void RetryPolicy::validate() const {
    if (interval.count() <= 0) {
        throw ConfigError("retry interval must be positive");
    }
    if (connect_timeout.count() <= 0) {
        throw ConfigError("connect timeout must be positive");
    }
    if (interval > MAX_DURATION || connect_timeout > MAX_DURATION
        || (timeout && *timeout > MAX_DURATION)) {
        throw ConfigError("durations are limited to " + format_seconds(MAX_DURATION));
    }
    if (timeout && *timeout < interval) {
        throw ConfigError("timeout " + format_seconds(*timeout)
                          + " is shorter than the retry interval " + format_seconds(interval));
    }
}

std::string RetryPolicy::describe() const {
    std::ostringstream oss;
    oss << "interval " << format_seconds(interval)
        << ", timeout " << (timeout ? format_seconds(*timeout) : std::string("unbounded"))
        << ", connect timeout " << format_seconds(attempt_timeout());
    return oss.str();
}

std::chrono::milliseconds parse_seconds(const std::string& text, const std::string& what) {
    double seconds = 0.0;
    std::size_t consumed = 0;
    try {
        seconds = std::stod(text, &consumed);
    } catch (const std::exception&) {
        throw ConfigError(what + ": '" + text + "' is not a number of seconds");
    }
    if (consumed != text.size() || !std::isfinite(seconds) || seconds < 0.0) {
        throw ConfigError(what + ": '" + text + "' is not a number of seconds");
    }
    if (seconds * 1000.0 > static_cast<double>(RetryPolicy::MAX_DURATION.count())) {
        throw ConfigError(what + ": '" + text + "' exceeds the limit of "
                          + format_seconds(RetryPolicy::MAX_DURATION));
    }
    return std::chrono::milliseconds(static_cast<long long>(std::llround(seconds * 1000.0)));
}

std::optional<std::chrono::milliseconds> parse_timeout(const std::string& text, const std::string& what) {
    std::string lowered = text;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lowered == "none" || lowered == "unbounded" || lowered == "infinite") {
        return std::nullopt;
    }
    auto value = parse_seconds(text, what);
    if (value.count() == 0) {
        return std::nullopt;
    }
    return value;
}

} // namespace gate
