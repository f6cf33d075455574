#pragma once

#include <algorithm>
#include <chrono>
#include <optional>
#include <string>

namespace gate {

// Fixed-interval polling with an optional overall deadline
struct RetryPolicy {
    static constexpr std::chrono::milliseconds DEFAULT_INTERVAL{1000};
    static constexpr std::chrono::milliseconds DEFAULT_TIMEOUT{60000};
    static constexpr std::chrono::milliseconds DEFAULT_CONNECT_TIMEOUT{1000};
    // 1e9 seconds. Longer durations overflow steady_clock arithmetic.
    static constexpr std::chrono::milliseconds MAX_DURATION{1000LL * 1000 * 1000 * 1000};

    std::chrono::milliseconds interval = DEFAULT_INTERVAL;
    std::optional<std::chrono::milliseconds> timeout = DEFAULT_TIMEOUT;   // nullopt = unbounded
    std::chrono::milliseconds connect_timeout = DEFAULT_CONNECT_TIMEOUT;

    bool bounded() const { return timeout.has_value(); }

    // One attempt never outlives one interval, so a gate with a bounded
    // timeout T always finishes within T + interval.
    std::chrono::milliseconds attempt_timeout() const {
        return std::min(connect_timeout, interval);
    }

    // Throws ConfigError when the invariants do not hold
    void validate() const;

    std::string describe() const;
};

// "1", "0.25", "30" seconds to milliseconds. Throws ConfigError, also for
// values above RetryPolicy::MAX_DURATION.
std::chrono::milliseconds parse_seconds(const std::string& text, const std::string& what);

// As parse_seconds, but "0", "none", "unbounded", "infinite" mean no timeout
std::optional<std::chrono::milliseconds> parse_timeout(const std::string& text, const std::string& what);

} // namespace gate
