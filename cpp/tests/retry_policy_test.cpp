#include <gtest/gtest.h>

#include "errors.hpp"
#include "retry_policy.hpp"

using namespace std::chrono_literals;

TEST(RetryPolicy, DefaultsAreValid) {
    gate::RetryPolicy policy;
    EXPECT_NO_THROW(policy.validate());
    EXPECT_TRUE(policy.bounded());
    EXPECT_EQ(policy.interval, 1s);
    EXPECT_EQ(*policy.timeout, 60s);
}

TEST(RetryPolicy, InvariantsAreEnforced) {
    gate::RetryPolicy policy;
    policy.interval = 0ms;
    EXPECT_THROW(policy.validate(), gate::ConfigError);

    policy.interval = 2s;
    policy.timeout = 1s;
    EXPECT_THROW(policy.validate(), gate::ConfigError);

    policy.timeout = 2s;
    EXPECT_NO_THROW(policy.validate());

    policy.timeout = std::nullopt;
    EXPECT_NO_THROW(policy.validate());

    policy.connect_timeout = 0ms;
    EXPECT_THROW(policy.validate(), gate::ConfigError);
}

TEST(RetryPolicy, AttemptTimeoutNeverExceedsInterval) {
    gate::RetryPolicy policy;
    policy.interval = 500ms;
    policy.connect_timeout = 3s;
    EXPECT_EQ(policy.attempt_timeout(), 500ms);

    policy.connect_timeout = 200ms;
    EXPECT_EQ(policy.attempt_timeout(), 200ms);
}

TEST(RetryPolicy, ParseSeconds) {
    EXPECT_EQ(gate::parse_seconds("1", "interval"), 1000ms);
    EXPECT_EQ(gate::parse_seconds("0.25", "interval"), 250ms);
    EXPECT_EQ(gate::parse_seconds("30", "interval"), 30s);
    EXPECT_THROW(gate::parse_seconds("", "interval"), gate::ConfigError);
    EXPECT_THROW(gate::parse_seconds("1s", "interval"), gate::ConfigError);
    EXPECT_THROW(gate::parse_seconds("-3", "interval"), gate::ConfigError);
    EXPECT_THROW(gate::parse_seconds("nan", "interval"), gate::ConfigError);
}

TEST(RetryPolicy, DurationsAboveTheLimitAreRejected) {
    EXPECT_EQ(gate::parse_seconds("1e9", "timeout"), gate::RetryPolicy::MAX_DURATION);
    EXPECT_THROW(gate::parse_seconds("1e10", "timeout"), gate::ConfigError);
    EXPECT_THROW(gate::parse_timeout("1e300", "timeout"), gate::ConfigError);

    gate::RetryPolicy policy;
    policy.timeout = gate::RetryPolicy::MAX_DURATION;
    EXPECT_NO_THROW(policy.validate());
    policy.timeout = gate::RetryPolicy::MAX_DURATION + 1ms;
    EXPECT_THROW(policy.validate(), gate::ConfigError);
}

TEST(RetryPolicy, ParseTimeoutUnboundedSpellings) {
    EXPECT_FALSE(gate::parse_timeout("0", "timeout").has_value());
    EXPECT_FALSE(gate::parse_timeout("none", "timeout").has_value());
    EXPECT_FALSE(gate::parse_timeout("Unbounded", "timeout").has_value());
    EXPECT_EQ(gate::parse_timeout("45", "timeout"), std::optional<std::chrono::milliseconds>(45s));
}

TEST(RetryPolicy, DescribeMentionsUnboundedTimeout) {
    gate::RetryPolicy policy;
    policy.timeout = std::nullopt;
    EXPECT_NE(policy.describe().find("unbounded"), std::string::npos);
}
