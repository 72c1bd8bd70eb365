#include <gtest/gtest.h>
#include "beamdrop/signaling/reconnect_policy.hpp"

using namespace beamdrop::signaling;
using namespace std::chrono_literals;

TEST(ReconnectPolicyTest, DefaultIsFiveLinearAttempts) {
    ReconnectPolicy policy;

    EXPECT_EQ(policy.max_attempts(), 5);
    EXPECT_EQ(policy.next_delay(), 2000ms);
    EXPECT_EQ(policy.next_delay(), 4000ms);
    EXPECT_EQ(policy.next_delay(), 6000ms);
    EXPECT_EQ(policy.next_delay(), 8000ms);
    EXPECT_EQ(policy.next_delay(), 10000ms);
    EXPECT_TRUE(policy.exhausted());
    EXPECT_FALSE(policy.next_delay().has_value());
}

TEST(ReconnectPolicyTest, ResetStartsOver) {
    ReconnectPolicy policy(2, ReconnectPolicy::linear_backoff(100ms));

    policy.next_delay();
    policy.next_delay();
    EXPECT_FALSE(policy.next_delay().has_value());

    policy.reset();
    EXPECT_EQ(policy.attempts(), 0);
    EXPECT_EQ(policy.next_delay(), 100ms);
}

TEST(ReconnectPolicyTest, ZeroAttemptsNeverRetries) {
    ReconnectPolicy policy(0, nullptr);
    EXPECT_FALSE(policy.next_delay().has_value());
}

TEST(ReconnectPolicyTest, ExponentialBackoffIsCapped) {
    ReconnectPolicy policy(6, ReconnectPolicy::exponential_backoff(100ms, 500ms));

    EXPECT_EQ(policy.next_delay(), 100ms);
    EXPECT_EQ(policy.next_delay(), 200ms);
    EXPECT_EQ(policy.next_delay(), 400ms);
    EXPECT_EQ(policy.next_delay(), 500ms);
    EXPECT_EQ(policy.next_delay(), 500ms);
}
