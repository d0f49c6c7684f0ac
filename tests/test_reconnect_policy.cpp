#include <gtest/gtest.h>

#include "infrastructure/reconnect_policy.hpp"

using extender::infrastructure::ReconnectPolicy;
using namespace std::chrono_literals;

TEST(ReconnectPolicyTest, DelayDoublesPerAttempt)
{
    ReconnectPolicy policy(1000ms, 60000ms, 5);

    EXPECT_EQ(policy.delay_for(1), 1000ms);
    EXPECT_EQ(policy.delay_for(2), 2000ms);
    EXPECT_EQ(policy.delay_for(3), 4000ms);
    EXPECT_EQ(policy.delay_for(4), 8000ms);
}

TEST(ReconnectPolicyTest, DelayIsCapped)
{
    ReconnectPolicy policy(1000ms, 5000ms, 10);

    EXPECT_EQ(policy.delay_for(3), 4000ms);
    EXPECT_EQ(policy.delay_for(4), 5000ms);
    EXPECT_EQ(policy.delay_for(1000), 5000ms);
}

TEST(ReconnectPolicyTest, DelayNeverDecreases)
{
    ReconnectPolicy policy(300ms, 45000ms, 50);

    auto previous = policy.delay_for(1);
    for (int attempt = 2; attempt <= 50; ++attempt)
    {
        auto delay = policy.delay_for(attempt);
        EXPECT_GE(delay, previous) << "attempt " << attempt;
        previous = delay;
    }
}

TEST(ReconnectPolicyTest, MaxBelowBaseIsRaisedToBase)
{
    ReconnectPolicy policy(2000ms, 500ms, 3);

    EXPECT_EQ(policy.max_delay(), 2000ms);
    EXPECT_EQ(policy.delay_for(3), 2000ms);
}

TEST(ReconnectPolicyTest, ExhaustedAfterMaxAttempts)
{
    ReconnectPolicy policy(1000ms, 60000ms, 3);

    EXPECT_FALSE(policy.exhausted(1));
    EXPECT_FALSE(policy.exhausted(3));
    EXPECT_TRUE(policy.exhausted(4));
}
