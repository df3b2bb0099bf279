/// @file test_rate_limiter.cpp
/// Unit tests for rate_limiter.hpp — minimum interval between requests.

#include "rate_limiter.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>
#include <chrono>

using namespace bili_trends;
using bili_trends::fakes::ManualClock;
using std::chrono::milliseconds;

// ============================================================================
// Construction and defaults
// ============================================================================

TEST(RateLimiter, FreshLimiterHasZeroStats) {
    ManualClock clock;
    RateLimiter rl(clock, milliseconds(1000));
    EXPECT_EQ(rl.minInterval(), milliseconds(1000));
    EXPECT_EQ(rl.totalWait(), milliseconds(0));
    EXPECT_EQ(rl.totalAcquisitions(), 0);
}

TEST(RateLimiter, NegativeIntervalClampsToZero) {
    ManualClock clock;
    RateLimiter rl(clock, milliseconds(-5));
    EXPECT_EQ(rl.minInterval(), milliseconds(0));
}

// ============================================================================
// acquire
// ============================================================================

TEST(RateLimiter, FirstAcquireDoesNotWait) {
    ManualClock clock;
    RateLimiter rl(clock, milliseconds(1000));
    rl.acquire();
    EXPECT_TRUE(clock.sleeps().empty());
    EXPECT_EQ(rl.totalAcquisitions(), 1);
}

TEST(RateLimiter, BackToBackAcquiresWaitFullInterval) {
    ManualClock clock;
    RateLimiter rl(clock, milliseconds(1000));
    rl.acquire();
    rl.acquire();
    rl.acquire();

    ASSERT_EQ(clock.sleeps().size(), 2u);
    EXPECT_EQ(clock.sleeps()[0], milliseconds(1000));
    EXPECT_EQ(clock.sleeps()[1], milliseconds(1000));
    EXPECT_EQ(rl.totalWait(), milliseconds(2000));
    EXPECT_EQ(rl.totalAcquisitions(), 3);
}

TEST(RateLimiter, ElapsedTimeReducesWait) {
    ManualClock clock;
    RateLimiter rl(clock, milliseconds(1000));
    rl.acquire();
    clock.advance(milliseconds(700));
    rl.acquire();

    ASSERT_EQ(clock.sleeps().size(), 1u);
    EXPECT_EQ(clock.sleeps()[0], milliseconds(300));
}

TEST(RateLimiter, NoWaitWhenIntervalAlreadyPassed) {
    ManualClock clock;
    RateLimiter rl(clock, milliseconds(1000));
    rl.acquire();
    clock.advance(milliseconds(1500));
    rl.acquire();
    EXPECT_TRUE(clock.sleeps().empty());
}

TEST(RateLimiter, ConsecutiveRequestsAreSpacedByInterval) {
    ManualClock clock;
    RateLimiter rl(clock, milliseconds(250));

    std::vector<Clock::time_point> issued;
    for (int i = 0; i < 5; ++i) {
        rl.acquire();
        issued.push_back(clock.now());
        clock.advance(milliseconds(40));   // request latency
    }
    for (std::size_t i = 1; i < issued.size(); ++i) {
        EXPECT_GE(issued[i] - issued[i - 1], milliseconds(250));
    }
}

TEST(RateLimiter, ZeroIntervalNeverWaits) {
    ManualClock clock;
    RateLimiter rl(clock, milliseconds(0));
    for (int i = 0; i < 10; ++i) rl.acquire();
    EXPECT_TRUE(clock.sleeps().empty());
    EXPECT_EQ(rl.totalAcquisitions(), 10);
}
