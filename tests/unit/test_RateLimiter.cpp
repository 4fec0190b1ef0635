#include <gtest/gtest.h>
#include "engine/RateLimiter.hpp"

using namespace sf::engine;
using namespace std::chrono_literals;

class RateLimiterTest : public ::testing::Test {
protected:
    sf::config::RateLimitConfig cfg;
    RateLimiter::Clock::time_point t0 = RateLimiter::Clock::now();

    void SetUp() override {
        cfg.enabled = true;
        cfg.rate = 2;
        cfg.per = 10s;
        cfg.burst = 3;
    }
};

TEST_F(RateLimiterTest, Disabled_AlwaysAllows) {
    cfg.enabled = false;
    RateLimiter rl(cfg);
    for (int i = 0; i < 100; ++i) EXPECT_TRUE(rl.check("alice", t0).allowed);
}

TEST_F(RateLimiterTest, Burst_ThenRejectWithRetryAfter) {
    RateLimiter rl(cfg);
    for (int i = 0; i < 3; ++i) EXPECT_TRUE(rl.check("alice", t0).allowed);

    const auto d = rl.check("alice", t0);
    EXPECT_FALSE(d.allowed);
    EXPECT_EQ(d.retryAfter, 5000ms);
}

TEST_F(RateLimiterTest, Refills_AtConfiguredRate) {
    RateLimiter rl(cfg);
    for (int i = 0; i < 3; ++i) ASSERT_TRUE(rl.check("alice", t0).allowed);

    EXPECT_FALSE(rl.check("alice", t0 + 2s).allowed);
    EXPECT_TRUE(rl.check("alice", t0 + 6s).allowed);
    EXPECT_FALSE(rl.check("alice", t0 + 6s).allowed);
}

TEST_F(RateLimiterTest, Refill_CappedAtBurst) {
    RateLimiter rl(cfg);
    ASSERT_TRUE(rl.check("alice", t0).allowed);

    const auto later = t0 + 1h;
    for (int i = 0; i < 3; ++i) EXPECT_TRUE(rl.check("alice", later).allowed);
    EXPECT_FALSE(rl.check("alice", later).allowed);
}

TEST_F(RateLimiterTest, OwnersHaveIndependentBuckets) {
    RateLimiter rl(cfg);
    for (int i = 0; i < 3; ++i) ASSERT_TRUE(rl.check("alice", t0).allowed);
    EXPECT_FALSE(rl.check("alice", t0).allowed);
    EXPECT_TRUE(rl.check("bob", t0).allowed);

    rl.reset("alice");
    EXPECT_TRUE(rl.check("alice", t0).allowed);
}

TEST_F(RateLimiterTest, IdleBuckets_AreDropped) {
    RateLimiter rl(cfg);
    for (int i = 0; i < 10; ++i) ASSERT_TRUE(rl.check("owner" + std::to_string(i), t0).allowed);
    ASSERT_TRUE(rl.check("late", t0 + 10s).allowed);
    EXPECT_EQ(rl.size(), 11u);

    // 3 tokens at 2 per 10s refill in 15s
    rl.pruneIdle(t0 + 14s);
    EXPECT_EQ(rl.size(), 11u);
    rl.pruneIdle(t0 + 15s);
    EXPECT_EQ(rl.size(), 1u);

    // a dropped owner starts again with a full burst
    for (int i = 0; i < 3; ++i) EXPECT_TRUE(rl.check("owner0", t0 + 15s).allowed);
    EXPECT_FALSE(rl.check("owner0", t0 + 15s).allowed);
}

TEST_F(RateLimiterTest, ManyOwners_PrunedDuringChecks) {
    RateLimiter rl(cfg);
    for (unsigned int i = 0; i < RateLimiter::PRUNE_EVERY; ++i) rl.check("once" + std::to_string(i), t0);

    for (unsigned int i = 0; i < RateLimiter::PRUNE_EVERY; ++i) rl.check("busy", t0 + 60s);
    EXPECT_EQ(rl.size(), 1u);
}
