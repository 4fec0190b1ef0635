#include <gtest/gtest.h>
#include "engine/RetryPolicy.hpp"
#include "engine/RetryScheduler.hpp"

#include <atomic>
#include <mutex>
#include <thread>
#include <vector>

using namespace sf::engine;
using namespace std::chrono_literals;

TEST(RetryPolicyTest, Backoff_DoublesUntilCapped) {
    const RetryPolicy p{3, 2000ms, 2.0, 60000ms};
    EXPECT_EQ(p.backoff(1), 2000ms);
    EXPECT_EQ(p.backoff(2), 4000ms);
    EXPECT_EQ(p.backoff(3), 8000ms);
    EXPECT_EQ(p.backoff(6), 60000ms);
    EXPECT_EQ(p.backoff(200), 60000ms);
}

TEST(RetryPolicyTest, CanRetry_CountsGrantedRetries) {
    const RetryPolicy p{2, 10ms, 2.0, 100ms};
    EXPECT_TRUE(p.canRetry(0));
    EXPECT_TRUE(p.canRetry(1));
    EXPECT_FALSE(p.canRetry(2));

    const RetryPolicy none{0, 10ms, 2.0, 100ms};
    EXPECT_FALSE(none.canRetry(0));
}

TEST(RetryPolicyTest, FromConfig) {
    sf::config::EngineConfig cfg;
    cfg.max_retries = 5;
    cfg.backoff_base = 100ms;
    cfg.backoff_multiplier = 3.0;
    cfg.backoff_max = 1000ms;

    const auto p = RetryPolicy::fromConfig(cfg);
    EXPECT_EQ(p.maxRetries, 5u);
    EXPECT_EQ(p.backoff(2), 300ms);
    EXPECT_EQ(p.backoff(4), 1000ms);
}

class RetrySchedulerTest : public ::testing::Test {
protected:
    std::mutex mutex;
    std::vector<std::string> fired;
    std::unique_ptr<RetryScheduler> scheduler;

    void SetUp() override {
        scheduler = std::make_unique<RetryScheduler>([this](const std::string& id) {
            std::scoped_lock lock(mutex);
            fired.push_back(id);
        });
        scheduler->start();
    }

    void TearDown() override { scheduler->stop(); }

    std::vector<std::string> firedSoFar() {
        std::scoped_lock lock(mutex);
        return fired;
    }
};

TEST_F(RetrySchedulerTest, FiresInDueOrder) {
    const auto now = RetryScheduler::Clock::now();
    scheduler->schedule("late", now + 120ms);
    scheduler->schedule("early", now + 30ms);

    std::this_thread::sleep_for(400ms);
    EXPECT_EQ(firedSoFar(), (std::vector<std::string>{"early", "late"}));
    EXPECT_EQ(scheduler->size(), 0u);
}

TEST_F(RetrySchedulerTest, CancelledEntryNeverFires) {
    scheduler->schedule("t1", RetryScheduler::Clock::now() + 100ms);
    EXPECT_TRUE(scheduler->pending("t1"));
    EXPECT_TRUE(scheduler->cancel("t1"));
    EXPECT_FALSE(scheduler->cancel("t1"));

    std::this_thread::sleep_for(250ms);
    EXPECT_TRUE(firedSoFar().empty());
}

TEST_F(RetrySchedulerTest, RescheduleReplacesPendingEntry) {
    const auto now = RetryScheduler::Clock::now();
    scheduler->schedule("t1", now + 50ms);
    scheduler->schedule("t1", now + 150ms);

    std::this_thread::sleep_for(100ms);
    EXPECT_TRUE(firedSoFar().empty());
    std::this_thread::sleep_for(250ms);
    EXPECT_EQ(firedSoFar(), (std::vector<std::string>{"t1"}));
}
