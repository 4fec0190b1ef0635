#pragma once

#include "config/Config.hpp"

#include <chrono>
#include <mutex>
#include <string>
#include <unordered_map>

namespace sf::engine {

// Per-owner token bucket: `rate` tokens per `per`, capped at `burst`
class RateLimiter {
public:
    using Clock = std::chrono::steady_clock;

    struct Decision {
        bool allowed = true;
        std::chrono::milliseconds retryAfter{0};
    };

    explicit RateLimiter(const config::RateLimitConfig& cfg);

    Decision check(const std::string& owner) { return check(owner, Clock::now()); }
    Decision check(const std::string& owner, Clock::time_point now);

    void reset(const std::string& owner);

    // Drops buckets idle long enough to have refilled to `burst`; check() does this every PRUNE_EVERY calls
    void pruneIdle(Clock::time_point now);

    [[nodiscard]] size_t size();

    static constexpr unsigned int PRUNE_EVERY = 64;

    [[nodiscard]] bool enabled() const { return enabled_; }

private:
    struct Bucket {
        double allowance;
        Clock::time_point lastCheck;
    };

    void pruneIdleLocked(Clock::time_point now);

    bool enabled_;
    double rate_;
    double perSeconds_;
    double burst_;

    std::mutex mutex_;
    std::unordered_map<std::string, Bucket> buckets_;
    unsigned int checks_ = 0;
};

}
