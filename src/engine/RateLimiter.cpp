#include "engine/RateLimiter.hpp"

#include <algorithm>

using namespace sf::engine;

RateLimiter::RateLimiter(const config::RateLimitConfig& cfg)
    : enabled_(cfg.enabled),
      rate_(std::max(cfg.rate, 0.001)),
      perSeconds_(std::max<double>(static_cast<double>(cfg.per.count()), 1.0)),
      burst_(std::max(cfg.burst, 1.0)) {}

RateLimiter::Decision RateLimiter::check(const std::string& owner, const Clock::time_point now) {
    if (!enabled_) return {};

    std::scoped_lock lock(mutex_);
    if (++checks_ % PRUNE_EVERY == 0) pruneIdleLocked(now);

    auto [it, inserted] = buckets_.try_emplace(owner, Bucket{burst_, now});
    auto& b = it->second;

    if (!inserted) {
        const double elapsed = std::chrono::duration<double>(now - b.lastCheck).count();
        b.lastCheck = now;
        b.allowance = std::min(burst_, b.allowance + std::max(0.0, elapsed) * (rate_ / perSeconds_));
    }

    if (b.allowance < 1.0) {
        const double waitSeconds = (1.0 - b.allowance) * (perSeconds_ / rate_);
        return {false, std::chrono::milliseconds(static_cast<long>(waitSeconds * 1000.0))};
    }

    b.allowance -= 1.0;
    return {};
}

void RateLimiter::reset(const std::string& owner) {
    std::scoped_lock lock(mutex_);
    buckets_.erase(owner);
}

void RateLimiter::pruneIdle(const Clock::time_point now) {
    std::scoped_lock lock(mutex_);
    pruneIdleLocked(now);
}

void RateLimiter::pruneIdleLocked(const Clock::time_point now) {
    // a bucket this idle is indistinguishable from a fresh one
    const auto refill = std::chrono::duration<double>(burst_ * perSeconds_ / rate_);
    std::erase_if(buckets_, [&](const auto& kv) { return now - kv.second.lastCheck >= refill; });
}

size_t RateLimiter::size() {
    std::scoped_lock lock(mutex_);
    return buckets_.size();
}
