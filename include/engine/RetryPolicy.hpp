#pragma once

#include "config/Config.hpp"

#include <chrono>

namespace sf::engine {

struct RetryPolicy {
    unsigned int maxRetries = 3;
    std::chrono::milliseconds base{2000};
    double multiplier = 2.0;
    std::chrono::milliseconds max{60000};

    static RetryPolicy fromConfig(const config::EngineConfig& cfg) {
        return {cfg.max_retries, cfg.backoff_base, cfg.backoff_multiplier, cfg.backoff_max};
    }

    // attempt counts retries already granted, so the first retry asks for attempt 1
    [[nodiscard]] bool canRetry(const unsigned int attemptsUsed) const { return attemptsUsed < maxRetries; }

    // min(base * multiplier^(attempt-1), max)
    [[nodiscard]] std::chrono::milliseconds backoff(unsigned int attempt) const;
};

}
