#pragma once

#include "concurrency/AsyncService.hpp"

#include <chrono>
#include <functional>
#include <mutex>
#include <queue>
#include <string>
#include <unordered_map>
#include <vector>

namespace sf::engine {

// Holds backoff waits so no worker sleeps through one. Fires the callback once an entry is due.
class RetryScheduler final : public concurrency::AsyncService {
public:
    using Clock = std::chrono::steady_clock;
    using FireFn = std::function<void(const std::string& taskId)>;

    explicit RetryScheduler(FireFn onDue);
    ~RetryScheduler() override;

    // Replaces any pending entry for the task
    void schedule(const std::string& taskId, Clock::time_point due);

    // false when nothing was pending
    bool cancel(const std::string& taskId);

    [[nodiscard]] bool pending(const std::string& taskId) const;
    [[nodiscard]] size_t size() const;

protected:
    void runLoop() override;

private:
    struct Entry {
        Clock::time_point due;
        std::string taskId;
        uint64_t generation;
    };

    struct Later {
        bool operator()(const Entry& a, const Entry& b) const { return a.due > b.due; } // min-heap on due
    };

    FireFn onDue_;

    mutable std::mutex mutex_;
    std::priority_queue<Entry, std::vector<Entry>, Later> heap_;
    std::unordered_map<std::string, uint64_t> live_;    // taskId -> generation of its current entry
    uint64_t generation_ = 0;
};

}
