#include "engine/RetryScheduler.hpp"
#include "log/Registry.hpp"

#include <algorithm>

using namespace sf::engine;

RetryScheduler::RetryScheduler(FireFn onDue)
    : AsyncService("RetryScheduler"), onDue_(std::move(onDue)) {}

RetryScheduler::~RetryScheduler() {
    stop();
}

void RetryScheduler::schedule(const std::string& taskId, const Clock::time_point due) {
    {
        std::scoped_lock lock(mutex_);
        const auto gen = ++generation_;
        live_[taskId] = gen;
        heap_.push({due, taskId, gen});
    }
    wake();
}

bool RetryScheduler::cancel(const std::string& taskId) {
    std::scoped_lock lock(mutex_);
    // the heap entry goes stale and is skipped when popped
    return live_.erase(taskId) > 0;
}

bool RetryScheduler::pending(const std::string& taskId) const {
    std::scoped_lock lock(mutex_);
    return live_.contains(taskId);
}

size_t RetryScheduler::size() const {
    std::scoped_lock lock(mutex_);
    return live_.size();
}

void RetryScheduler::runLoop() {
    while (!shouldStop()) {
        std::vector<std::string> due;
        auto sleepFor = std::chrono::milliseconds(500);

        {
            std::scoped_lock lock(mutex_);
            const auto now = Clock::now();
            while (!heap_.empty()) {
                const auto& top = heap_.top();
                const auto it = live_.find(top.taskId);
                if (it == live_.end() || it->second != top.generation) {
                    heap_.pop();
                    continue;
                }
                if (top.due > now) {
                    sleepFor = std::min(sleepFor, std::chrono::duration_cast<std::chrono::milliseconds>(top.due - now) +
                                                  std::chrono::milliseconds(1));
                    break;
                }
                due.push_back(top.taskId);
                live_.erase(it);
                heap_.pop();
            }
        }

        for (const auto& id : due) {
            try {
                onDue_(id);
            } catch (const std::exception& e) {
                log::Registry::engine()->error("[RetryScheduler] Retry of {} failed: {}", id, e.what());
            }
        }

        if (due.empty()) lazySleep(sleepFor);
    }
}
