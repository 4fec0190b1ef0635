#pragma once

#include "engine/EventBus.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace sf::reporter {

// Renders engine events to the `events` logger. Transitions are always logged; progress is throttled per task.
class LogReporter {
public:
    LogReporter(std::shared_ptr<engine::EventBus> bus, std::chrono::milliseconds progressInterval);
    ~LogReporter();

    LogReporter(const LogReporter&) = delete;
    LogReporter& operator=(const LogReporter&) = delete;

    [[nodiscard]] static std::string render(const engine::model::Event& e);

private:
    void onEvent(const engine::model::Event& e);

    std::shared_ptr<engine::EventBus> bus_;
    engine::EventBus::SubscriptionId subscription_;
    std::chrono::milliseconds interval_;

    std::mutex mutex_;
    std::unordered_map<std::string, std::chrono::steady_clock::time_point> lastProgress_;
};

}
