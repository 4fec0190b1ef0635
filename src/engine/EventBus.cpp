#include "engine/EventBus.hpp"
#include "log/Registry.hpp"

#include <map>

using namespace sf::engine;
using namespace sf::engine::model;

EventBus::EventBus()
    : AsyncService("EventBus") {}

EventBus::~EventBus() {
    stop();
}

EventBus::SubscriptionId EventBus::subscribe(Handler handler) {
    std::unique_lock lock(handlersMutex_);
    const auto id = nextId_++;
    handlers_.emplace(id, std::move(handler));
    return id;
}

void EventBus::unsubscribe(const SubscriptionId id) {
    std::unique_lock lock(handlersMutex_);
    handlers_.erase(id);
}

void EventBus::publish(Event event) {
    {
        std::scoped_lock lock(queueMutex_);
        // progress ticks are droppable, transitions are not
        if (queue_.size() >= MAX_QUEUED && !event.transition) {
            if (++dropped_ % 1000 == 1)
                log::Registry::events()->warn("[EventBus] Queue full, dropped {} progress events", dropped_);
            return;
        }
        queue_.push_back(std::move(event));
    }
    queueCv_.notify_one();
}

void EventBus::flush() {
    std::unique_lock lock(queueMutex_);
    drainedCv_.wait(lock, [this] { return (queue_.empty() && !dispatching_) || !isRunning(); });
}

void EventBus::deliver(const Event& event) const {
    // Copy handlers so a handler may subscribe or unsubscribe without deadlocking
    std::map<SubscriptionId, Handler> copy;
    {
        std::shared_lock lock(handlersMutex_);
        copy.insert(handlers_.begin(), handlers_.end());
    }

    for (const auto& [id, handler] : copy) {
        try {
            handler(event);
        } catch (const std::exception& e) {
            log::Registry::events()->error("[EventBus] Subscriber {} threw: {}", id, e.what());
        }
    }
}

void EventBus::runLoop() {
    while (true) {
        std::deque<Event> batch;
        {
            std::unique_lock lock(queueMutex_);
            queueCv_.wait_for(lock, std::chrono::milliseconds(200), [this] { return !queue_.empty() || shouldStop(); });
            if (queue_.empty()) {
                drainedCv_.notify_all();
                if (shouldStop()) break;
                continue;
            }
            batch.swap(queue_);
            dispatching_ = true;
        }

        for (const auto& e : batch) deliver(e);

        {
            std::scoped_lock lock(queueMutex_);
            dispatching_ = false;
        }
        drainedCv_.notify_all();
    }
}
