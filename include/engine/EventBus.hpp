#pragma once

#include "concurrency/AsyncService.hpp"
#include "engine/model/Event.hpp"

#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

namespace sf::engine {

// Ordered asynchronous channel. publish() never blocks on consumers; one dispatcher thread delivers
// events to every subscriber in publication order.
class EventBus final : public concurrency::AsyncService {
public:
    using Handler = std::function<void(const model::Event&)>;
    using SubscriptionId = uint64_t;

    static constexpr size_t MAX_QUEUED = 10000;

    EventBus();
    ~EventBus() override;

    SubscriptionId subscribe(Handler handler);
    void unsubscribe(SubscriptionId id);

    void publish(model::Event event);

    // Blocks until everything published so far has been delivered
    void flush();

protected:
    void runLoop() override;

private:
    void deliver(const model::Event& event) const;

    mutable std::shared_mutex handlersMutex_;
    std::unordered_map<SubscriptionId, Handler> handlers_;
    SubscriptionId nextId_ = 1;

    std::mutex queueMutex_;
    std::condition_variable queueCv_;
    std::condition_variable drainedCv_;
    std::deque<model::Event> queue_;
    bool dispatching_ = false;
    uint64_t dropped_ = 0;
};

}
