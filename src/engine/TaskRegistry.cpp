#include "engine/TaskRegistry.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <mutex>

using namespace sf::engine;
using namespace sf::transfer::model;

TaskRegistry::TaskRegistry(const size_t historyLimit)
    : historyLimit_(historyLimit) {}

bool TaskRegistry::insert(const std::shared_ptr<TaskEntry>& entry) {
    const auto id = entry->snapshot().id;
    std::unique_lock lock(mutex_);
    if (!tasks_.emplace(id, entry).second) return false;
    order_.push_back(id);
    return true;
}

std::shared_ptr<TaskEntry> TaskRegistry::find(const std::string& id) const {
    std::shared_lock lock(mutex_);
    const auto it = tasks_.find(id);
    return it == tasks_.end() ? nullptr : it->second;
}

std::vector<std::shared_ptr<TaskEntry>> TaskRegistry::entries() const {
    std::shared_lock lock(mutex_);
    std::vector<std::shared_ptr<TaskEntry>> out;
    out.reserve(order_.size());
    for (const auto& id : order_) out.push_back(tasks_.at(id));
    return out;
}

std::vector<TaskSnapshot> TaskRegistry::list(const std::string& owner) const {
    std::vector<TaskSnapshot> out;
    for (const auto& e : entries()) {
        auto snap = e->snapshot();
        if (snap.owner == owner) out.push_back(std::move(snap));
    }
    return out;
}

std::vector<TaskSnapshot> TaskRegistry::all() const {
    std::vector<TaskSnapshot> out;
    for (const auto& e : entries()) out.push_back(e->snapshot());
    return out;
}

void TaskRegistry::retire(const std::string& id) {
    std::unique_lock lock(mutex_);
    if (!tasks_.contains(id) || std::ranges::find(history_, id) != history_.end()) return;
    history_.push_back(id);

    while (history_.size() > historyLimit_) {
        const auto evicted = history_.front();
        history_.pop_front();
        tasks_.erase(evicted);
        std::erase(order_, evicted);
        log::Registry::engine()->debug("[TaskRegistry] Evicted {} from history", evicted);
    }
}

size_t TaskRegistry::size() const {
    std::shared_lock lock(mutex_);
    return tasks_.size();
}

size_t TaskRegistry::historySize() const {
    std::shared_lock lock(mutex_);
    return history_.size();
}
