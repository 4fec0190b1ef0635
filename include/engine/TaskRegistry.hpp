#pragma once

#include "engine/TaskEntry.hpp"

#include <deque>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace sf::engine {

// Every live task plus a bounded history of terminal ones. The shared mutex covers map access only;
// snapshots are copied through each entry's own lock.
class TaskRegistry {
public:
    explicit TaskRegistry(size_t historyLimit);

    // false if a task with this id is still held
    bool insert(const std::shared_ptr<TaskEntry>& entry);

    [[nodiscard]] std::shared_ptr<TaskEntry> find(const std::string& id) const;

    // Insertion order
    [[nodiscard]] std::vector<transfer::model::TaskSnapshot> list(const std::string& owner) const;
    [[nodiscard]] std::vector<transfer::model::TaskSnapshot> all() const;
    [[nodiscard]] std::vector<std::shared_ptr<TaskEntry>> entries() const;

    // Moves a terminal task into history, evicting the oldest beyond the limit
    void retire(const std::string& id);

    [[nodiscard]] size_t size() const;
    [[nodiscard]] size_t historySize() const;

private:
    const size_t historyLimit_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<TaskEntry>> tasks_;
    std::vector<std::string> order_;
    std::deque<std::string> history_;
};

}
