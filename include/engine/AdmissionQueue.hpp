#pragma once

#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace sf::engine {

// Global and per-owner concurrency ceilings over one FIFO. Admission walks the FIFO in submission
// order and takes the first task whose owner is under its ceiling while a global slot is free.
// The admit callback runs outside the queue lock; callers must not hold a task lock when calling
// enqueue() or release().
class AdmissionQueue {
public:
    using AdmitFn = std::function<void(const std::string& taskId, const std::string& owner)>;

    AdmissionQueue(unsigned int globalLimit, unsigned int perOwnerLimit, AdmitFn onAdmit);

    // Appends to the back and admits whatever now fits
    void enqueue(const std::string& taskId, const std::string& owner);

    // Frees one slot held by owner and immediately admits the next eligible tasks
    void release(const std::string& owner);

    // Removes a waiting task; false if it was not waiting (already admitted or unknown)
    bool withdraw(const std::string& taskId);

    [[nodiscard]] unsigned int active() const;
    [[nodiscard]] unsigned int activeFor(const std::string& owner) const;
    [[nodiscard]] size_t waiting() const;

    [[nodiscard]] unsigned int globalLimit() const { return globalLimit_; }
    [[nodiscard]] unsigned int perOwnerLimit() const { return perOwnerLimit_; }

private:
    struct Waiting {
        std::string taskId;
        std::string owner;
    };

    std::vector<Waiting> collectAdmissions();   // caller holds mutex_
    void dispatch(const std::vector<Waiting>& admitted) const;

    const unsigned int globalLimit_;
    const unsigned int perOwnerLimit_;
    AdmitFn onAdmit_;

    mutable std::mutex mutex_;
    std::deque<Waiting> fifo_;
    std::unordered_map<std::string, unsigned int> perOwner_;
    unsigned int active_ = 0;
};

}
