#include "engine/AdmissionQueue.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <stdexcept>

using namespace sf::engine;

AdmissionQueue::AdmissionQueue(const unsigned int globalLimit, const unsigned int perOwnerLimit, AdmitFn onAdmit)
    : globalLimit_(std::max(1u, globalLimit)),
      perOwnerLimit_(std::max(1u, perOwnerLimit)),
      onAdmit_(std::move(onAdmit)) {
    if (!onAdmit_) throw std::invalid_argument("AdmissionQueue requires an admit callback");
}

std::vector<AdmissionQueue::Waiting> AdmissionQueue::collectAdmissions() {
    std::vector<Waiting> admitted;

    for (auto it = fifo_.begin(); it != fifo_.end() && active_ < globalLimit_;) {
        auto& count = perOwner_[it->owner];
        if (count >= perOwnerLimit_) {
            ++it;
            continue;
        }

        ++count;
        ++active_;
        admitted.push_back(std::move(*it));
        it = fifo_.erase(it);
    }

    return admitted;
}

void AdmissionQueue::dispatch(const std::vector<Waiting>& admitted) const {
    for (const auto& w : admitted) {
        log::Registry::admission()->debug("[AdmissionQueue] Admitted {} for {}", w.taskId, w.owner);
        onAdmit_(w.taskId, w.owner);
    }
}

void AdmissionQueue::enqueue(const std::string& taskId, const std::string& owner) {
    std::vector<Waiting> admitted;
    {
        std::scoped_lock lock(mutex_);
        fifo_.push_back({taskId, owner});
        admitted = collectAdmissions();
        log::Registry::admission()->debug("[AdmissionQueue] Enqueued {} for {} (active {}/{}, waiting {})",
                                          taskId, owner, active_, globalLimit_, fifo_.size());
    }
    dispatch(admitted);
}

void AdmissionQueue::release(const std::string& owner) {
    std::vector<Waiting> admitted;
    {
        std::scoped_lock lock(mutex_);
        const auto it = perOwner_.find(owner);
        if (it == perOwner_.end() || it->second == 0 || active_ == 0) {
            log::Registry::admission()->error("[AdmissionQueue] Release for {} without a held slot", owner);
            return;
        }

        if (--it->second == 0) perOwner_.erase(it);
        --active_;
        admitted = collectAdmissions();
    }
    dispatch(admitted);
}

bool AdmissionQueue::withdraw(const std::string& taskId) {
    std::scoped_lock lock(mutex_);
    const auto it = std::ranges::find_if(fifo_, [&](const Waiting& w) { return w.taskId == taskId; });
    if (it == fifo_.end()) return false;
    fifo_.erase(it);
    return true;
}

unsigned int AdmissionQueue::active() const {
    std::scoped_lock lock(mutex_);
    return active_;
}

unsigned int AdmissionQueue::activeFor(const std::string& owner) const {
    std::scoped_lock lock(mutex_);
    const auto it = perOwner_.find(owner);
    return it == perOwner_.end() ? 0 : it->second;
}

size_t AdmissionQueue::waiting() const {
    std::scoped_lock lock(mutex_);
    return fifo_.size();
}
