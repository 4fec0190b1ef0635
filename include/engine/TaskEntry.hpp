#pragma once

#include "auth/model/Credential.hpp"
#include "backend/Transfer.hpp"
#include "transfer/model/TaskSnapshot.hpp"

#include <condition_variable>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>

namespace sf::engine {

// Mutable record of one task. `mutex` serialises transitions; readers only ever touch `published`.
struct TaskEntry {
    explicit TaskEntry(transfer::model::TaskSnapshot initial)
        : task(std::move(initial)), published(task) {}

    std::mutex mutex;
    std::condition_variable cv;     // wakes the monitoring worker early

    transfer::model::TaskSnapshot task;
    std::shared_ptr<backend::Transfer> transfer;

    bool holdsSlot = false;
    bool pauseRequested = false;
    bool resumeRequested = false;
    bool retryPending = false;      // upload retry waiting in the scheduler
    bool authFallbackUsed = false;
    std::optional<auth::model::Credential> credentialOverride;
    std::optional<auth::model::Credential> credential;
    std::filesystem::path workDir;
    std::filesystem::path downloadOutput;

    // caller holds mutex
    void publishSnapshot() {
        std::scoped_lock lock(snapshotMutex_);
        published = task;
    }

    [[nodiscard]] transfer::model::TaskSnapshot snapshot() const {
        std::scoped_lock lock(snapshotMutex_);
        return published;
    }

private:
    mutable std::mutex snapshotMutex_;
    transfer::model::TaskSnapshot published;
};

}
