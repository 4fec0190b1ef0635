#pragma once

#include "backend/Transfer.hpp"

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>

namespace sf::backend {

// Runs run() on its own thread and maps its outcome onto a TransferStatus.
// A TransferError thrown from run() keeps its kind; any other exception is Fatal.
class ThreadedTransfer : public Transfer {
public:
    ThreadedTransfer(std::string name, bool pausable);
    ~ThreadedTransfer() override;

    ThreadedTransfer(const ThreadedTransfer&) = delete;
    ThreadedTransfer& operator=(const ThreadedTransfer&) = delete;

    // Must be called once the object is fully constructed
    void launch();

    void cancel() override;
    void pause() override;
    void resume() override;

    [[nodiscard]] bool supportsPause() const override { return pausable_; }

    [[nodiscard]] TransferStatus status() const override;

    void wait() override;

protected:
    // Returns the produced path; throws TransferError on failure
    virtual std::filesystem::path run() = 0;

    void publish(transfer::model::Progress progress);

    [[nodiscard]] bool cancelRequested() const { return cancelRequested_.load(std::memory_order_acquire); }
    [[nodiscard]] bool pauseRequested() const { return paused_.load(std::memory_order_acquire); }

    // Blocks while paused. Returns false if cancelled.
    bool waitWhilePaused();

    [[nodiscard]] transfer::model::Progress lastProgress() const;

    std::string name_;

private:
    void finish(Phase phase, std::optional<transfer::model::ErrorInfo> error, std::filesystem::path output);

    const bool pausable_;
    std::atomic<bool> cancelRequested_{false};
    std::atomic<bool> paused_{false};

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    TransferStatus status_;

    std::mutex joinMutex_;
    std::thread worker_;
};

}
