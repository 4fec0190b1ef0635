#include "backend/ThreadedTransfer.hpp"
#include "transfer/errors.hpp"
#include "log/Registry.hpp"

using namespace sf::backend;
using namespace sf::transfer;
using namespace sf::transfer::model;

void Transfer::pause() {
    throw UnsupportedOperation("Pause is not supported by this backend");
}

void Transfer::resume() {
    throw UnsupportedOperation("Resume is not supported by this backend");
}

ThreadedTransfer::ThreadedTransfer(std::string name, const bool pausable)
    : name_(std::move(name)), pausable_(pausable) {}

ThreadedTransfer::~ThreadedTransfer() {
    cancel();
    wait();
}

void ThreadedTransfer::launch() {
    if (worker_.joinable()) throw std::logic_error("[" + name_ + "] launch() called twice");

    worker_ = std::thread([this] {
        try {
            auto out = run();
            if (cancelRequested()) finish(Phase::Cancelled, std::nullopt, {});
            else finish(Phase::Succeeded, std::nullopt, std::move(out));
        } catch (const TransferError& e) {
            if (cancelRequested()) finish(Phase::Cancelled, std::nullopt, {});
            else finish(Phase::Failed, e.info(), {});
        } catch (const std::exception& e) {
            if (cancelRequested()) finish(Phase::Cancelled, std::nullopt, {});
            else finish(Phase::Failed, ErrorInfo{ErrorKind::Fatal, e.what(), {}}, {});
        }
    });
}

void ThreadedTransfer::finish(const Phase phase, std::optional<ErrorInfo> error, std::filesystem::path output) {
    if (phase == Phase::Failed && error)
        log::Registry::download()->debug("[{}] Transfer failed ({}): {}", name_, to_string(error->kind), error->message);

    {
        std::scoped_lock lock(mutex_);
        status_.phase = phase;
        status_.error = std::move(error);
        status_.output = std::move(output);
    }
}

void ThreadedTransfer::cancel() {
    cancelRequested_.store(true, std::memory_order_release);
    {
        std::scoped_lock lock(mutex_);
        paused_.store(false, std::memory_order_release);
    }
    cv_.notify_all();
}

void ThreadedTransfer::pause() {
    if (!pausable_) Transfer::pause();

    std::scoped_lock lock(mutex_);
    if (isFinished(status_.phase)) return;
    paused_.store(true, std::memory_order_release);
    status_.phase = Phase::Paused;
}

void ThreadedTransfer::resume() {
    if (!pausable_) Transfer::resume();

    {
        std::scoped_lock lock(mutex_);
        if (isFinished(status_.phase)) return;
        paused_.store(false, std::memory_order_release);
        status_.phase = Phase::Running;
    }
    cv_.notify_all();
}

bool ThreadedTransfer::waitWhilePaused() {
    std::unique_lock lock(mutex_);
    cv_.wait(lock, [this] { return !paused_.load() || cancelRequested(); });
    return !cancelRequested();
}

void ThreadedTransfer::publish(Progress progress) {
    progress.clamp();
    std::scoped_lock lock(mutex_);
    status_.progress = std::move(progress);
}

Progress ThreadedTransfer::lastProgress() const {
    std::scoped_lock lock(mutex_);
    return status_.progress;
}

TransferStatus ThreadedTransfer::status() const {
    std::scoped_lock lock(mutex_);
    return status_;
}

void ThreadedTransfer::wait() {
    std::scoped_lock lock(joinMutex_);
    if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) worker_.join();
}
