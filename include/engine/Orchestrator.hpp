#pragma once

#include "config/Config.hpp"
#include "crypto/IdGenerator.hpp"
#include "engine/RateLimiter.hpp"
#include "engine/RetryPolicy.hpp"
#include "engine/TaskRegistry.hpp"
#include "transfer/DestinationResolver.hpp"
#include "transfer/SourceResolver.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace sf::backend { class Registry; }
namespace sf::auth { class CredentialResolver; }
namespace sf::concurrency { class ThreadPool; }

namespace sf::engine {

class AdmissionQueue;
class EventBus;
class RetryScheduler;

// Owns every task from submission to its terminal state. Workers come from a pool sized to the
// global ceiling; backoff waits live in the RetryScheduler; progress and transitions go out on the EventBus.
class Orchestrator {
public:
    static constexpr std::chrono::seconds SHUTDOWN_GRACE{30};

    Orchestrator(const config::Config& cfg,
                 std::shared_ptr<backend::Registry> backends,
                 std::shared_ptr<auth::CredentialResolver> credentials,
                 std::shared_ptr<EventBus> events);

    ~Orchestrator();

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    void start();

    // Throws ResolutionError (no task created) or SubmissionRejected
    std::string submit(const std::string& reference, const std::string& destinationSpec, const std::string& owner);

    // false only for unknown ids
    bool cancel(const std::string& taskId);

    // Downloading tasks only
    bool pause(const std::string& taskId);

    // Paused tasks only
    bool resume(const std::string& taskId);

    [[nodiscard]] std::optional<transfer::model::TaskSnapshot> status(const std::string& taskId) const;
    [[nodiscard]] std::vector<transfer::model::TaskSnapshot> list(const std::string& owner) const;
    [[nodiscard]] std::vector<transfer::model::TaskSnapshot> listAll() const;

    // Cancels every non-terminal task, waits for teardown and stops the workers
    void shutdown();

    [[nodiscard]] size_t liveTasks() const { return live_.load(); }

    // true once every submitted task is terminal
    bool waitUntilIdle(std::chrono::milliseconds timeout);

    [[nodiscard]] const AdmissionQueue& admission() const { return *admission_; }

private:
    enum class Stage { Download, Upload };

    // Work decided under a task lock and carried out after it is released
    struct Followup {
        bool releaseSlot = false;
        bool enqueue = false;
        bool terminal = false;
    };

    struct StageResult {
        backend::TransferStatus status;
        bool timedOut = false;
        bool requeued = false;
    };

    void onAdmitted(const std::string& taskId, const std::string& owner);
    void onRetryDue(const std::string& taskId);

    void runStage(const std::shared_ptr<TaskEntry>& e, Stage stage);
    void submitStage(const std::shared_ptr<TaskEntry>& e, Stage stage);

    std::shared_ptr<backend::Transfer> startTransfer(TaskEntry& e, Stage stage,
                                                     const std::optional<auth::model::Credential>& cred);
    std::optional<auth::model::Credential> resolveCredential(TaskEntry& e, Stage stage);

    StageResult monitor(TaskEntry& e, std::unique_lock<std::mutex>& lock);

    // Each returns true when the stage loop should try again immediately
    bool handleFailure(TaskEntry& e, const transfer::model::ErrorInfo& error, Stage stage, Followup& f);

    void transition(TaskEntry& e, transfer::model::State to);
    void finalize(TaskEntry& e, transfer::model::State to, std::string reason,
                  std::optional<transfer::model::ErrorInfo> error, Followup& f);
    void apply(const std::shared_ptr<TaskEntry>& e, const Followup& f);

    void publishEvent(const TaskEntry& e, bool transition) const;
    void cleanupWorkspace(TaskEntry& e) const;

    config::EngineConfig engineCfg_;
    std::filesystem::path downloadDir_;
    RetryPolicy retry_;

    std::shared_ptr<backend::Registry> backends_;
    std::shared_ptr<auth::CredentialResolver> credentials_;
    std::shared_ptr<EventBus> events_;

    transfer::SourceResolver sources_;
    transfer::DestinationResolver destinations_;
    RateLimiter limiter_;
    crypto::IdGenerator ids_;
    TaskRegistry registry_;

    std::unique_ptr<AdmissionQueue> admission_;
    std::unique_ptr<RetryScheduler> scheduler_;
    std::unique_ptr<concurrency::ThreadPool> pool_;

    std::atomic<bool> stopping_{false};
    std::atomic<size_t> live_{0};
    std::mutex idleMutex_;
    std::condition_variable idleCv_;
};

}
