#include "engine/Orchestrator.hpp"
#include "engine/AdmissionQueue.hpp"
#include "engine/EventBus.hpp"
#include "engine/RetryScheduler.hpp"
#include "auth/CredentialResolver.hpp"
#include "auth/ServiceAccountPool.hpp"
#include "backend/Registry.hpp"
#include "concurrency/Task.hpp"
#include "concurrency/ThreadPool.hpp"
#include "transfer/errors.hpp"
#include "log/Registry.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <utility>

using namespace sf::engine;
using namespace sf::transfer::model;
using namespace sf::backend;

namespace fs = std::filesystem;

namespace {

class StageTask final : public sf::concurrency::Task {
public:
    explicit StageTask(std::function<void()> fn) : fn_(std::move(fn)) {}

    void operator()() override { fn_(); }

private:
    std::function<void()> fn_;
};

std::string describe(const Destination& d) {
    if (d.target.empty()) return to_string(d.kind);
    return to_string(d.kind) + ":" + d.target;
}

std::string stageName(const bool download) { return download ? "download" : "upload"; }

// A backend that reports the whole work directory as its output but produced a single entry hands over that entry
fs::path uploadInput(const fs::path& output, const fs::path& workDir) {
    const auto produced = output.empty() ? workDir : output;
    if (produced != workDir || !fs::is_directory(produced)) return produced;

    std::error_code ec;
    fs::path only;
    size_t count = 0;
    for (const auto& entry : fs::directory_iterator(produced, ec)) {
        if (++count > 1) break;
        only = entry.path();
    }
    return count == 1 ? only : produced;
}

}

Orchestrator::Orchestrator(const config::Config& cfg,
                           std::shared_ptr<backend::Registry> backends,
                           std::shared_ptr<auth::CredentialResolver> credentials,
                           std::shared_ptr<EventBus> events)
    : engineCfg_(cfg.engine),
      downloadDir_(cfg.paths.download_dir),
      retry_(RetryPolicy::fromConfig(cfg.engine)),
      backends_(std::move(backends)),
      credentials_(std::move(credentials)),
      events_(std::move(events)),
      sources_(cfg.resolver.extra_extractor_domains),
      destinations_(cfg.destinations.default_spec, cfg.cloud.default_folder),
      limiter_(cfg.rate_limit),
      registry_(cfg.engine.history_limit),
      admission_(std::make_unique<AdmissionQueue>(
          cfg.engine.global_limit, cfg.engine.per_owner_limit,
          [this](const std::string& id, const std::string& owner) { onAdmitted(id, owner); })),
      scheduler_(std::make_unique<RetryScheduler>([this](const std::string& id) { onRetryDue(id); })),
      pool_(std::make_unique<concurrency::ThreadPool>(admission_->globalLimit(), "TaskWorkers")) {
    if (!backends_ || !credentials_ || !events_)
        throw std::invalid_argument("[Orchestrator] Backends, credentials and event bus are required");
}

Orchestrator::~Orchestrator() {
    shutdown();
}

void Orchestrator::start() {
    if (!events_->isRunning()) events_->start();
    scheduler_->start();
    log::Registry::engine()->info("[Orchestrator] Started with {} workers (per-owner limit {}, max retries {})",
                                  admission_->globalLimit(), admission_->perOwnerLimit(), retry_.maxRetries);
}

std::string Orchestrator::submit(const std::string& reference, const std::string& destinationSpec,
                                 const std::string& owner) {
    if (stopping_.load()) throw transfer::SubmissionRejected("Engine is shutting down");
    if (owner.empty()) throw transfer::SubmissionRejected("Submission without an owner");

    const auto source = sources_.resolve(reference);
    const auto destination = destinations_.resolve(destinationSpec);

    try {
        (void)backends_->downloader(source.kind);
        (void)backends_->uploader(destination.kind);
    } catch (const transfer::FatalTransferError& e) {
        throw transfer::ResolutionError(e.what());
    }

    if (limiter_.enabled()) {
        if (const auto d = limiter_.check(owner); !d.allowed) {
            const auto secs = static_cast<long>(std::ceil(static_cast<double>(d.retryAfter.count()) / 1000.0));
            log::Registry::engine()->warn("[Orchestrator] Rate limited submission from {}", owner);
            throw transfer::SubmissionRejected(fmt::format("Rate limit exceeded, try again in {}s", secs));
        }
    }

    TaskSnapshot initial;
    initial.owner = owner;
    initial.source = source;
    initial.destination = destination;
    initial.state = State::Queued;
    initial.created_at = Clock::now();

    std::shared_ptr<TaskEntry> entry;
    do {
        initial.id = ids_.generate();
        entry = std::make_shared<TaskEntry>(initial);
        entry->workDir = downloadDir_ / initial.id;
    } while (!registry_.insert(entry));

    ++live_;

    {
        std::scoped_lock lock(entry->mutex);
        publishEvent(*entry, true);
    }

    log::Registry::engine()->info("[Orchestrator] Task {} queued for {} ({} -> {})",
                                  initial.id, owner, to_string(source.kind), describe(destination));
    log::Registry::audit()->info("submit id={} owner={} source={} reference={} destination={}",
                                 initial.id, owner, to_string(source.kind), source.reference, describe(destination));

    admission_->enqueue(initial.id, owner);
    return initial.id;
}

bool Orchestrator::cancel(const std::string& taskId) {
    const auto e = registry_.find(taskId);
    if (!e) return false;

    Followup f;
    {
        std::scoped_lock lock(e->mutex);
        auto& t = e->task;
        if (isTerminal(t.state)) return true;

        const bool first = !t.cancel_requested;
        t.cancel_requested = true;

        if (t.state == State::Queued) {
            admission_->withdraw(taskId);
            scheduler_->cancel(taskId);
            finalize(*e, State::Cancelled, "Cancelled by user", std::nullopt, f);
        } else if (t.state == State::Uploading && e->retryPending) {
            e->retryPending = false;
            scheduler_->cancel(taskId);
            finalize(*e, State::Cancelled, "Cancelled by user", std::nullopt, f);
        } else {
            if (e->transfer) e->transfer->cancel();
            e->publishSnapshot();
            if (first) log::Registry::engine()->info("[Orchestrator] Cancellation requested for {}", taskId);
        }
    }

    e->cv.notify_all();
    apply(e, f);
    return true;
}

bool Orchestrator::pause(const std::string& taskId) {
    const auto e = registry_.find(taskId);
    if (!e) return false;

    {
        std::scoped_lock lock(e->mutex);
        if (e->task.state != State::Downloading || e->task.cancel_requested) return false;
        e->pauseRequested = true;
        e->resumeRequested = false;
    }

    e->cv.notify_all();
    return true;
}

bool Orchestrator::resume(const std::string& taskId) {
    const auto e = registry_.find(taskId);
    if (!e) return false;

    {
        std::scoped_lock lock(e->mutex);
        if (e->task.cancel_requested) return false;
        if (e->task.state == State::Downloading && e->pauseRequested) {
            e->pauseRequested = false;
            return true;
        }
        if (e->task.state != State::Paused) return false;
        e->resumeRequested = true;
    }

    e->cv.notify_all();
    return true;
}

std::optional<TaskSnapshot> Orchestrator::status(const std::string& taskId) const {
    const auto e = registry_.find(taskId);
    if (!e) return std::nullopt;
    return e->snapshot();
}

std::vector<TaskSnapshot> Orchestrator::list(const std::string& owner) const {
    return registry_.list(owner);
}

std::vector<TaskSnapshot> Orchestrator::listAll() const {
    return registry_.all();
}

void Orchestrator::shutdown() {
    if (stopping_.exchange(true)) return;

    const auto logger = log::Registry::engine();
    logger->info("[Orchestrator] Shutting down with {} live tasks", live_.load());

    for (const auto& e : registry_.entries()) cancel(e->snapshot().id);

    if (!waitUntilIdle(SHUTDOWN_GRACE))
        logger->error("[Orchestrator] {} tasks did not confirm teardown within {}s",
                      live_.load(), SHUTDOWN_GRACE.count());

    scheduler_->stop();
    pool_->stop();
    events_->flush();

    logger->info("[Orchestrator] Shutdown complete");
}

bool Orchestrator::waitUntilIdle(const std::chrono::milliseconds timeout) {
    std::unique_lock lock(idleMutex_);
    return idleCv_.wait_for(lock, timeout, [this] { return live_.load() == 0; });
}

void Orchestrator::onAdmitted(const std::string& taskId, const std::string& owner) {
    const auto e = registry_.find(taskId);
    if (!e) {
        admission_->release(owner);
        return;
    }

    bool stale = false;
    {
        std::scoped_lock lock(e->mutex);
        if (e->task.state != State::Queued) stale = true;
        else {
            e->holdsSlot = true;
            transition(*e, State::Downloading);
        }
    }

    if (stale) {
        admission_->release(owner);
        return;
    }

    submitStage(e, Stage::Download);
}

void Orchestrator::onRetryDue(const std::string& taskId) {
    const auto e = registry_.find(taskId);
    if (!e) return;

    bool enqueue = false, upload = false;
    std::string owner;
    {
        std::scoped_lock lock(e->mutex);
        owner = e->task.owner;
        if (e->task.cancel_requested) return;
        if (e->task.state == State::Queued) enqueue = true;
        else if (e->task.state == State::Uploading && e->retryPending) {
            e->retryPending = false;
            upload = true;
        }
    }

    if (enqueue) admission_->enqueue(taskId, owner);
    if (upload) submitStage(e, Stage::Upload);
}

void Orchestrator::submitStage(const std::shared_ptr<TaskEntry>& e, const Stage stage) {
    auto work = [this, e, stage] {
        try {
            runStage(e, stage);
        } catch (const std::exception& ex) {
            log::Registry::engine()->error("[Orchestrator] Worker for {} failed: {}", e->snapshot().id, ex.what());
            Followup f;
            {
                std::scoped_lock lock(e->mutex);
                e->transfer.reset();
                finalize(*e, State::Failed, ex.what(), ErrorInfo{ErrorKind::Fatal, ex.what(), {}}, f);
            }
            apply(e, f);
        }
    };

    try {
        pool_->submit(std::make_shared<StageTask>(std::move(work)));
    } catch (const std::exception& ex) {
        Followup f;
        {
            std::scoped_lock lock(e->mutex);
            if (e->task.cancel_requested) finalize(*e, State::Cancelled, "Cancelled by user", std::nullopt, f);
            else finalize(*e, State::Failed, "No worker available", ErrorInfo{ErrorKind::Fatal, ex.what(), {}}, f);
        }
        apply(e, f);
    }
}

std::optional<sf::auth::model::Credential> Orchestrator::resolveCredential(TaskEntry& e, const Stage stage) {
    const auto kind = stage == Stage::Download
        ? backends_->downloader(e.task.source.kind)->credentialKind()
        : backends_->uploader(e.task.destination.kind)->credentialKind();
    if (!kind) return std::nullopt;

    {
        std::scoped_lock lock(e.mutex);
        if (e.credentialOverride && e.credentialOverride->kind == *kind) return e.credentialOverride;
    }

    return credentials_->resolve(e.task.owner, *kind);
}

std::shared_ptr<Transfer> Orchestrator::startTransfer(TaskEntry& e, const Stage stage,
                                                      const std::optional<auth::model::Credential>& cred) {
    if (stage == Stage::Download) {
        fs::create_directories(e.workDir);
        const DownloadJob job{e.task.id, e.task.owner, e.task.source.reference, e.workDir, cred};
        return backends_->downloader(e.task.source.kind)->start(job);
    }

    std::filesystem::path input;
    {
        std::scoped_lock lock(e.mutex);
        input = e.downloadOutput;
    }
    const UploadJob job{e.task.id, e.task.owner, input, e.task.destination, cred};
    return backends_->uploader(e.task.destination.kind)->start(job);
}

void Orchestrator::runStage(const std::shared_ptr<TaskEntry>& e, const Stage stage) {
    const bool download = stage == Stage::Download;
    Followup f;
    bool advance = false;

    while (true) {
        {
            std::scoped_lock lock(e->mutex);
            if (e->task.cancel_requested) {
                finalize(*e, State::Cancelled, "Cancelled by user", std::nullopt, f);
                break;
            }
        }

        std::optional<auth::model::Credential> cred;
        std::shared_ptr<Transfer> handle;
        std::optional<ErrorInfo> startError;

        try {
            cred = resolveCredential(*e, stage);
            handle = startTransfer(*e, stage, cred);
            if (!handle) throw transfer::FatalTransferError("Backend returned no transfer");
        } catch (const transfer::TransferError& ex) {
            startError = ex.info();
        } catch (const std::exception& ex) {
            startError = ErrorInfo{ErrorKind::Fatal, ex.what(), {}};
        }

        std::unique_lock lock(e->mutex);
        e->credential = cred;

        if (startError) {
            log::Registry::engine()->warn("[Orchestrator] {} could not start {}: {}",
                                          e->task.id, stageName(download), startError->message);
            if (handleFailure(*e, *startError, stage, f)) continue;
            break;
        }

        e->transfer = handle;
        if (e->task.cancel_requested) handle->cancel();

        auto result = monitor(*e, lock);

        lock.unlock();
        handle->wait();
        lock.lock();

        e->transfer.reset();
        e->pauseRequested = e->resumeRequested = false;

        const auto phase = result.status.phase;
        const bool delivered = !download && phase == Phase::Succeeded;

        if (e->task.cancel_requested && !delivered) {
            finalize(*e, State::Cancelled, "Cancelled by user", std::nullopt, f);
            break;
        }

        // finished on its own while held; resume so the outcome leaves from Downloading
        if (e->task.state == State::Paused) transition(*e, State::Downloading);

        if (phase == Phase::Succeeded) {
            if (download) {
                e->downloadOutput = uploadInput(result.status.output, e->workDir);
                e->credentialOverride.reset();
                e->task.progress = {};
                transition(*e, State::Uploading);
                advance = true;
            } else {
                finalize(*e, State::Completed, "Delivered to " + describe(e->task.destination), std::nullopt, f);
            }
            break;
        }

        if (phase == Phase::Cancelled && result.requeued) {
            log::Registry::engine()->info("[Orchestrator] {} cannot pause, requeued", e->task.id);
            transition(*e, State::Queued);
            f.releaseSlot = std::exchange(e->holdsSlot, false);
            f.enqueue = true;
            break;
        }

        ErrorInfo error;
        if (phase == Phase::Cancelled) {
            error = {ErrorKind::Transient, result.timedOut
                ? fmt::format("No progress for {}s", engineCfg_.inactivity_timeout.count())
                : "Transfer stopped unexpectedly", {}};
        } else {
            error = result.status.error.value_or(ErrorInfo{ErrorKind::Fatal, "Transfer failed without an error", {}});
        }

        if (handleFailure(*e, error, stage, f)) continue;
        break;
    }

    apply(e, f);
    if (advance) runStage(e, Stage::Upload);
}

Orchestrator::StageResult Orchestrator::monitor(TaskEntry& e, std::unique_lock<std::mutex>& lock) {
    StageResult r;
    const auto timeout = engineCfg_.inactivity_timeout;
    auto lastBytes = std::numeric_limits<uint64_t>::max();
    auto lastChange = Clock::now();

    while (true) {
        auto st = e.transfer->status();
        e.task.progress = st.progress;
        e.task.progress.clamp();

        if (isFinished(st.phase)) {
            r.status = std::move(st);
            e.publishSnapshot();
            return r;
        }

        const auto now = Clock::now();
        if (st.progress.transferred != lastBytes) {
            lastBytes = st.progress.transferred;
            lastChange = now;
        } else if (e.task.state != State::Paused && !r.timedOut && !r.requeued &&
                   timeout.count() > 0 && now - lastChange >= timeout) {
            log::Registry::engine()->warn("[Orchestrator] {} made no progress for {}s, cancelling",
                                          e.task.id, timeout.count());
            r.timedOut = true;
            e.transfer->cancel();
        }

        if (std::exchange(e.pauseRequested, false) && e.task.state == State::Downloading &&
            !e.task.cancel_requested && !r.timedOut && !r.requeued) {
            bool paused = false;
            if (e.transfer->supportsPause()) {
                try {
                    e.transfer->pause();
                    paused = true;
                } catch (const transfer::UnsupportedOperation& ex) {
                    log::Registry::engine()->debug("[Orchestrator] {} pause refused: {}", e.task.id, ex.what());
                }
            }

            if (paused) transition(e, State::Paused);
            else {
                r.requeued = true;
                e.transfer->cancel();
            }
        }

        if (std::exchange(e.resumeRequested, false) && e.task.state == State::Paused && !e.task.cancel_requested) {
            e.transfer->resume();
            transition(e, State::Downloading);
            lastChange = now;
        }

        e.publishSnapshot();
        publishEvent(e, false);
        e.cv.wait_for(lock, engineCfg_.status_poll_interval);
    }
}

bool Orchestrator::handleFailure(TaskEntry& e, const ErrorInfo& error, const Stage stage, Followup& f) {
    auto& t = e.task;
    const auto logger = log::Registry::engine();
    const bool download = stage == Stage::Download;

    switch (error.kind) {
        case ErrorKind::Transient: {
            if (!retry_.canRetry(t.attempt)) {
                finalize(e, State::Failed, fmt::format("Failed after {} retries: {}", t.attempt, error.message), error, f);
                return false;
            }

            ++t.attempt;
            // flood control: never retry before the server-requested wait
            const auto delay = std::max(retry_.backoff(t.attempt),
                                        std::chrono::duration_cast<std::chrono::milliseconds>(error.retryAfter));
            logger->warn("[Orchestrator] {} {} failed: {} (retry {}/{} in {}ms)", t.id, stageName(download),
                         error.message, t.attempt, retry_.maxRetries, delay.count());

            if (download) {
                transition(e, State::Queued);
                f.releaseSlot = std::exchange(e.holdsSlot, false);
            } else {
                e.retryPending = true;
                e.publishSnapshot();
                publishEvent(e, false);
            }

            scheduler_->schedule(t.id, RetryScheduler::Clock::now() + delay);
            return false;
        }

        case ErrorKind::Auth:
            if (e.credential && e.credential->scope == auth::model::CredentialScope::User && !e.authFallbackUsed) {
                credentials_->invalidate(e.credential->path);
                if (auto fallback = credentials_->resolveFallback(t.owner, e.credential->kind)) {
                    logger->warn("[Orchestrator] {} rejected the credential of {}, retrying with the global one",
                                 t.id, t.owner);
                    e.authFallbackUsed = true;
                    e.credentialOverride = std::move(fallback);
                    return true;
                }
            }
            finalize(e, State::Failed, "Authentication failed: " + error.message, error, f);
            return false;

        case ErrorKind::QuotaExceeded:
            if (e.credential && e.credential->scope == auth::model::CredentialScope::Pool &&
                !error.account.empty() && e.credential->account == error.account && credentials_->pool()) {
                credentials_->pool()->reportQuotaExceeded(error.account);
                logger->warn("[Orchestrator] {} hit the quota of {}, rotating", t.id, error.account);
                return true;
            }
            finalize(e, State::Failed, "Quota exceeded: " + error.message, error, f);
            return false;

        default:
            finalize(e, State::Failed, error.message, error, f);
            return false;
    }
}

void Orchestrator::transition(TaskEntry& e, const State to) {
    auto& t = e.task;
    if (!canTransition(t.state, to))
        throw std::logic_error(fmt::format("Illegal transition {} -> {} for {}", to_string(t.state), to_string(to), t.id));

    log::Registry::engine()->info("[Orchestrator] {}: {} -> {}", t.id, to_string(t.state), to_string(to));
    t.state = to;
    if (to == State::Downloading && !t.started_at) t.started_at = Clock::now();

    e.publishSnapshot();
    publishEvent(e, true);
}

void Orchestrator::finalize(TaskEntry& e, const State to, std::string reason,
                            std::optional<ErrorInfo> error, Followup& f) {
    auto& t = e.task;
    if (isTerminal(t.state)) return;

    const auto logger = log::Registry::engine();
    if (!canTransition(t.state, to))
        logger->error("[Orchestrator] Forcing {} -> {} for {}", to_string(t.state), to_string(to), t.id);

    cleanupWorkspace(e);

    const auto from = t.state;
    t.state = to;
    t.reason = std::move(reason);
    t.error = to == State::Failed ? std::move(error) : std::nullopt;
    t.completed_at = Clock::now();
    e.retryPending = false;
    e.pauseRequested = e.resumeRequested = false;

    if (std::exchange(e.holdsSlot, false)) f.releaseSlot = true;
    f.terminal = true;

    if (to == State::Failed) logger->warn("[Orchestrator] {}: {} -> failed ({})", t.id, to_string(from), t.reason);
    else logger->info("[Orchestrator] {}: {} -> {} ({})", t.id, to_string(from), to_string(to), t.reason);

    e.publishSnapshot();
    publishEvent(e, true);
}

void Orchestrator::apply(const std::shared_ptr<TaskEntry>& e, const Followup& f) {
    const auto snap = e->snapshot();

    if (f.releaseSlot) admission_->release(snap.owner);
    if (f.enqueue) admission_->enqueue(snap.id, snap.owner);

    if (f.terminal) {
        log::Registry::audit()->info("{} id={} owner={} attempt={} reason={}",
                                     to_string(snap.state), snap.id, snap.owner, snap.attempt, snap.reason);
        registry_.retire(snap.id);
        {
            std::scoped_lock lock(idleMutex_);
            --live_;
        }
        idleCv_.notify_all();
    }
}

void Orchestrator::publishEvent(const TaskEntry& e, const bool transition) const {
    const auto& t = e.task;
    events_->publish(model::Event{t.id, t.owner, t.state, t.progress, t.attempt, t.reason,
                                  std::chrono::system_clock::now(), transition});
}

void Orchestrator::cleanupWorkspace(TaskEntry& e) const {
    if (e.workDir.empty()) return;

    std::error_code ec;
    fs::remove_all(e.workDir, ec);
    if (ec) log::Registry::engine()->warn("[Orchestrator] Failed to remove {}: {}", e.workDir.string(), ec.message());
}
