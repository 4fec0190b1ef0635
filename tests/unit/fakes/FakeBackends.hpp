#pragma once

#include "backend/Downloader.hpp"
#include "backend/ThreadedTransfer.hpp"
#include "backend/Uploader.hpp"
#include "transfer/errors.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <deque>
#include <fstream>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace sf::test {

// One scripted backend run
struct Outcome {
    enum class Kind {
        Succeed,    // progresses for `duration`, then produces a file
        Fail,       // progresses for `duration`, then throws `error`
        Hang,       // progresses until cancelled
        Stall,      // reports no progress until cancelled
        RejectStart // start() itself throws `error`
    };

    Kind kind = Kind::Succeed;
    transfer::model::ErrorInfo error{transfer::model::ErrorKind::Transient, "scripted failure", {}};
    std::chrono::milliseconds duration{20};
    bool pausable = false;
    bool quotaOnCredential = false;     // Fail with QuotaExceeded naming the job's service account

    static Outcome succeed() { return {}; }

    static Outcome fail(const transfer::model::ErrorKind kind, std::string message = "scripted failure") {
        Outcome o;
        o.kind = Kind::Fail;
        o.error = {kind, std::move(message), {}};
        return o;
    }

    static Outcome hang(const bool pausable = false) {
        Outcome o;
        o.kind = Kind::Hang;
        o.pausable = pausable;
        return o;
    }

    static Outcome stall() {
        Outcome o;
        o.kind = Kind::Stall;
        return o;
    }

    static Outcome quotaExceeded() {
        Outcome o;
        o.kind = Kind::Fail;
        o.quotaOnCredential = true;
        o.error = {transfer::model::ErrorKind::QuotaExceeded, "quotaExceeded", {}};
        return o;
    }
};

[[noreturn]] inline void throwFor(const transfer::model::ErrorInfo& e) {
    using transfer::model::ErrorKind;
    switch (e.kind) {
        case ErrorKind::Transient: throw transfer::TransientTransferError(e.message, e.retryAfter);
        case ErrorKind::Auth: throw transfer::AuthError(e.message);
        case ErrorKind::QuotaExceeded: throw transfer::QuotaExceededError(e.message, e.account);
        case ErrorKind::Unsupported: throw transfer::UnsupportedOperation(e.message);
        default: throw transfer::FatalTransferError(e.message);
    }
}

// Shared bookkeeping for every transfer a fake backend starts
struct Tracker {
    std::atomic<int> running{0};
    std::atomic<int> maxRunning{0};
    std::atomic<int> started{0};

    void enter() {
        const int now = ++running;
        int seen = maxRunning.load();
        while (now > seen && !maxRunning.compare_exchange_weak(seen, now)) {}
    }

    void leave() { --running; }
};

class FakeTransfer final : public backend::ThreadedTransfer {
public:
    FakeTransfer(Outcome outcome, std::filesystem::path output, std::string account, Tracker& tracker)
        : ThreadedTransfer("FakeTransfer", outcome.pausable),
          outcome_(std::move(outcome)), output_(std::move(output)), account_(std::move(account)), tracker_(tracker) {}

    ~FakeTransfer() override {
        cancel();
        wait();
    }

protected:
    std::filesystem::path run() override {
        tracker_.enter();
        struct Leave {
            Tracker& t;
            ~Leave() { t.leave(); }
        } leave{tracker_};

        using Kind = Outcome::Kind;
        const auto deadline = std::chrono::steady_clock::now() + outcome_.duration;
        transfer::model::Progress p;
        p.total = 1000;

        while (true) {
            if (cancelRequested()) throw transfer::TransientTransferError("cancelled");
            if (outcome_.pausable && !waitWhilePaused()) throw transfer::TransientTransferError("cancelled");

            const bool forever = outcome_.kind == Kind::Hang || outcome_.kind == Kind::Stall;
            if (!forever && std::chrono::steady_clock::now() >= deadline) break;

            if (outcome_.kind != Kind::Stall && p.transferred < 999) {
                ++p.transferred;
                publish(p);
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
        }

        if (outcome_.kind == Kind::Fail) {
            auto err = outcome_.error;
            if (outcome_.quotaOnCredential) err.account = account_;
            throwFor(err);
        }

        if (!output_.empty() && !std::filesystem::exists(output_)) {
            std::filesystem::create_directories(output_.parent_path());
            std::ofstream(output_) << "payload";
        }

        p.transferred = 1000;
        publish(p);
        return output_;
    }

private:
    Outcome outcome_;
    std::filesystem::path output_;
    std::string account_;
    Tracker& tracker_;
};

// Pops one Outcome per start(); an empty script succeeds
class Script {
public:
    void push(Outcome o) {
        std::scoped_lock lock(mutex_);
        outcomes_.push_back(std::move(o));
    }

    Outcome next() {
        std::scoped_lock lock(mutex_);
        if (outcomes_.empty()) return Outcome::succeed();
        auto o = std::move(outcomes_.front());
        outcomes_.pop_front();
        return o;
    }

private:
    std::mutex mutex_;
    std::deque<Outcome> outcomes_;
};

class FakeDownloader final : public backend::Downloader {
public:
    explicit FakeDownloader(const transfer::model::SourceKind kind,
                            const std::optional<auth::model::CredentialKind> credKind = std::nullopt)
        : kind_(kind), credKind_(credKind) {}

    [[nodiscard]] transfer::model::SourceKind kind() const override { return kind_; }
    [[nodiscard]] std::optional<auth::model::CredentialKind> credentialKind() const override { return credKind_; }

    std::shared_ptr<backend::Transfer> start(const backend::DownloadJob& job) override {
        {
            std::scoped_lock lock(mutex_);
            jobs_.push_back(job);
        }
        ++tracker.started;

        auto outcome = script.next();
        if (outcome.kind == Outcome::Kind::RejectStart) throwFor(outcome.error);

        const auto account = job.credential ? job.credential->account : std::string{};
        auto t = std::make_shared<FakeTransfer>(std::move(outcome), job.workDir / "file.bin", account, tracker);
        t->launch();
        return t;
    }

    std::vector<backend::DownloadJob> jobs() {
        std::scoped_lock lock(mutex_);
        return jobs_;
    }

    Script script;
    Tracker tracker;

private:
    transfer::model::SourceKind kind_;
    std::optional<auth::model::CredentialKind> credKind_;
    std::mutex mutex_;
    std::vector<backend::DownloadJob> jobs_;
};

class FakeUploader final : public backend::Uploader {
public:
    explicit FakeUploader(const transfer::model::DestinationKind kind,
                          const std::optional<auth::model::CredentialKind> credKind = std::nullopt)
        : kind_(kind), credKind_(credKind) {}

    [[nodiscard]] transfer::model::DestinationKind kind() const override { return kind_; }
    [[nodiscard]] std::optional<auth::model::CredentialKind> credentialKind() const override { return credKind_; }

    std::shared_ptr<backend::Transfer> start(const backend::UploadJob& job) override {
        {
            std::scoped_lock lock(mutex_);
            jobs_.push_back(job);
        }
        ++tracker.started;

        auto outcome = script.next();
        if (outcome.kind == Outcome::Kind::RejectStart) throwFor(outcome.error);

        const auto account = job.credential ? job.credential->account : std::string{};
        auto t = std::make_shared<FakeTransfer>(std::move(outcome), std::filesystem::path{}, account, tracker);
        t->launch();
        return t;
    }

    std::vector<backend::UploadJob> jobs() {
        std::scoped_lock lock(mutex_);
        return jobs_;
    }

    Script script;
    Tracker tracker;

private:
    transfer::model::DestinationKind kind_;
    std::optional<auth::model::CredentialKind> credKind_;
    std::mutex mutex_;
    std::vector<backend::UploadJob> jobs_;
};

template <typename Pred>
bool waitFor(Pred pred, const std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return pred();
}

}
