#pragma once

#include "transfer/model/ErrorInfo.hpp"
#include "transfer/model/Progress.hpp"

#include <filesystem>
#include <optional>

namespace sf::backend {

enum class Phase { Running, Paused, Succeeded, Failed, Cancelled };

struct TransferStatus {
    Phase phase{Phase::Running};
    transfer::model::Progress progress;
    std::optional<transfer::model::ErrorInfo> error;    // set when Failed
    std::filesystem::path output;                       // set when Succeeded
};

[[nodiscard]] inline bool isFinished(const Phase p) {
    return p == Phase::Succeeded || p == Phase::Failed || p == Phase::Cancelled;
}

// Handle on one running backend operation. Exclusively owns its thread, subprocess or curl handle.
class Transfer {
public:
    virtual ~Transfer() = default;

    // Idempotent, safe after natural completion. Teardown is confirmed once status() reports a finished phase.
    virtual void cancel() = 0;

    // Throw UnsupportedOperation unless supportsPause()
    virtual void pause();
    virtual void resume();

    [[nodiscard]] virtual bool supportsPause() const { return false; }

    // Non-blocking snapshot
    [[nodiscard]] virtual TransferStatus status() const = 0;

    // Blocks until the worker has exited
    virtual void wait() = 0;
};

}
