#pragma once

#include "transfer/model/Destination.hpp"
#include "transfer/model/ErrorInfo.hpp"
#include "transfer/model/Progress.hpp"
#include "transfer/model/Source.hpp"
#include "transfer/model/State.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace sf::transfer::model {

using Clock = std::chrono::steady_clock;

struct TaskSnapshot {
    std::string id;
    std::string owner;
    Source source;
    Destination destination;
    State state{State::Queued};
    Progress progress;
    unsigned int attempt = 0;
    std::optional<ErrorInfo> error;     // set only when Failed
    std::string reason;                 // set on every terminal state
    Clock::time_point created_at{};
    std::optional<Clock::time_point> started_at, completed_at;
    bool cancel_requested = false;
};

void to_json(nlohmann::json& j, const TaskSnapshot& t);

std::string to_string(const TaskSnapshot& t);

}
