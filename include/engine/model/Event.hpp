#pragma once

#include "transfer/model/Progress.hpp"
#include "transfer/model/State.hpp"

#include <chrono>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace sf::engine::model {

struct Event {
    std::string taskId;
    std::string owner;
    transfer::model::State state{transfer::model::State::Queued};
    transfer::model::Progress progress;
    unsigned int attempt = 0;
    std::string reason;
    std::chrono::system_clock::time_point timestamp{};
    bool transition = false;    // false for progress ticks
};

void to_json(nlohmann::json& j, const Event& e);

}
