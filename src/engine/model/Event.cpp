#include "engine/model/Event.hpp"

#include <nlohmann/json.hpp>

using namespace sf::engine::model;

void sf::engine::model::to_json(nlohmann::json& j, const Event& e) {
    j = {
        {"task_id", e.taskId},
        {"owner", e.owner},
        {"state", transfer::model::to_string(e.state)},
        {"progress", e.progress},
        {"attempt", e.attempt},
        {"reason", e.reason},
        {"timestamp_ms", std::chrono::duration_cast<std::chrono::milliseconds>(e.timestamp.time_since_epoch()).count()},
        {"transition", e.transition}
    };
}
