#include "transfer/model/State.hpp"

#include <stdexcept>

using namespace sf::transfer::model;

std::string sf::transfer::model::to_string(const State s) {
    switch (s) {
        case State::Queued: return "queued";
        case State::Downloading: return "downloading";
        case State::Paused: return "paused";
        case State::Uploading: return "uploading";
        case State::Completed: return "completed";
        case State::Failed: return "failed";
        case State::Cancelled: return "cancelled";
        default: throw std::invalid_argument("Unknown task state");
    }
}

State sf::transfer::model::stateFromString(const std::string& str) {
    if (str == "queued") return State::Queued;
    if (str == "downloading") return State::Downloading;
    if (str == "paused") return State::Paused;
    if (str == "uploading") return State::Uploading;
    if (str == "completed") return State::Completed;
    if (str == "failed") return State::Failed;
    if (str == "cancelled") return State::Cancelled;
    throw std::invalid_argument("Unknown task state: " + str);
}

bool sf::transfer::model::isTerminal(const State s) {
    return s == State::Completed || s == State::Failed || s == State::Cancelled;
}

bool sf::transfer::model::holdsSlot(const State s) {
    return s == State::Downloading || s == State::Paused || s == State::Uploading;
}

bool sf::transfer::model::canTransition(const State from, const State to) {
    switch (from) {
        case State::Queued:
            return to == State::Downloading || to == State::Cancelled;
        case State::Downloading:
            return to == State::Uploading || to == State::Queued || to == State::Failed ||
                   to == State::Paused || to == State::Cancelled;
        case State::Paused:
            return to == State::Downloading || to == State::Cancelled;
        case State::Uploading:
            return to == State::Completed || to == State::Failed || to == State::Cancelled;
        case State::Completed:
        case State::Failed:
        case State::Cancelled:
            return false;
    }
    return false;
}
