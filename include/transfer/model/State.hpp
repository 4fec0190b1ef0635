#pragma once

#include <string>

namespace sf::transfer::model {

enum class State { Queued, Downloading, Paused, Uploading, Completed, Failed, Cancelled };

std::string to_string(State s);
State stateFromString(const std::string& str);

[[nodiscard]] bool isTerminal(State s);

// Holds an admission slot
[[nodiscard]] bool holdsSlot(State s);

// Downloading -> Downloading and Uploading -> Uploading are in-place retries, not transitions
[[nodiscard]] bool canTransition(State from, State to);

}
