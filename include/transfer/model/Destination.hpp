#pragma once

#include <string>

namespace sf::transfer::model {

enum class DestinationKind { Chat, Cloud, RemoteSync };

// target: chat id, drive folder id (empty = configured default), or "remote:path"
struct Destination {
    DestinationKind kind{DestinationKind::Chat};
    std::string target;
};

std::string to_string(DestinationKind k);

}
