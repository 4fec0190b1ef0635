#pragma once

#include "transfer/model/Destination.hpp"

#include <string>

namespace sf::transfer {

// "chat:<chatId>", "drive:<folderId>" (folder optional), "remote:<name>:<path>"
class DestinationResolver {
public:
    DestinationResolver(std::string defaultSpec, std::string defaultFolder);

    // Empty spec falls back to the configured default. Throws ResolutionError.
    [[nodiscard]] model::Destination resolve(const std::string& spec) const;

private:
    std::string defaultSpec_;
    std::string defaultFolder_;
};

}
