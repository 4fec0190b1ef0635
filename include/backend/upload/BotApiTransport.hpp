#pragma once

#include "backend/upload/ChatTransport.hpp"

namespace sf::backend {

// Bot API sendDocument over a curl mime POST
class BotApiTransport final : public ChatTransport {
public:
    BotApiTransport(std::string apiBase, std::string botToken);

    void sendDocument(const std::string& chatId,
                      const std::filesystem::path& file,
                      const std::string& caption,
                      const ProgressFn& progress) override;

private:
    std::string apiBase_;
    std::string botToken_;
};

}
