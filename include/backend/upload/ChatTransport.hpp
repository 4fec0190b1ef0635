#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>

namespace sf::backend {

// Sends one document to a chat. Returning false from the progress callback aborts the send.
// Failures throw TransferError.
class ChatTransport {
public:
    using ProgressFn = std::function<bool(uint64_t sent, uint64_t total)>;

    virtual ~ChatTransport() = default;

    virtual void sendDocument(const std::string& chatId,
                              const std::filesystem::path& file,
                              const std::string& caption,
                              const ProgressFn& progress) = 0;
};

}
