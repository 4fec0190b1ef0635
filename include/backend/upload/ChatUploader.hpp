#pragma once

#include "backend/Uploader.hpp"
#include "backend/ThreadedTransfer.hpp"
#include "backend/upload/ChatTransport.hpp"

#include <vector>

namespace sf::backend {

// Files above maxPartBytes become "<name>.001", "<name>.002", ... in outDir. Smaller files are returned as is.
std::vector<std::filesystem::path> splitFile(const std::filesystem::path& file, uintmax_t maxPartBytes,
                                             const std::filesystem::path& outDir);

// Regular files under input (or input itself), sorted by path
std::vector<std::filesystem::path> collectFiles(const std::filesystem::path& input);

class ChatTransfer final : public ThreadedTransfer {
public:
    ChatTransfer(UploadJob job, std::shared_ptr<ChatTransport> transport, uintmax_t maxPartBytes);
    ~ChatTransfer() override;

protected:
    std::filesystem::path run() override;

private:
    UploadJob job_;
    std::shared_ptr<ChatTransport> transport_;
    uintmax_t maxPartBytes_;
};

class ChatUploader final : public Uploader {
public:
    ChatUploader(std::shared_ptr<ChatTransport> transport, uintmax_t maxPartBytes);

    [[nodiscard]] transfer::model::DestinationKind kind() const override { return transfer::model::DestinationKind::Chat; }

    [[nodiscard]] std::optional<auth::model::CredentialKind> credentialKind() const override { return std::nullopt; }

    std::shared_ptr<Transfer> start(const UploadJob& job) override;

private:
    std::shared_ptr<ChatTransport> transport_;
    uintmax_t maxPartBytes_;
};

}
