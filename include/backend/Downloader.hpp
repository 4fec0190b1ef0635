#pragma once

#include "auth/model/Credential.hpp"
#include "backend/Transfer.hpp"
#include "transfer/model/Source.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace sf::backend {

struct DownloadJob {
    std::string taskId;
    std::string owner;
    std::string reference;
    std::filesystem::path workDir;      // exists, owned by the task
    std::optional<auth::model::Credential> credential;
};

class Downloader {
public:
    virtual ~Downloader() = default;

    [[nodiscard]] virtual transfer::model::SourceKind kind() const = 0;

    // Kind of credential resolved before each start(); nullopt = none needed
    [[nodiscard]] virtual std::optional<auth::model::CredentialKind> credentialKind() const = 0;

    // Returns a running transfer; setup failures throw TransferError
    virtual std::shared_ptr<Transfer> start(const DownloadJob& job) = 0;
};

}
