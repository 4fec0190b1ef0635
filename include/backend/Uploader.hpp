#pragma once

#include "auth/model/Credential.hpp"
#include "backend/Transfer.hpp"
#include "transfer/model/Destination.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace sf::backend {

struct UploadJob {
    std::string taskId;
    std::string owner;
    std::filesystem::path input;        // file or directory produced by the download
    transfer::model::Destination destination;
    std::optional<auth::model::Credential> credential;
};

class Uploader {
public:
    virtual ~Uploader() = default;

    [[nodiscard]] virtual transfer::model::DestinationKind kind() const = 0;

    [[nodiscard]] virtual std::optional<auth::model::CredentialKind> credentialKind() const = 0;

    virtual std::shared_ptr<Transfer> start(const UploadJob& job) = 0;
};

}
