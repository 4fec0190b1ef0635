#pragma once

#include "backend/Uploader.hpp"
#include "backend/rclone.hpp"

namespace sf::backend {

// Copies the download to an arbitrary "remote:path"
class RemoteSyncUploader final : public Uploader {
public:
    explicit RemoteSyncUploader(RcloneOptions opts);

    [[nodiscard]] transfer::model::DestinationKind kind() const override { return transfer::model::DestinationKind::RemoteSync; }

    [[nodiscard]] std::optional<auth::model::CredentialKind> credentialKind() const override { return std::nullopt; }

    std::shared_ptr<Transfer> start(const UploadJob& job) override;

    [[nodiscard]] std::vector<std::string> buildArgv(const UploadJob& job) const;

private:
    RcloneOptions opts_;
};

}
