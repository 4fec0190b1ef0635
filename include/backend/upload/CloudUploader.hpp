#pragma once

#include "backend/Uploader.hpp"
#include "backend/rclone.hpp"

namespace sf::backend {

// Mirror: copies the download into a drive folder, authenticated by a pool service account when enabled
class CloudUploader final : public Uploader {
public:
    CloudUploader(RcloneOptions opts, std::string defaultFolder, bool useServiceAccounts);

    [[nodiscard]] transfer::model::DestinationKind kind() const override { return transfer::model::DestinationKind::Cloud; }

    [[nodiscard]] std::optional<auth::model::CredentialKind> credentialKind() const override;

    std::shared_ptr<Transfer> start(const UploadJob& job) override;

    [[nodiscard]] std::vector<std::string> buildArgv(const UploadJob& job) const;

private:
    RcloneOptions opts_;
    std::string defaultFolder_;
    bool useServiceAccounts_;
};

}
