#pragma once

#include "backend/Downloader.hpp"
#include "backend/rclone.hpp"

namespace sf::backend {

// Clones a drive file or folder link into the work directory through rclone
class CloudCloneDownloader final : public Downloader {
public:
    explicit CloudCloneDownloader(RcloneOptions opts, bool useServiceAccounts);

    [[nodiscard]] transfer::model::SourceKind kind() const override { return transfer::model::SourceKind::CloudClone; }

    [[nodiscard]] std::optional<auth::model::CredentialKind> credentialKind() const override;

    std::shared_ptr<Transfer> start(const DownloadJob& job) override;

    [[nodiscard]] std::vector<std::string> buildArgv(const DownloadJob& job) const;

private:
    RcloneOptions opts_;
    bool useServiceAccounts_;
};

}
