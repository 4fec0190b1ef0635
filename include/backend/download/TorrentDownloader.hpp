#pragma once

#include "backend/Downloader.hpp"
#include "backend/ProcessTransfer.hpp"

namespace sf::backend {

// "[#2089b0 400.0KiB/33.2MiB(1%) CN:1 DL:115.7KiB ETA:4m51s]"
std::optional<transfer::model::Progress> parseAria2Readout(const std::string& line);

class Aria2Transfer final : public ProcessTransfer {
public:
    Aria2Transfer(const std::string& taskId, std::vector<std::string> argv, std::filesystem::path output);
    ~Aria2Transfer() override;

protected:
    void onLine(const std::string& line) override;
    void classifyExit(int exitCode, const std::deque<std::string>& tail) override;
};

class TorrentDownloader final : public Downloader {
public:
    explicit TorrentDownloader(std::string aria2c = "aria2c");

    [[nodiscard]] transfer::model::SourceKind kind() const override { return transfer::model::SourceKind::Torrent; }

    [[nodiscard]] std::optional<auth::model::CredentialKind> credentialKind() const override { return std::nullopt; }

    std::shared_ptr<Transfer> start(const DownloadJob& job) override;

    [[nodiscard]] std::vector<std::string> buildArgv(const DownloadJob& job) const;

private:
    std::string binary_;
};

}
