#pragma once

#include "backend/Downloader.hpp"
#include "backend/ProcessTransfer.hpp"

namespace sf::backend {

// "[download]  12.3% of ~50.00MiB at  1.20MiB/s ETA 00:35"
std::optional<transfer::model::Progress> parseYtDlpProgress(const std::string& line);

class YtDlpTransfer final : public ProcessTransfer {
public:
    YtDlpTransfer(const std::string& taskId, std::vector<std::string> argv, std::filesystem::path output);
    ~YtDlpTransfer() override;

protected:
    void onLine(const std::string& line) override;
    void classifyExit(int exitCode, const std::deque<std::string>& tail) override;
};

class ExtractorDownloader final : public Downloader {
public:
    explicit ExtractorDownloader(std::string ytDlp = "yt-dlp");

    [[nodiscard]] transfer::model::SourceKind kind() const override { return transfer::model::SourceKind::Extractor; }

    [[nodiscard]] std::optional<auth::model::CredentialKind> credentialKind() const override {
        return auth::model::CredentialKind::Cookie;
    }

    std::shared_ptr<Transfer> start(const DownloadJob& job) override;

    [[nodiscard]] std::vector<std::string> buildArgv(const DownloadJob& job) const;

private:
    std::string binary_;
};

}
