#pragma once

#include "backend/Downloader.hpp"
#include "backend/ThreadedTransfer.hpp"
#include "backend/download/ShareLinkResolver.hpp"

#include <cstdio>
#include <curl/curl.h>
#include <memory>
#include <optional>
#include <string>

namespace sf::backend {

// Single-file transfer over libcurl. Resumes from <workDir>/download.part across retries
// and renames to the server-provided or URL-derived name on completion.
class HttpTransfer final : public ThreadedTransfer {
public:
    static constexpr const char* PART_FILE = "download.part";

    explicit HttpTransfer(DownloadJob job, std::shared_ptr<ShareLinkResolver> shareLinks = nullptr);
    ~HttpTransfer() override;

    // Content-Disposition filename, if any
    static std::optional<std::string> filenameFromHeaders(const std::string& headers);
    static std::string filenameFromUrl(const std::string& url);

protected:
    std::filesystem::path run() override;

private:
    struct Attempt {
        CURLcode rc = CURLE_OK;
        long httpCode = 0;
        std::string effectiveUrl;
    };

    Attempt perform(const std::string& url);

    static size_t onWrite(char* ptr, size_t size, size_t nmemb, void* userdata);
    static size_t onHeader(char* ptr, size_t size, size_t nmemb, void* userdata);
    static int onProgress(void* userdata, curl_off_t dltotal, curl_off_t dlnow, curl_off_t ultotal, curl_off_t ulnow);

    void classify(CURLcode rc, long httpCode, bool isHttp) const;

    DownloadJob job_;
    std::shared_ptr<ShareLinkResolver> shareLinks_;
    std::string cookieHeader_;
    std::string cookieFile_;
    CURL* handle_ = nullptr;
    FILE* out_ = nullptr;
    bool isHttp_ = false;
    bool discard_ = false;
    curl_off_t offset_ = 0;
    std::string headers_;
    std::string errorBody_;
};

class HttpDownloader final : public Downloader {
public:
    explicit HttpDownloader(std::shared_ptr<ShareLinkResolver> shareLinks = nullptr) : shareLinks_(std::move(shareLinks)) {}

    [[nodiscard]] transfer::model::SourceKind kind() const override { return transfer::model::SourceKind::DirectHttp; }

    [[nodiscard]] std::optional<auth::model::CredentialKind> credentialKind() const override {
        return auth::model::CredentialKind::Cookie;
    }

    std::shared_ptr<Transfer> start(const DownloadJob& job) override;

private:
    std::shared_ptr<ShareLinkResolver> shareLinks_;
};

}
