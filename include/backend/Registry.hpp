#pragma once

#include "backend/Downloader.hpp"
#include "backend/Uploader.hpp"
#include "config/Config.hpp"

#include <memory>
#include <unordered_map>

namespace sf::backend {

// Closed set of backends keyed by kind. Populated before the engine starts, read-only afterwards.
class Registry {
public:
    void add(std::shared_ptr<Downloader> downloader);
    void add(std::shared_ptr<Uploader> uploader);

    // Throw FatalTransferError when no backend is registered for the kind
    [[nodiscard]] std::shared_ptr<Downloader> downloader(transfer::model::SourceKind kind) const;
    [[nodiscard]] std::shared_ptr<Uploader> uploader(transfer::model::DestinationKind kind) const;

    // aria2c, libcurl, yt-dlp and rclone downloaders; Bot API, drive and remote uploaders
    static std::shared_ptr<Registry> createDefault(const config::Config& cfg);

private:
    std::unordered_map<transfer::model::SourceKind, std::shared_ptr<Downloader>> downloaders_;
    std::unordered_map<transfer::model::DestinationKind, std::shared_ptr<Uploader>> uploaders_;
};

}
