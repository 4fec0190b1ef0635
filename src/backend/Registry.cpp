#include "backend/Registry.hpp"
#include "backend/download/CloudCloneDownloader.hpp"
#include "backend/download/ExtractorDownloader.hpp"
#include "backend/download/HttpDownloader.hpp"
#include "backend/download/TeraboxResolver.hpp"
#include "backend/download/TorrentDownloader.hpp"
#include "backend/upload/BotApiTransport.hpp"
#include "backend/upload/ChatUploader.hpp"
#include "backend/upload/CloudUploader.hpp"
#include "backend/upload/RemoteSyncUploader.hpp"
#include "transfer/errors.hpp"

using namespace sf::backend;
using namespace sf::transfer;
using namespace sf::transfer::model;

void Registry::add(std::shared_ptr<Downloader> downloader) {
    if (!downloader) throw std::invalid_argument("Downloader must not be null");
    const auto kind = downloader->kind();
    downloaders_[kind] = std::move(downloader);
}

void Registry::add(std::shared_ptr<Uploader> uploader) {
    if (!uploader) throw std::invalid_argument("Uploader must not be null");
    const auto kind = uploader->kind();
    uploaders_[kind] = std::move(uploader);
}

std::shared_ptr<Downloader> Registry::downloader(const SourceKind kind) const {
    const auto it = downloaders_.find(kind);
    if (it == downloaders_.end()) throw FatalTransferError("No downloader registered for " + to_string(kind));
    return it->second;
}

std::shared_ptr<Uploader> Registry::uploader(const DestinationKind kind) const {
    const auto it = uploaders_.find(kind);
    if (it == uploaders_.end()) throw FatalTransferError("No uploader registered for " + to_string(kind));
    return it->second;
}

std::shared_ptr<Registry> Registry::createDefault(const config::Config& cfg) {
    const RcloneOptions rclone{cfg.tools.rclone, cfg.tools.rclone_config, cfg.cloud.remote};
    const bool pool = cfg.credentials.service_accounts.enabled;

    auto registry = std::make_shared<Registry>();
    registry->add(std::make_shared<TorrentDownloader>(cfg.tools.aria2c));
    const TeraboxOptions terabox{cfg.resolver.terabox_api_base,
                                 cfg.credentials.cookies_dir / cfg.credentials.terabox_cookie_file};
    registry->add(std::make_shared<HttpDownloader>(std::make_shared<TeraboxResolver>(terabox)));
    registry->add(std::make_shared<ExtractorDownloader>(cfg.tools.yt_dlp));
    registry->add(std::make_shared<CloudCloneDownloader>(rclone, pool));

    registry->add(std::make_shared<ChatUploader>(
        std::make_shared<BotApiTransport>(cfg.chat.api_base, cfg.chat.bot_token), cfg.chat.effectivePartBytes()));
    registry->add(std::make_shared<CloudUploader>(rclone, cfg.cloud.default_folder, pool));
    registry->add(std::make_shared<RemoteSyncUploader>(rclone));
    return registry;
}
