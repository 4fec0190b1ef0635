#include "transfer/SourceResolver.hpp"
#include "transfer/errors.hpp"
#include "util/sanitize.hpp"

#include <boost/algorithm/string.hpp>

#include <algorithm>
#include <cctype>

using namespace sf::transfer;
using namespace sf::transfer::model;

namespace {

const std::vector<std::string> kVideoDomains{
    "youtube.com", "youtu.be", "music.youtube.com", "vimeo.com", "dailymotion.com", "dai.ly",
    "twitch.tv", "tiktok.com", "instagram.com", "twitter.com", "x.com", "facebook.com",
    "fb.watch", "reddit.com", "v.redd.it", "soundcloud.com", "bilibili.com", "b23.tv"
};

bool isInfoHash(const std::string& s) {
    if (s.size() == 40)
        return std::ranges::all_of(s, [](const unsigned char c) { return std::isxdigit(c) != 0; });
    if (s.size() == 32)
        return std::ranges::all_of(s, [](const unsigned char c) {
            return (c >= 'a' && c <= 'z') || (c >= '2' && c <= '7');
        });
    return false;
}

bool hasScheme(const std::string& lowered, const std::initializer_list<const char*> schemes) {
    return std::ranges::any_of(schemes, [&](const char* s) { return boost::algorithm::starts_with(lowered, s); });
}

bool hostMatches(const std::string& host, const std::string& domain) {
    return host == domain || boost::algorithm::ends_with(host, "." + domain);
}

}

SourceResolver::SourceResolver(std::vector<std::string> extraExtractorDomains) {
    extractorDomains_ = kVideoDomains;
    for (auto& d : extraExtractorDomains) {
        boost::algorithm::to_lower(d);
        boost::algorithm::trim(d);
        if (!d.empty()) extractorDomains_.push_back(std::move(d));
    }
}

bool SourceResolver::isTorrentReference(const std::string& lowered) {
    if (boost::algorithm::starts_with(lowered, "magnet:")) return true;
    if (isInfoHash(lowered)) return true;

    if (!hasScheme(lowered, {"http://", "https://", "ftp://"})) return false;
    auto path = lowered;
    if (const auto q = path.find_first_of("?#"); q != std::string::npos) path.resize(q);
    return boost::algorithm::ends_with(path, ".torrent");
}

bool SourceResolver::isCloudDriveUrl(const std::string& lowered) {
    if (!hasScheme(lowered, {"http://", "https://"})) return false;

    const auto host = util::hostOf(lowered);
    if (host == "drive.google.com")
        return lowered.find("/file/d/") != std::string::npos ||
               lowered.find("/drive/folders/") != std::string::npos ||
               lowered.find("/folderview?id=") != std::string::npos ||
               lowered.find("open?id=") != std::string::npos ||
               lowered.find("uc?id=") != std::string::npos ||
               lowered.find("uc?export=download&id=") != std::string::npos;

    if (host == "docs.google.com") return lowered.find("/d/") != std::string::npos;
    return false;
}

bool SourceResolver::isExtractorUrl(const std::string& lowered) const {
    if (!hasScheme(lowered, {"http://", "https://"})) return false;
    const auto host = util::hostOf(lowered);
    if (host.empty()) return false;
    return std::ranges::any_of(extractorDomains_, [&](const std::string& d) { return hostMatches(host, d); });
}

Source SourceResolver::resolve(const std::string& reference) const {
    const auto trimmed = boost::algorithm::trim_copy(reference);
    if (trimmed.empty()) throw ResolutionError("Empty source reference");

    if (util::hasForbiddenScheme(trimmed))
        throw ResolutionError("Forbidden URL scheme in reference: " + trimmed);

    const auto lowered = boost::algorithm::to_lower_copy(trimmed);

    if (isTorrentReference(lowered)) return {SourceKind::Torrent, trimmed};
    if (isCloudDriveUrl(lowered)) return {SourceKind::CloudClone, trimmed};
    if (isExtractorUrl(lowered)) return {SourceKind::Extractor, trimmed};
    if (hasScheme(lowered, {"http://", "https://", "ftp://"}) && util::isAllowedUrl(trimmed))
        return {SourceKind::DirectHttp, trimmed};

    throw ResolutionError("No backend can handle reference: " + trimmed);
}
