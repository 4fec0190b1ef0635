#include "backend/rclone.hpp"
#include "transfer/errors.hpp"
#include "util/parse.hpp"

#include <boost/algorithm/string.hpp>
#include <fmt/format.h>

#include <algorithm>
#include <cctype>

using namespace sf::backend;
using namespace sf::transfer;
using namespace sf::transfer::model;
using namespace sf::util;

namespace {

std::optional<uint64_t> sizeWithUnit(std::string s) {
    boost::algorithm::erase_all(s, " ");
    boost::algorithm::erase_all(s, "\t");
    // bare counts ("3 / 10") belong to the file-count line
    if (!std::ranges::any_of(s, [](const unsigned char c) { return std::isalpha(c) != 0; })) return std::nullopt;
    return parseSize(s);
}

}

std::optional<Progress> sf::backend::parseRcloneStats(const std::string& line) {
    std::string body = line;
    if (const auto t = body.find("Transferred:"); t != std::string::npos) body = body.substr(t + 12);
    else if (const auto n = body.find("NOTICE:"); n != std::string::npos) body = body.substr(n + 7);

    std::vector<std::string> parts;
    boost::algorithm::split(parts, body, boost::is_any_of(","));
    if (parts.size() < 3) return std::nullopt;

    const auto slash = parts[0].find(" / ");
    if (slash == std::string::npos) return std::nullopt;

    const auto done = sizeWithUnit(parts[0].substr(0, slash));
    const auto total = sizeWithUnit(parts[0].substr(slash + 3));
    if (!done || !total) return std::nullopt;

    auto pct = boost::algorithm::trim_copy(parts[1]);
    if (pct.empty() || pct.back() != '%') return std::nullopt;

    Progress p;
    p.transferred = *done;
    if (*total > 0) p.total = *total;

    auto rate = boost::algorithm::trim_copy(parts[2]);
    if (boost::algorithm::ends_with(rate, "/s")) rate.resize(rate.size() - 2);
    if (const auto r = sizeWithUnit(rate)) p.rate = static_cast<double>(*r);

    if (parts.size() > 3) {
        auto eta = boost::algorithm::trim_copy(parts[3]);
        if (boost::algorithm::starts_with(eta, "ETA")) eta = boost::algorithm::trim_copy(eta.substr(3));
        if (eta != "-") p.eta = parseUnitDuration(eta);
    }

    p.clamp();
    return p;
}

std::vector<std::string> sf::backend::rcloneBaseArgs(const RcloneOptions& opts) {
    std::vector<std::string> argv{opts.binary};
    if (!opts.config.empty()) argv.push_back("--config=" + opts.config.string());
    argv.emplace_back("--stats=1s");
    argv.emplace_back("--stats-one-line");
    argv.emplace_back("--stats-log-level=NOTICE");
    argv.emplace_back("--retries=1");
    argv.emplace_back("--low-level-retries=3");
    return argv;
}

std::string sf::backend::driveRemote(const RcloneOptions& opts, const std::string& folderId,
                                     const std::optional<auth::model::Credential>& credential) {
    std::string base;
    if (credential && credential->kind == auth::model::CredentialKind::ServiceAccount) base = ":drive";
    else {
        base = opts.remote;
        while (!base.empty() && base.back() == ':') base.pop_back();
    }
    if (!folderId.empty()) base += ",root_folder_id=" + folderId;
    return base + ":";
}

std::string sf::backend::copyTarget(const std::filesystem::path& input, std::string target) {
    if (!std::filesystem::is_directory(input)) return target;
    if (!target.empty() && target.back() != ':' && target.back() != '/') target += '/';
    return target + input.filename().string();
}

void sf::backend::appendCredentialArgs(std::vector<std::string>& argv, const std::optional<auth::model::Credential>& credential) {
    if (credential && credential->kind == auth::model::CredentialKind::ServiceAccount)
        argv.push_back("--drive-service-account-file=" + credential->path.string());
}

std::optional<DriveLink> sf::backend::parseDriveLink(const std::string& url) {
    const auto idAfter = [&](const std::string& marker) -> std::optional<std::string> {
        const auto pos = url.find(marker);
        if (pos == std::string::npos) return std::nullopt;
        auto id = url.substr(pos + marker.size());
        if (const auto end = id.find_first_of("/?&#"); end != std::string::npos) id.resize(end);
        if (id.empty()) return std::nullopt;
        return id;
    };

    if (auto id = idAfter("/folders/")) return DriveLink{*id, true};
    if (auto id = idAfter("folderview?id=")) return DriveLink{*id, true};
    if (auto id = idAfter("/file/d/")) return DriveLink{*id, false};
    if (auto id = idAfter("/d/")) return DriveLink{*id, false};
    if (auto id = idAfter("?id=")) return DriveLink{*id, false};
    if (auto id = idAfter("&id=")) return DriveLink{*id, false};
    return std::nullopt;
}

RcloneTransfer::RcloneTransfer(std::string name, std::vector<std::string> argv, std::filesystem::path output, std::string account)
    : ProcessTransfer(std::move(name), std::move(argv), false, std::move(output)), account_(std::move(account)) {}

RcloneTransfer::~RcloneTransfer() {
    cancel();
    wait();
}

void RcloneTransfer::onLine(const std::string& line) {
    if (auto p = parseRcloneStats(line)) publish(*p);
}

void RcloneTransfer::classifyExit(const int exitCode, const std::deque<std::string>& tail) {
    std::string text;
    for (const auto& l : tail) text += l + "\n";
    const auto msg = fmt::format("rclone exited with status {}: {}", exitCode, lastLines(tail));
    const auto has = [&](const char* needle) { return text.find(needle) != std::string::npos; };

    // order matters: "userRateLimitExceeded" contains "RateLimitExceeded"
    if (has("quotaExceeded") || has("storageQuotaExceeded") || has("dailyLimitExceeded") ||
        has("userRateLimitExceeded") || has("teamDriveFileLimitExceeded") || exitCode == 8)
        throw QuotaExceededError(msg, account_);
    if (has("rateLimitExceeded") || has("Error 429") || has("backendError")) throw TransientTransferError(msg);
    if (has("invalid_grant") || has("Error 401") || has("unauthorized_client") ||
        has("insufficientFilePermissions") || has("Error 403"))
        throw AuthError(msg);

    switch (exitCode) {
        case 5:     // temporary error
            throw TransientTransferError(msg);
        default:    // 3 dir not found, 4 file not found, 7 fatal, anything else
            throw FatalTransferError(msg);
    }
}
