#include "backend/download/TorrentDownloader.hpp"
#include "transfer/errors.hpp"
#include "util/parse.hpp"
#include "log/Registry.hpp"

#include <boost/algorithm/string.hpp>
#include <fmt/format.h>

using namespace sf::backend;
using namespace sf::transfer;
using namespace sf::transfer::model;
using namespace sf::util;

std::optional<Progress> sf::backend::parseAria2Readout(const std::string& line) {
    const auto open = line.find("[#");
    if (open == std::string::npos) return std::nullopt;
    const auto close = line.find(']', open);
    const auto body = line.substr(open + 2, close == std::string::npos ? std::string::npos : close - open - 2);

    std::vector<std::string> fields;
    boost::algorithm::split(fields, body, boost::is_any_of(" "), boost::token_compress_on);
    if (fields.size() < 2) return std::nullopt;

    // fields[0] is the gid
    auto sizes = fields[1];
    if (const auto paren = sizes.find('('); paren != std::string::npos) sizes.resize(paren);
    const auto slash = sizes.find('/');
    if (slash == std::string::npos) return std::nullopt;

    const auto done = parseSize(sizes.substr(0, slash));
    const auto total = parseSize(sizes.substr(slash + 1));
    if (!done) return std::nullopt;

    Progress p;
    p.transferred = *done;
    if (total && *total > 0) p.total = *total;

    for (size_t i = 2; i < fields.size(); ++i) {
        const auto& f = fields[i];
        if (boost::algorithm::starts_with(f, "DL:")) {
            if (const auto rate = parseSize(f.substr(3))) p.rate = static_cast<double>(*rate);
        } else if (boost::algorithm::starts_with(f, "ETA:")) {
            p.eta = parseUnitDuration(f.substr(4));
        }
    }

    p.clamp();
    return p;
}

Aria2Transfer::Aria2Transfer(const std::string& taskId, std::vector<std::string> argv, std::filesystem::path output)
    : ProcessTransfer("Aria2Transfer:" + taskId, std::move(argv), true, std::move(output)) {}

Aria2Transfer::~Aria2Transfer() {
    cancel();
    wait();
}

void Aria2Transfer::onLine(const std::string& line) {
    if (auto p = parseAria2Readout(line)) publish(*p);
}

void Aria2Transfer::classifyExit(const int exitCode, const std::deque<std::string>& tail) {
    const auto msg = fmt::format("aria2c exited with status {}: {}", exitCode, lastLines(tail));
    switch (exitCode) {
        case 2:     // timeout
        case 6:     // network problem
        case 19:    // name resolution failed
        case 22:    // bad HTTP response header
        case 29:    // server overloaded
            throw TransientTransferError(msg);
        case 24:    // HTTP authorization failed
            throw AuthError(msg);
        default:
            throw FatalTransferError(msg);
    }
}

TorrentDownloader::TorrentDownloader(std::string aria2c)
    : binary_(std::move(aria2c)) {}

std::vector<std::string> TorrentDownloader::buildArgv(const DownloadJob& job) const {
    auto ref = job.reference;
    if (const auto lowered = boost::algorithm::to_lower_copy(ref);
        !boost::algorithm::starts_with(lowered, "magnet:") && lowered.find("://") == std::string::npos)
        ref = "magnet:?xt=urn:btih:" + ref;

    return {
        binary_,
        "--dir=" + job.workDir.string(),
        "--seed-time=0",
        "--summary-interval=1",
        "--console-log-level=warn",
        "--enable-color=false",
        "--file-allocation=none",
        "--continue=true",
        "--follow-torrent=mem",
        "--bt-save-metadata=false",
        ref
    };
}

std::shared_ptr<Transfer> TorrentDownloader::start(const DownloadJob& job) {
    auto t = std::make_shared<Aria2Transfer>(job.taskId, buildArgv(job), job.workDir);
    t->launch();
    return t;
}
