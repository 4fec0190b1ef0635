#include "backend/download/ExtractorDownloader.hpp"
#include "transfer/errors.hpp"
#include "util/cookies.hpp"
#include "util/parse.hpp"

#include <boost/algorithm/string.hpp>
#include <fmt/format.h>

using namespace sf::backend;
using namespace sf::transfer;
using namespace sf::transfer::model;
using namespace sf::util;

std::optional<Progress> sf::backend::parseYtDlpProgress(const std::string& line) {
    if (!boost::algorithm::starts_with(line, "[download]")) return std::nullopt;

    std::vector<std::string> t;
    auto rest = line.substr(10);
    boost::algorithm::trim(rest);
    boost::algorithm::split(t, rest, boost::is_any_of(" "), boost::token_compress_on);
    // newer releases pad the estimate: "of ~  50.00MiB"
    if (t.size() > 3 && t[2] == "~") t.erase(t.begin() + 2);
    if (t.size() < 3 || t[0].empty() || t[0].back() != '%' || t[1] != "of") return std::nullopt;

    const auto pct = parseLeadingDouble(t[0]);
    const auto total = parseSize(t[2]);
    if (!pct || !total) return std::nullopt;

    Progress p;
    p.total = *total;
    p.transferred = static_cast<uint64_t>(static_cast<double>(*total) * (*pct / 100.0));

    for (size_t i = 3; i + 1 < t.size(); ++i) {
        if (t[i] == "at") {
            auto rate = t[i + 1];
            if (boost::algorithm::ends_with(rate, "/s")) rate.resize(rate.size() - 2);
            if (const auto r = parseSize(rate)) p.rate = static_cast<double>(*r);
        } else if (t[i] == "ETA") {
            p.eta = parseClockDuration(t[i + 1]);
        }
    }

    p.clamp();
    return p;
}

YtDlpTransfer::YtDlpTransfer(const std::string& taskId, std::vector<std::string> argv, std::filesystem::path output)
    : ProcessTransfer("YtDlpTransfer:" + taskId, std::move(argv), false, std::move(output)) {}

YtDlpTransfer::~YtDlpTransfer() {
    cancel();
    wait();
}

void YtDlpTransfer::onLine(const std::string& line) {
    if (auto p = parseYtDlpProgress(line)) publish(*p);
}

void YtDlpTransfer::classifyExit(const int exitCode, const std::deque<std::string>& tail) {
    std::string text;
    for (const auto& l : tail) text += l + "\n";
    const auto lower = boost::algorithm::to_lower_copy(text);
    const auto msg = fmt::format("yt-dlp exited with status {}: {}", exitCode, lastLines(tail));

    const auto has = [&](const char* needle) { return lower.find(needle) != std::string::npos; };

    if (has("unsupported url")) throw FatalTransferError(msg);
    if (has("http error 429") || has("too many requests")) throw TransientTransferError(msg);
    if (has("sign in to confirm") || has("login required") || has("use --cookies") ||
        has("cookies are no longer valid") || has("private video") || has("http error 401") ||
        has("http error 403"))
        throw AuthError(msg);
    if (has("timed out") || has("connection reset") || has("unable to download webpage") ||
        has("temporary failure in name resolution") || has("http error 5"))
        throw TransientTransferError(msg);

    throw FatalTransferError(msg);
}

ExtractorDownloader::ExtractorDownloader(std::string ytDlp)
    : binary_(std::move(ytDlp)) {}

std::vector<std::string> ExtractorDownloader::buildArgv(const DownloadJob& job) const {
    std::vector<std::string> argv{
        binary_,
        "--newline",
        "--no-colors",
        "--no-part",
        "--continue",
        "--restrict-filenames",
        "-o", (job.workDir / "%(title).180B [%(id)s].%(ext)s").string()
    };

    if (job.credential) {
        if (const auto cookies = readCookieFile(job.credential->path)) {
            if (cookies->format == CookieFormat::Netscape) {
                argv.emplace_back("--cookies");
                argv.push_back(job.credential->path.string());
            } else {
                argv.emplace_back("--add-header");
                argv.push_back("Cookie:" + cookies->toHeader());
            }
        }
    }

    argv.emplace_back("--");
    argv.push_back(job.reference);
    return argv;
}

std::shared_ptr<Transfer> ExtractorDownloader::start(const DownloadJob& job) {
    auto t = std::make_shared<YtDlpTransfer>(job.taskId, buildArgv(job), job.workDir);
    t->launch();
    return t;
}
