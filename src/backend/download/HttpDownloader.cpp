#include "backend/download/HttpDownloader.hpp"
#include "transfer/errors.hpp"
#include "util/cookies.hpp"
#include "util/curlWrappers.hpp"
#include "util/parse.hpp"
#include "util/sanitize.hpp"
#include "log/Registry.hpp"

#include <boost/algorithm/string.hpp>
#include <fmt/format.h>

#include <algorithm>
#include <vector>

using namespace sf::backend;
using namespace sf::transfer;
using namespace sf::transfer::model;
using namespace sf::util;

namespace fs = std::filesystem;

HttpTransfer::HttpTransfer(DownloadJob job, std::shared_ptr<ShareLinkResolver> shareLinks)
    : ThreadedTransfer("HttpTransfer:" + job.taskId, true), job_(std::move(job)), shareLinks_(std::move(shareLinks)) {}

HttpTransfer::~HttpTransfer() {
    cancel();
    wait();
}

std::optional<std::string> HttpTransfer::filenameFromHeaders(const std::string& headers) {
    std::vector<std::string> lines;
    boost::algorithm::split(lines, headers, boost::is_any_of("\n"));

    // last response wins when redirects were followed
    std::optional<std::string> found;
    for (auto& line : lines) {
        boost::algorithm::trim(line);
        if (!boost::algorithm::istarts_with(line, "content-disposition:")) continue;

        const auto lower = boost::algorithm::to_lower_copy(line);
        if (const auto star = lower.find("filename*="); star != std::string::npos) {
            auto v = line.substr(star + 10);
            if (const auto semi = v.find(';'); semi != std::string::npos) v.resize(semi);
            if (const auto quote = v.find("''"); quote != std::string::npos) v.erase(0, quote + 2);
            boost::algorithm::trim_if(v, boost::is_any_of("\" "));
            try {
                found = url_decode(v);
            } catch (const std::runtime_error&) {
                found = v;
            }
            continue;
        }

        if (const auto plain = lower.find("filename="); plain != std::string::npos) {
            auto v = line.substr(plain + 9);
            if (!v.empty() && v.front() == '"') {
                v.erase(0, 1);
                if (const auto close = v.find('"'); close != std::string::npos) v.resize(close);
            } else if (const auto semi = v.find(';'); semi != std::string::npos) v.resize(semi);
            boost::algorithm::trim(v);
            if (!v.empty()) found = v;
        }
    }
    return found;
}

std::string HttpTransfer::filenameFromUrl(const std::string& url) {
    auto path = url;
    if (const auto q = path.find_first_of("?#"); q != std::string::npos) path.resize(q);
    if (const auto scheme = path.find("://"); scheme != std::string::npos) {
        path.erase(0, scheme + 3);
        const auto slash = path.find('/');
        path = slash == std::string::npos ? std::string{} : path.substr(slash);
    }
    while (!path.empty() && path.back() == '/') path.pop_back();

    const auto slash = path.rfind('/');
    auto name = slash == std::string::npos ? path : path.substr(slash + 1);
    try {
        name = url_decode(name);
    } catch (const std::runtime_error&) {}

    return name.empty() ? "download" : name;
}

size_t HttpTransfer::onHeader(char* ptr, const size_t size, const size_t nmemb, void* userdata) {
    auto* self = static_cast<HttpTransfer*>(userdata);
    self->headers_.append(ptr, size * nmemb);
    return size * nmemb;
}

size_t HttpTransfer::onWrite(char* ptr, const size_t size, const size_t nmemb, void* userdata) {
    auto* self = static_cast<HttpTransfer*>(userdata);
    const size_t n = size * nmemb;

    if (!self->out_ && !self->discard_) {
        long code = 0;
        curl_easy_getinfo(self->handle_, CURLINFO_RESPONSE_CODE, &code);

        if (self->isHttp_ && code >= 400) self->discard_ = true;
        else {
            // 206 (or a resumed ftp/file transfer) appends; a full HTTP response restarts from zero
            const bool append = self->offset_ > 0 && (!self->isHttp_ || code == 206);
            if (!append) self->offset_ = 0;
            const auto part = self->job_.workDir / PART_FILE;
            self->out_ = std::fopen(part.c_str(), append ? "ab" : "wb");
            if (!self->out_) return 0;  // CURLE_WRITE_ERROR
        }
    }

    if (self->discard_) {
        if (self->errorBody_.size() < 512) self->errorBody_.append(ptr, std::min<size_t>(n, 512));
        return n;
    }

    return std::fwrite(ptr, 1, n, self->out_);
}

int HttpTransfer::onProgress(void* userdata, const curl_off_t dltotal, const curl_off_t dlnow, curl_off_t, curl_off_t) {
    auto* self = static_cast<HttpTransfer*>(userdata);
    if (self->cancelRequested()) return 1;

    if (self->pauseRequested() && !self->waitWhilePaused()) return 1;

    Progress p;
    p.transferred = static_cast<uint64_t>(self->offset_ + dlnow);
    if (dltotal > 0) p.total = static_cast<uint64_t>(self->offset_ + dltotal);

    curl_off_t speed = 0;
    curl_easy_getinfo(self->handle_, CURLINFO_SPEED_DOWNLOAD_T, &speed);
    p.rate = static_cast<double>(speed);
    if (p.total && speed > 0)
        p.eta = std::chrono::seconds((static_cast<curl_off_t>(*p.total) - static_cast<curl_off_t>(p.transferred)) / speed);

    if (!self->discard_) self->publish(p);
    return 0;
}

void HttpTransfer::classify(const CURLcode rc, const long httpCode, const bool isHttp) const {
    if (isHttp && httpCode >= 400) {
        const auto msg = fmt::format("HTTP {} from {}", httpCode, job_.reference);
        if (httpCode == 401 || httpCode == 403) throw AuthError(msg);
        if (httpCode == 408 || httpCode == 429 || httpCode >= 500) throw TransientTransferError(msg);
        throw FatalTransferError(msg);
    }

    if (rc == CURLE_OK) return;

    const auto msg = fmt::format("{}: {}", job_.reference, curl_easy_strerror(rc));
    switch (rc) {
        case CURLE_OPERATION_TIMEDOUT:
        case CURLE_COULDNT_CONNECT:
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_PARTIAL_FILE:
        case CURLE_GOT_NOTHING:
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_HTTP2:
        case CURLE_HTTP2_STREAM:
        case CURLE_FTP_ACCEPT_TIMEOUT:
            throw TransientTransferError(msg);
        case CURLE_LOGIN_DENIED:
        case CURLE_REMOTE_ACCESS_DENIED:
            throw AuthError(msg);
        default:
            throw FatalTransferError(msg);
    }
}

HttpTransfer::Attempt HttpTransfer::perform(const std::string& url) {
    headers_.clear();
    errorBody_.clear();
    discard_ = false;

    CurlEasy h;
    handle_ = h;
    SList headerList;

    curl_easy_setopt(h, CURLOPT_URL, url.c_str());
    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, onWrite);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, this);
    curl_easy_setopt(h, CURLOPT_HEADERFUNCTION, onHeader);
    curl_easy_setopt(h, CURLOPT_HEADERDATA, this);
    curl_easy_setopt(h, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(h, CURLOPT_XFERINFOFUNCTION, onProgress);
    curl_easy_setopt(h, CURLOPT_XFERINFODATA, this);
    curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT, 30L);
    if (offset_ > 0) curl_easy_setopt(h, CURLOPT_RESUME_FROM_LARGE, offset_);

    if (!cookieHeader_.empty()) headerList.add("Cookie: " + cookieHeader_);
    else if (!cookieFile_.empty()) curl_easy_setopt(h, CURLOPT_COOKIEFILE, cookieFile_.c_str());
    if (headerList.get()) curl_easy_setopt(h, CURLOPT_HTTPHEADER, headerList.get());

    Attempt a;
    a.rc = curl_easy_perform(h);
    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &a.httpCode);
    char* effective = nullptr;
    curl_easy_getinfo(h, CURLINFO_EFFECTIVE_URL, &effective);
    a.effectiveUrl = effective ? effective : url;
    handle_ = nullptr;

    if (out_) {
        std::fclose(out_);
        out_ = nullptr;
    }
    return a;
}

std::filesystem::path HttpTransfer::run() {
    ensureCurlGlobalInit();

    const auto part = job_.workDir / PART_FILE;
    std::error_code ec;
    if (fs::exists(part, ec)) offset_ = static_cast<curl_off_t>(fs::file_size(part, ec));
    if (ec) offset_ = 0;

    if (job_.credential) {
        if (const auto cookies = readCookieFile(job_.credential->path)) {
            if (cookies->format == CookieFormat::Netscape) cookieFile_ = job_.credential->path.string();
            else cookieHeader_ = cookies->toHeader();
        }
    }

    auto url = job_.reference;
    std::optional<std::string> knownName;
    if (shareLinks_ && shareLinks_->handles(job_.reference)) {
        const auto file = shareLinks_->resolve(job_.reference, job_.credential);
        if (cancelRequested()) return {};
        url = file.directUrl;
        if (!file.name.empty()) knownName = file.name;
        cookieHeader_ = file.cookieHeader;
        cookieFile_.clear();
    }

    const auto scheme = boost::algorithm::to_lower_copy(url.substr(0, url.find(':')));
    isHttp_ = scheme == "http" || scheme == "https";

    auto attempt = perform(url);

    // the server ignored Range; the partial file cannot be extended, so start over
    if (attempt.rc == CURLE_RANGE_ERROR && offset_ > 0 && !cancelRequested()) {
        log::Registry::download()->info("[HttpTransfer] {} does not support resuming, restarting from zero",
                                        job_.reference);
        fs::remove(part, ec);
        offset_ = 0;
        attempt = perform(url);
    }

    const auto [rc, httpCode, effectiveUrl] = attempt;

    if (cancelRequested()) return {};

    const auto lowered = boost::algorithm::to_lower_copy(effectiveUrl);
    const bool isHttp = boost::algorithm::starts_with(lowered, "http://") || boost::algorithm::starts_with(lowered, "https://");

    // partial file already complete
    const bool alreadyComplete = isHttp && httpCode == 416 && offset_ > 0;
    if (!alreadyComplete) classify(rc, httpCode, isHttp);

    if (!fs::exists(part, ec)) {
        // empty body never triggered the write callback
        if (std::FILE* f = std::fopen(part.c_str(), "wb")) std::fclose(f);
        else throw FatalTransferError("Cannot create " + part.string());
    }

    auto name = knownName.value_or(filenameFromHeaders(headers_).value_or(filenameFromUrl(effectiveUrl)));
    name = sanitizeFilename(name);
    if (name == PART_FILE) name = "download";

    const auto target = job_.workDir / name;
    fs::rename(part, target, ec);
    if (ec) throw FatalTransferError(fmt::format("Failed to move {} to {}: {}", part.string(), target.string(), ec.message()));

    const auto size = fs::file_size(target, ec);
    Progress done = lastProgress();
    if (!ec) {
        done.transferred = size;
        done.total = size;
    }
    done.eta = std::chrono::seconds(0);
    publish(done);

    log::Registry::download()->debug("[HttpTransfer] {} -> {}", job_.reference, target.string());
    return target;
}

std::shared_ptr<Transfer> HttpDownloader::start(const DownloadJob& job) {
    auto t = std::make_shared<HttpTransfer>(job, shareLinks_);
    t->launch();
    return t;
}
