#include "backend/download/TeraboxResolver.hpp"
#include "transfer/errors.hpp"
#include "util/cookies.hpp"
#include "util/curlWrappers.hpp"
#include "util/sanitize.hpp"
#include "log/Registry.hpp"

#include <boost/algorithm/string.hpp>
#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <string_view>
#include <vector>

using namespace sf::backend;
using namespace sf::transfer;
using namespace sf::util;

namespace {

const std::vector<std::string> kTeraboxDomains{
    "terabox.com", "nephobox.com", "4funbox.com", "mirrobox.com", "momerybox.com",
    "teraboxapp.com", "1024tera.com", "terabox.app", "gibibox.com", "goaibox.com",
    "terasharelink.com", "teraboxlink.com", "freeterabox.com", "1024terabox.com",
    "teraboxshare.com", "terafileshare.com", "terabox.club"
};

// share/list errno values that mean the session cookie was not accepted
bool isLoginErrno(const int code) {
    return code == -6 || code == 2;
}

void raiseForHttp(const HttpResponse& res, const std::string_view what) {
    if (res.curl != CURLE_OK) throw TransientTransferError(fmt::format("{}: {}", what, res.error));
    if (res.http == 401 || res.http == 403) throw AuthError(fmt::format("{}: HTTP {}", what, res.http));
    if (res.http == 429 || res.http >= 500) throw TransientTransferError(fmt::format("{}: HTTP {}", what, res.http));
    if (res.http >= 400) throw FatalTransferError(fmt::format("{}: HTTP {}", what, res.http));
}

}

TeraboxResolver::TeraboxResolver(TeraboxOptions options) : options_(std::move(options)) {
    while (!options_.apiBase.empty() && options_.apiBase.back() == '/') options_.apiBase.pop_back();
}

bool TeraboxResolver::isTeraboxUrl(const std::string& url) {
    const auto host = hostOf(url);
    if (host.empty()) return false;
    return std::ranges::any_of(kTeraboxDomains, [&](const std::string& d) {
        return host == d || boost::algorithm::ends_with(host, "." + d);
    });
}

std::optional<std::string> TeraboxResolver::shortUrlOf(const std::string& url) {
    auto path = url;
    if (const auto hash = path.find('#'); hash != std::string::npos) path.resize(hash);

    if (const auto q = path.find("surl="); q != std::string::npos) {
        auto v = path.substr(q + 5);
        if (const auto amp = v.find('&'); amp != std::string::npos) v.resize(amp);
        if (!v.empty()) return v;
    }

    if (const auto s = path.find("/s/"); s != std::string::npos) {
        auto v = path.substr(s + 3);
        if (const auto end = v.find_first_of("/?"); end != std::string::npos) v.resize(end);
        // share paths carry a leading '1' that the API omits
        if (v.size() > 1 && v.front() == '1') return v.substr(1);
    }
    return std::nullopt;
}

std::optional<std::string> TeraboxResolver::jsTokenOf(const std::string& html) {
    static constexpr std::string_view open = "fn%28%22";
    static constexpr std::string_view close = "%22%29";

    const auto start = html.find(open);
    if (start == std::string::npos) return std::nullopt;
    const auto end = html.find(close, start + open.size());
    if (end == std::string::npos || end == start + open.size()) return std::nullopt;
    return html.substr(start + open.size(), end - start - open.size());
}

SharedFile TeraboxResolver::parseShareList(const std::string& body) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(body);
    } catch (const nlohmann::json::exception& e) {
        throw FatalTransferError(fmt::format("Terabox share/list returned invalid JSON: {}", e.what()));
    }

    const int code = j.value("errno", 0);
    if (isLoginErrno(code)) throw AuthError(fmt::format("Terabox rejected the account cookie (errno {})", code));
    if (code != 0) throw FatalTransferError(fmt::format("Terabox share/list failed (errno {})", code));

    if (!j.contains("list") || !j["list"].is_array() || j["list"].empty())
        throw FatalTransferError("Terabox share contains no files");

    const auto& item = j["list"].front();
    const auto& isdir = item.contains("isdir") ? item["isdir"] : nlohmann::json(0);
    if ((isdir.is_string() && isdir.get<std::string>() == "1") || (isdir.is_number() && isdir.get<int>() == 1))
        throw FatalTransferError("Terabox folder shares are not supported");

    SharedFile file;
    file.directUrl = item.value("dlink", "");
    file.name = item.value("server_filename", "");
    if (file.directUrl.empty()) throw FatalTransferError("Terabox share/list carried no download link");

    if (item.contains("size")) {
        const auto& size = item["size"];
        if (size.is_number_unsigned()) file.size = size.get<uint64_t>();
        else if (size.is_string()) {
            try {
                file.size = std::stoull(size.get<std::string>());
            } catch (const std::exception&) {
                file.size.reset();
            }
        }
    }
    return file;
}

bool TeraboxResolver::isAccountCookie(const std::string& header) {
    return header.find("ndus=") != std::string::npos || header.find("lang=") != std::string::npos;
}

std::string TeraboxResolver::cookieFor(const std::optional<auth::model::Credential>& credential) const {
    if (credential) {
        if (const auto cookies = readCookieFile(credential->path)) {
            if (auto header = cookies->toHeader(); isAccountCookie(header)) return header;
        }
    }

    if (!options_.cookieFile.empty()) {
        if (const auto cookies = readCookieFile(options_.cookieFile)) {
            if (auto header = cookies->toHeader(); isAccountCookie(header)) return header;
            log::Registry::credentials()->warn("[Terabox] {} has no ndus or lang cookie", options_.cookieFile.string());
        }
    }

    throw AuthError("Terabox cookie not found; add lang and ndus to " +
                    (options_.cookieFile.empty() ? std::string("the Terabox cookie file") : options_.cookieFile.string()));
}

SharedFile TeraboxResolver::resolve(const std::string& reference, const std::optional<auth::model::Credential>& credential) {
    ensureCurlGlobalInit();

    const auto cookie = cookieFor(credential);
    const auto shortUrl = shortUrlOf(reference);
    if (!shortUrl) throw FatalTransferError("Not a Terabox share link: " + reference);

    SList pageHeaders;
    pageHeaders.add("Cookie: " + cookie);
    const auto page = performCurl([&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, reference.c_str());
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, pageHeaders.get());
        curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT, 30L);
        curl_easy_setopt(h, CURLOPT_TIMEOUT, 60L);
    });
    raiseForHttp(page, "Terabox share page");

    const auto token = jsTokenOf(page.body);
    if (!token) throw AuthError("Terabox share page carried no jsToken; the account cookie may have expired");

    const auto listUrl = fmt::format(
        "{}/share/list?app_id=250528&web=1&channel=dubox&clienttype=0&jsToken={}&page=1&num=20"
        "&by=name&order=asc&shorturl={}&root=1",
        options_.apiBase, *token, *shortUrl);

    SList listHeaders;
    listHeaders.add("Cookie: " + cookie);
    listHeaders.add("Referer: " + reference);
    const auto list = performCurl([&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, listUrl.c_str());
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, listHeaders.get());
        curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT, 30L);
        curl_easy_setopt(h, CURLOPT_TIMEOUT, 60L);
    });
    raiseForHttp(list, "Terabox share/list");

    auto file = parseShareList(list.body);
    file.cookieHeader = cookie;
    if (file.name.empty()) file.name = *shortUrl;

    log::Registry::download()->debug("[Terabox] {} -> {} ({} bytes)", reference, file.name,
                                     file.size ? std::to_string(*file.size) : std::string("?"));
    return file;
}
