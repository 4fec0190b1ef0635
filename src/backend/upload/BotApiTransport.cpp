#include "backend/upload/BotApiTransport.hpp"
#include "transfer/errors.hpp"
#include "util/curlWrappers.hpp"
#include "log/Registry.hpp"

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include <chrono>
#include <memory>

using namespace sf::backend;
using namespace sf::transfer;
using namespace sf::util;

namespace {

struct ProgressCtx {
    const ChatTransport::ProgressFn* fn;
};

int onUploadProgress(void* userdata, curl_off_t, curl_off_t, const curl_off_t ultotal, const curl_off_t ulnow) {
    const auto* ctx = static_cast<ProgressCtx*>(userdata);
    if (!ctx->fn || !*ctx->fn) return 0;
    return (*ctx->fn)(static_cast<uint64_t>(ulnow), static_cast<uint64_t>(ultotal)) ? 0 : 1;
}

}

BotApiTransport::BotApiTransport(std::string apiBase, std::string botToken)
    : apiBase_(std::move(apiBase)), botToken_(std::move(botToken)) {
    while (!apiBase_.empty() && apiBase_.back() == '/') apiBase_.pop_back();
}

void BotApiTransport::sendDocument(const std::string& chatId,
                                   const std::filesystem::path& file,
                                   const std::string& caption,
                                   const ProgressFn& progress) {
    if (botToken_.empty()) throw FatalTransferError("Chat delivery is not configured (chat.bot_token is empty)");
    ensureCurlGlobalInit();

    const auto url = fmt::format("{}/bot{}/sendDocument", apiBase_, botToken_);
    ProgressCtx ctx{&progress};

    // the mime tree must outlive curl_easy_perform
    std::unique_ptr<Mime> mime;

    const auto res = performCurl([&](CURL* h) {
        mime = std::make_unique<Mime>(h);
        mime->addField("chat_id", chatId);
        if (!caption.empty()) mime->addField("caption", caption);
        mime->addFile("document", file.string(), file.filename().string());

        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_MIMEPOST, mime->get());
        curl_easy_setopt(h, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(h, CURLOPT_XFERINFOFUNCTION, onUploadProgress);
        curl_easy_setopt(h, CURLOPT_XFERINFODATA, &ctx);
        curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT, 30L);
    });

    if (res.curl == CURLE_ABORTED_BY_CALLBACK) throw TransientTransferError("Upload aborted");

    if (res.curl != CURLE_OK) {
        const auto msg = fmt::format("sendDocument failed: {}", res.error);
        switch (res.curl) {
            case CURLE_READ_ERROR:
            case CURLE_FILE_COULDNT_READ_FILE:
                throw FatalTransferError(msg);
            default:
                throw TransientTransferError(msg);
        }
    }

    std::string description;
    std::chrono::seconds retryAfter{0};
    try {
        const auto j = nlohmann::json::parse(res.body);
        if (j.value("ok", false) && res.http / 100 == 2) return;
        description = j.value("description", "");
        if (j.contains("parameters") && j["parameters"].is_object())
            retryAfter = std::chrono::seconds(j["parameters"].value("retry_after", 0L));
    } catch (const nlohmann::json::exception&) {
        description = res.body.substr(0, 200);
    }

    const auto msg = fmt::format("sendDocument HTTP {}: {}", res.http, description);
    if (res.http == 429 || res.http >= 500) throw TransientTransferError(msg, retryAfter);
    if (res.http == 401 || res.http == 403) throw AuthError(msg);
    throw FatalTransferError(msg);    // 400, 413 and anything else
}
