#pragma once

#include "backend/download/ShareLinkResolver.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace sf::backend {

struct TeraboxOptions {
    std::string apiBase = "https://www.terabox.app";
    std::filesystem::path cookieFile;   // bot-wide account cookie, used when the owner has none
};

// Terabox share links: the share page yields a jsToken, share/list yields the dlink,
// and the dlink is downloaded with the same account cookie.
class TeraboxResolver final : public ShareLinkResolver {
public:
    explicit TeraboxResolver(TeraboxOptions options);

    static bool isTeraboxUrl(const std::string& url);

    [[nodiscard]] bool handles(const std::string& reference) const override { return isTeraboxUrl(reference); }

    SharedFile resolve(const std::string& reference, const std::optional<auth::model::Credential>& credential) override;

    // "https://terabox.com/s/1AbC" or ".../sharing/link?surl=AbC" -> "AbC"
    static std::optional<std::string> shortUrlOf(const std::string& url);

    // The share page embeds fn("<token>") url-encoded
    static std::optional<std::string> jsTokenOf(const std::string& html);

    // share/list reply -> first file. Throws AuthError or FatalTransferError.
    static SharedFile parseShareList(const std::string& body);

    // A Terabox session cookie carries ndus (or at least lang)
    static bool isAccountCookie(const std::string& header);

private:
    [[nodiscard]] std::string cookieFor(const std::optional<auth::model::Credential>& credential) const;

    TeraboxOptions options_;
};

}
