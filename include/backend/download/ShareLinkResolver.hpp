#pragma once

#include "auth/model/Credential.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace sf::backend {

// A share page resolved to something the HTTP transfer can fetch directly
struct SharedFile {
    std::string directUrl;
    std::string name;
    std::optional<uint64_t> size;
    std::string cookieHeader;   // sent with the direct download
};

// Turns file-hosting share links into direct links before the HTTP transfer starts
class ShareLinkResolver {
public:
    virtual ~ShareLinkResolver() = default;

    [[nodiscard]] virtual bool handles(const std::string& reference) const = 0;

    // Runs on the transfer thread; throws TransferError
    virtual SharedFile resolve(const std::string& reference, const std::optional<auth::model::Credential>& credential) = 0;
};

}
