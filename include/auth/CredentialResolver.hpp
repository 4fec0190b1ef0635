#pragma once

#include "auth/model/Credential.hpp"
#include "config/Config.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace sf::auth {

class ServiceAccountPool;

// Resolves the credential a backend should use for a job. Never blocks on anything but a short file read.
class CredentialResolver {
public:
    CredentialResolver(const config::CredentialsConfig& cfg, std::shared_ptr<ServiceAccountPool> pool);

    // Cookie: per-user file, then global file, then nullopt (unauthenticated).
    // ServiceAccount: pool account, nullopt when the pool is disabled or empty.
    std::optional<model::Credential> resolve(const std::string& owner, model::CredentialKind kind);

    // Global artifact only; used after an AuthError on a user cookie
    std::optional<model::Credential> resolveFallback(const std::string& owner, model::CredentialKind kind);

    // Marks a file invalid for one TTL window, e.g. after the backend rejected it
    void invalidate(const std::filesystem::path& path);

    [[nodiscard]] bool isValidCookieFile(const std::filesystem::path& path);

    [[nodiscard]] std::filesystem::path userCookiePath(const std::string& owner) const;
    [[nodiscard]] std::filesystem::path globalCookiePath() const;

    [[nodiscard]] std::shared_ptr<ServiceAccountPool> pool() const { return pool_; }

    // Validity entries currently cached; expired ones are dropped whenever a new one is stored
    [[nodiscard]] size_t cachedEntries();

private:
    struct Validity {
        bool valid = false;
        std::chrono::steady_clock::time_point checkedAt;
    };

    void pruneExpired(std::chrono::steady_clock::time_point now);   // caller holds cacheMutex_

    std::filesystem::path cookiesDir_;
    std::string globalCookieFile_;
    std::chrono::seconds ttl_;
    bool poolEnabled_;
    std::shared_ptr<ServiceAccountPool> pool_;

    std::unordered_map<std::string, Validity> cache_;
    std::mutex cacheMutex_;
};

}
