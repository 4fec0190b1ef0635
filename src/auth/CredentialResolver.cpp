#include "auth/CredentialResolver.hpp"
#include "auth/ServiceAccountPool.hpp"
#include "util/cookies.hpp"
#include "util/sanitize.hpp"
#include "log/Registry.hpp"

#include <stdexcept>

using namespace sf::auth;
using namespace sf::auth::model;

std::string sf::auth::model::to_string(const CredentialKind k) {
    switch (k) {
        case CredentialKind::Cookie: return "cookie";
        case CredentialKind::ServiceAccount: return "service_account";
        default: throw std::invalid_argument("Unknown credential kind");
    }
}

std::string sf::auth::model::to_string(const CredentialScope s) {
    switch (s) {
        case CredentialScope::User: return "user";
        case CredentialScope::Global: return "global";
        case CredentialScope::Pool: return "pool";
        default: throw std::invalid_argument("Unknown credential scope");
    }
}

CredentialResolver::CredentialResolver(const config::CredentialsConfig& cfg, std::shared_ptr<ServiceAccountPool> pool)
    : cookiesDir_(cfg.cookies_dir),
      globalCookieFile_(cfg.global_cookie_file),
      ttl_(cfg.validity_ttl),
      poolEnabled_(cfg.service_accounts.enabled),
      pool_(std::move(pool)) {}

std::filesystem::path CredentialResolver::userCookiePath(const std::string& owner) const {
    return cookiesDir_ / (util::sanitizeFilename(owner) + ".txt");
}

std::filesystem::path CredentialResolver::globalCookiePath() const {
    return cookiesDir_ / globalCookieFile_;
}

bool CredentialResolver::isValidCookieFile(const std::filesystem::path& path) {
    const auto key = path.string();
    const auto now = std::chrono::steady_clock::now();

    {
        std::scoped_lock lock(cacheMutex_);
        if (const auto it = cache_.find(key); it != cache_.end()) {
            if (now - it->second.checkedAt < ttl_) return it->second.valid;
        }
    }

    // file read happens outside the cache lock
    const bool valid = util::readCookieFile(path).has_value();

    std::scoped_lock lock(cacheMutex_);
    pruneExpired(now);
    auto& entry = cache_[key];
    entry.valid = valid;
    entry.checkedAt = now;
    return valid;
}

void CredentialResolver::invalidate(const std::filesystem::path& path) {
    const auto now = std::chrono::steady_clock::now();
    std::scoped_lock lock(cacheMutex_);
    pruneExpired(now);
    auto& entry = cache_[path.string()];
    entry.valid = false;
    entry.checkedAt = now;
    log::Registry::credentials()->warn("[CredentialResolver] Invalidated credential file {}", path.string());
}

void CredentialResolver::pruneExpired(const std::chrono::steady_clock::time_point now) {
    std::erase_if(cache_, [&](const auto& kv) { return now - kv.second.checkedAt >= ttl_; });
}

size_t CredentialResolver::cachedEntries() {
    std::scoped_lock lock(cacheMutex_);
    return cache_.size();
}

std::optional<Credential> CredentialResolver::resolve(const std::string& owner, const CredentialKind kind) {
    if (kind == CredentialKind::ServiceAccount) {
        if (!poolEnabled_ || !pool_) return std::nullopt;
        return pool_->acquire();
    }

    if (!owner.empty()) {
        if (const auto userPath = userCookiePath(owner); isValidCookieFile(userPath))
            return Credential{CredentialKind::Cookie, CredentialScope::User, userPath, owner};
    }

    if (auto global = resolveFallback(owner, kind)) return global;

    log::Registry::credentials()->warn("[CredentialResolver] No cookie for owner {}, proceeding unauthenticated", owner);
    return std::nullopt;
}

std::optional<Credential> CredentialResolver::resolveFallback(const std::string&, const CredentialKind kind) {
    if (kind != CredentialKind::Cookie) return std::nullopt;
    if (const auto globalPath = globalCookiePath(); isValidCookieFile(globalPath))
        return Credential{CredentialKind::Cookie, CredentialScope::Global, globalPath, "global"};
    return std::nullopt;
}
