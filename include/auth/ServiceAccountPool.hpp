#pragma once

#include "auth/model/Credential.hpp"

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace sf::auth {

struct ServiceAccount {
    std::string name;
    std::filesystem::path path;
    unsigned int quota_used_today = 0;
    bool disabled = false;
    uint64_t last_used = 0;    // monotonic sequence, 0 = never
};

// Explicit array of accounts with a rotation cursor. One mutex serialises every mutation.
class ServiceAccountPool {
public:
    explicit ServiceAccountPool(std::filesystem::path dir);

    // Least-recently-used enabled account. nullopt on an empty pool;
    // throws QuotaExceededError once every account is disabled.
    std::optional<model::Credential> acquire();

    void reportQuotaExceeded(const std::string& account);

    void resetQuotaWindow();

    [[nodiscard]] size_t size();
    [[nodiscard]] size_t enabledCount();
    [[nodiscard]] std::vector<ServiceAccount> accounts();

private:
    void ensureLoaded();    // caller holds mutex_

    std::filesystem::path dir_;
    std::vector<ServiceAccount> accounts_;
    size_t cursor_ = 0;
    uint64_t sequence_ = 0;
    bool loaded_ = false;
    std::mutex mutex_;
};

}
