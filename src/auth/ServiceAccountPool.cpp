#include "auth/ServiceAccountPool.hpp"
#include "transfer/errors.hpp"
#include "log/Registry.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <fstream>

using namespace sf::auth;
using namespace sf::auth::model;
using namespace sf::transfer;

ServiceAccountPool::ServiceAccountPool(std::filesystem::path dir)
    : dir_(std::move(dir)) {}

void ServiceAccountPool::ensureLoaded() {
    if (loaded_) return;
    loaded_ = true;

    namespace fs = std::filesystem;
    std::error_code ec;
    if (!fs::is_directory(dir_, ec)) {
        log::Registry::credentials()->warn("[ServiceAccountPool] Directory not found: {}", dir_.string());
        return;
    }

    std::vector<fs::path> files;
    for (const auto& entry : fs::directory_iterator(dir_, ec))
        if (entry.is_regular_file() && entry.path().extension() == ".json") files.push_back(entry.path());
    std::ranges::sort(files);

    for (const auto& file : files) {
        try {
            std::ifstream in(file);
            const auto j = nlohmann::json::parse(in);
            ServiceAccount sa;
            sa.path = file;
            sa.name = j.value("client_email", file.stem().string());
            accounts_.push_back(std::move(sa));
        } catch (const nlohmann::json::exception& e) {
            log::Registry::credentials()->warn("[ServiceAccountPool] Skipping malformed account file {}: {}",
                                               file.string(), e.what());
        }
    }

    log::Registry::credentials()->info("[ServiceAccountPool] Loaded {} service accounts from {}",
                                       accounts_.size(), dir_.string());
}

std::optional<Credential> ServiceAccountPool::acquire() {
    std::scoped_lock lock(mutex_);
    ensureLoaded();

    if (accounts_.empty()) return std::nullopt;

    const size_t n = accounts_.size();
    std::optional<size_t> pick;
    for (size_t i = 0; i < n; ++i) {
        const size_t idx = (cursor_ + i) % n;
        if (accounts_[idx].disabled) continue;
        if (!pick || accounts_[idx].last_used < accounts_[*pick].last_used) pick = idx;
    }

    if (!pick) throw QuotaExceededError("All " + std::to_string(n) + " service accounts exhausted their quota", "");

    auto& sa = accounts_[*pick];
    sa.last_used = ++sequence_;
    ++sa.quota_used_today;
    cursor_ = (*pick + 1) % n;

    log::Registry::credentials()->debug("[ServiceAccountPool] Acquired {} (used {} today)", sa.name, sa.quota_used_today);
    return Credential{CredentialKind::ServiceAccount, CredentialScope::Pool, sa.path, sa.name};
}

void ServiceAccountPool::reportQuotaExceeded(const std::string& account) {
    std::scoped_lock lock(mutex_);
    ensureLoaded();

    const auto it = std::ranges::find_if(accounts_, [&](const ServiceAccount& sa) { return sa.name == account; });
    if (it == accounts_.end()) {
        log::Registry::credentials()->warn("[ServiceAccountPool] Quota report for unknown account: {}", account);
        return;
    }

    if (!it->disabled)
        log::Registry::credentials()->warn("[ServiceAccountPool] Disabling {} until quota reset", account);
    it->disabled = true;
}

void ServiceAccountPool::resetQuotaWindow() {
    std::scoped_lock lock(mutex_);
    for (auto& sa : accounts_) {
        sa.disabled = false;
        sa.quota_used_today = 0;
    }
    log::Registry::credentials()->info("[ServiceAccountPool] Quota window reset for {} accounts", accounts_.size());
}

size_t ServiceAccountPool::size() {
    std::scoped_lock lock(mutex_);
    ensureLoaded();
    return accounts_.size();
}

size_t ServiceAccountPool::enabledCount() {
    std::scoped_lock lock(mutex_);
    ensureLoaded();
    return static_cast<size_t>(std::ranges::count_if(accounts_, [](const ServiceAccount& sa) { return !sa.disabled; }));
}

std::vector<ServiceAccount> ServiceAccountPool::accounts() {
    std::scoped_lock lock(mutex_);
    ensureLoaded();
    return accounts_;
}
