#include "auth/QuotaResetService.hpp"
#include "auth/ServiceAccountPool.hpp"
#include "log/Registry.hpp"

using namespace sf::auth;

QuotaResetService::QuotaResetService(std::shared_ptr<ServiceAccountPool> pool, const std::chrono::hours interval)
    : AsyncService("QuotaResetService"), pool_(std::move(pool)), interval_(interval) {}

QuotaResetService::~QuotaResetService() {
    stop();
}

void QuotaResetService::runLoop() {
    while (!shouldStop()) {
        lazySleep(interval_);
        if (shouldStop()) break;

        try {
            pool_->resetQuotaWindow();
        } catch (const std::exception& e) {
            log::Registry::credentials()->warn("[QuotaResetService] Failed to reset quota window: {}", e.what());
        }
    }
}
