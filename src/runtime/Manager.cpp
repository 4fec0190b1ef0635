#include "runtime/Manager.hpp"
#include "runtime/Deps.hpp"
#include "auth/QuotaResetService.hpp"
#include "concurrency/AsyncService.hpp"
#include "config/Config.hpp"
#include "engine/EventBus.hpp"
#include "log/Registry.hpp"

#include <chrono>
#include <stdexcept>
#include <vector>

namespace sf::runtime {

Manager& Manager::instance() {
    static Manager instance;
    return instance;
}

void Manager::init(const config::Config& cfg) {
    std::scoped_lock lock(mutex_);
    if (!services_.empty()) return;

    const auto& deps = Deps::get();
    if (!deps.eventBus) throw std::runtime_error("[Manager] Deps must be initialized first");

    eventBus = deps.eventBus;
    services_["EventBus"] = eventBus;

    if (cfg.credentials.service_accounts.enabled) {
        quotaResetService = std::make_shared<auth::QuotaResetService>(deps.accountPool,
                                                                      cfg.credentials.service_accounts.reset_interval);
        services_["QuotaResetService"] = quotaResetService;
    }
}

void Manager::startAll() {
    log::Registry::skyferry()->debug("[Manager] Starting all services...");
    {
        std::scoped_lock lock(mutex_);
        tryStart("EventBus", eventBus);
        tryStart("QuotaResetService", quotaResetService);
    }
    log::Registry::skyferry()->debug("[Manager] All services started.");

    startWatchdog();
}

void Manager::stopAll() {
    log::Registry::skyferry()->debug("[Manager] Stopping all services...");
    stopWatchdog();

    {
        std::scoped_lock lock(mutex_);
        stopService("QuotaResetService", quotaResetService);
        stopService("EventBus", eventBus);
    }

    log::Registry::skyferry()->debug("[Manager] All services stopped.");
}

void Manager::restartService(const std::string& name) {
    std::shared_ptr<concurrency::AsyncService> svc;
    {
        std::scoped_lock lock(mutex_);
        const auto it = services_.find(name);
        if (it == services_.end() || !it->second) return;
        svc = it->second;
    }

    log::Registry::skyferry()->warn("[Manager] Restarting service: {}", name);
    svc->restart();
}

bool Manager::allRunning() const {
    std::scoped_lock lock(mutex_);
    for (const auto& [_, svc] : services_)
        if (svc && !svc->isRunning()) return false;
    return true;
}

void Manager::tryStart(const std::string& name, const std::shared_ptr<concurrency::AsyncService>& svc) {
    if (!svc) return;
    log::Registry::skyferry()->debug("[Manager] Starting service: {}", name);
    try {
        svc->start();
    } catch (const std::exception& e) {
        log::Registry::skyferry()->error("[Manager] Failed to start {}: {}", name, e.what());
        throw;
    }
}

void Manager::stopService(const std::string& name, const std::shared_ptr<concurrency::AsyncService>& svc) {
    if (!svc || !svc->isRunning()) return;

    log::Registry::skyferry()->debug("[Manager] Stopping service: {}", name);
    try {
        svc->stop();
    } catch (const std::exception& e) {
        log::Registry::skyferry()->error("[Manager] Failed to stop {} gracefully: {}", name, e.what());
    }
}

void Manager::startWatchdog() {
    if (watchdogRunning.exchange(true)) return; // already running
    watchdogThread = std::thread([this]() {
        log::Registry::skyferry()->info("[Manager] Watchdog started.");
        while (watchdogRunning) {
            std::vector<std::string> down;
            {
                std::scoped_lock lock(mutex_);
                for (const auto& [name, svc] : services_)
                    if (svc && !svc->isRunning()) down.push_back(name);
            }

            for (const auto& name : down) {
                log::Registry::skyferry()->warn("[Watchdog] {} is down, restarting...", name);
                restartService(name);
            }

            for (int i = 0; i < 20 && watchdogRunning; ++i)
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
        log::Registry::skyferry()->info("[Manager] Watchdog stopped.");
    });
}

void Manager::stopWatchdog() {
    if (!watchdogRunning.exchange(false)) return;
    if (watchdogThread.joinable())
        watchdogThread.join();
}

}
