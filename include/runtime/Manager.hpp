#pragma once

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace sf::concurrency { class AsyncService; }
namespace sf::auth { class QuotaResetService; }
namespace sf::engine { class EventBus; }
namespace sf::config { struct Config; }

namespace sf::runtime {

// Starts, watches and stops the long-running services around the engine
class Manager {
public:
    static Manager& instance();

    // Requires Deps::init()
    void init(const config::Config& cfg);

    void startAll();
    void stopAll();
    void restartService(const std::string& name);

    [[nodiscard]] bool allRunning() const;

    // prevent accidental copies
    Manager(const Manager&) = delete;
    Manager& operator=(const Manager&) = delete;

private:
    Manager() = default;

    void tryStart(const std::string& name, const std::shared_ptr<concurrency::AsyncService>& svc);
    static void stopService(const std::string& name, const std::shared_ptr<concurrency::AsyncService>& svc);

    void startWatchdog();
    void stopWatchdog();

    std::shared_ptr<engine::EventBus> eventBus;
    std::shared_ptr<auth::QuotaResetService> quotaResetService;

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<concurrency::AsyncService>> services_;

    // Watchdog state
    std::thread watchdogThread;
    std::atomic<bool> watchdogRunning{false};
};

}
