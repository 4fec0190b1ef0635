#include "reporter/LogReporter.hpp"
#include "util/humanize.hpp"
#include "log/Registry.hpp"

#include <fmt/format.h>

using namespace sf::reporter;
using namespace sf::engine::model;
using namespace sf::transfer::model;

LogReporter::LogReporter(std::shared_ptr<engine::EventBus> bus, const std::chrono::milliseconds progressInterval)
    : bus_(std::move(bus)), interval_(progressInterval) {
    subscription_ = bus_->subscribe([this](const Event& e) { onEvent(e); });
}

LogReporter::~LogReporter() {
    bus_->unsubscribe(subscription_);
}

std::string LogReporter::render(const Event& e) {
    std::string out = fmt::format("{} [{}]", e.taskId, to_string(e.state));

    if (isTerminal(e.state)) {
        if (!e.reason.empty()) out += " " + e.reason;
        return out;
    }

    const auto& p = e.progress;
    if (const auto pct = p.percent()) {
        out += fmt::format(" {} {:.1f}% {}/{}", util::progressBar(*pct, 12), *pct,
                           util::readableSize(p.transferred), util::readableSize(*p.total));
    } else if (p.transferred > 0) {
        out += " " + util::readableSize(p.transferred);
    }

    if (p.rate > 0) out += " at " + util::readableRate(p.rate);
    if (p.eta) out += " ETA " + util::readableTime(*p.eta);
    if (e.attempt > 0) out += fmt::format(" (retry {})", e.attempt);
    return out;
}

void LogReporter::onEvent(const Event& e) {
    const auto logger = log::Registry::events();

    if (e.transition) {
        {
            std::scoped_lock lock(mutex_);
            if (isTerminal(e.state)) lastProgress_.erase(e.taskId);
        }

        if (e.state == State::Failed) logger->warn("[{}] {}", e.owner, render(e));
        else logger->info("[{}] {}", e.owner, render(e));
        return;
    }

    const auto now = std::chrono::steady_clock::now();
    {
        std::scoped_lock lock(mutex_);
        auto& last = lastProgress_[e.taskId];
        if (last.time_since_epoch().count() != 0 && now - last < interval_) return;
        last = now;
    }

    logger->info("[{}] {}", e.owner, render(e));
}
