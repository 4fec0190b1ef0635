#include "runtime/Deps.hpp"
#include "auth/CredentialResolver.hpp"
#include "auth/ServiceAccountPool.hpp"
#include "backend/Registry.hpp"
#include "config/Config.hpp"
#include "engine/EventBus.hpp"
#include "engine/Orchestrator.hpp"
#include "log/Registry.hpp"

using namespace sf::runtime;

Deps& Deps::get() {
    static Deps instance_;
    return instance_;
}

void Deps::init(const config::Config& cfg) {
    if (const auto& registry = get(); registry.orchestrator || registry.backends || registry.credentials) {
        log::Registry::skyferry()->warn("[Deps] Already initialized, ignoring second init()");
        return;
    }

    log::Registry::skyferry()->info("[Deps] Initializing...");

    auto& ctx = get();
    ctx.accountPool = std::make_shared<auth::ServiceAccountPool>(cfg.credentials.service_accounts.dir);
    ctx.credentials = std::make_shared<auth::CredentialResolver>(cfg.credentials, ctx.accountPool);
    ctx.backends = backend::Registry::createDefault(cfg);
    ctx.eventBus = std::make_shared<engine::EventBus>();
    ctx.orchestrator = std::make_shared<engine::Orchestrator>(cfg, ctx.backends, ctx.credentials, ctx.eventBus);

    log::Registry::skyferry()->info("[Deps] Initialized.");
}

void Deps::reset() {
    auto& ctx = get();
    ctx.orchestrator.reset();
    ctx.eventBus.reset();
    ctx.backends.reset();
    ctx.credentials.reset();
    ctx.accountPool.reset();
}
