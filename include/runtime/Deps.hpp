#pragma once

#include <memory>

namespace sf::config { struct Config; }
namespace sf::backend { class Registry; }
namespace sf::auth { class CredentialResolver; class ServiceAccountPool; }
namespace sf::engine { class EventBus; class Orchestrator; }

namespace sf::runtime {

struct Deps {
    std::shared_ptr<auth::ServiceAccountPool> accountPool;
    std::shared_ptr<auth::CredentialResolver> credentials;
    std::shared_ptr<backend::Registry> backends;
    std::shared_ptr<engine::EventBus> eventBus;
    std::shared_ptr<engine::Orchestrator> orchestrator;

    Deps(const Deps&) = delete;
    Deps& operator=(const Deps&) = delete;

    static Deps& get();

    static void init(const config::Config& cfg);

    // Drops every dependency, orchestrator first
    static void reset();

private:
    Deps() = default;  // private ctor
};

}
