// Services
#include "runtime/Manager.hpp"
#include "runtime/Deps.hpp"
#include "runtime/JobFeed.hpp"

// Engine
#include "engine/EventBus.hpp"
#include "engine/Orchestrator.hpp"
#include "reporter/LogReporter.hpp"
#include "transfer/errors.hpp"

// Misc
#include "config/ConfigRegistry.hpp"
#include "log/Registry.hpp"
#include "util/curlWrappers.hpp"

// Libraries
#include <atomic>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <thread>
#include <unistd.h>
#include <nlohmann/json.hpp>

using namespace sf::config;

namespace {
constexpr auto DEFAULT_CONFIG_PATH = "/etc/skyferry/config.yaml";

std::atomic<bool> shouldExit = false;

void signalHandler(const int) {
    shouldExit = true;
}

struct Args {
    std::filesystem::path configPath = DEFAULT_CONFIG_PATH;
    bool explicitConfig = false;
    bool printConfig = false;
    bool help = false;
};

Args parseArgs(const int argc, char** argv) {
    Args args;
    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];
        if (arg == "--help" || arg == "-h") args.help = true;
        else if (arg == "--print-config") args.printConfig = true;
        else if (arg == "--config" || arg == "-c") {
            if (i + 1 >= argc) throw std::invalid_argument("--config requires a path");
            args.configPath = argv[++i];
            args.explicitConfig = true;
        } else if (arg.starts_with("--config=")) {
            args.configPath = std::string(arg.substr(9));
            args.explicitConfig = true;
        } else throw std::invalid_argument("Unknown argument: " + std::string(arg));
    }
    return args;
}

void printUsage() {
    std::cout << "Usage: skyferry [--config PATH] [--print-config]\n"
                 "Reads jobs from stdin, one per line: owner<TAB>reference[<TAB>destination]\n"
                 "Destinations: chat:<chatId>, drive:<folderId>, remote:<name>:<path>\n";
}
}

int main(const int argc, char** argv) {
    Args args;
    try {
        args = parseArgs(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "skyferry: " << e.what() << "\n";
        printUsage();
        return EXIT_FAILURE;
    }

    if (args.help) {
        printUsage();
        return EXIT_SUCCESS;
    }

    try {
        if (args.explicitConfig || std::filesystem::exists(args.configPath)) ConfigRegistry::init(args.configPath);
        else ConfigRegistry::init(Config{});

        const auto& cfg = ConfigRegistry::get();

        if (args.printConfig) {
            std::cout << nlohmann::json(cfg).dump(2) << std::endl;
            return EXIT_SUCCESS;
        }

        sf::log::Registry::init(cfg.logging, cfg.paths.log_dir);
        sf::util::ensureCurlGlobalInit();

        sf::log::Registry::skyferry()->info("[*] Initializing skyferry...");
        sf::runtime::Deps::init(cfg);
        sf::runtime::Manager::instance().init(cfg);

        const auto& deps = sf::runtime::Deps::get();
        auto reporter = std::make_unique<sf::reporter::LogReporter>(deps.eventBus, std::chrono::seconds(5));

        sf::runtime::Manager::instance().startAll();
        deps.orchestrator->start();

        sf::log::Registry::skyferry()->info("[✓] skyferry started, reading jobs from stdin");

        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        sf::runtime::JobFeed feed(STDIN_FILENO, [&](const sf::runtime::JobLine& job) {
            try {
                const auto id = deps.orchestrator->submit(job.reference, job.destination, job.owner);
                std::cout << id << std::endl;
            } catch (const sf::transfer::ResolutionError& e) {
                std::cerr << "error: " << e.what() << std::endl;
            } catch (const sf::transfer::SubmissionRejected& e) {
                std::cerr << "rejected: " << e.what() << std::endl;
            }
        });

        std::thread reader([&] { feed.run(shouldExit); });

        while (!shouldExit && !(feed.exhausted() && deps.orchestrator->liveTasks() == 0))
            std::this_thread::sleep_for(std::chrono::milliseconds(200));

        if (shouldExit) sf::log::Registry::skyferry()->info("[!] Signal received. Cancelling all tasks...");

        shouldExit = true;
        reader.join();

        deps.orchestrator->shutdown();
        sf::runtime::Manager::instance().stopAll();
        reporter.reset();
        sf::runtime::Deps::reset();

        sf::log::Registry::skyferry()->info("[✓] skyferry shut down cleanly.");
        return EXIT_SUCCESS;
    } catch (const std::exception& e) {
        if (sf::log::Registry::isInitialized()) sf::log::Registry::skyferry()->error("[-] Fatal: {}", e.what());
        else std::cerr << "skyferry: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }
}
