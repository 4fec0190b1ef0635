#include "log/Registry.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>

#include <stdexcept>
#include <vector>

namespace sf::log {

void Registry::init(const config::LoggingConfig& cnf, const std::filesystem::path& logDir) {
    if (initialized_) {
        spdlog::warn("[log::Registry] Already initialized, ignoring second init()");
        return;
    }

    console_sink_ = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink_->set_level(cnf.levels.console_log_level);
    console_sink_->set_color_mode(spdlog::color_mode::automatic);
    console_sink_->set_pattern(LOG_FORMAT);

    std::vector<spdlog::sink_ptr> sinks{console_sink_};

    if (cnf.file_sinks) {
        namespace fs = std::filesystem;
        if (!fs::exists(logDir)) fs::create_directories(logDir);

        main_file_sink_ = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            (logDir / "skyferry.log").string(), main_max_bytes_, main_max_files_);
        main_file_sink_->set_level(cnf.levels.file_log_level);
        sinks.push_back(main_file_sink_);
    }

    auto makeLogger = [&](const std::string& name, const spdlog::level::level_enum lvl) {
        const auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        logger->set_level(lvl);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    };

    const auto& sub_levels = cnf.levels.subsystem_levels;
    makeLogger("skyferry",    sub_levels.skyferry);
    makeLogger("engine",      sub_levels.engine);
    makeLogger("admission",   sub_levels.admission);
    makeLogger("credentials", sub_levels.credentials);
    makeLogger("download",    sub_levels.download);
    makeLogger("upload",      sub_levels.upload);
    makeLogger("events",      sub_levels.events);

    // audit: file-only sink (append)
    {
        spdlog::sink_ptr auditSink;
        if (cnf.file_sinks) auditSink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
            (logDir / "audit.log").string(), /*truncate=*/false);
        else auditSink = std::make_shared<spdlog::sinks::null_sink_mt>();

        const auto logger = std::make_shared<spdlog::logger>("audit", auditSink);
        logger->set_level(spdlog::level::info);
        logger->flush_on(spdlog::level::info);
        spdlog::register_logger(logger);
    }

    initialized_ = true;
    skyferry()->debug("[log::Registry] Initialized");
}

std::shared_ptr<spdlog::logger> Registry::get(const std::string& name) {
    auto logger = spdlog::get(name);
    if (!logger) {
        if (!initialized_) throw std::runtime_error("[log::Registry] Registry not initialized, cannot get logger: " + name);
        throw std::runtime_error("[log::Registry] Logger not found: " + name);
    }
    return logger;
}

bool Registry::isInitialized() { return initialized_; }

}
