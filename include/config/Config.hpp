#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>
#include <nlohmann/json_fwd.hpp>

namespace sf::config {

// The public Bot API rejects documents above 50MB; a self-hosted Bot API server accepts up to 2000MiB
constexpr static uintmax_t PUBLIC_BOT_API_PART_BYTES = static_cast<uintmax_t>(47) * 1024 * 1024;
constexpr static uintmax_t LOCAL_BOT_API_PART_BYTES = static_cast<uintmax_t>(2000) * 1024 * 1024;
constexpr static uintmax_t DEFAULT_CHAT_PART_BYTES = PUBLIC_BOT_API_PART_BYTES;
constexpr static auto PUBLIC_BOT_API_BASE = "https://api.telegram.org";

struct EngineConfig {
    unsigned int global_limit = 4;
    unsigned int per_owner_limit = 2;
    unsigned int max_retries = 3;
    std::chrono::milliseconds backoff_base{2000};
    double backoff_multiplier = 2.0;
    std::chrono::milliseconds backoff_max{60000};
    std::chrono::milliseconds status_poll_interval{1000};
    std::chrono::seconds inactivity_timeout{300};
    unsigned int history_limit = 200;
};

struct PathsConfig {
    std::filesystem::path download_dir = "/var/lib/skyferry/downloads";
    std::filesystem::path log_dir = "/var/log/skyferry";
};

struct ServiceAccountsConfig {
    bool enabled = false;
    std::filesystem::path dir = "/etc/skyferry/accounts";
    std::chrono::hours reset_interval{24};
};

struct CredentialsConfig {
    std::filesystem::path cookies_dir = "/etc/skyferry/cookies";
    std::string global_cookie_file = "cookies.txt";
    std::string terabox_cookie_file = "terabox.txt";   // needs the lang and ndus cookies
    std::chrono::seconds validity_ttl{30};
    ServiceAccountsConfig service_accounts;
};

struct ToolsConfig {
    std::string aria2c = "aria2c";
    std::string yt_dlp = "yt-dlp";
    std::string rclone = "rclone";
    std::filesystem::path rclone_config;
};

struct ChatConfig {
    std::string bot_token;
    std::string api_base = PUBLIC_BOT_API_BASE;
    uintmax_t max_part_bytes = DEFAULT_CHAT_PART_BYTES;

    [[nodiscard]] bool usesPublicApi() const;

    // max_part_bytes capped to what the configured endpoint accepts
    [[nodiscard]] uintmax_t effectivePartBytes() const;
};

struct CloudConfig {
    std::string remote = "gdrive:";
    std::string default_folder;
};

struct DestinationsConfig {
    std::string default_spec;
};

struct ResolverConfig {
    std::vector<std::string> extra_extractor_domains;
    std::string terabox_api_base = "https://www.terabox.app";
};

struct RateLimitConfig {
    bool enabled = false;
    double rate = 10;
    std::chrono::seconds per{60};
    double burst = 15;
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum skyferry    = spdlog::level::info;   // Startup, shutdown, service lifecycle
    spdlog::level::level_enum engine      = spdlog::level::info;   // State transitions, retries
    spdlog::level::level_enum admission   = spdlog::level::warn;   // Slot accounting
    spdlog::level::level_enum credentials = spdlog::level::warn;   // Missing cookies, pool rotation
    spdlog::level::level_enum download    = spdlog::level::warn;   // Backend failures
    spdlog::level::level_enum upload      = spdlog::level::warn;   // Backend failures, quota
    spdlog::level::level_enum events      = spdlog::level::info;   // Progress reporter output
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::warn;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    LogLevelsConfig levels;
    bool file_sinks = true;
};

struct Config {
    EngineConfig engine;
    PathsConfig paths;
    CredentialsConfig credentials;
    ToolsConfig tools;
    ChatConfig chat;
    CloudConfig cloud;
    DestinationsConfig destinations;
    ResolverConfig resolver;
    RateLimitConfig rate_limit;
    LoggingConfig logging;
};

Config loadConfig(const std::filesystem::path& path);

void to_json(nlohmann::json& j, const Config& c);
void to_json(nlohmann::json& j, const EngineConfig& c);
void to_json(nlohmann::json& j, const PathsConfig& c);
void to_json(nlohmann::json& j, const CredentialsConfig& c);
void to_json(nlohmann::json& j, const ServiceAccountsConfig& c);
void to_json(nlohmann::json& j, const ToolsConfig& c);
void to_json(nlohmann::json& j, const ChatConfig& c);
void to_json(nlohmann::json& j, const CloudConfig& c);
void to_json(nlohmann::json& j, const RateLimitConfig& c);
void to_json(nlohmann::json& j, const LoggingConfig& c);

} // namespace sf::config
