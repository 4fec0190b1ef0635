#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <yaml-cpp/yaml.h>
#include <nlohmann/json.hpp>
#include <boost/algorithm/string.hpp>

namespace sf::config {

Config loadConfig(const std::filesystem::path& path) {
    Config cfg;
    const YAML::Node root = YAML::LoadFile(path.string());

    if (auto node = root["engine"]) YAML::convert<EngineConfig>::decode(node, cfg.engine);
    if (auto node = root["paths"]) YAML::convert<PathsConfig>::decode(node, cfg.paths);
    if (auto node = root["credentials"]) YAML::convert<CredentialsConfig>::decode(node, cfg.credentials);
    if (auto node = root["tools"]) YAML::convert<ToolsConfig>::decode(node, cfg.tools);
    if (auto node = root["chat"]) YAML::convert<ChatConfig>::decode(node, cfg.chat);
    if (auto node = root["cloud"]) YAML::convert<CloudConfig>::decode(node, cfg.cloud);
    if (auto node = root["rate_limit"]) YAML::convert<RateLimitConfig>::decode(node, cfg.rate_limit);
    if (auto node = root["logging"]) YAML::convert<LoggingConfig>::decode(node, cfg.logging);

    if (auto node = root["destinations"]; node && node.IsMap())
        cfg.destinations.default_spec = node["default"].as<std::string>("");

    if (auto node = root["resolver"]; node && node.IsMap()) {
        if (node["extra_extractor_domains"])
            cfg.resolver.extra_extractor_domains = node["extra_extractor_domains"].as<std::vector<std::string>>();
        cfg.resolver.terabox_api_base = node["terabox_api_base"].as<std::string>(cfg.resolver.terabox_api_base);
    }

    return cfg;
}

static std::string levelName(const spdlog::level::level_enum lvl) {
    const auto sv = spdlog::level::to_string_view(lvl);
    return {sv.data(), sv.size()};
}

void to_json(nlohmann::json& j, const Config& c) {
    j = {
        {"engine", c.engine},
        {"paths", c.paths},
        {"credentials", c.credentials},
        {"tools", c.tools},
        {"chat", c.chat},
        {"cloud", c.cloud},
        {"destinations", {{"default", c.destinations.default_spec}}},
        {"resolver", {
            {"extra_extractor_domains", c.resolver.extra_extractor_domains},
            {"terabox_api_base", c.resolver.terabox_api_base}
        }},
        {"rate_limit", c.rate_limit},
        {"logging", c.logging}
    };
}

void to_json(nlohmann::json& j, const EngineConfig& c) {
    j = {
        {"global_limit", c.global_limit},
        {"per_owner_limit", c.per_owner_limit},
        {"max_retries", c.max_retries},
        {"backoff_base_ms", c.backoff_base.count()},
        {"backoff_multiplier", c.backoff_multiplier},
        {"backoff_max_ms", c.backoff_max.count()},
        {"status_poll_interval_ms", c.status_poll_interval.count()},
        {"inactivity_timeout_s", c.inactivity_timeout.count()},
        {"history_limit", c.history_limit}
    };
}

void to_json(nlohmann::json& j, const PathsConfig& c) {
    j = {
        {"download_dir", c.download_dir.string()},
        {"log_dir", c.log_dir.string()}
    };
}

void to_json(nlohmann::json& j, const ServiceAccountsConfig& c) {
    j = {
        {"enabled", c.enabled},
        {"dir", c.dir.string()},
        {"reset_interval_hours", c.reset_interval.count()}
    };
}

void to_json(nlohmann::json& j, const CredentialsConfig& c) {
    j = {
        {"cookies_dir", c.cookies_dir.string()},
        {"global_cookie_file", c.global_cookie_file},
        {"terabox_cookie_file", c.terabox_cookie_file},
        {"validity_ttl_s", c.validity_ttl.count()},
        {"service_accounts", c.service_accounts}
    };
}

void to_json(nlohmann::json& j, const ToolsConfig& c) {
    j = {
        {"aria2c", c.aria2c},
        {"yt_dlp", c.yt_dlp},
        {"rclone", c.rclone},
        {"rclone_config", c.rclone_config.string()}
    };
}

bool ChatConfig::usesPublicApi() const {
    auto base = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(api_base));
    boost::algorithm::trim_right_if(base, boost::is_any_of("/"));
    return base.empty() || base == PUBLIC_BOT_API_BASE || base == "http://api.telegram.org";
}

uintmax_t ChatConfig::effectivePartBytes() const {
    const auto limit = usesPublicApi() ? PUBLIC_BOT_API_PART_BYTES : LOCAL_BOT_API_PART_BYTES;
    if (max_part_bytes == 0 || max_part_bytes > limit) return limit;
    return max_part_bytes;
}

void to_json(nlohmann::json& j, const ChatConfig& c) {
    // never echo the bot token
    j = {
        {"bot_token_set", !c.bot_token.empty()},
        {"api_base", c.api_base},
        {"max_part_bytes", c.max_part_bytes}
    };
}

void to_json(nlohmann::json& j, const CloudConfig& c) {
    j = {
        {"remote", c.remote},
        {"default_folder", c.default_folder}
    };
}

void to_json(nlohmann::json& j, const RateLimitConfig& c) {
    j = {
        {"enabled", c.enabled},
        {"rate", c.rate},
        {"per_seconds", c.per.count()},
        {"burst", c.burst}
    };
}

void to_json(nlohmann::json& j, const LoggingConfig& c) {
    const auto& s = c.levels.subsystem_levels;
    j = {
        {"file_sinks", c.file_sinks},
        {"console_log_level", levelName(c.levels.console_log_level)},
        {"file_log_level", levelName(c.levels.file_log_level)},
        {"subsystem_levels", {
            {"skyferry", levelName(s.skyferry)},
            {"engine", levelName(s.engine)},
            {"admission", levelName(s.admission)},
            {"credentials", levelName(s.credentials)},
            {"download", levelName(s.download)},
            {"upload", levelName(s.upload)},
            {"events", levelName(s.events)}
        }}
    };
}

} // namespace sf::config
