#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace sf::config;

template<>
struct convert<EngineConfig> {
    static Node encode(const EngineConfig& rhs) {
        Node node;
        node["global_limit"] = rhs.global_limit;
        node["per_owner_limit"] = rhs.per_owner_limit;
        node["max_retries"] = rhs.max_retries;
        node["backoff_base_ms"] = rhs.backoff_base.count();
        node["backoff_multiplier"] = rhs.backoff_multiplier;
        node["backoff_max_ms"] = rhs.backoff_max.count();
        node["status_poll_interval_ms"] = rhs.status_poll_interval.count();
        node["inactivity_timeout_s"] = rhs.inactivity_timeout.count();
        node["history_limit"] = rhs.history_limit;
        return node;
    }

    static bool decode(const Node& node, EngineConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.global_limit = node["global_limit"].as<unsigned int>(4);
        rhs.per_owner_limit = node["per_owner_limit"].as<unsigned int>(2);
        rhs.max_retries = node["max_retries"].as<unsigned int>(3);
        rhs.backoff_base = std::chrono::milliseconds(node["backoff_base_ms"].as<long>(2000));
        rhs.backoff_multiplier = node["backoff_multiplier"].as<double>(2.0);
        rhs.backoff_max = std::chrono::milliseconds(node["backoff_max_ms"].as<long>(60000));
        rhs.status_poll_interval = std::chrono::milliseconds(node["status_poll_interval_ms"].as<long>(1000));
        rhs.inactivity_timeout = std::chrono::seconds(node["inactivity_timeout_s"].as<long>(300));
        rhs.history_limit = node["history_limit"].as<unsigned int>(200);
        if (rhs.global_limit == 0) rhs.global_limit = 1;
        if (rhs.per_owner_limit == 0) rhs.per_owner_limit = 1;
        return true;
    }
};

template<>
struct convert<PathsConfig> {
    static Node encode(const PathsConfig& rhs) {
        Node node;
        node["download_dir"] = rhs.download_dir.string();
        node["log_dir"] = rhs.log_dir.string();
        return node;
    }

    static bool decode(const Node& node, PathsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.download_dir = node["download_dir"].as<std::string>("/var/lib/skyferry/downloads");
        rhs.log_dir = node["log_dir"].as<std::string>("/var/log/skyferry");
        return true;
    }
};

template<>
struct convert<ServiceAccountsConfig> {
    static Node encode(const ServiceAccountsConfig& rhs) {
        Node node;
        node["enabled"] = rhs.enabled;
        node["dir"] = rhs.dir.string();
        node["reset_interval_hours"] = rhs.reset_interval.count();
        return node;
    }

    static bool decode(const Node& node, ServiceAccountsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.enabled = node["enabled"].as<bool>(false);
        rhs.dir = node["dir"].as<std::string>("/etc/skyferry/accounts");
        rhs.reset_interval = std::chrono::hours(node["reset_interval_hours"].as<long>(24));
        return true;
    }
};

template<>
struct convert<CredentialsConfig> {
    static Node encode(const CredentialsConfig& rhs) {
        Node node;
        node["cookies_dir"] = rhs.cookies_dir.string();
        node["global_cookie_file"] = rhs.global_cookie_file;
        node["terabox_cookie_file"] = rhs.terabox_cookie_file;
        node["validity_ttl_s"] = rhs.validity_ttl.count();
        node["service_accounts"] = rhs.service_accounts;
        return node;
    }

    static bool decode(const Node& node, CredentialsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.cookies_dir = node["cookies_dir"].as<std::string>("/etc/skyferry/cookies");
        rhs.global_cookie_file = node["global_cookie_file"].as<std::string>("cookies.txt");
        rhs.terabox_cookie_file = node["terabox_cookie_file"].as<std::string>("terabox.txt");
        rhs.validity_ttl = std::chrono::seconds(node["validity_ttl_s"].as<long>(30));
        if (node["service_accounts"]) rhs.service_accounts = node["service_accounts"].as<ServiceAccountsConfig>();
        return true;
    }
};

template<>
struct convert<ToolsConfig> {
    static Node encode(const ToolsConfig& rhs) {
        Node node;
        node["aria2c"] = rhs.aria2c;
        node["yt_dlp"] = rhs.yt_dlp;
        node["rclone"] = rhs.rclone;
        node["rclone_config"] = rhs.rclone_config.string();
        return node;
    }

    static bool decode(const Node& node, ToolsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.aria2c = node["aria2c"].as<std::string>("aria2c");
        rhs.yt_dlp = node["yt_dlp"].as<std::string>("yt-dlp");
        rhs.rclone = node["rclone"].as<std::string>("rclone");
        rhs.rclone_config = node["rclone_config"].as<std::string>("");
        return true;
    }
};

template<>
struct convert<ChatConfig> {
    static Node encode(const ChatConfig& rhs) {
        Node node;
        node["bot_token"] = rhs.bot_token;
        node["api_base"] = rhs.api_base;
        node["max_part_mb"] = rhs.max_part_bytes / (1024 * 1024);
        return node;
    }

    static bool decode(const Node& node, ChatConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.bot_token = node["bot_token"].as<std::string>("");
        rhs.api_base = node["api_base"].as<std::string>(PUBLIC_BOT_API_BASE);
        if (node["max_part_mb"]) rhs.max_part_bytes = node["max_part_mb"].as<uintmax_t>() * 1024 * 1024;
        else rhs.max_part_bytes = rhs.usesPublicApi() ? PUBLIC_BOT_API_PART_BYTES : LOCAL_BOT_API_PART_BYTES;
        rhs.max_part_bytes = rhs.effectivePartBytes();
        return true;
    }
};

template<>
struct convert<CloudConfig> {
    static Node encode(const CloudConfig& rhs) {
        Node node;
        node["remote"] = rhs.remote;
        node["default_folder"] = rhs.default_folder;
        return node;
    }

    static bool decode(const Node& node, CloudConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.remote = node["remote"].as<std::string>("gdrive:");
        rhs.default_folder = node["default_folder"].as<std::string>("");
        return true;
    }
};

template<>
struct convert<RateLimitConfig> {
    static Node encode(const RateLimitConfig& rhs) {
        Node node;
        node["enabled"] = rhs.enabled;
        node["rate"] = rhs.rate;
        node["per_seconds"] = rhs.per.count();
        node["burst"] = rhs.burst;
        return node;
    }

    static bool decode(const Node& node, RateLimitConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.enabled = node["enabled"].as<bool>(false);
        rhs.rate = node["rate"].as<double>(10);
        rhs.per = std::chrono::seconds(node["per_seconds"].as<long>(60));
        rhs.burst = node["burst"].as<double>(15);
        return true;
    }
};

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["skyferry"]    = to_std_string(spdlog::level::to_string_view(rhs.skyferry));
        node["engine"]      = to_std_string(spdlog::level::to_string_view(rhs.engine));
        node["admission"]   = to_std_string(spdlog::level::to_string_view(rhs.admission));
        node["credentials"] = to_std_string(spdlog::level::to_string_view(rhs.credentials));
        node["download"]    = to_std_string(spdlog::level::to_string_view(rhs.download));
        node["upload"]      = to_std_string(spdlog::level::to_string_view(rhs.upload));
        node["events"]      = to_std_string(spdlog::level::to_string_view(rhs.events));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.skyferry = spdlog::level::from_str(node["skyferry"].as<std::string>("info"));
        rhs.engine = spdlog::level::from_str(node["engine"].as<std::string>("info"));
        rhs.admission = spdlog::level::from_str(node["admission"].as<std::string>("warn"));
        rhs.credentials = spdlog::level::from_str(node["credentials"].as<std::string>("warn"));
        rhs.download = spdlog::level::from_str(node["download"].as<std::string>("warn"));
        rhs.upload = spdlog::level::from_str(node["upload"].as<std::string>("warn"));
        rhs.events = spdlog::level::from_str(node["events"].as<std::string>("info"));
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"]    = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystem_levels"]  = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = spdlog::level::from_str(node["console_log_level"].as<std::string>("info"));
        rhs.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("warn"));
        if (node["subsystem_levels"]) rhs.subsystem_levels = node["subsystem_levels"].as<SubsystemLogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["file_sinks"] = rhs.file_sinks;
        node["log_levels"] = rhs.levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.file_sinks = node["file_sinks"].as<bool>(true);
        if (node["log_levels"]) rhs.levels = node["log_levels"].as<LogLevelsConfig>();
        return true;
    }
};

}
