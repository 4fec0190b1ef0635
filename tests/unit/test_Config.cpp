#include <gtest/gtest.h>
#include "config/Config.hpp"

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <unistd.h>
#include <yaml-cpp/yaml.h>

using namespace sf::config;
namespace fs = std::filesystem;

class ConfigTest : public ::testing::Test {
protected:
    fs::path file;

    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        file = fs::temp_directory_path() / ("skyferry-config-" + std::to_string(::getpid()) + "-" + info->name() + ".yaml");
    }

    void TearDown() override { fs::remove(file); }

    void write(const std::string& yaml) const { std::ofstream(file) << yaml; }
};

TEST_F(ConfigTest, LoadsEverySection) {
    write(R"(
engine:
  global_limit: 8
  per_owner_limit: 3
  max_retries: 5
  backoff_base_ms: 500
  backoff_multiplier: 3.0
  backoff_max_ms: 9000
  status_poll_interval_ms: 250
  inactivity_timeout_s: 120
  history_limit: 50
paths:
  download_dir: /srv/skyferry/dl
  log_dir: /srv/skyferry/log
credentials:
  cookies_dir: /srv/skyferry/cookies
  global_cookie_file: shared.txt
  terabox_cookie_file: tb.txt
  validity_ttl_s: 10
  service_accounts:
    enabled: true
    dir: /srv/skyferry/accounts
    reset_interval_hours: 12
tools:
  aria2c: /usr/local/bin/aria2c
  rclone_config: /srv/skyferry/rclone.conf
chat:
  bot_token: "123:abc"
  max_part_mb: 40
cloud:
  remote: "drive:"
  default_folder: F0
destinations:
  default: "chat:-1001"
resolver:
  extra_extractor_domains: [videos.example.org, clips.example.net]
  terabox_api_base: https://www.1024tera.com
rate_limit:
  enabled: true
  rate: 5
  per_seconds: 30
  burst: 8
logging:
  file_sinks: false
  log_levels:
    console_log_level: debug
    subsystem_levels:
      engine: trace
)");

    const auto cfg = loadConfig(file);

    EXPECT_EQ(cfg.engine.global_limit, 8u);
    EXPECT_EQ(cfg.engine.per_owner_limit, 3u);
    EXPECT_EQ(cfg.engine.max_retries, 5u);
    EXPECT_EQ(cfg.engine.backoff_base, std::chrono::milliseconds(500));
    EXPECT_DOUBLE_EQ(cfg.engine.backoff_multiplier, 3.0);
    EXPECT_EQ(cfg.engine.backoff_max, std::chrono::milliseconds(9000));
    EXPECT_EQ(cfg.engine.status_poll_interval, std::chrono::milliseconds(250));
    EXPECT_EQ(cfg.engine.inactivity_timeout, std::chrono::seconds(120));
    EXPECT_EQ(cfg.engine.history_limit, 50u);

    EXPECT_EQ(cfg.paths.download_dir, "/srv/skyferry/dl");
    EXPECT_EQ(cfg.credentials.global_cookie_file, "shared.txt");
    EXPECT_EQ(cfg.credentials.terabox_cookie_file, "tb.txt");
    EXPECT_EQ(cfg.credentials.validity_ttl, std::chrono::seconds(10));
    EXPECT_TRUE(cfg.credentials.service_accounts.enabled);
    EXPECT_EQ(cfg.credentials.service_accounts.reset_interval, std::chrono::hours(12));

    EXPECT_EQ(cfg.tools.aria2c, "/usr/local/bin/aria2c");
    EXPECT_EQ(cfg.tools.yt_dlp, "yt-dlp");
    EXPECT_EQ(cfg.tools.rclone_config, "/srv/skyferry/rclone.conf");

    EXPECT_EQ(cfg.chat.bot_token, "123:abc");
    EXPECT_EQ(cfg.chat.max_part_bytes, 40u * 1024 * 1024);
    EXPECT_EQ(cfg.chat.api_base, "https://api.telegram.org");
    EXPECT_EQ(cfg.cloud.remote, "drive:");
    EXPECT_EQ(cfg.cloud.default_folder, "F0");
    EXPECT_EQ(cfg.destinations.default_spec, "chat:-1001");
    ASSERT_EQ(cfg.resolver.extra_extractor_domains.size(), 2u);
    EXPECT_EQ(cfg.resolver.extra_extractor_domains[1], "clips.example.net");
    EXPECT_EQ(cfg.resolver.terabox_api_base, "https://www.1024tera.com");

    EXPECT_TRUE(cfg.rate_limit.enabled);
    EXPECT_DOUBLE_EQ(cfg.rate_limit.rate, 5);
    EXPECT_EQ(cfg.rate_limit.per, std::chrono::seconds(30));
    EXPECT_DOUBLE_EQ(cfg.rate_limit.burst, 8);

    EXPECT_FALSE(cfg.logging.file_sinks);
    EXPECT_EQ(cfg.logging.levels.console_log_level, spdlog::level::debug);
    EXPECT_EQ(cfg.logging.levels.file_log_level, spdlog::level::warn);
    EXPECT_EQ(cfg.logging.levels.subsystem_levels.engine, spdlog::level::trace);
    EXPECT_EQ(cfg.logging.levels.subsystem_levels.admission, spdlog::level::warn);
}

TEST_F(ConfigTest, MissingSectionsKeepDefaults) {
    write("paths:\n  download_dir: /tmp/dl\n");
    const auto cfg = loadConfig(file);
    const Config defaults;

    EXPECT_EQ(cfg.paths.download_dir, "/tmp/dl");
    EXPECT_EQ(cfg.paths.log_dir, defaults.paths.log_dir);
    EXPECT_EQ(cfg.engine.global_limit, defaults.engine.global_limit);
    EXPECT_EQ(cfg.engine.max_retries, defaults.engine.max_retries);
    EXPECT_EQ(cfg.credentials.cookies_dir, defaults.credentials.cookies_dir);
    EXPECT_FALSE(cfg.rate_limit.enabled);
    EXPECT_TRUE(cfg.destinations.default_spec.empty());
}

TEST_F(ConfigTest, ZeroLimitsClampToOne) {
    write("engine:\n  global_limit: 0\n  per_owner_limit: 0\n");
    const auto cfg = loadConfig(file);
    EXPECT_EQ(cfg.engine.global_limit, 1u);
    EXPECT_EQ(cfg.engine.per_owner_limit, 1u);
}

TEST_F(ConfigTest, ChatPartSize_CappedForPublicBotApi) {
    write("chat:\n  max_part_mb: 2000\n");
    EXPECT_EQ(loadConfig(file).chat.max_part_bytes, PUBLIC_BOT_API_PART_BYTES);

    write("chat:\n  api_base: https://API.telegram.org/\n");
    EXPECT_EQ(loadConfig(file).chat.max_part_bytes, PUBLIC_BOT_API_PART_BYTES);

    EXPECT_EQ(Config{}.chat.max_part_bytes, PUBLIC_BOT_API_PART_BYTES);
    EXPECT_LE(PUBLIC_BOT_API_PART_BYTES, 50u * 1000 * 1000);
}

TEST_F(ConfigTest, ChatPartSize_LocalBotApiAllowsLargeParts) {
    write("chat:\n  api_base: http://localhost:8081\n");
    EXPECT_EQ(loadConfig(file).chat.max_part_bytes, LOCAL_BOT_API_PART_BYTES);

    write("chat:\n  api_base: http://localhost:8081\n  max_part_mb: 5000\n");
    EXPECT_EQ(loadConfig(file).chat.max_part_bytes, LOCAL_BOT_API_PART_BYTES);

    ChatConfig chat;
    chat.api_base = "http://localhost:8081";
    chat.max_part_bytes = 0;
    EXPECT_EQ(chat.effectivePartBytes(), LOCAL_BOT_API_PART_BYTES);
}

TEST_F(ConfigTest, MissingFileThrows) {
    EXPECT_THROW(loadConfig(file), YAML::BadFile);
}

TEST_F(ConfigTest, SerializesToJson) {
    Config cfg;
    cfg.engine.global_limit = 6;
    cfg.destinations.default_spec = "drive:F1";

    const nlohmann::json j = cfg;
    EXPECT_EQ(j["engine"]["global_limit"], 6);
    EXPECT_EQ(j["destinations"]["default"], "drive:F1");
    EXPECT_EQ(j["engine"]["backoff_base_ms"], 2000);
    EXPECT_EQ(j["credentials"]["service_accounts"]["enabled"], false);
}
