#include "stash/config/config_loader.hpp"

#include "support/temp_files.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

namespace fs = std::filesystem;
using stash::config::ConfigLoader;
using stash::testing::create_temp_dir;
using stash::testing::write_text_file;

TEST(ConfigLoaderTest, LoadsAllSections) {
    const auto dir = create_temp_dir("stash_config_");
    const auto path = write_text_file(dir / "stash.yaml",
        "api:\n"
        "  base_url: https://artifacts.example.com/api/v1/\n"
        "  key: file-key\n"
        "  send_part_receipts: true\n"
        "http:\n"
        "  timeout_seconds: 600\n"
        "  connect_timeout_seconds: 5\n"
        "  user_agent: ci-agent/2\n"
        "logging:\n"
        "  level: debug\n"
        "  pattern: \"%v\"\n");

    auto config = ConfigLoader::load_from_yaml(path);

    EXPECT_EQ(config.api.base_url, "https://artifacts.example.com/api/v1/");
    EXPECT_EQ(config.api.api_key, "file-key");
    EXPECT_TRUE(config.api.send_part_receipts);
    EXPECT_EQ(config.http.timeout_seconds, 600);
    EXPECT_EQ(config.http.connect_timeout_seconds, 5);
    EXPECT_EQ(config.http.user_agent, "ci-agent/2");
    EXPECT_EQ(config.logging.level, "debug");
    EXPECT_EQ(config.logging.pattern, "%v");
}

TEST(ConfigLoaderTest, PartialFileKeepsDefaults) {
    const auto dir = create_temp_dir("stash_config_");
    const auto path = write_text_file(dir / "stash.yaml", "api:\n  key: only-key\n");

    auto config = ConfigLoader::load_from_yaml(path);

    EXPECT_EQ(config.api.api_key, "only-key");
    EXPECT_EQ(config.api.base_url, stash::config::kDefaultApiBaseUrl);
    EXPECT_FALSE(config.api.send_part_receipts);
    EXPECT_EQ(config.http.timeout_seconds, 0);
    EXPECT_EQ(config.http.connect_timeout_seconds, 30);
    EXPECT_EQ(config.logging.level, "info");
}

TEST(ConfigLoaderTest, EnvironmentWinsOverFile) {
    const auto dir = create_temp_dir("stash_config_");
    const auto path = write_text_file(dir / "stash.yaml",
        "api:\n  key: file-key\n  base_url: https://file.example.com\n");

    auto env = stash::fixed_environment({
        {"STASH_API_KEY", "env-key"},
        {"STASH_API_URL", "https://env.example.com"},
        {"STASH_LOG_LEVEL", "warn"},
    });

    auto config = ConfigLoader::load(path, env);

    EXPECT_EQ(config.api.api_key, "env-key");
    EXPECT_EQ(config.api.base_url, "https://env.example.com");
    EXPECT_EQ(config.logging.level, "warn");
}

TEST(ConfigLoaderTest, MissingFileFallsBackToDefaultsAndEnvironment) {
    const auto dir = create_temp_dir("stash_config_");
    auto env = stash::fixed_environment({{"STASH_API_KEY", "env-key"}});

    auto config = ConfigLoader::load(dir / "absent.yaml", env);

    EXPECT_EQ(config.api.api_key, "env-key");
    EXPECT_EQ(config.api.base_url, stash::config::kDefaultApiBaseUrl);

    auto no_path = ConfigLoader::load(std::nullopt, stash::fixed_environment({}));
    EXPECT_TRUE(no_path.api.api_key.empty());
}

TEST(ConfigLoaderTest, MalformedFileThrows) {
    const auto dir = create_temp_dir("stash_config_");
    const auto path = write_text_file(dir / "broken.yaml", "api: [unclosed\n");

    EXPECT_THROW(ConfigLoader::load_from_yaml(path), std::runtime_error);
}

TEST(ConfigLoaderTest, RejectsNegativeTimeouts) {
    const auto dir = create_temp_dir("stash_config_");
    const auto path = write_text_file(dir / "stash.yaml", "http:\n  timeout_seconds: -1\n");

    EXPECT_THROW(ConfigLoader::load_from_yaml(path), std::runtime_error);
}
