// File: tests/config/platform_config_test.cpp
//
// Tests for the YAML platform configuration

#include "config/platform_config.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

namespace modelstore {
namespace {

class PlatformConfigTest : public ::testing::Test {
protected:
    std::string temp_config_path = "/tmp/test_platform_config.yaml";

    void TearDown() override {
        std::filesystem::remove(temp_config_path);
    }
};

TEST_F(PlatformConfigTest, DefaultConfig) {
    auto config = PlatformConfig::Default();

    EXPECT_EQ("local", config.default_platform);
    ASSERT_EQ(1u, config.platforms.size());
    EXPECT_EQ("memory", config.platforms.at("local").backend_class);
    EXPECT_TRUE(config.platforms.at("local").options.empty());
    EXPECT_TRUE(config.Validate());
}

TEST_F(PlatformConfigTest, LoadFromString) {
    std::string yaml = R"(
default: local

platforms:
  local:
    class: sqlite
    path: /tmp/models.db
    cache_size: 64
  scratch:
    class: memory
    cache: false
)";

    auto config_opt = PlatformConfig::LoadFromString(yaml);
    ASSERT_TRUE(config_opt.has_value());

    auto config = config_opt.value();
    EXPECT_EQ("local", config.default_platform);
    ASSERT_EQ(2u, config.platforms.size());

    const PlatformInfo& local = config.platforms.at("local");
    EXPECT_EQ("sqlite", local.backend_class);
    EXPECT_EQ("/tmp/models.db", local.options.at("path"));
    EXPECT_EQ("64", local.options.at("cache_size"));
    EXPECT_EQ(0u, local.options.count("class"));

    EXPECT_EQ("false", config.platforms.at("scratch").options.at("cache"));
}

TEST_F(PlatformConfigTest, UnknownSectionsAndSequencesIgnored) {
    std::string yaml = R"(
default: local
notes:
  owner: modelling team
  tags: [a, b]
platforms:
  local:
    class: memory
    aliases:
      - scratch
      - test
)";

    auto config = PlatformConfig::LoadFromString(yaml);
    ASSERT_TRUE(config.has_value());
    ASSERT_EQ(1u, config->platforms.size());
    EXPECT_EQ("memory", config->platforms.at("local").backend_class);
    EXPECT_TRUE(config->platforms.at("local").options.empty());
}

TEST_F(PlatformConfigTest, LoadFromFile) {
    std::ofstream file(temp_config_path);
    file << "default: scratch\n"
         << "platforms:\n"
         << "  scratch:\n"
         << "    class: memory\n";
    file.close();

    auto config = PlatformConfig::LoadFromFile(temp_config_path);
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ("scratch", config->default_platform);
}

TEST_F(PlatformConfigTest, LoadFromMissingFile) {
    EXPECT_FALSE(PlatformConfig::LoadFromFile("/nonexistent/platforms.yaml").has_value());
}

TEST_F(PlatformConfigTest, MalformedYaml) {
    EXPECT_FALSE(PlatformConfig::LoadFromString("default: [local\nplatforms: {").has_value());
}

TEST_F(PlatformConfigTest, PlatformMustBeMapping) {
    std::string yaml = R"(
default: local
platforms:
  local: sqlite
)";
    EXPECT_FALSE(PlatformConfig::LoadFromString(yaml).has_value());
}

TEST_F(PlatformConfigTest, PlatformWithoutClass) {
    std::string yaml = R"(
default: local
platforms:
  local:
    path: /tmp/models.db
)";
    EXPECT_FALSE(PlatformConfig::LoadFromString(yaml).has_value());
}

TEST_F(PlatformConfigTest, ValidationErrors) {
    PlatformConfig config;
    auto errors = config.GetValidationErrors();
    ASSERT_EQ(2u, errors.size());
    EXPECT_EQ("at least one platform must be configured", errors[0]);
    EXPECT_EQ("no default platform", errors[1]);

    config.platforms[""] = PlatformInfo{"memory", {}};
    config.platforms["remote"] = PlatformInfo{};
    config.default_platform = "local";
    errors = config.GetValidationErrors();
    ASSERT_EQ(3u, errors.size());
    EXPECT_EQ("platform names must not be empty", errors[0]);
    EXPECT_EQ("platform 'remote' has no class", errors[1]);
    EXPECT_EQ("default platform 'local' is not configured", errors[2]);
    EXPECT_FALSE(config.Validate());
}

TEST_F(PlatformConfigTest, GetPlatformInfo) {
    auto config = PlatformConfig::Default();
    config.platforms["scratch"] = PlatformInfo{"memory", {{"cache", "false"}}};

    const PlatformInfo* info = config.GetPlatformInfo();
    ASSERT_NE(nullptr, info);
    EXPECT_TRUE(info->options.empty());

    info = config.GetPlatformInfo("scratch");
    ASSERT_NE(nullptr, info);
    EXPECT_EQ("false", info->options.at("cache"));

    EXPECT_EQ(nullptr, config.GetPlatformInfo("missing"));
}

} // namespace
} // namespace modelstore
