#include <gtest/gtest.h>
#include <vcodec_util/config.h>
#include <vcodec_util/config_loader.h>
#include "vcodec/core/session_timezone.hpp"
#include "vcodec/core/value_decoder.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        unsetenv("VCODEC_LOG_LEVEL");
        unsetenv("VCODEC_DEFAULT_TIMEZONE");
        unsetenv("VCODEC_REQUEST_COMPLEX_TYPES");
        util::Config::reset();

        std::ofstream file("test_codec_config.json");
        file << R"({
            "logging": {
                "level": "debug",
                "console": false,
                "file": true,
                "file_path": "test.log",
                "rotate_max_size_mb": 10,
                "rotate_max_files": 5
            },
            "codec": {
                "request_complex_types": false,
                "default_timezone": "+03:00"
            }
        })";
        file.close();
    }

    void TearDown() override {
        std::filesystem::remove("test_codec_config.json");
        unsetenv("VCODEC_LOG_LEVEL");
        unsetenv("VCODEC_DEFAULT_TIMEZONE");
        unsetenv("VCODEC_REQUEST_COMPLEX_TYPES");
        util::Config::reset();
    }
};

TEST_F(ConfigTest, Defaults) {
    EXPECT_EQ(util::Config::logging().level, "info");
    EXPECT_TRUE(util::Config::logging().console);
    EXPECT_FALSE(util::Config::logging().file);
    EXPECT_TRUE(util::Config::codec().requestComplexTypes);
    EXPECT_EQ(util::Config::codec().defaultTimezone, "UTC");
}

TEST_F(ConfigTest, LoadFromJson) {
    ASSERT_TRUE(util::Config::load("test_codec_config.json"));

    EXPECT_EQ(util::Config::logging().level, "debug");
    EXPECT_FALSE(util::Config::logging().console);
    EXPECT_TRUE(util::Config::logging().file);
    EXPECT_EQ(util::Config::logging().filePath, "test.log");
    EXPECT_EQ(util::Config::logging().rotateMaxSizeMb, 10u);
    EXPECT_EQ(util::Config::logging().rotateMaxFiles, 5u);

    EXPECT_FALSE(util::Config::codec().requestComplexTypes);
    EXPECT_EQ(util::Config::codec().defaultTimezone, "+03:00");
}

TEST_F(ConfigTest, MissingFileKeepsDefaults) {
    EXPECT_FALSE(util::Config::load("no_such_config.json"));
    EXPECT_EQ(util::Config::codec().defaultTimezone, "UTC");
}

TEST_F(ConfigTest, PartialJsonText) {
    util::Config::loadFromJsonText(R"({"codec": {"default_timezone": "UTC-5"}})");
    EXPECT_EQ(util::Config::codec().defaultTimezone, "UTC-5");
    EXPECT_TRUE(util::Config::codec().requestComplexTypes);
    EXPECT_EQ(util::Config::logging().level, "info");
}

TEST_F(ConfigTest, EnvOverridesJson) {
    setenv("VCODEC_LOG_LEVEL", "warn", 1);
    setenv("VCODEC_DEFAULT_TIMEZONE", "Z", 1);
    setenv("VCODEC_REQUEST_COMPLEX_TYPES", "on", 1);

    ASSERT_TRUE(util::Config::load("test_codec_config.json"));

    EXPECT_EQ(util::Config::logging().level, "warn");
    EXPECT_EQ(util::Config::codec().defaultTimezone, "Z");
    EXPECT_TRUE(util::Config::codec().requestComplexTypes);

    // Values not overridden by env should remain from JSON
    EXPECT_EQ(util::Config::logging().filePath, "test.log");
}

TEST_F(ConfigTest, UnrecognisedBooleanEnvKeepsValue) {
    setenv("VCODEC_REQUEST_COMPLEX_TYPES", "maybe", 1);
    ASSERT_TRUE(util::Config::load("test_codec_config.json"));
    EXPECT_FALSE(util::Config::codec().requestComplexTypes);
}

TEST(ParseBoolSettingTest, Spellings) {
    EXPECT_TRUE(util::parseBoolSetting("1", false));
    EXPECT_TRUE(util::parseBoolSetting("TRUE", false));
    EXPECT_TRUE(util::parseBoolSetting("Yes", false));
    EXPECT_FALSE(util::parseBoolSetting("0", true));
    EXPECT_FALSE(util::parseBoolSetting("off", true));
    EXPECT_TRUE(util::parseBoolSetting("", true));
    EXPECT_FALSE(util::parseBoolSetting("2", false));
}

// ============================================================================
// Settings consumed by the codec
// ============================================================================

TEST_F(ConfigTest, DecoderOptionsFromConfig) {
    EXPECT_TRUE(vcodec::core::DecoderOptions::fromConfig().requestComplexTypes);
    ASSERT_TRUE(util::Config::load("test_codec_config.json"));
    EXPECT_FALSE(vcodec::core::DecoderOptions::fromConfig().requestComplexTypes);
}

TEST_F(ConfigTest, SessionTimezoneFromConfig) {
    using vcodec::core::SessionTimezone;
    EXPECT_EQ(SessionTimezone::fromConfig(), SessionTimezone::utc());
    ASSERT_TRUE(util::Config::load("test_codec_config.json"));
    EXPECT_EQ(SessionTimezone::fromConfig(), SessionTimezone::fixedOffset(3 * 3600));
}

// ============================================================================
// ConfigLoader
// ============================================================================

class ConfigLoaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() / "vcodec_config_loader_test";
        std::filesystem::create_directories(dir_);
        std::ofstream(dir_ / "custom_codec.json") << "{}";
        util::ConfigLoader::clearSearchPaths();
    }

    void TearDown() override {
        util::ConfigLoader::clearSearchPaths();
        std::filesystem::remove_all(dir_);
    }

    std::filesystem::path dir_;
};

TEST_F(ConfigLoaderTest, CustomPathsComeFirst) {
    util::ConfigLoader::addSearchPath(dir_);
    const auto paths = util::ConfigLoader::getSearchPaths();
    ASSERT_FALSE(paths.empty());
    EXPECT_EQ(paths.front(), dir_);
}

TEST_F(ConfigLoaderTest, FindsFileInCustomPath) {
    EXPECT_EQ(util::ConfigLoader::findConfigFile("custom_codec.json"), "");
    util::ConfigLoader::addSearchPath(dir_);
    EXPECT_EQ(util::ConfigLoader::findConfigFile("custom_codec.json"),
              (dir_ / "custom_codec.json").string());
}

TEST_F(ConfigLoaderTest, MissingFileYieldsEmptyPath) {
    EXPECT_EQ(util::ConfigLoader::findConfigFile("definitely_missing_vcodec.json"), "");
}
