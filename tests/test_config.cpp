#include <gtest/gtest.h>

#include "packguard/config.hpp"
#include "testing.hpp"

#include <cstdlib>

namespace packguard::config {
namespace {

class ConfigTest : public ::testing::Test {
  protected:
    testutil::TemporaryDirectory tmp;

    std::string Write(const std::string& body) {
        const std::string p = tmp.Path() + "/config.json";
        testutil::WriteFile(p, body);
        return p;
    }
};

TEST_F(ConfigTest, MissingDefaultFileGivesDefaults) {
    Settings s;
    auto r = LoadSettings(tmp.Path() + "/absent.json", false, s);
    ASSERT_TRUE(r.is_ok()) << r.msg;
    EXPECT_EQ(s.sounds_dir, DefaultSoundsDir());
    EXPECT_TRUE(s.registry_urls.empty());
    EXPECT_EQ(s.log_level, LogLevel::Info);
    EXPECT_TRUE(s.log_file.empty());
    EXPECT_EQ(s.connect_timeout_sec, 30u);
    EXPECT_EQ(s.transfer_timeout_sec, 300u);
    EXPECT_EQ(s.max_extracted_bytes, 256ULL * 1024 * 1024);
    EXPECT_TRUE(s.progress);
}

TEST_F(ConfigTest, MissingNamedFileIsAnError) {
    Settings s;
    auto r = LoadSettings(tmp.Path() + "/absent.json", true, s);
    ASSERT_FALSE(r.is_ok());
    EXPECT_EQ(r.kind, ErrorKind::kConfig);
}

TEST_F(ConfigTest, FileValuesOverrideDefaults) {
    const auto path = Write(R"({
        "SoundsDir": "/srv/sounds",
        "RegistryUrls": ["https://a.example/registry.json", "file:///tmp/r.json"],
        "LogLevel": "debug",
        "LogFile": "/var/log/packguard.log",
        "ConnectTimeoutSec": 5,
        "TransferTimeoutSec": 60,
        "MaxExtractedBytes": 1048576,
        "Progress": false
    })");

    Settings s;
    auto r = LoadSettings(path, true, s);
    ASSERT_TRUE(r.is_ok()) << r.msg;
    EXPECT_EQ(s.sounds_dir, "/srv/sounds");
    ASSERT_EQ(s.registry_urls.size(), 2u);
    EXPECT_EQ(s.registry_urls[1], "file:///tmp/r.json");
    EXPECT_EQ(s.log_level, LogLevel::Debug);
    EXPECT_EQ(s.log_file, "/var/log/packguard.log");
    EXPECT_EQ(s.connect_timeout_sec, 5u);
    EXPECT_EQ(s.transfer_timeout_sec, 60u);
    EXPECT_EQ(s.max_extracted_bytes, 1048576u);
    EXPECT_FALSE(s.progress);
}

TEST_F(ConfigTest, PartialFileKeepsOtherDefaults) {
    const auto path = Write(R"({"LogLevel": "warn"})");
    Settings s;
    ASSERT_TRUE(LoadSettings(path, true, s).is_ok());
    EXPECT_EQ(s.log_level, LogLevel::Warn);
    EXPECT_EQ(s.sounds_dir, DefaultSoundsDir());
    EXPECT_TRUE(s.progress);
}

TEST_F(ConfigTest, WrongTypesAreRejected) {
    const char* bodies[] = {
        R"({"SoundsDir": 42})",
        R"({"SoundsDir": ""})",
        R"({"RegistryUrls": "https://a.example"})",
        R"({"RegistryUrls": [1, 2]})",
        R"({"LogLevel": "loud"})",
        R"({"ConnectTimeoutSec": -1})",
        R"({"MaxExtractedBytes": 1.5})",
        R"({"Progress": "yes"})",
        R"({"LogFile": false})",
        R"([1, 2, 3])",
        R"({not json)",
    };
    for (const char* body : bodies) {
        Settings s;
        auto r = LoadSettings(Write(body), true, s);
        EXPECT_FALSE(r.is_ok()) << body;
        EXPECT_EQ(r.kind, ErrorKind::kConfig) << body;
    }
}

TEST_F(ConfigTest, LoadFileResetsPreviousValues) {
    PackguardConfigFromFile cfg;
    ASSERT_TRUE(cfg.LoadFile(Write(R"({"SoundsDir": "/a", "Progress": true})")).is_ok());
    ASSERT_TRUE(cfg.sounds_dir.has_value());

    ASSERT_TRUE(cfg.LoadFile(Write(R"({"LogLevel": "error"})")).is_ok());
    EXPECT_FALSE(cfg.sounds_dir.has_value());
    EXPECT_FALSE(cfg.progress.has_value());
    ASSERT_TRUE(cfg.log_level.has_value());
    EXPECT_EQ(*cfg.log_level, LogLevel::Error);
}

TEST_F(ConfigTest, ResolveConfigPathOrder) {
    bool must_exist = false;
    EXPECT_EQ(ResolveConfigPath("/etc/pg.json", must_exist), "/etc/pg.json");
    EXPECT_TRUE(must_exist);

    ::setenv("PACKGUARD_CONFIG", "/from/env.json", 1);
    EXPECT_EQ(ResolveConfigPath("", must_exist), "/from/env.json");
    EXPECT_TRUE(must_exist);

    ::unsetenv("PACKGUARD_CONFIG");
    const auto fallback = ResolveConfigPath("", must_exist);
    EXPECT_FALSE(must_exist);
    EXPECT_NE(fallback.find("/.config/packguard/config.json"), std::string::npos);
}

} // namespace
} // namespace packguard::config
