#include <gtest/gtest.h>

#include "packguard/logger.hpp"
#include "testing.hpp"

namespace packguard {
namespace {

class LoggerFileTest : public ::testing::Test {
  protected:
    testutil::TemporaryDirectory tmp;
    LogLevel saved_ = LogLevel::Info;

    void SetUp() override { saved_ = Logger::Instance().Level(); }
    void TearDown() override {
        Logger::Instance().ResetOutput();
        Logger::Instance().SetLevel(saved_);
    }
};

TEST(LogLevelTest, ParsesKnownNames) {
    EXPECT_EQ(ParseLogLevel("debug"), LogLevel::Debug);
    EXPECT_EQ(ParseLogLevel("warn"), LogLevel::Warn);
    EXPECT_EQ(ParseLogLevel("none"), LogLevel::None);
    EXPECT_FALSE(ParseLogLevel("WARN").has_value());
    EXPECT_FALSE(ParseLogLevel("").has_value());
    EXPECT_STREQ(LogLevelName(LogLevel::Error), "ERROR");
}

TEST_F(LoggerFileTest, WritesFilteredLinesToFile) {
    const std::string path = tmp.Path() + "/packguard.log";
    ASSERT_TRUE(Logger::Instance().SetOutputFile(path).is_ok());
    Logger::Instance().SetLevel(LogLevel::Warn);

    LogInfo("hidden %d", 1);
    LogWarn("shown %s", "warning");
    LogError("shown %d", 2);
    Logger::Instance().ResetOutput();

    const std::string text = testutil::ReadFileText(path);
    EXPECT_EQ(text.find("hidden"), std::string::npos);
    EXPECT_NE(text.find("packguard[WARN]"), std::string::npos);
    EXPECT_NE(text.find("test_logger.cpp:"), std::string::npos);
    EXPECT_NE(text.find(": shown warning\n"), std::string::npos);
    EXPECT_NE(text.find(": shown 2\n"), std::string::npos);
}

TEST_F(LoggerFileTest, NoneSilencesEverything) {
    const std::string path = tmp.Path() + "/quiet.log";
    ASSERT_TRUE(Logger::Instance().SetOutputFile(path).is_ok());
    Logger::Instance().SetLevel(LogLevel::None);
    LogError("never written");
    Logger::Instance().ResetOutput();
    EXPECT_TRUE(testutil::ReadFileText(path).empty());
}

TEST_F(LoggerFileTest, UnwritableFileIsConfigError) {
    auto r = Logger::Instance().SetOutputFile(tmp.Path() + "/missing/dir/x.log");
    ASSERT_FALSE(r.is_ok());
    EXPECT_EQ(r.kind, ErrorKind::kConfig);
}

} // namespace
} // namespace packguard
