#include <gtest/gtest.h>

#include "packguard/logger.hpp"
#include "packguard/registry.hpp"
#include "testing.hpp"

namespace packguard {
namespace {

const std::string kDigest(64, 'a');

TEST(RegistryParseTest, ParsesEntries) {
    const std::string doc = R"({
        "version": "1.2",
        "packs": [
            {
                "id": "protoss",
                "name": "Protoss",
                "description": "En taro",
                "version": "1.0.0",
                "author": "someone",
                "download_url": "https://example.com/protoss.zip",
                "size": "2.1 MB",
                "file_count": 40,
                "preview_url": "https://example.com/protoss.mp3",
                "sha256": ")" + kDigest + R"("
            },
            {"id": "terran", "download_url": "https://example.com/terran.zip"}
        ]
    })";

    auto reg = ParseRegistry(doc);
    ASSERT_TRUE(reg.has_value()) << reg.error();
    EXPECT_EQ(reg->version, "1.2");
    ASSERT_EQ(reg->packs.size(), 2u);

    const auto& p = reg->packs[0];
    EXPECT_EQ(p.id, "protoss");
    EXPECT_EQ(p.name, "Protoss");
    EXPECT_EQ(p.author, "someone");
    EXPECT_EQ(p.file_count, 40u);
    EXPECT_EQ(p.sha256, kDigest);

    const auto* t = reg->Find("terran");
    ASSERT_NE(t, nullptr);
    EXPECT_EQ(t->name, "terran");
    EXPECT_TRUE(t->sha256.empty());
    EXPECT_EQ(reg->Find("zerg"), nullptr);
}

TEST(RegistryParseTest, SkipsUnusableEntries) {
    const std::string doc = R"({
        "packs": [
            "not an object",
            {"id": "../evil", "download_url": "https://example.com/x.zip"},
            {"id": "nourl"},
            {"id": "badsum", "download_url": "https://example.com/b.zip", "sha256": "1234"},
            {"id": 7, "download_url": "https://example.com/n.zip"},
            {"id": "good", "download_url": "https://example.com/g.zip"}
        ]
    })";

    auto reg = ParseRegistry(doc);
    ASSERT_TRUE(reg.has_value());
    ASSERT_EQ(reg->packs.size(), 1u);
    EXPECT_EQ(reg->packs[0].id, "good");
}

TEST(RegistryParseTest, RejectsMalformedDocuments) {
    EXPECT_FALSE(ParseRegistry("{").has_value());
    EXPECT_FALSE(ParseRegistry("[]").has_value());
    EXPECT_FALSE(ParseRegistry(R"({"version": "1"})").has_value());
    EXPECT_FALSE(ParseRegistry(R"({"packs": {}})").has_value());
}

TEST(RegistryParseTest, EmptyPackListIsValid) {
    auto reg = ParseRegistry(R"({"packs": []})");
    ASSERT_TRUE(reg.has_value());
    EXPECT_TRUE(reg->packs.empty());
}

TEST(RegistryMergeTest, FirstSourceWinsAndBadSourcesAreSkipped) {
    testutil::TemporaryDirectory tmp;
    const std::string a = tmp.Path() + "/a.json";
    const std::string b = tmp.Path() + "/b.json";
    const std::string broken = tmp.Path() + "/broken.json";

    testutil::WriteFile(a, R"({"version": "A", "packs": [
        {"id": "shared", "name": "From A", "download_url": "https://a/shared.zip"},
        {"id": "only-a", "download_url": "https://a/only-a.zip"}
    ]})");
    testutil::WriteFile(b, R"({"version": "B", "packs": [
        {"id": "shared", "name": "From B", "download_url": "https://b/shared.zip"},
        {"id": "only-b", "download_url": "https://b/only-b.zip"}
    ]})");
    testutil::WriteFile(broken, "not json at all");

    const std::vector<std::string> urls = {
        "file://" + tmp.Path() + "/missing.json",
        "file://" + broken,
        "file://" + a,
        "file://" + b,
    };

    Downloader downloader;
    const auto reg = FetchMergedRegistry(urls, downloader);
    EXPECT_EQ(reg.version, "A");
    ASSERT_EQ(reg.packs.size(), 3u);
    EXPECT_EQ(reg.packs[0].id, "shared");
    EXPECT_EQ(reg.packs[0].name, "From A");
    EXPECT_EQ(reg.packs[1].id, "only-a");
    EXPECT_EQ(reg.packs[2].id, "only-b");
}

TEST(RegistryMergeTest, AllSourcesFailingIsReported) {
    testutil::TemporaryDirectory tmp;
    const std::string log = tmp.Path() + "/registry.log";
    const LogLevel saved = Logger::Instance().Level();
    ASSERT_TRUE(Logger::Instance().SetOutputFile(log).is_ok());
    Logger::Instance().SetLevel(LogLevel::Warn);

    Downloader downloader;
    const auto reg = FetchMergedRegistry({"file://" + tmp.Path() + "/missing.json"}, downloader);

    Logger::Instance().ResetOutput();
    Logger::Instance().SetLevel(saved);

    EXPECT_TRUE(reg.packs.empty());
    EXPECT_NE(testutil::ReadFileText(log).find("No registry source could be read"), std::string::npos);
}

TEST(RegistryMergeTest, NoSourcesGivesEmptyRegistry) {
    Downloader downloader;
    const auto reg = FetchMergedRegistry({}, downloader);
    EXPECT_TRUE(reg.packs.empty());
}

} // namespace
} // namespace packguard
