#include <gtest/gtest.h>

#include "packguard/pack_rules.hpp"

namespace packguard {
namespace {

TEST(PackRulesTest, EventNamesAreTheFixedSeven) {
    EXPECT_EQ(kEventNames.size(), 7u);
    EXPECT_TRUE(IsEventName("session-start"));
    EXPECT_TRUE(IsEventName("tool-failure"));
    EXPECT_FALSE(IsEventName("Session-Start"));
    EXPECT_FALSE(IsEventName("startup"));
    EXPECT_FALSE(IsEventName(""));
}

TEST(PackRulesTest, LowerExtensionUsesLastDotOfLastComponent) {
    EXPECT_EQ(LowerExtension("a.WAV"), "wav");
    EXPECT_EQ(LowerExtension("x.tar.Mp3"), "mp3");
    EXPECT_EQ(LowerExtension("dir.d/noext"), "");
    EXPECT_EQ(LowerExtension("trailing."), "");
    EXPECT_EQ(LowerExtension(".wav"), "");
    EXPECT_EQ(LowerExtension("stop/.MP3"), "");
    EXPECT_EQ(LowerExtension(".hidden.ogg"), "ogg");
    EXPECT_TRUE(IsAllowedExtension("m4a"));
    EXPECT_FALSE(IsAllowedExtension("flac"));
    EXPECT_FALSE(IsAllowedExtension("WAV"));
}

TEST(PackRulesTest, PackIdCharacterSet) {
    EXPECT_TRUE(IsValidPackId("protoss"));
    EXPECT_TRUE(IsValidPackId("pack-2"));
    EXPECT_FALSE(IsValidPackId(""));
    EXPECT_FALSE(IsValidPackId("Pack"));
    EXPECT_FALSE(IsValidPackId("../etc"));
    EXPECT_FALSE(IsValidPackId("a/b"));
    EXPECT_FALSE(IsValidPackId("a_b"));
    EXPECT_FALSE(IsValidPackId("a.b"));
}

TEST(PackRulesTest, PlainFileName) {
    EXPECT_TRUE(IsPlainFileName("a.wav"));
    EXPECT_FALSE(IsPlainFileName(""));
    EXPECT_FALSE(IsPlainFileName(".."));
    EXPECT_FALSE(IsPlainFileName("a/b.wav"));
}

} // namespace
} // namespace packguard
