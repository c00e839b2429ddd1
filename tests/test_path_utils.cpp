#include <gtest/gtest.h>

#include "packguard/path_utils.hpp"

TEST(PathUtilsTest, ParentSegmentAnywhere) {
    EXPECT_TRUE(packguard::HasParentSegment("../a"));
    EXPECT_TRUE(packguard::HasParentSegment("a/../b"));
    EXPECT_TRUE(packguard::HasParentSegment("a/b/.."));
    EXPECT_TRUE(packguard::HasParentSegment("a\\..\\b"));
    EXPECT_FALSE(packguard::HasParentSegment("a/..b/c"));
    EXPECT_FALSE(packguard::HasParentSegment("a/b.."));
}

TEST(PathUtilsTest, RootedPaths) {
    EXPECT_TRUE(packguard::IsRootedPath("/etc/passwd"));
    EXPECT_TRUE(packguard::IsRootedPath("\\windows"));
    EXPECT_TRUE(packguard::IsRootedPath("C:evil"));
    EXPECT_FALSE(packguard::IsRootedPath("pack/stop/a.wav"));
    EXPECT_FALSE(packguard::IsRootedPath(""));
}

TEST(PathUtilsTest, SegmentsAndSeparators) {
    const auto segs = packguard::SplitPathSegments("p//stop/a.wav/");
    ASSERT_EQ(segs.size(), 3u);
    EXPECT_EQ(segs[1], "stop");
    EXPECT_EQ(packguard::CountSeparators("p/stop/a.wav"), 2);
    EXPECT_EQ(packguard::CollapseSlashes("a//b///c/"), "a/b/c");
    EXPECT_EQ(packguard::CollapseSlashes("//x"), "/x");
}
