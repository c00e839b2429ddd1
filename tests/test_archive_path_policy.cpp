#include <gtest/gtest.h>

#include "packguard/archive_path_policy.hpp"

namespace packguard {

TEST(ArchivePathPolicyTest, CollapsesDuplicateSlashes) {
    ArchivePathPolicy policy;
    std::string out;

    auto res = policy.NormalizeEntryPath("pack//stop/a.wav", out);
    ASSERT_TRUE(res.is_ok()) << res.msg;
    EXPECT_EQ(out, "pack/stop/a.wav");
}

TEST(ArchivePathPolicyTest, RejectsParentSegments) {
    ArchivePathPolicy policy;
    std::string out;

    auto res = policy.NormalizeEntryPath("pack/../escape.txt", out);
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.kind, ErrorKind::kExtractionFailed);
    EXPECT_NE(res.msg.find("Unsafe path in archive"), std::string::npos);
}

TEST(ArchivePathPolicyTest, RejectsRootedAndDotPaths) {
    ArchivePathPolicy policy;
    std::string out;

    EXPECT_FALSE(policy.NormalizeEntryPath("/etc/passwd", out).is_ok());
    EXPECT_FALSE(policy.NormalizeEntryPath("./pack/stop/a.wav", out).is_ok());
    EXPECT_FALSE(policy.NormalizeEntryPath("pack\\stop\\a.wav", out).is_ok());
    EXPECT_FALSE(policy.NormalizeEntryPath("", out).is_ok());
}

} // namespace packguard
