#include <gtest/gtest.h>

#include "packguard/structural_auditor.hpp"

namespace packguard {
namespace {

ArchiveEntry F(std::string path) { return ArchiveEntry{std::move(path), EntryKind::kFile, 10}; }
ArchiveEntry D(std::string path) { return ArchiveEntry{std::move(path), EntryKind::kDirectory, 0}; }

TEST(StructuralAuditorTest, WellFormedPackPasses) {
    StructuralAuditor auditor;
    const auto report = auditor.Audit({
        D("mypack/"),
        D("mypack/session-start/"),
        F("mypack/session-start/a.wav"),
        F("mypack/stop/b.MP3"),
    }, "mypack");

    EXPECT_TRUE(report.Passed());
    EXPECT_TRUE(report.Messages().empty());
}

TEST(StructuralAuditorTest, TraversalAnywhereInPath) {
    StructuralAuditor auditor;
    const auto report = auditor.Audit({
        F("mypack/session-start/a.wav"),
        F("mypack/../../etc/passwd"),
        F("../mypack/stop/a.wav"),
        F("mypack/stop/.."),
    }, "mypack");

    ASSERT_FALSE(report.Passed());
    EXPECT_EQ(report.Count(Violation::kPathTraversal), 3u);
}

TEST(StructuralAuditorTest, ReportsEveryViolationOfEveryEntry) {
    StructuralAuditor auditor;
    const auto report = auditor.Audit({
        F("/abs/stop/a.wav"),
        ArchiveEntry{"mypack/stop/link.wav", EntryKind::kSymlink, 0},
        ArchiveEntry{"mypack/stop/dev.wav", EntryKind::kSpecial, 0},
        F("mypack/a/b/c/d.wav"),
        F("other/stop/a.wav"),
        F("mypack/startup/a.wav"),
        F("mypack/stop/a.exe"),
    }, "mypack");

    EXPECT_EQ(report.Count(Violation::kAbsolutePath), 1u);
    EXPECT_EQ(report.Count(Violation::kSymlinkNotAllowed), 1u);
    EXPECT_EQ(report.Count(Violation::kSpecialEntry), 1u);
    EXPECT_EQ(report.Count(Violation::kTooDeep), 1u);
    // "/abs/..." has an empty root segment and "other/..." the wrong one.
    EXPECT_EQ(report.Count(Violation::kUnexpectedRoot), 2u);
    EXPECT_EQ(report.Count(Violation::kInvalidEvent), 1u);
    EXPECT_EQ(report.Count(Violation::kDisallowedExtension), 1u);
}

TEST(StructuralAuditorTest, DirectoriesSkipEventAndExtensionRules) {
    StructuralAuditor auditor;
    const auto report = auditor.Audit({D("mypack/random-dir/")}, "mypack");
    EXPECT_TRUE(report.Passed());
}

TEST(StructuralAuditorTest, InvalidPackIdStopsTheAudit) {
    StructuralAuditor auditor;
    const auto report = auditor.Audit({F("x/../y")}, "../evil");

    ASSERT_EQ(report.Items().size(), 1u);
    EXPECT_EQ(report.Items()[0].kind, Violation::kInvalidPackId);
}

TEST(StructuralAuditorTest, MessagesNameKindAndPath) {
    StructuralAuditor auditor;
    const auto report = auditor.Audit({F("mypack/stop/a.txt")}, "mypack");

    const auto lines = report.Messages();
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0], "DisallowedExtension: mypack/stop/a.txt");
}

} // namespace
} // namespace packguard
