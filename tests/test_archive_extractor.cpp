#include <gtest/gtest.h>

#include "packguard/archive_extractor.hpp"
#include "testing.hpp"

namespace packguard {
namespace {

using testutil::Dir;
using testutil::File;
using testutil::Symlink;

class ArchiveExtractorTest : public ::testing::Test {
  protected:
    testutil::TemporaryDirectory temp_dir;

    std::string Dest() {
        const std::string d = temp_dir.Path() + "/scratch";
        testutil::MakeDirs(d);
        return d;
    }
};

TEST_F(ArchiveExtractorTest, ExtractsFilesAndDirectories) {
    const std::string wav = testutil::WavBytes(2048);
    testutil::MemoryReader reader(testutil::BuildTar({
        Dir("mypack/"),
        Dir("mypack/stop/"),
        File("mypack/stop/a.wav", wav),
    }));

    ArchiveExtractor extractor;
    const std::string dst = Dest();
    auto r = extractor.ExtractToDir(reader, dst);
    ASSERT_TRUE(r.is_ok()) << r.msg;

    EXPECT_EQ(testutil::ReadFileText(dst + "/mypack/stop/a.wav"), wav);
}

TEST_F(ArchiveExtractorTest, ExtractsZip) {
    const std::string ogg = testutil::OggBytes(500);
    testutil::MemoryReader reader(testutil::BuildZip({File("mypack/notification/n.ogg", ogg)}));

    ArchiveExtractor extractor;
    const std::string dst = Dest();
    auto r = extractor.ExtractToDir(reader, dst);
    ASSERT_TRUE(r.is_ok()) << r.msg;
    EXPECT_EQ(testutil::ReadFileText(dst + "/mypack/notification/n.ogg"), ogg);
}

TEST_F(ArchiveExtractorTest, ExtractsBelowSymlinkedParent) {
    const std::string real = temp_dir.Path() + "/real";
    testutil::MakeDirs(real + "/scratch");
    const std::string link = temp_dir.Path() + "/link";
    ASSERT_EQ(::symlink(real.c_str(), link.c_str()), 0);

    const std::string wav = testutil::WavBytes(512);
    testutil::MemoryReader reader(testutil::BuildTar({File("mypack/stop/a.wav", wav)}));

    ArchiveExtractor extractor;
    auto r = extractor.ExtractToDir(reader, link + "/scratch");
    ASSERT_TRUE(r.is_ok()) << r.msg;
    EXPECT_EQ(testutil::ReadFileText(real + "/scratch/mypack/stop/a.wav"), wav);
}

TEST_F(ArchiveExtractorTest, RefusesTraversalAndWritesNothingOutside) {
    testutil::MemoryReader reader(testutil::BuildTar({
        File("mypack/../escape.wav", testutil::WavBytes(64)),
    }));

    ArchiveExtractor extractor;
    const std::string dst = Dest();
    auto r = extractor.ExtractToDir(reader, dst);
    ASSERT_FALSE(r.is_ok());
    EXPECT_EQ(r.kind, ErrorKind::kExtractionFailed);
    EXPECT_FALSE(testutil::Exists(temp_dir.Path() + "/escape.wav"));
    EXPECT_FALSE(testutil::Exists(dst + "/escape.wav"));
}

TEST_F(ArchiveExtractorTest, RefusesSymlinkEntries) {
    testutil::MemoryReader reader(testutil::BuildTar({
        Symlink("mypack/stop/a.wav", "/etc/passwd"),
    }));

    ArchiveExtractor extractor;
    const std::string dst = Dest();
    auto r = extractor.ExtractToDir(reader, dst);
    ASSERT_FALSE(r.is_ok());
    EXPECT_EQ(r.kind, ErrorKind::kExtractionFailed);
    EXPECT_FALSE(testutil::Exists(dst + "/mypack/stop/a.wav"));
}

TEST_F(ArchiveExtractorTest, StopsAtTotalByteLimit) {
    testutil::MemoryReader reader(testutil::BuildTar({
        File("mypack/stop/a.wav", testutil::WavBytes(4096)),
        File("mypack/stop/b.wav", testutil::WavBytes(4096)),
    }));

    ArchiveExtractor::Options opt;
    opt.max_total_bytes = 6000;
    ArchiveExtractor extractor(opt);
    auto r = extractor.ExtractToDir(reader, Dest());
    ASSERT_FALSE(r.is_ok());
    EXPECT_NE(r.msg.find("expands beyond"), std::string::npos);
}

TEST_F(ArchiveExtractorTest, DestinationMustBeADirectory) {
    testutil::MemoryReader reader(testutil::BuildTar({File("mypack/stop/a.wav", "x")}));
    ArchiveExtractor extractor;
    auto r = extractor.ExtractToDir(reader, temp_dir.Path() + "/missing");
    ASSERT_FALSE(r.is_ok());
    EXPECT_EQ(r.kind, ErrorKind::kExtractionFailed);
}

} // namespace
} // namespace packguard
