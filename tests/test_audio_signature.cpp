#include <gtest/gtest.h>

#include "packguard/audio_signature.hpp"

#include <string>
#include <vector>

namespace packguard {
namespace {

std::optional<AudioFormat> Detect(const std::vector<std::uint8_t>& bytes) {
    return DetectAudioFormat(std::span<const std::uint8_t>(bytes.data(), bytes.size()));
}

std::vector<std::uint8_t> Str(const std::string& s) { return {s.begin(), s.end()}; }

TEST(AudioSignatureTest, RecognizesEachFormat) {
    EXPECT_EQ(Detect(Str(std::string("RIFF\0\0\0\0WAVE", 12))), AudioFormat::kWav);
    EXPECT_EQ(Detect(Str(std::string("FORM\0\0\0\0AIFF", 12))), AudioFormat::kAiff);
    EXPECT_EQ(Detect(Str("OggS")), AudioFormat::kOgg);
    EXPECT_EQ(Detect({0x49, 0x44, 0x33, 0x04}), AudioFormat::kMp3Id3);
    EXPECT_EQ(Detect({0xFF, 0xFB, 0x90, 0x00}), AudioFormat::kMp3FrameSync);
    EXPECT_EQ(Detect({0xFF, 0xF3, 0x90, 0x00}), AudioFormat::kMp3FrameSync);
    EXPECT_EQ(Detect({0xFF, 0xF1, 0x50, 0x80}), AudioFormat::kAacAdts);
    EXPECT_EQ(Detect({0xFF, 0xF9, 0x50, 0x80}), AudioFormat::kAacAdts);
    EXPECT_EQ(Detect(Str(std::string("\0\0\0\x20" "ftypM4A ", 12))), AudioFormat::kMp4);
}

TEST(AudioSignatureTest, FormatNamesAreDistinct) {
    EXPECT_STREQ(AudioFormatName(AudioFormat::kWav), "wav");
    EXPECT_STREQ(AudioFormatName(AudioFormat::kMp3Id3), "mp3-id3");
    EXPECT_STREQ(AudioFormatName(AudioFormat::kMp3FrameSync), "mp3-frame");
    EXPECT_STREQ(AudioFormatName(AudioFormat::kMp4), "mp4");
}

TEST(AudioSignatureTest, RiffWithoutWaveIsRejected) {
    EXPECT_FALSE(Detect(Str(std::string("RIFF\0\0\0\0AVI ", 12))).has_value());
}

TEST(AudioSignatureTest, ShortInputNeverMatches) {
    EXPECT_FALSE(Detect({}).has_value());
    EXPECT_FALSE(Detect({0x49, 0x44, 0x33}).has_value());
    EXPECT_FALSE(Detect({0xFF, 0xFB}).has_value());
}

TEST(AudioSignatureTest, PlainTextIsRejected) {
    EXPECT_FALSE(HasAudioSignature(Str("hello, this is not audio")));
}

} // namespace
} // namespace packguard
