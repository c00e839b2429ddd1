#include "packguard/audio_signature.hpp"

#include <array>
#include <cstring>

namespace packguard {

namespace {

constexpr std::array<AudioFormat, 7> kAllFormats = {
    AudioFormat::kWav,
    AudioFormat::kAiff,
    AudioFormat::kOgg,
    AudioFormat::kMp3Id3,
    AudioFormat::kMp3FrameSync,
    AudioFormat::kAacAdts,
    AudioFormat::kMp4,
};

bool BytesAt(std::span<const std::uint8_t> h, std::size_t off, const char* lit) {
    const std::size_t n = std::strlen(lit);
    if (h.size() < off + n) return false;
    return std::memcmp(h.data() + off, lit, n) == 0;
}

bool Matches(AudioFormat f, std::span<const std::uint8_t> h) {
    switch (f) {
        case AudioFormat::kWav:
            return BytesAt(h, 0, "RIFF") && BytesAt(h, 8, "WAVE");
        case AudioFormat::kAiff:
            return BytesAt(h, 0, "FORM") && BytesAt(h, 8, "AIFF");
        case AudioFormat::kOgg:
            return BytesAt(h, 0, "OggS");
        case AudioFormat::kMp3Id3:
            return BytesAt(h, 0, "ID3");
        case AudioFormat::kMp3FrameSync:
            return h[0] == 0xFF && (h[1] == 0xFB || h[1] == 0xF3 || h[1] == 0xF2);
        case AudioFormat::kAacAdts:
            return h[0] == 0xFF && (h[1] == 0xF1 || h[1] == 0xF9);
        case AudioFormat::kMp4:
            return BytesAt(h, 4, "ftyp");
    }
    return false;
}

} // namespace

const char* AudioFormatName(AudioFormat f) {
    switch (f) {
        case AudioFormat::kWav:          return "wav";
        case AudioFormat::kAiff:         return "aiff";
        case AudioFormat::kOgg:          return "ogg";
        case AudioFormat::kMp3Id3:       return "mp3-id3";
        case AudioFormat::kMp3FrameSync: return "mp3-frame";
        case AudioFormat::kAacAdts:      return "aac-adts";
        case AudioFormat::kMp4:          return "mp4";
    }
    return "unknown";
}

std::optional<AudioFormat> DetectAudioFormat(std::span<const std::uint8_t> header) {
    // Anything shorter than a four-byte tag is never audio.
    if (header.size() < 4) return std::nullopt;
    for (const AudioFormat f : kAllFormats) {
        if (Matches(f, header)) return f;
    }
    return std::nullopt;
}

} // namespace packguard
