#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>

namespace packguard {

enum class AudioFormat {
    kWav,
    kAiff,
    kOgg,
    kMp3Id3,
    kMp3FrameSync,
    kAacAdts,
    kMp4,
};

inline constexpr std::size_t kSignatureHeaderBytes = 12;

const char* AudioFormatName(AudioFormat f);

// Returns the first format whose leading-byte rule matches, if any.
std::optional<AudioFormat> DetectAudioFormat(std::span<const std::uint8_t> header);

inline bool HasAudioSignature(std::span<const std::uint8_t> header) {
    return DetectAudioFormat(header).has_value();
}

} // namespace packguard
