#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace packguard {

inline constexpr std::array<std::string_view, 7> kEventNames = {
    "session-start",
    "prompt-submit",
    "notification",
    "stop",
    "session-end",
    "subagent-stop",
    "tool-failure",
};

inline constexpr std::array<std::string_view, 6> kAudioExtensions = {
    "wav", "mp3", "aiff", "m4a", "ogg", "aac",
};

inline constexpr std::uint64_t kMaxSoundFileBytes = 10ULL * 1024 * 1024;
inline constexpr int kMaxEntryDepth = 3;

bool IsEventName(std::string_view name);
bool IsAllowedExtension(std::string_view ext_lower);

// Lowercased text after the last '.' of the final path component, empty if none.
std::string LowerExtension(std::string_view filename);

// Pack ids are used as path components: [a-z0-9-]+, nonempty.
bool IsValidPackId(std::string_view id);

// A single path component safe to join under a trusted directory.
bool IsPlainFileName(std::string_view name);

} // namespace packguard
