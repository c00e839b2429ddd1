#pragma once

#include "packguard/logger.hpp"
#include "packguard/result.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace packguard::config {

// Values read from the JSON config file; unset keys stay empty so callers
// can layer them over defaults and command-line flags.
class PackguardConfigFromFile {
public:
    std::optional<std::string> sounds_dir;
    std::vector<std::string> registry_urls;
    std::optional<LogLevel> log_level;
    std::optional<std::string> log_file;
    std::optional<std::uint64_t> connect_timeout_sec;
    std::optional<std::uint64_t> transfer_timeout_sec;
    std::optional<std::uint64_t> max_extracted_bytes;
    std::optional<bool> progress;

    Result LoadFile(const std::string &path);

    void Reset();
};

// Effective settings after defaults and the config file are merged.
struct Settings {
    std::string sounds_dir;
    std::vector<std::string> registry_urls;
    LogLevel log_level = LogLevel::Info;
    std::string log_file; // empty => stderr
    std::uint64_t connect_timeout_sec = 30;
    std::uint64_t transfer_timeout_sec = 300;
    std::uint64_t max_extracted_bytes = 256ULL * 1024 * 1024;
    bool progress = true;
};

// $HOME/.claude/sounds
std::string DefaultSoundsDir();

// explicit_path, else $PACKGUARD_CONFIG, else $HOME/.config/packguard/config.json.
// must_exist is set when the path was named by the user.
std::string ResolveConfigPath(const std::string &explicit_path, bool &must_exist);

// Applies the file at path over the defaults. A missing file is only an error
// when must_exist is set.
Result LoadSettings(const std::string &path, bool must_exist, Settings &out);

} // namespace packguard::config
