#include "packguard/config.hpp"

#include "packguard/config_json_utils.hpp"

#include <cstdlib>
#include <filesystem>
#include <system_error>

namespace packguard::config {

namespace {

std::string HomeDir() {
    const char* home = std::getenv("HOME");
    return (home && *home) ? std::string(home) : std::string(".");
}

} // namespace

void PackguardConfigFromFile::Reset() {
    sounds_dir.reset();
    registry_urls.clear();
    log_level.reset();
    log_file.reset();
    connect_timeout_sec.reset();
    transfer_timeout_sec.reset();
    max_extracted_bytes.reset();
    progress.reset();
}

Result PackguardConfigFromFile::LoadFile(const std::string &path) {
    Reset();

    nlohmann::json json;
    std::string err;
    if (!detail::LoadJsonObjectFromFile(path, json, err)) {
        return Result::Fail(ErrorKind::kConfig, "Config: " + err);
    }

    if (!detail::FillConfigFromJson(json, *this, err)) {
        Reset();
        return Result::Fail(ErrorKind::kConfig, "Config: " + err + " in " + path);
    }

    return Result::Ok();
}

std::string DefaultSoundsDir() { return HomeDir() + "/.claude/sounds"; }

std::string ResolveConfigPath(const std::string &explicit_path, bool &must_exist) {
    if (!explicit_path.empty()) {
        must_exist = true;
        return explicit_path;
    }
    const char* env = std::getenv("PACKGUARD_CONFIG");
    if (env && *env) {
        must_exist = true;
        return env;
    }
    must_exist = false;
    return HomeDir() + "/.config/packguard/config.json";
}

Result LoadSettings(const std::string &path, bool must_exist, Settings &out) {
    out = Settings{};
    out.sounds_dir = DefaultSoundsDir();

    std::error_code ec;
    if (!must_exist && !std::filesystem::exists(path, ec)) {
        return Result::Ok();
    }

    PackguardConfigFromFile cfg;
    auto r = cfg.LoadFile(path);
    if (!r.is_ok()) return r;

    if (cfg.sounds_dir) out.sounds_dir = *cfg.sounds_dir;
    out.registry_urls = cfg.registry_urls;
    if (cfg.log_level) out.log_level = *cfg.log_level;
    if (cfg.log_file) out.log_file = *cfg.log_file;
    if (cfg.connect_timeout_sec) out.connect_timeout_sec = *cfg.connect_timeout_sec;
    if (cfg.transfer_timeout_sec) out.transfer_timeout_sec = *cfg.transfer_timeout_sec;
    if (cfg.max_extracted_bytes) out.max_extracted_bytes = *cfg.max_extracted_bytes;
    if (cfg.progress) out.progress = *cfg.progress;
    return Result::Ok();
}

} // namespace packguard::config
