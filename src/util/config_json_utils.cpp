#include "packguard/config_json_utils.hpp"

#include <fstream>

namespace packguard::config::detail {

namespace {

// Each getter leaves `out` alone when the key is absent and reports a type
// mismatch through `err`.
bool GetStringIfPresent(const nlohmann::json& j, const char* key,
                        std::optional<std::string>& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!it->is_string()) {
        err = std::string(key) + " must be a string";
        return false;
    }
    out = it->get<std::string>();
    return true;
}

bool GetU64IfPresent(const nlohmann::json& j, const char* key,
                     std::optional<std::uint64_t>& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!(it->is_number_unsigned() || it->is_number_integer())) {
        err = std::string(key) + " must be a non-negative integer";
        return false;
    }
    auto v = it->get<long long>();
    if (v < 0) {
        err = std::string(key) + " must be a non-negative integer";
        return false;
    }
    out = static_cast<std::uint64_t>(v);
    return true;
}

bool GetBoolIfPresent(const nlohmann::json& j, const char* key,
                      std::optional<bool>& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!it->is_boolean()) {
        err = std::string(key) + " must be a boolean";
        return false;
    }
    out = it->get<bool>();
    return true;
}

bool GetStringArrayIfPresent(const nlohmann::json& j, const char* key,
                             std::vector<std::string>& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!it->is_array()) {
        err = std::string(key) + " must be an array of strings";
        return false;
    }
    out.clear();
    for (const auto& v : *it) {
        if (!v.is_string()) {
            err = std::string(key) + " must be an array of strings";
            return false;
        }
        out.push_back(v.get<std::string>());
    }
    return true;
}

} // namespace

bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err) {
    std::ifstream is(path);
    if (!is.good()) {
        err = "cannot open " + path;
        return false;
    }

    try {
        is >> out;
    } catch (const std::exception& e) {
        err = "invalid JSON in " + path + ": " + e.what();
        return false;
    }

    if (!out.is_object()) {
        err = "root must be JSON object: " + path;
        return false;
    }

    return true;
}

bool FillConfigFromJson(const nlohmann::json& j, PackguardConfigFromFile& cfg, std::string& err) {
    if (!GetStringIfPresent(j, "SoundsDir", cfg.sounds_dir, err))
        return false;
    if (cfg.sounds_dir && cfg.sounds_dir->empty()) {
        err = "SoundsDir must not be empty";
        return false;
    }

    if (!GetStringArrayIfPresent(j, "RegistryUrls", cfg.registry_urls, err))
        return false;

    {
        std::optional<std::string> level;
        if (!GetStringIfPresent(j, "LogLevel", level, err))
            return false;
        if (level) {
            cfg.log_level = ParseLogLevel(*level);
            if (!cfg.log_level) {
                err = "LogLevel must be one of debug, info, warn, error, none";
                return false;
            }
        }
    }

    if (!GetStringIfPresent(j, "LogFile", cfg.log_file, err))
        return false;

    if (!GetU64IfPresent(j, "ConnectTimeoutSec", cfg.connect_timeout_sec, err))
        return false;
    if (!GetU64IfPresent(j, "TransferTimeoutSec", cfg.transfer_timeout_sec, err))
        return false;
    if (!GetU64IfPresent(j, "MaxExtractedBytes", cfg.max_extracted_bytes, err))
        return false;
    if (!GetBoolIfPresent(j, "Progress", cfg.progress, err))
        return false;

    return true;
}

} // namespace packguard::config::detail
