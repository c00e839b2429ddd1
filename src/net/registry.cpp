#include "packguard/registry.hpp"

#include "packguard/logger.hpp"
#include "packguard/pack_rules.hpp"

#include <nlohmann/json.hpp>

#include <set>

namespace packguard {

namespace {

bool GetString(const nlohmann::json& j, const char* key, std::string& out) {
    auto it = j.find(key);
    if (it == j.end())
        return false;
    if (!it->is_string())
        return false;
    out = it->get<std::string>();
    return true;
}

bool GetU64(const nlohmann::json& j, const char* key, std::uint64_t& out) {
    auto it = j.find(key);
    if (it == j.end())
        return false;
    if (!(it->is_number_unsigned() || it->is_number_integer()))
        return false;
    const auto v = it->get<long long>();
    if (v < 0)
        return false;
    out = static_cast<std::uint64_t>(v);
    return true;
}

bool IsHexDigest(std::string_view s) {
    if (s.size() != 64) return false;
    for (char c : s) {
        const bool hex = (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
        if (!hex) return false;
    }
    return true;
}

} // namespace

const RegistryEntry* Registry::Find(std::string_view id) const {
    for (const auto& p : packs) {
        if (p.id == id) return &p;
    }
    return nullptr;
}

std::expected<Registry, std::string> ParseRegistry(std::string_view json_text) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(json_text.begin(), json_text.end());
    } catch (const std::exception& e) {
        return std::unexpected(std::string("invalid registry JSON: ") + e.what());
    }

    if (!j.is_object())
        return std::unexpected("registry root must be a JSON object");

    Registry reg;
    (void)GetString(j, "version", reg.version);

    auto packs = j.find("packs");
    if (packs == j.end() || !packs->is_array())
        return std::unexpected("registry is missing a \"packs\" array");

    for (const auto& item : *packs) {
        if (!item.is_object()) {
            LogWarn("Registry: skipping non-object pack entry");
            continue;
        }

        RegistryEntry e;
        if (!GetString(item, "id", e.id) || !IsValidPackId(e.id)) {
            LogWarn("Registry: skipping pack with invalid id");
            continue;
        }
        if (!GetString(item, "download_url", e.download_url) || e.download_url.empty()) {
            LogWarn("Registry: skipping pack %s without download_url", e.id.c_str());
            continue;
        }

        (void)GetString(item, "name", e.name);
        (void)GetString(item, "description", e.description);
        (void)GetString(item, "version", e.version);
        (void)GetString(item, "author", e.author);
        (void)GetString(item, "size", e.size);
        (void)GetU64(item, "file_count", e.file_count);
        (void)GetString(item, "preview_url", e.preview_url);

        if (GetString(item, "sha256", e.sha256) && !IsHexDigest(e.sha256)) {
            LogWarn("Registry: skipping pack %s with malformed sha256", e.id.c_str());
            continue;
        }

        if (e.name.empty()) e.name = e.id;
        reg.packs.push_back(std::move(e));
    }

    return reg;
}

Registry FetchMergedRegistry(const std::vector<std::string>& urls, const Downloader& downloader) {
    Registry merged;
    std::set<std::string> seen;
    std::size_t usable = 0;

    for (const auto& url : urls) {
        std::string body;
        auto r = downloader.FetchToString(url, body);
        if (!r.is_ok()) {
            LogWarn("Registry source skipped: %s", r.message().c_str());
            continue;
        }

        auto parsed = ParseRegistry(body);
        if (!parsed) {
            LogWarn("Registry source %s skipped: %s", url.c_str(), parsed.error().c_str());
            continue;
        }

        ++usable;
        if (merged.version.empty()) merged.version = parsed->version;
        for (auto& p : parsed->packs) {
            if (!seen.insert(p.id).second) {
                LogDebug("Registry: %s from %s shadowed by earlier source", p.id.c_str(), url.c_str());
                continue;
            }
            merged.packs.push_back(std::move(p));
        }
    }

    if (!urls.empty() && usable == 0) {
        LogWarn("No registry source could be read (%zu configured); the pack catalogue is empty",
                urls.size());
    }
    return merged;
}

} // namespace packguard
