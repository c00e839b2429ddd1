#pragma once

#include "packguard/downloader.hpp"

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace packguard {

struct RegistryEntry {
    std::string id;
    std::string name;
    std::string description;
    std::string version;
    std::string author;
    std::string download_url;
    std::string size;
    std::uint64_t file_count = 0;
    std::string preview_url;
    std::string sha256; // empty when the catalogue does not pin one
};

struct Registry {
    std::string version;
    std::vector<RegistryEntry> packs;

    const RegistryEntry* Find(std::string_view id) const;
};

// Entries with an invalid id or no download_url are skipped with a warning.
std::expected<Registry, std::string> ParseRegistry(std::string_view json_text);

// Downloads every catalogue and merges them; the first occurrence of an id
// wins. Unreachable or malformed sources are logged and skipped.
Registry FetchMergedRegistry(const std::vector<std::string>& urls, const Downloader& downloader);

} // namespace packguard
