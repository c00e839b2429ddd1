#include "packguard/pack_rules.hpp"

#include <algorithm>
#include <cctype>

namespace packguard {

bool IsEventName(std::string_view name) {
    return std::find(kEventNames.begin(), kEventNames.end(), name) != kEventNames.end();
}

bool IsAllowedExtension(std::string_view ext_lower) {
    return std::find(kAudioExtensions.begin(), kAudioExtensions.end(), ext_lower) !=
           kAudioExtensions.end();
}

std::string LowerExtension(std::string_view filename) {
    const auto slash = filename.find_last_of('/');
    if (slash != std::string_view::npos) filename.remove_prefix(slash + 1);

    const auto dot = filename.find_last_of('.');
    // A leading dot marks a hidden name, not an extension.
    if (dot == std::string_view::npos || dot == 0 || dot + 1 >= filename.size()) return {};

    std::string ext(filename.substr(dot + 1));
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return ext;
}

bool IsValidPackId(std::string_view id) {
    if (id.empty()) return false;
    return std::all_of(id.begin(), id.end(), [](char c) {
        return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-';
    });
}

bool IsPlainFileName(std::string_view name) {
    if (name.empty() || name == "." || name == "..") return false;
    return name.find('/') == std::string_view::npos && name.find('\0') == std::string_view::npos;
}

} // namespace packguard
