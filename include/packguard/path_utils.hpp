#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace packguard {

// Non-empty '/'-separated segments of an archive path.
inline std::vector<std::string_view> SplitPathSegments(std::string_view p) {
    std::vector<std::string_view> out;
    while (!p.empty()) {
        const auto pos = p.find('/');
        const auto seg = p.substr(0, pos);
        if (!seg.empty()) out.push_back(seg);
        if (pos == std::string_view::npos) break;
        p.remove_prefix(pos + 1);
    }
    return out;
}

// True if any '/' or '\' separated segment is "..".
inline bool HasParentSegment(std::string_view p) {
    while (true) {
        const auto pos = p.find_first_of("/\\");
        if (p.substr(0, pos) == "..") return true;
        if (pos == std::string_view::npos) return false;
        p.remove_prefix(pos + 1);
    }
}

// Rooted on POSIX ("/x"), Windows ("\x") or a drive letter ("C:...").
inline bool IsRootedPath(std::string_view p) {
    if (p.empty()) return false;
    if (p.front() == '/' || p.front() == '\\') return true;
    const unsigned char c = static_cast<unsigned char>(p.front());
    const bool alpha = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
    return p.size() >= 2 && alpha && p[1] == ':';
}

inline int CountSeparators(std::string_view p) {
    int n = 0;
    for (char c : p) {
        if (c == '/') ++n;
    }
    return n;
}

// Collapse duplicate slashes and drop a trailing one; never strips a root.
inline std::string CollapseSlashes(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    bool prev_slash = false;
    for (char c : s) {
        const bool slash = (c == '/');
        if (slash && prev_slash) continue;
        out.push_back(c);
        prev_slash = slash;
    }
    if (out.size() > 1 && out.back() == '/') out.pop_back();
    return out;
}

} // namespace packguard
