#include "packguard/archive_path_policy.hpp"

#include "packguard/path_utils.hpp"

namespace packguard {

bool ArchivePathPolicy::IsSafeRelativePath(const std::string& p) {
    if (p.empty()) return false;
    if (IsRootedPath(p)) return false;
    if (p.find('\\') != std::string::npos) return false;
    if (HasParentSegment(p)) return false;
    for (const auto seg : SplitPathSegments(p)) {
        if (seg == ".") return false;
    }
    return true;
}

Result ArchivePathPolicy::NormalizeEntryPath(const char* raw_path, std::string& out_relative) const {
    out_relative = CollapseSlashes(raw_path ? std::string_view(raw_path) : std::string_view());
    if (!IsSafeRelativePath(out_relative)) {
        return Result::Fail(ErrorKind::kExtractionFailed, "Unsafe path in archive: " + out_relative);
    }
    return Result::Ok();
}

} // namespace packguard
