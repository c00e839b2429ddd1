#include "packguard/structural_auditor.hpp"

#include "packguard/logger.hpp"
#include "packguard/pack_rules.hpp"
#include "packguard/path_utils.hpp"

#include <algorithm>

namespace packguard {

const char* ViolationName(Violation v) {
    switch (v) {
        case Violation::kInvalidPackId:       return "InvalidPackId";
        case Violation::kPathTraversal:       return "PathTraversal";
        case Violation::kAbsolutePath:        return "AbsolutePath";
        case Violation::kSymlinkNotAllowed:   return "SymlinkNotAllowed";
        case Violation::kSpecialEntry:        return "SpecialEntry";
        case Violation::kTooDeep:             return "TooDeep";
        case Violation::kUnexpectedRoot:      return "UnexpectedRoot";
        case Violation::kInvalidEvent:        return "InvalidEvent";
        case Violation::kDisallowedExtension: return "DisallowedExtension";
    }
    return "Unknown";
}

std::size_t ValidationReport::Count(Violation kind) const {
    return static_cast<std::size_t>(std::count_if(
        items_.begin(), items_.end(), [kind](const ViolationRecord& r) { return r.kind == kind; }));
}

void ValidationReport::Add(Violation kind, std::string path) {
    items_.push_back(ViolationRecord{kind, std::move(path)});
}

std::vector<std::string> ValidationReport::Messages() const {
    std::vector<std::string> out;
    out.reserve(items_.size());
    for (const auto& item : items_) {
        out.push_back(std::string(ViolationName(item.kind)) + ": " + item.path);
    }
    return out;
}

void StructuralAuditor::AuditEntry(const ArchiveEntry& entry,
                                   std::string_view expected_pack_id,
                                   ValidationReport& report) {
    const std::string& p = entry.path;

    if (HasParentSegment(p)) report.Add(Violation::kPathTraversal, p);
    if (IsRootedPath(p)) report.Add(Violation::kAbsolutePath, p);

    switch (entry.kind) {
        case EntryKind::kSymlink:
            report.Add(Violation::kSymlinkNotAllowed, p);
            break;
        case EntryKind::kSpecial:
            report.Add(Violation::kSpecialEntry, p);
            break;
        case EntryKind::kFile:
        case EntryKind::kDirectory:
            break;
    }

    if (CountSeparators(p) > kMaxEntryDepth) report.Add(Violation::kTooDeep, p);

    // A rooted path has an empty first segment, which never equals a valid id.
    const auto slash = p.find('/');
    const std::string_view root = std::string_view(p).substr(0, slash);
    if (root != expected_pack_id) report.Add(Violation::kUnexpectedRoot, p);

    if (entry.kind != EntryKind::kFile) return;

    const auto segments = SplitPathSegments(p);
    if (segments.size() != 3) return;

    if (!IsEventName(segments[1])) report.Add(Violation::kInvalidEvent, p);
    if (!IsAllowedExtension(LowerExtension(segments[2]))) {
        report.Add(Violation::kDisallowedExtension, p);
    }
}

ValidationReport StructuralAuditor::Audit(const std::vector<ArchiveEntry>& entries,
                                          std::string_view expected_pack_id) const {
    ValidationReport report;

    if (!IsValidPackId(expected_pack_id)) {
        report.Add(Violation::kInvalidPackId, std::string(expected_pack_id));
        return report;
    }

    for (const auto& entry : entries) {
        AuditEntry(entry, expected_pack_id, report);
    }

    if (!report.Passed()) {
        LogWarn("structural audit: %zu violation(s) in %zu entries",
                report.Items().size(), entries.size());
    }
    return report;
}

} // namespace packguard
