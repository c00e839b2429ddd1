#pragma once

#include "packguard/archive_lister.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace packguard {

enum class Violation {
    kInvalidPackId,
    kPathTraversal,
    kAbsolutePath,
    kSymlinkNotAllowed,
    kSpecialEntry,
    kTooDeep,
    kUnexpectedRoot,
    kInvalidEvent,
    kDisallowedExtension,
};

const char* ViolationName(Violation v);

struct ViolationRecord {
    Violation kind;
    std::string path;
};

class ValidationReport {
  public:
    bool Passed() const { return items_.empty(); }
    const std::vector<ViolationRecord>& Items() const { return items_; }
    std::size_t Count(Violation kind) const;

    void Add(Violation kind, std::string path);

    // "<Kind>: <path>", one line per violation in discovery order.
    std::vector<std::string> Messages() const;

  private:
    std::vector<ViolationRecord> items_;
};

// Pre-extraction audit of entry metadata. Every rule is applied to every
// entry; nothing short-circuits.
class StructuralAuditor {
  public:
    ValidationReport Audit(const std::vector<ArchiveEntry>& entries,
                           std::string_view expected_pack_id) const;

  private:
    static void AuditEntry(const ArchiveEntry& entry,
                           std::string_view expected_pack_id,
                           ValidationReport& report);
};

} // namespace packguard
