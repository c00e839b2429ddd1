#pragma once

#include "packguard/io.hpp"
#include "packguard/result.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace packguard {

enum class EntryKind {
    kFile,
    kDirectory,
    kSymlink,
    // Hardlinks, devices, FIFOs, sockets.
    kSpecial,
};

const char* EntryKindName(EntryKind kind);

struct ArchiveEntry {
    std::string path; // as stored, '/'-separated
    EntryKind kind = EntryKind::kFile;
    std::uint64_t size = 0;
};

// Enumerates archive headers without writing anything to disk. Every failure
// is reported as ErrorKind::kArchiveUnreadable.
class ArchiveLister {
  public:
    Result List(IReader& archive_stream, std::vector<ArchiveEntry>& out) const;
    Result ListFile(const std::string& archive_path, std::vector<ArchiveEntry>& out) const;
};

} // namespace packguard
