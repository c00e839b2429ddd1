#pragma once

#include "packguard/result.hpp"

#include <string>

namespace packguard {

// Extraction-time containment check. Independent of the structural audit so
// that an archive which changed between listing and extraction still cannot
// write outside the destination.
class ArchivePathPolicy {
  public:
    Result NormalizeEntryPath(const char* raw_path, std::string& out_relative) const;

  private:
    static bool IsSafeRelativePath(const std::string& p);
};

} // namespace packguard
