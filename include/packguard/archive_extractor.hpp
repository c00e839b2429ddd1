#pragma once

#include "packguard/io.hpp"
#include "packguard/result.hpp"

#include <cstdint>
#include <string>

namespace packguard {

class ArchiveExtractor {
  public:
    struct Options {
        // Abort once this many bytes have been written in total (0 disables).
        std::uint64_t max_total_bytes = 256ULL * 1024 * 1024;
    };

    ArchiveExtractor() = default;
    explicit ArchiveExtractor(const Options& opt) : opt_(opt) {}

    // dst_dir must exist and be exclusively owned by the caller. Only regular
    // files and directories are written; any failure is kExtractionFailed.
    Result ExtractToDir(IReader& archive_stream, const std::string& dst_dir) const;
    Result ExtractFileToDir(const std::string& archive_path, const std::string& dst_dir) const;

  private:
    Options opt_{};
};

} // namespace packguard
