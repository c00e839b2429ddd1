#pragma once

#include "packguard/audio_signature.hpp"
#include "packguard/fd.hpp"
#include "packguard/pack_rules.hpp"
#include "packguard/result.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace packguard {

enum class ContentReason {
    kSymlink,
    kUnknownEventDirectory,
    kMisplacedFile,
    kDisallowedExtension,
    kTooLarge,
    kBadSignature,
    kNotRegularFile,
    kUnreadable,
};

const char* ContentReasonName(ContentReason r);

struct ContentFinding {
    std::string path; // relative to the audited pack directory
    ContentReason reason;
};

// Post-extraction audit of a pack directory laid out as <event>/<file>.
// Symlinks are judged by their own attributes and never followed or read.
class ContentAuditor {
  public:
    struct Options {
        std::uint64_t max_file_bytes = kMaxSoundFileBytes;
    };

    ContentAuditor() = default;
    explicit ContentAuditor(const Options& opt) : opt_(opt) {}

    // Read-only: reports every entry Sanitize would remove, in walk order.
    Result Audit(const std::string& pack_dir, std::vector<ContentFinding>& out) const;

    // Removes every finding (children before parents), then prunes
    // directories left empty. out_removed counts the findings removed.
    Result Sanitize(const std::string& pack_dir, std::size_t& out_removed) const;

    // Leaf checks for a file whose destination is chosen by a trusted caller:
    // extension, not a symlink, size limit, signature. On success out_fd is
    // open on the checked file, positioned at offset 0.
    Result AdmitSingleFile(const std::string& path, Fd& out_fd) const;

  private:
    std::optional<ContentReason> InspectOpenFile(int fd, AudioFormat* detected = nullptr) const;
    std::optional<ContentReason> InspectFile(const std::string& path) const;
    static Result PruneEmptyDirectories(const std::string& pack_dir, std::size_t& out_pruned);

    Options opt_{};
};

} // namespace packguard
