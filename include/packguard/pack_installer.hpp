#pragma once

#include "packguard/content_auditor.hpp"
#include "packguard/downloader.hpp"
#include "packguard/pack_layout.hpp"
#include "packguard/pack_publisher.hpp"
#include "packguard/progress.hpp"
#include "packguard/result.hpp"
#include "packguard/structural_auditor.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace packguard {

// Result of a dry run through both audit phases.
struct ValidationOutcome {
    // Set when the archive could not be listed or extracted.
    Result archive;
    ValidationReport structural;
    std::vector<ContentFinding> content;
    bool content_checked = false;

    bool Passed() const { return archive.is_ok() && structural.Passed() && content.empty(); }

    // One line per problem in the order found.
    std::vector<std::string> Messages() const;
};

// Runs both audit phases without installing. Extraction for the content
// phase happens under scratch_parent and is always discarded.
class PackValidator {
  public:
    struct Options {
        std::uint64_t max_extracted_bytes = 256ULL * 1024 * 1024;
    };

    PackValidator() = default;
    explicit PackValidator(const Options& opt) : opt_(opt) {}

    ValidationOutcome Validate(const std::string& archive_path,
                               std::string_view pack_id,
                               const std::string& scratch_parent) const;

  private:
    Options opt_{};
};

// List -> structural audit -> extract -> sanitize -> publish, for a local
// archive or one fetched from a URL. The live directory changes only at the
// final publish; everything before it happens in a private scratch directory.
class PackInstaller {
  public:
    struct Options {
        std::uint64_t max_extracted_bytes = 256ULL * 1024 * 1024;
        DownloadOptions download{};
    };

    explicit PackInstaller(PackLayout layout);
    PackInstaller(PackLayout layout, const Options& opt);
    PackInstaller(PackLayout layout, const Options& opt, PackPublisher publisher);

    void SetProgressSink(IProgress* sink) { progress_sink_ = sink; }

    // report_out, when given, receives the structural findings.
    Result InstallFromFile(const std::string& archive_path,
                           std::string_view pack_id,
                           ValidationReport* report_out = nullptr) const;

    // expected_sha256 may be empty to skip verification.
    Result InstallFromUrl(const std::string& url,
                          std::string_view pack_id,
                          const std::string& expected_sha256,
                          ValidationReport* report_out = nullptr) const;

  private:
    Result InstallArchive(const std::string& archive_path,
                          std::string_view pack_id,
                          const std::string& live_dir,
                          ValidationReport* report_out) const;

    PackLayout layout_;
    Options opt_{};
    PackPublisher publisher_;
    IProgress* progress_sink_ = nullptr;
};

} // namespace packguard
