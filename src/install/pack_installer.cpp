#include "packguard/pack_installer.hpp"

#include "packguard/archive_extractor.hpp"
#include "packguard/archive_lister.hpp"
#include "packguard/logger.hpp"
#include "packguard/pack_lock.hpp"
#include "packguard/scratch_directory.hpp"
#include "packguard/sha256.hpp"
#include "packguard/temp_file.hpp"

#include <sys/stat.h>

namespace packguard {

namespace {

// The extracted tree must contain the pack directory itself, as a real
// directory and not something the archive planted in its place.
Result CheckExtractedPackDir(const std::string& staged_dir) {
    struct stat st{};
    if (::lstat(staged_dir.c_str(), &st) != 0) {
        return Result::Fail(ErrorKind::kExtractionFailed,
                            "archive did not produce a pack directory: " + staged_dir);
    }
    if (!S_ISDIR(st.st_mode)) {
        return Result::Fail(ErrorKind::kExtractionFailed,
                            "pack directory is not a directory: " + staged_dir);
    }
    return Result::Ok();
}

std::string StructuralSummary(const ValidationReport& report) {
    std::string msg = "archive failed structural audit (" + std::to_string(report.Items().size()) +
                      " violation" + (report.Items().size() == 1 ? "" : "s") + ")";
    const auto lines = report.Messages();
    if (!lines.empty()) msg += ": " + lines.front();
    return msg;
}

} // namespace

std::vector<std::string> ValidationOutcome::Messages() const {
    std::vector<std::string> out;
    if (!archive.is_ok()) {
        out.push_back(std::string(ErrorKindName(archive.kind)) + ": " + archive.message());
    }
    for (auto& line : structural.Messages()) out.push_back(std::move(line));
    for (const auto& f : content) {
        out.push_back(std::string(ContentReasonName(f.reason)) + ": " + f.path);
    }
    return out;
}

ValidationOutcome PackValidator::Validate(const std::string& archive_path,
                                          std::string_view pack_id,
                                          const std::string& scratch_parent) const {
    ValidationOutcome out;

    std::vector<ArchiveEntry> entries;
    if (IsValidPackId(pack_id)) {
        ArchiveLister lister;
        auto lr = lister.ListFile(archive_path, entries);
        if (!lr.is_ok()) {
            out.archive = lr;
            return out;
        }
    }

    StructuralAuditor auditor;
    out.structural = auditor.Audit(entries, pack_id);
    if (!out.structural.Passed()) return out;

    ScratchDirectory scratch;
    auto sr = ScratchDirectory::Create(scratch_parent, "validate-", scratch);
    if (!sr.is_ok()) {
        out.archive = sr.As(ErrorKind::kExtractionFailed);
        return out;
    }

    ArchiveExtractor::Options eopt;
    eopt.max_total_bytes = opt_.max_extracted_bytes;
    ArchiveExtractor extractor(eopt);
    auto er = extractor.ExtractFileToDir(archive_path, scratch.Path());
    if (!er.is_ok()) {
        out.archive = er;
        return out;
    }

    const std::string pack_dir = scratch.Path() + "/" + std::string(pack_id);
    auto cr = CheckExtractedPackDir(pack_dir);
    if (!cr.is_ok()) {
        out.archive = cr;
        return out;
    }

    ContentAuditor content;
    std::vector<ContentFinding> findings;
    auto ar = content.Audit(pack_dir, findings);
    if (!ar.is_ok()) {
        out.archive = ar;
        return out;
    }
    out.content_checked = true;
    for (auto& f : findings) {
        f.path = std::string(pack_id) + "/" + f.path;
        out.content.push_back(std::move(f));
    }
    return out;
}

PackInstaller::PackInstaller(PackLayout layout) : PackInstaller(std::move(layout), Options{}) {}

PackInstaller::PackInstaller(PackLayout layout, const Options& opt)
    : layout_(std::move(layout)), opt_(opt) {}

PackInstaller::PackInstaller(PackLayout layout, const Options& opt, PackPublisher publisher)
    : layout_(std::move(layout)), opt_(opt), publisher_(std::move(publisher)) {}

Result PackInstaller::InstallFromFile(const std::string& archive_path,
                                      std::string_view pack_id,
                                      ValidationReport* report_out) const {
    std::string live_dir;
    auto r = layout_.LiveDir(pack_id, live_dir);
    if (!r.is_ok()) return r;

    r = layout_.EnsureCreated();
    if (!r.is_ok()) return r.As(ErrorKind::kInstallFailed);

    return InstallArchive(archive_path, pack_id, live_dir, report_out);
}

Result PackInstaller::InstallFromUrl(const std::string& url,
                                     std::string_view pack_id,
                                     const std::string& expected_sha256,
                                     ValidationReport* report_out) const {
    std::string live_dir;
    auto r = layout_.LiveDir(pack_id, live_dir);
    if (!r.is_ok()) return r;

    r = layout_.EnsureCreated();
    if (!r.is_ok()) return r.As(ErrorKind::kInstallFailed);

    LogInfo("Downloading pack %.*s from %s",
            static_cast<int>(pack_id.size()), pack_id.data(), url.c_str());

    Downloader downloader(opt_.download);
    TempFile archive;
    r = downloader.Fetch(url, layout_.StagingRoot(), progress_sink_, archive);
    if (!r.is_ok()) return r;
    archive.Close();

    if (!expected_sha256.empty()) {
        r = VerifySha256File(archive.Path(), expected_sha256);
        if (!r.is_ok()) return r;
        LogDebug("Checksum verified for %s", url.c_str());
    }

    return InstallArchive(archive.Path(), pack_id, live_dir, report_out);
}

Result PackInstaller::InstallArchive(const std::string& archive_path,
                                     std::string_view pack_id,
                                     const std::string& live_dir,
                                     ValidationReport* report_out) const {
    const std::string id(pack_id);

    std::vector<ArchiveEntry> entries;
    ArchiveLister lister;
    auto r = lister.ListFile(archive_path, entries);
    if (!r.is_ok()) return r;
    LogDebug("Listed %zu entries from %s", entries.size(), archive_path.c_str());

    StructuralAuditor auditor;
    ValidationReport report = auditor.Audit(entries, pack_id);
    if (report_out) *report_out = report;
    if (!report.Passed()) {
        for (const auto& line : report.Messages()) LogDebug("Structural: %s", line.c_str());
        return Result::Fail(ErrorKind::kStructuralViolation, StructuralSummary(report));
    }

    ScratchDirectory scratch;
    r = ScratchDirectory::Create(layout_.StagingRoot(), id + "-", scratch);
    if (!r.is_ok()) return r.As(ErrorKind::kExtractionFailed);

    ArchiveExtractor::Options eopt;
    eopt.max_total_bytes = opt_.max_extracted_bytes;
    ArchiveExtractor extractor(eopt);
    r = extractor.ExtractFileToDir(archive_path, scratch.Path());
    if (!r.is_ok()) return r;

    const std::string staged_dir = scratch.Path() + "/" + id;
    r = CheckExtractedPackDir(staged_dir);
    if (!r.is_ok()) return r;

    ContentAuditor content;
    std::size_t removed = 0;
    r = content.Sanitize(staged_dir, removed);
    if (!r.is_ok()) return r.As(ErrorKind::kExtractionFailed);

    PackLock lock;
    r = PackLock::Acquire(layout_.LockRoot(), pack_id, lock);
    if (!r.is_ok()) return r.kind == ErrorKind::kCancelled ? r : r.As(ErrorKind::kInstallFailed);

    r = publisher_.Publish(staged_dir, live_dir);
    if (!r.is_ok()) return r;

    LogInfo("Installed pack %s", id.c_str());
    return Result::Ok();
}

} // namespace packguard
