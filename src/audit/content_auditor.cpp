#include "packguard/content_auditor.hpp"

#include "packguard/audio_signature.hpp"
#include "packguard/logger.hpp"

#include <array>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace packguard {

namespace {

// O_NOFOLLOW refuses a final-component symlink; O_NONBLOCK keeps a FIFO
// swapped in after the walk from blocking the open.
constexpr int kOpenFlags = O_RDONLY | O_NOFOLLOW | O_NONBLOCK;

ssize_t ReadFull(int fd, std::uint8_t* buf, size_t len) {
    size_t off = 0;
    while (off < len) {
        const ssize_t n = ::read(fd, buf + off, len - off);
        if (n < 0) {
            if (errno == EINTR) continue;
            return -1;
        }
        if (n == 0) break;
        off += static_cast<size_t>(n);
    }
    return static_cast<ssize_t>(off);
}

Result AuditError(const std::string& what, const std::error_code& ec) {
    return Result::Fail(ErrorKind::kIo, what + ": " + ec.message(), ec.value());
}

} // namespace

const char* ContentReasonName(ContentReason r) {
    switch (r) {
        case ContentReason::kSymlink:               return "Symlink";
        case ContentReason::kUnknownEventDirectory: return "UnknownEventDirectory";
        case ContentReason::kMisplacedFile:         return "MisplacedFile";
        case ContentReason::kDisallowedExtension:   return "DisallowedExtension";
        case ContentReason::kTooLarge:              return "TooLarge";
        case ContentReason::kBadSignature:          return "BadSignature";
        case ContentReason::kNotRegularFile:        return "NotRegularFile";
        case ContentReason::kUnreadable:            return "Unreadable";
    }
    return "Unknown";
}

std::optional<ContentReason> ContentAuditor::InspectOpenFile(int fd, AudioFormat* detected) const {
    struct stat st{};
    if (::fstat(fd, &st) != 0) return ContentReason::kUnreadable;
    if (!S_ISREG(st.st_mode)) return ContentReason::kNotRegularFile;
    if (static_cast<std::uint64_t>(st.st_size) > opt_.max_file_bytes) return ContentReason::kTooLarge;

    std::array<std::uint8_t, kSignatureHeaderBytes> header{};
    const ssize_t n = ReadFull(fd, header.data(), header.size());
    if (n < 0) return ContentReason::kUnreadable;

    const auto format = DetectAudioFormat(std::span<const std::uint8_t>(header.data(), static_cast<size_t>(n)));
    if (!format) return ContentReason::kBadSignature;
    if (detected) *detected = *format;
    return std::nullopt;
}

std::optional<ContentReason> ContentAuditor::InspectFile(const std::string& path) const {
    Fd fd = Fd::Open(path, kOpenFlags);
    if (!fd.Valid()) {
        return errno == ELOOP ? ContentReason::kSymlink : ContentReason::kUnreadable;
    }
    return InspectOpenFile(fd.Get());
}

Result ContentAuditor::Audit(const std::string& pack_dir, std::vector<ContentFinding>& out) const {
    out.clear();

    const fs::path root(pack_dir);
    std::error_code ec;
    const auto root_status = fs::symlink_status(root, ec);
    if (ec) return AuditError("cannot stat " + pack_dir, ec);
    if (!fs::is_directory(root_status)) {
        return Result::Fail(ErrorKind::kIo, "not a directory: " + pack_dir);
    }

    fs::recursive_directory_iterator it(root, fs::directory_options::none, ec);
    if (ec) return AuditError("cannot walk " + pack_dir, ec);

    auto mark = [&](const fs::path& p, ContentReason reason) {
        out.push_back(ContentFinding{p.lexically_relative(root).generic_string(), reason});
    };

    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) return AuditError("walk failed in " + pack_dir, ec);

        const fs::path& p = it->path();
        const int components = it.depth() + 1;

        const auto st = it->symlink_status(ec);
        if (ec) return AuditError("cannot stat " + p.string(), ec);

        switch (st.type()) {
            case fs::file_type::symlink:
                mark(p, ContentReason::kSymlink);
                continue;

            case fs::file_type::directory:
                if (components == 1 && !IsEventName(p.filename().string())) {
                    mark(p, ContentReason::kUnknownEventDirectory);
                    it.disable_recursion_pending();
                }
                continue;

            case fs::file_type::regular:
                break;

            default:
                mark(p, ContentReason::kNotRegularFile);
                continue;
        }

        if (components != 2) {
            mark(p, ContentReason::kMisplacedFile);
            continue;
        }
        if (!IsEventName(p.parent_path().filename().string())) {
            mark(p, ContentReason::kUnknownEventDirectory);
            continue;
        }
        if (!IsAllowedExtension(LowerExtension(p.filename().string()))) {
            mark(p, ContentReason::kDisallowedExtension);
            continue;
        }
        if (const auto reason = InspectFile(p.string())) {
            mark(p, *reason);
        }
    }
    if (ec) return AuditError("walk failed in " + pack_dir, ec);

    return Result::Ok();
}

Result ContentAuditor::PruneEmptyDirectories(const std::string& pack_dir, std::size_t& out_pruned) {
    out_pruned = 0;
    std::error_code ec;
    std::vector<fs::path> dirs;

    fs::recursive_directory_iterator it(pack_dir, fs::directory_options::none, ec);
    if (ec) return AuditError("cannot walk " + pack_dir, ec);
    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) return AuditError("walk failed in " + pack_dir, ec);
        if (it->is_directory(ec) && !it->is_symlink(ec)) dirs.push_back(it->path());
    }
    if (ec) return AuditError("walk failed in " + pack_dir, ec);

    // Pre-order walk: reversing it visits children before their parents.
    for (auto d = dirs.rbegin(); d != dirs.rend(); ++d) {
        if (!fs::is_empty(*d, ec) || ec) continue;
        if (!fs::remove(*d, ec) || ec) {
            return AuditError("cannot remove empty directory " + d->string(), ec);
        }
        ++out_pruned;
    }
    return Result::Ok();
}

Result ContentAuditor::Sanitize(const std::string& pack_dir, std::size_t& out_removed) const {
    out_removed = 0;

    std::vector<ContentFinding> findings;
    auto audit = Audit(pack_dir, findings);
    if (!audit.is_ok()) return audit;

    const fs::path root(pack_dir);
    std::error_code ec;
    for (auto f = findings.rbegin(); f != findings.rend(); ++f) {
        LogInfo("sanitize: removing %s (%s)", f->path.c_str(), ContentReasonName(f->reason));
        // remove_all never follows symlinks; it deletes the link itself.
        fs::remove_all(root / f->path, ec);
        if (ec) return AuditError("cannot remove " + f->path, ec);
        ++out_removed;
    }

    std::size_t pruned = 0;
    auto prune = PruneEmptyDirectories(pack_dir, pruned);
    if (!prune.is_ok()) return prune;

    if (out_removed > 0 || pruned > 0) {
        LogInfo("sanitize: %zu entr%s removed, %zu empty director%s pruned in %s",
                out_removed, out_removed == 1 ? "y" : "ies",
                pruned, pruned == 1 ? "y" : "ies", pack_dir.c_str());
    }
    return Result::Ok();
}

Result ContentAuditor::AdmitSingleFile(const std::string& path, Fd& out_fd) const {
    const std::string name = fs::path(path).filename().string();
    if (!IsAllowedExtension(LowerExtension(name))) {
        return Result::Fail(ErrorKind::kContentRejected, "extension not allowed: " + name);
    }

    Fd fd = Fd::Open(path, kOpenFlags);
    if (!fd.Valid()) {
        const int e = errno;
        if (e == ELOOP) return Result::Fail(ErrorKind::kContentRejected, "symlinks are not accepted: " + path, e);
        return Result::Fail(ErrorKind::kContentRejected,
                            "cannot open " + path + ": " + std::strerror(e), e);
    }

    AudioFormat format{};
    if (const auto reason = InspectOpenFile(fd.Get(), &format)) {
        return Result::Fail(ErrorKind::kContentRejected,
                            std::string(ContentReasonName(*reason)) + ": " + path);
    }
    LogDebug("admitted %s as %s", path.c_str(), AudioFormatName(format));

    if (::lseek(fd.Get(), 0, SEEK_SET) != 0) {
        return Result::Fail(ErrorKind::kIo, "lseek failed: " + path, errno);
    }
    // Clear O_NONBLOCK for the caller's plain reads.
    const int fl = ::fcntl(fd.Get(), F_GETFL);
    if (fl >= 0) (void)::fcntl(fd.Get(), F_SETFL, fl & ~O_NONBLOCK);

    out_fd = std::move(fd);
    return Result::Ok();
}

} // namespace packguard
