#include "packguard/archive_extractor.hpp"

#include "packguard/archive_path_policy.hpp"
#include "packguard/archive_reader_adapter.hpp"
#include "packguard/file_reader.hpp"
#include "packguard/logger.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <filesystem>
#include <memory>

namespace packguard {

namespace {

struct ArchiveWriteDeleter {
    void operator()(archive* a) const {
        if (a) archive_write_free(a);
    }
};

Result Failed(const std::string& what) {
    return Result::Fail(ErrorKind::kExtractionFailed, what);
}

} // namespace

Result ArchiveExtractor::ExtractToDir(IReader& archive_stream, const std::string& dst_dir) const {
    namespace fs = std::filesystem;

    std::error_code ec;
    const auto st = fs::symlink_status(fs::path(dst_dir), ec);
    if (ec || !fs::is_directory(st)) {
        return Failed("Destination is not a directory: " + dst_dir);
    }

    // SECURE_SYMLINKS checks every component of the absolute target, so the
    // prefix (e.g. a symlinked home or sounds dir) must already be resolved.
    const fs::path base_dir = fs::canonical(fs::path(dst_dir), ec);
    if (ec) return Failed("Cannot resolve destination " + dst_dir + ": " + ec.message());

    ArchiveReadPtr ar = NewPackArchiveReader();
    if (!ar) return Failed("archive_read_new failed");

    if (OpenArchiveFromReader(ar.get(), archive_stream) != ARCHIVE_OK) {
        return Failed("archive_read_open2: " + ArchiveErr(ar.get()));
    }

    std::unique_ptr<archive, ArchiveWriteDeleter> aw(archive_write_disk_new());
    if (!aw) return Failed("archive_write_disk_new failed");

    int flags = 0;
    flags |= ARCHIVE_EXTRACT_SECURE_NODOTDOT;
    flags |= ARCHIVE_EXTRACT_SECURE_SYMLINKS;
    // Entry paths are rewritten to absolute paths under dst_dir, so
    // NOABSOLUTEPATHS would reject every valid target. Ownership, ACLs,
    // xattrs and timestamps from the archive are never restored.

    archive_write_disk_set_options(aw.get(), flags);

    ArchivePathPolicy path_policy;
    std::uint64_t extracted = 0;

    archive_entry* entry = nullptr;

    while (true) {
        const int r = archive_read_next_header(ar.get(), &entry);
        if (r == ARCHIVE_EOF) break;
        if (r != ARCHIVE_OK) return Failed("archive_read_next_header: " + ArchiveErr(ar.get()));

        const auto type = archive_entry_filetype(entry);
        if (archive_entry_hardlink(entry) != nullptr || (type != AE_IFREG && type != AE_IFDIR)) {
            return Failed(std::string("Refusing non-regular entry: ") +
                          (archive_entry_pathname(entry) ? archive_entry_pathname(entry) : "?"));
        }

        std::string rel;
        auto path_res = path_policy.NormalizeEntryPath(archive_entry_pathname(entry), rel);
        if (!path_res.is_ok()) return path_res;

        const std::string target_path = (base_dir / fs::path(rel)).string();
        archive_entry_set_pathname(entry, target_path.c_str());
        archive_entry_set_perm(entry, type == AE_IFDIR ? 0755 : 0644);

        LogDebug("extract: %s", target_path.c_str());

        const int wh = archive_write_header(aw.get(), entry);
        if (wh != ARCHIVE_OK) return Failed("archive_write_header: " + ArchiveErr(aw.get()));

        const void* buff = nullptr;
        size_t size = 0;
        la_int64_t offset = 0;

        while (true) {
            const int rr = archive_read_data_block(ar.get(), &buff, &size, &offset);
            if (rr == ARCHIVE_EOF) break;
            if (rr != ARCHIVE_OK) return Failed("archive_read_data_block: " + ArchiveErr(ar.get()));

            extracted += static_cast<std::uint64_t>(size);
            if (opt_.max_total_bytes > 0 && extracted > opt_.max_total_bytes) {
                return Failed("Archive expands beyond " + std::to_string(opt_.max_total_bytes) + " bytes");
            }

            const la_ssize_t ww = archive_write_data_block(aw.get(), buff, size, offset);
            if (ww != ARCHIVE_OK) return Failed("archive_write_data_block: " + ArchiveErr(aw.get()));
        }

        const int wf = archive_write_finish_entry(aw.get());
        if (wf != ARCHIVE_OK) return Failed("archive_write_finish_entry: " + ArchiveErr(aw.get()));
    }

    if (archive_write_close(aw.get()) != ARCHIVE_OK) {
        return Failed("archive_write_close: " + ArchiveErr(aw.get()));
    }

    LogDebug("extracted %llu bytes into %s", (unsigned long long)extracted, dst_dir.c_str());
    return Result::Ok();
}

Result ArchiveExtractor::ExtractFileToDir(const std::string& archive_path,
                                          const std::string& dst_dir) const {
    FileReader reader;
    auto r = FileReader::Open(archive_path, reader);
    if (!r.is_ok()) return r.As(ErrorKind::kExtractionFailed);
    return ExtractToDir(reader, dst_dir);
}

} // namespace packguard
