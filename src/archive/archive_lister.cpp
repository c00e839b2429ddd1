#include "packguard/archive_lister.hpp"

#include "packguard/archive_reader_adapter.hpp"
#include "packguard/file_reader.hpp"
#include "packguard/logger.hpp"

#include <archive_entry.h>

namespace packguard {

namespace {

Result Unreadable(const std::string& what) {
    return Result::Fail(ErrorKind::kArchiveUnreadable, what);
}

EntryKind ClassifyEntry(archive_entry* entry) {
    if (archive_entry_hardlink(entry) != nullptr) return EntryKind::kSpecial;
    switch (archive_entry_filetype(entry)) {
        case AE_IFREG: return EntryKind::kFile;
        case AE_IFDIR: return EntryKind::kDirectory;
        case AE_IFLNK: return EntryKind::kSymlink;
        default:       return EntryKind::kSpecial;
    }
}

} // namespace

const char* EntryKindName(EntryKind kind) {
    switch (kind) {
        case EntryKind::kFile:      return "file";
        case EntryKind::kDirectory: return "directory";
        case EntryKind::kSymlink:   return "symlink";
        case EntryKind::kSpecial:   return "special";
    }
    return "unknown";
}

Result ArchiveLister::List(IReader& archive_stream, std::vector<ArchiveEntry>& out) const {
    out.clear();

    ArchiveReadPtr ar = NewPackArchiveReader();
    if (!ar) return Unreadable("archive_read_new failed");

    if (OpenArchiveFromReader(ar.get(), archive_stream) != ARCHIVE_OK) {
        return Unreadable("cannot open archive: " + ArchiveErr(ar.get()));
    }

    archive_entry* entry = nullptr;
    while (true) {
        const int r = archive_read_next_header(ar.get(), &entry);
        if (r == ARCHIVE_EOF) break;
        if (r != ARCHIVE_OK) return Unreadable("corrupt archive: " + ArchiveErr(ar.get()));

        if (archive_entry_is_encrypted(entry)) {
            return Unreadable("encrypted archives are not supported");
        }

        const char* name = archive_entry_pathname(entry);
        if (!name) name = archive_entry_pathname_utf8(entry);
        if (!name) return Unreadable("archive entry without a path");

        ArchiveEntry info;
        info.path = name;
        info.kind = ClassifyEntry(entry);

        // Decode the data without keeping it so unsupported compression and
        // corruption surface here, not halfway through extraction.
        std::uint64_t decoded = 0;
        const void* buff = nullptr;
        size_t size = 0;
        la_int64_t offset = 0;
        while (true) {
            const int rr = archive_read_data_block(ar.get(), &buff, &size, &offset);
            if (rr == ARCHIVE_EOF) break;
            if (rr != ARCHIVE_OK) {
                return Unreadable("cannot decode " + info.path + ": " + ArchiveErr(ar.get()));
            }
            decoded += static_cast<std::uint64_t>(size);
        }

        if (info.kind == EntryKind::kFile) {
            const la_int64_t declared = archive_entry_size_is_set(entry) ? archive_entry_size(entry) : 0;
            info.size = declared > 0 ? static_cast<std::uint64_t>(declared) : decoded;
        }
        LogDebug("list: %s [%s] %llu",
                 info.path.c_str(), EntryKindName(info.kind), (unsigned long long)info.size);
        out.push_back(std::move(info));
    }

    return Result::Ok();
}

Result ArchiveLister::ListFile(const std::string& archive_path, std::vector<ArchiveEntry>& out) const {
    FileReader reader;
    auto r = FileReader::Open(archive_path, reader);
    if (!r.is_ok()) return r.As(ErrorKind::kArchiveUnreadable);
    return List(reader, out);
}

} // namespace packguard
