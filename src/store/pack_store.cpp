#include "packguard/pack_store.hpp"

#include "packguard/content_auditor.hpp"
#include "packguard/logger.hpp"
#include "packguard/pack_lock.hpp"
#include "packguard/pack_rules.hpp"
#include "packguard/scratch_directory.hpp"
#include "packguard/temp_file.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <dirent.h>
#include <fcntl.h>
#include <filesystem>
#include <fstream>
#include <memory>
#include <random>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace packguard {

namespace {

constexpr int kDirOpenFlags = O_RDONLY | O_DIRECTORY | O_NOFOLLOW | O_CLOEXEC;

struct DirCloser {
    void operator()(DIR* d) const {
        if (d) ::closedir(d);
    }
};
using DirPtr = std::unique_ptr<DIR, DirCloser>;

Result Errno(ErrorKind kind, const std::string& what) {
    const int e = errno;
    return Result::Fail(kind, what + ": " + std::strerror(e), e);
}

bool IsDirectoryNoFollow(const std::string& path) {
    struct stat st{};
    return ::lstat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
}

// Appends "<event>/<name>" for every allow-listed regular file in one event
// directory of the snapshot. A missing event directory contributes nothing.
Result CollectEventFiles(int pack_fd, std::string_view event, std::vector<std::string>& out) {
    const std::string ev(event);
    const int fd = ::openat(pack_fd, ev.c_str(), kDirOpenFlags);
    if (fd < 0) {
        if (errno == ENOENT || errno == ENOTDIR || errno == ELOOP) return Result::Ok();
        return Errno(ErrorKind::kIo, "cannot open event directory " + ev);
    }

    DirPtr dir(::fdopendir(fd));
    if (!dir) {
        const int e = errno;
        ::close(fd);
        return Result::Fail(ErrorKind::kIo, "fdopendir failed for " + ev, e);
    }

    while (true) {
        errno = 0;
        const dirent* de = ::readdir(dir.get());
        if (!de) {
            if (errno != 0) return Errno(ErrorKind::kIo, "readdir failed for " + ev);
            break;
        }
        const std::string name = de->d_name;
        if (name.empty() || name[0] == '.') continue;
        if (!IsAllowedExtension(LowerExtension(name))) continue;

        struct stat st{};
        if (::fstatat(::dirfd(dir.get()), name.c_str(), &st, AT_SYMLINK_NOFOLLOW) != 0) continue;
        if (!S_ISREG(st.st_mode)) continue;

        out.push_back(ev + "/" + name);
    }
    return Result::Ok();
}

} // namespace

Result PackSnapshot::Files(std::vector<std::string>& out) const {
    out.clear();
    if (!Valid()) return Result::Fail(ErrorKind::kIo, "snapshot is not open");

    for (const auto event : kEventNames) {
        auto r = CollectEventFiles(dir_.Get(), event, out);
        if (!r.is_ok()) return r;
    }
    std::sort(out.begin(), out.end());
    return Result::Ok();
}

Result PackSnapshot::ReadFile(std::string_view rel_path, std::vector<std::uint8_t>& out) const {
    out.clear();
    if (!Valid()) return Result::Fail(ErrorKind::kIo, "snapshot is not open");

    const auto slash = rel_path.find('/');
    if (slash == std::string_view::npos)
        return Result::Fail(ErrorKind::kIo, "expected <event>/<file>: " + std::string(rel_path));
    const std::string event(rel_path.substr(0, slash));
    const std::string name(rel_path.substr(slash + 1));
    if (!IsEventName(event) || !IsPlainFileName(name))
        return Result::Fail(ErrorKind::kIo, "not a sound path: " + std::string(rel_path));

    Fd event_fd = Fd::OpenAt(dir_, event, kDirOpenFlags);
    if (!event_fd.Valid()) return Errno(ErrorKind::kIo, "cannot open " + event);

    Fd file_fd = Fd::OpenAt(event_fd, name, O_RDONLY | O_NOFOLLOW | O_NONBLOCK);
    if (!file_fd.Valid()) return Errno(ErrorKind::kIo, "cannot open " + std::string(rel_path));

    struct stat st{};
    if (::fstat(file_fd.Get(), &st) != 0) return Errno(ErrorKind::kIo, "fstat failed");
    if (!S_ISREG(st.st_mode)) return Result::Fail(ErrorKind::kIo, "not a regular file: " + std::string(rel_path));
    if (static_cast<std::uint64_t>(st.st_size) > kMaxSoundFileBytes)
        return Result::Fail(ErrorKind::kIo, "file too large: " + std::string(rel_path));

    out.resize(static_cast<std::size_t>(st.st_size));
    std::size_t off = 0;
    while (off < out.size()) {
        const ssize_t n = ::read(file_fd.Get(), out.data() + off, out.size() - off);
        if (n < 0) {
            if (errno == EINTR) continue;
            return Errno(ErrorKind::kIo, "read failed: " + std::string(rel_path));
        }
        if (n == 0) break;
        off += static_cast<std::size_t>(n);
    }
    out.resize(off);
    return Result::Ok();
}

PackStore::PackStore(PackLayout layout) : layout_(std::move(layout)) {}

PackStore::PackStore(PackLayout layout, PackPublisher publisher)
    : layout_(std::move(layout)), publisher_(std::move(publisher)) {}

std::vector<std::string> PackStore::InstalledPackIds() const {
    std::vector<std::string> ids;
    std::error_code ec;
    fs::directory_iterator it(layout_.Root(), ec);
    if (ec) return ids;

    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) break;
        const std::string name = it->path().filename().string();
        if (name.empty() || name[0] == '.') continue;
        if (!IsValidPackId(name)) continue;
        std::error_code sec;
        if (!fs::is_directory(it->symlink_status(sec))) continue;
        ids.push_back(name);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

Result PackStore::RequireInstalled(std::string_view pack_id, std::string& out_live_dir) const {
    auto r = layout_.LiveDir(pack_id, out_live_dir);
    if (!r.is_ok()) return r;
    if (!IsDirectoryNoFollow(out_live_dir))
        return Result::Fail(ErrorKind::kIo, "pack not installed: " + std::string(pack_id), ENOENT);
    return Result::Ok();
}

Result PackStore::OpenSnapshot(std::string_view pack_id, PackSnapshot& out) const {
    std::string live;
    auto r = layout_.LiveDir(pack_id, live);
    if (!r.is_ok()) return r;

    Fd fd = Fd::Open(live, kDirOpenFlags);
    if (!fd.Valid()) {
        if (errno == ENOENT) return Result::Fail(ErrorKind::kIo, "pack not installed: " + std::string(pack_id), ENOENT);
        return Errno(ErrorKind::kIo, "cannot open pack " + live);
    }

    out.pack_id_ = std::string(pack_id);
    out.dir_ = std::move(fd);
    return Result::Ok();
}

Result PackStore::PickRandomSound(const PackSnapshot& snapshot, std::string& out_rel_path) const {
    std::vector<std::string> files;
    auto r = snapshot.Files(files);
    if (!r.is_ok()) return r;
    if (files.empty())
        return Result::Fail(ErrorKind::kIo, "pack has no sounds: " + snapshot.PackId());

    thread_local std::mt19937 rng{std::random_device{}()};
    std::uniform_int_distribution<std::size_t> pick(0, files.size() - 1);
    out_rel_path = files[pick(rng)];
    return Result::Ok();
}

Result PackStore::SoundFiles(std::string_view pack_id, std::string_view event,
                             std::vector<std::string>& out) const {
    out.clear();
    if (!IsEventName(event))
        return Result::Fail(ErrorKind::kIo, "unknown event: " + std::string(event));

    PackSnapshot snap;
    auto r = OpenSnapshot(pack_id, snap);
    if (!r.is_ok()) return r;

    const std::string ev(event);
    r = CollectEventFiles(snap.dir_.Get(), ev, out);
    if (!r.is_ok()) return r;
    for (auto& f : out) f.erase(0, ev.size() + 1);
    std::sort(out.begin(), out.end());
    return Result::Ok();
}

Result PackStore::CreatePack(std::string_view pack_id) const {
    std::string live;
    auto r = layout_.LiveDir(pack_id, live);
    if (!r.is_ok()) return r;
    r = layout_.EnsureCreated();
    if (!r.is_ok()) return r.As(ErrorKind::kInstallFailed);

    const std::string id(pack_id);
    ScratchDirectory scratch;
    r = ScratchDirectory::Create(layout_.StagingRoot(), id + "-", scratch);
    if (!r.is_ok()) return r.As(ErrorKind::kInstallFailed);

    const std::string staged = scratch.Path() + "/" + id;
    if (::mkdir(staged.c_str(), 0755) != 0) return Errno(ErrorKind::kInstallFailed, "mkdir " + staged);
    for (const auto event : kEventNames) {
        const std::string dir = staged + "/" + std::string(event);
        if (::mkdir(dir.c_str(), 0755) != 0) return Errno(ErrorKind::kInstallFailed, "mkdir " + dir);
    }

    PackLock lock;
    r = PackLock::Acquire(layout_.LockRoot(), pack_id, lock);
    if (!r.is_ok()) return r;

    struct stat st{};
    if (::lstat(live.c_str(), &st) == 0)
        return Result::Fail(ErrorKind::kInstallFailed, "pack already exists: " + id, EEXIST);

    r = publisher_.Publish(staged, live);
    if (!r.is_ok()) return r;
    LogInfo("Created pack %s", id.c_str());
    return Result::Ok();
}

Result PackStore::UninstallPack(std::string_view pack_id) const {
    std::string live;
    auto r = RequireInstalled(pack_id, live);
    if (!r.is_ok()) return r;
    r = layout_.EnsureCreated();
    if (!r.is_ok()) return r.As(ErrorKind::kInstallFailed);

    const std::string id(pack_id);
    PackLock lock;
    r = PackLock::Acquire(layout_.LockRoot(), pack_id, lock);
    if (!r.is_ok()) return r;

    // Move out of the live namespace first so the id disappears in one step.
    ScratchDirectory graveyard;
    r = ScratchDirectory::Create(layout_.StagingRoot(), "uninstall-" + id + "-", graveyard);
    if (!r.is_ok()) return r.As(ErrorKind::kInstallFailed);

    const std::string aside = graveyard.Path() + "/" + id;
    if (::rename(live.c_str(), aside.c_str()) != 0)
        return Errno(ErrorKind::kInstallFailed, "rename " + live + " -> " + aside);
    lock.Release();
    graveyard.Discard();

    r = ClearActiveIf(pack_id);
    if (!r.is_ok()) return r;
    LogInfo("Uninstalled pack %s", id.c_str());
    return Result::Ok();
}

std::optional<std::string> PackStore::ActivePackId() const {
    std::ifstream is(layout_.ActiveMarker());
    if (!is.good()) return std::nullopt;

    std::string id;
    std::getline(is, id);
    const auto first = id.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return std::nullopt;
    const auto last = id.find_last_not_of(" \t\r\n");
    id = id.substr(first, last - first + 1);
    if (!IsValidPackId(id)) return std::nullopt;
    return id;
}

Result PackStore::SetActivePack(std::string_view pack_id) const {
    std::string live;
    auto r = RequireInstalled(pack_id, live);
    if (!r.is_ok()) return r;

    TempFile tmp;
    r = TempFile::Create(layout_.Root(), ".active-pack-", tmp);
    if (!r.is_ok()) return r;

    const std::string line = std::string(pack_id) + "\n";
    r = WriteAllToFd(tmp.GetFd(), line.data(), line.size());
    if (!r.is_ok()) return r;
    if (::fchmod(tmp.GetFd(), 0644) != 0) return Errno(ErrorKind::kIo, "fchmod " + tmp.Path());
    if (::fsync(tmp.GetFd()) != 0) return Errno(ErrorKind::kIo, "fsync " + tmp.Path());

    if (::rename(tmp.Path().c_str(), layout_.ActiveMarker().c_str()) != 0)
        return Errno(ErrorKind::kIo, "rename " + tmp.Path());
    tmp.Keep();

    LogInfo("Active pack: %s", std::string(pack_id).c_str());
    return Result::Ok();
}

Result PackStore::EnsureActivePack(std::string& out_id) const {
    out_id.clear();
    const auto installed = InstalledPackIds();

    if (auto current = ActivePackId()) {
        if (std::find(installed.begin(), installed.end(), *current) != installed.end()) {
            out_id = *current;
            return Result::Ok();
        }
    }
    if (installed.empty()) return Result::Ok();

    auto r = SetActivePack(installed.front());
    if (!r.is_ok()) return r;
    out_id = installed.front();
    return Result::Ok();
}

Result PackStore::LockInstalled(std::string_view pack_id, PackLock& lock, std::string& live) const {
    auto r = layout_.EnsureCreated();
    if (!r.is_ok()) return r.As(ErrorKind::kIo);
    r = PackLock::Acquire(layout_.LockRoot(), pack_id, lock);
    if (!r.is_ok()) return r;
    // An uninstall may have won the lock first.
    return RequireInstalled(pack_id, live);
}

Result PackStore::ClearActiveIf(std::string_view pack_id) const {
    const auto current = ActivePackId();
    if (!current || *current != pack_id) return Result::Ok();
    if (::unlink(layout_.ActiveMarker().c_str()) != 0 && errno != ENOENT)
        return Errno(ErrorKind::kIo, "cannot remove " + layout_.ActiveMarker());
    return Result::Ok();
}

Result PackStore::AddSound(std::string_view pack_id, std::string_view event,
                           const std::string& source_path) const {
    std::string live;
    auto r = RequireInstalled(pack_id, live);
    if (!r.is_ok()) return r;
    if (!IsEventName(event))
        return Result::Fail(ErrorKind::kContentRejected, "unknown event: " + std::string(event));

    const std::string name = fs::path(source_path).filename().string();
    if (!IsPlainFileName(name))
        return Result::Fail(ErrorKind::kContentRejected, "invalid file name: " + name);

    ContentAuditor auditor;
    Fd src;
    r = auditor.AdmitSingleFile(source_path, src);
    if (!r.is_ok()) return r;

    // Held until the link so a concurrent publish cannot swap the directory
    // out from under the new file.
    PackLock lock;
    r = LockInstalled(pack_id, lock, live);
    if (!r.is_ok()) return r;

    const std::string event_dir = live + "/" + std::string(event);
    if (::mkdir(event_dir.c_str(), 0755) != 0 && errno != EEXIST)
        return Errno(ErrorKind::kIo, "mkdir " + event_dir);
    if (!IsDirectoryNoFollow(event_dir))
        return Result::Fail(ErrorKind::kIo, "not a directory: " + event_dir);

    TempFile tmp;
    r = TempFile::Create(event_dir, ".add-", tmp);
    if (!r.is_ok()) return r;

    std::vector<std::uint8_t> buf(64 * 1024);
    std::uint64_t copied = 0;
    while (true) {
        const ssize_t n = ::read(src.Get(), buf.data(), buf.size());
        if (n < 0) {
            if (errno == EINTR) continue;
            return Errno(ErrorKind::kIo, "read " + source_path);
        }
        if (n == 0) break;
        copied += static_cast<std::uint64_t>(n);
        if (copied > kMaxSoundFileBytes)
            return Result::Fail(ErrorKind::kContentRejected, "file grew past size limit: " + source_path);
        r = WriteAllToFd(tmp.GetFd(), buf.data(), static_cast<std::size_t>(n));
        if (!r.is_ok()) return r;
    }
    if (::fchmod(tmp.GetFd(), 0644) != 0) return Errno(ErrorKind::kIo, "fchmod " + tmp.Path());
    if (::fsync(tmp.GetFd()) != 0) return Errno(ErrorKind::kIo, "fsync " + tmp.Path());

    // link() refuses to replace an existing name; the temp name is dropped
    // when tmp goes out of scope.
    const std::string dest = event_dir + "/" + name;
    if (::link(tmp.Path().c_str(), dest.c_str()) != 0) {
        if (errno == EEXIST)
            return Result::Fail(ErrorKind::kIo, "sound already exists: " + dest, EEXIST);
        return Errno(ErrorKind::kIo, "link " + dest);
    }

    LogInfo("Added %s to %s/%s", name.c_str(), std::string(pack_id).c_str(), std::string(event).c_str());
    return Result::Ok();
}

Result PackStore::RemoveSound(std::string_view pack_id, std::string_view event,
                              std::string_view filename) const {
    std::string live;
    auto r = RequireInstalled(pack_id, live);
    if (!r.is_ok()) return r;
    if (!IsEventName(event))
        return Result::Fail(ErrorKind::kIo, "unknown event: " + std::string(event));
    if (!IsPlainFileName(filename))
        return Result::Fail(ErrorKind::kIo, "invalid file name: " + std::string(filename));

    PackLock lock;
    r = LockInstalled(pack_id, lock, live);
    if (!r.is_ok()) return r;

    const std::string path = live + "/" + std::string(event) + "/" + std::string(filename);
    if (::unlink(path.c_str()) != 0) return Errno(ErrorKind::kIo, "cannot remove " + path);

    LogInfo("Removed %s", path.c_str());
    return Result::Ok();
}

} // namespace packguard
