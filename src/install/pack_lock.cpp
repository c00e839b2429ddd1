#include "packguard/pack_lock.hpp"

#include "packguard/pack_rules.hpp"
#include "packguard/signals.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <string>
#include <sys/file.h>
#include <unistd.h>

namespace packguard {

Result PackLock::Acquire(std::string_view lock_dir, std::string_view pack_id, PackLock& out) {
    out.Release();
    if (!IsValidPackId(pack_id)) {
        return Result::Fail(ErrorKind::kInvalidPackId, "invalid pack id: '" + std::string(pack_id) + "'");
    }

    const std::string path = std::string(lock_dir) + "/" + std::string(pack_id) + ".lock";
    Fd fd = Fd::Open(path, O_RDWR | O_CREAT | O_NOFOLLOW, 0600);
    if (!fd.Valid()) {
        const int e = errno;
        return Result::Fail(ErrorKind::kInstallFailed, "cannot open lock " + path + ": " + std::strerror(e), e);
    }

    while (::flock(fd.Get(), LOCK_EX) != 0) {
        const int e = errno;
        if (e == EINTR && !g_cancel.load(std::memory_order_relaxed)) continue;
        if (e == EINTR) return Result::Fail(ErrorKind::kCancelled, "cancelled while waiting for " + path, e);
        return Result::Fail(ErrorKind::kInstallFailed, "flock failed on " + path + ": " + std::strerror(e), e);
    }

    out.fd_ = std::move(fd);
    return Result::Ok();
}

void PackLock::Release() {
    if (fd_.Valid()) {
        (void)::flock(fd_.Get(), LOCK_UN);
        fd_.Close();
    }
}

} // namespace packguard
