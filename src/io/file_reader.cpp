#include "packguard/file_reader.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace packguard {

Result FileReader::Open(std::string path, FileReader& out) {
    if (path.empty()) return Result::Fail(ENOENT, "empty input path");

    Fd fd = Fd::Open(path, O_RDONLY | O_NONBLOCK);
    if (!fd.Valid()) {
        const int e = errno;
        return Result::Fail(e, "Failed to open input: " + path + " (" + std::strerror(e) + ")");
    }

    struct stat st{};
    if (::fstat(fd.Get(), &st) != 0) {
        const int e = errno;
        return Result::Fail(e, "fstat failed: " + path + " (" + std::strerror(e) + ")");
    }
    if (!S_ISREG(st.st_mode)) {
        const int e = S_ISDIR(st.st_mode) ? EISDIR : EINVAL;
        return Result::Fail(e, "Not a regular file: " + path);
    }

    // O_NONBLOCK only guarded the open against fifos.
    const int flags = ::fcntl(fd.Get(), F_GETFL);
    if (flags >= 0) (void)::fcntl(fd.Get(), F_SETFL, flags & ~O_NONBLOCK);

    out.path_ = std::move(path);
    out.fd_ = std::move(fd);
    out.size_ = static_cast<std::uint64_t>(st.st_size);
    return Result::Ok();
}

std::optional<std::uint64_t> FileReader::TotalSize() const { return size_; }

ssize_t FileReader::Read(std::span<std::uint8_t> out) {
    while (true) {
        ssize_t n = ::read(fd_.Get(), out.data(), out.size());
        if (n >= 0) {
            return n;
        }
        if (errno == EINTR) {
            continue;
        }
        return -1;
    }
}

} // namespace packguard
