#include "packguard/temp_file.hpp"

#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>
#include <vector>

namespace packguard {

Result TempFile::Create(std::string_view dir, std::string_view prefix, TempFile& out) {
    std::string tmpl(dir);
    tmpl += '/';
    tmpl += prefix;
    tmpl += "XXXXXX";

    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');

    const int fd = ::mkostemp(buf.data(), O_CLOEXEC);
    if (fd < 0)
        return Result::Fail(errno, "mkostemp failed in " + std::string(dir) + ": " + std::strerror(errno));

    TempFile tmp;
    tmp.fd_.Reset(fd);
    tmp.path_ = buf.data();
    out = std::move(tmp);
    return Result::Ok();
}

TempFile::TempFile() = default;
TempFile::TempFile(TempFile&& other) noexcept { *this = std::move(other); }
TempFile& TempFile::operator=(TempFile&& other) noexcept {
    if (this != &other) {
        Cleanup();
        fd_ = std::move(other.fd_);
        path_ = std::move(other.path_);
        other.path_.clear();
    }
    return *this;
}
TempFile::~TempFile() { Cleanup(); }

int TempFile::GetFd() const { return fd_.Get(); }
const std::string& TempFile::Path() const { return path_; }

void TempFile::Close() { fd_.Close(); }

void TempFile::Keep() {
    Close();
    path_.clear();
}

void TempFile::Cleanup() {
    Close();
    if (!path_.empty()) {
        ::unlink(path_.c_str());
        path_.clear();
    }
}

Result WriteAllToFd(int fd, const void* data, std::size_t len) {
    const auto* p = static_cast<const std::uint8_t*>(data);
    size_t off = 0;
    while (off < len) {
        const ssize_t n = ::write(fd, p + off, len - off);
        if (n < 0) {
            if (errno == EINTR) continue;
            return Result::Fail(errno, std::string("write failed: ") + std::strerror(errno));
        }
        off += static_cast<size_t>(n);
    }
    return Result::Ok();
}

} // namespace packguard
