#include "packguard/fd.hpp"

#include <fcntl.h>
#include <unistd.h>

namespace packguard {

Fd::Fd(int fd) : fd_(fd) {}

Fd::Fd(Fd&& other) noexcept : fd_(other.Release()) {}

Fd& Fd::operator=(Fd&& other) noexcept {
    if (this != &other) Reset(other.Release());
    return *this;
}

Fd::~Fd() { Close(); }

Fd Fd::Open(const std::string& path, int flags, mode_t mode) {
    return Fd(::open(path.c_str(), flags | O_CLOEXEC, mode));
}

Fd Fd::OpenAt(const Fd& dir, const std::string& name, int flags, mode_t mode) {
    return Fd(::openat(dir.Get(), name.c_str(), flags | O_CLOEXEC, mode));
}

int Fd::Get() const { return fd_; }

bool Fd::Valid() const { return fd_ >= 0; }

void Fd::Reset(int fd) {
    Close();
    fd_ = fd;
}

int Fd::Release() {
    const int fd = fd_;
    fd_ = -1;
    return fd;
}

void Fd::Close() {
    if (fd_ >= 0) ::close(fd_);
    fd_ = -1;
}

} // namespace packguard
