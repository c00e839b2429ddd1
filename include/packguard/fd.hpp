#pragma once

#include <string>
#include <sys/types.h>

namespace packguard {

// Owning file descriptor. Every descriptor it opens is close-on-exec so that
// popen'd validators and curl helpers never inherit pack or lock files.
class Fd {
  public:
    Fd() = default;
    explicit Fd(int fd);

    Fd(const Fd&) = delete;
    Fd& operator=(const Fd&) = delete;

    Fd(Fd&& other) noexcept;
    Fd& operator=(Fd&& other) noexcept;

    ~Fd();

    // On failure the result is invalid and errno is left from open(2).
    static Fd Open(const std::string& path, int flags, mode_t mode = 0);
    // Opens name relative to dir, which must hold a directory descriptor.
    static Fd OpenAt(const Fd& dir, const std::string& name, int flags, mode_t mode = 0);

    int Get() const;
    bool Valid() const;

    void Reset(int fd);
    // Give up ownership without closing.
    int Release();
    void Close();

  private:
    int fd_{-1};
};

} // namespace packguard
