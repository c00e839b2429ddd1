#pragma once

#include "packguard/fd.hpp"
#include "packguard/result.hpp"

#include <cstddef>
#include <string>
#include <string_view>

namespace packguard {

// Exclusively created file, unlinked on destruction unless Keep() was called.
class TempFile {
public:
    static Result Create(std::string_view dir, std::string_view prefix, TempFile& out);

    TempFile();
    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;
    TempFile(TempFile&& other) noexcept;
    TempFile& operator=(TempFile&& other) noexcept;
    ~TempFile();

    int GetFd() const;
    const std::string& Path() const;
    void Close();

    // The path is now owned by someone else (renamed or linked away).
    void Keep();

private:
    void Cleanup();

    Fd fd_;
    std::string path_;
};

Result WriteAllToFd(int fd, const void* data, std::size_t len);

} // namespace packguard
