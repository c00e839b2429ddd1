#include "packguard/scratch_directory.hpp"

#include "packguard/logger.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;

namespace packguard {

Result ScratchDirectory::Create(std::string_view parent_dir, std::string_view prefix, ScratchDirectory& out) {
    out.Discard();

    const fs::path base = parent_dir.empty() ? fs::temp_directory_path() : fs::path(parent_dir);
    std::error_code ec;
    fs::create_directories(base, ec);
    if (ec) {
        return Result::Fail(ErrorKind::kIo, "create_directories failed: " + base.string() + ": " + ec.message(),
                            ec.value());
    }

    std::string tmpl = (base / (std::string(prefix) + "XXXXXX")).string();
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');

    // mkdtemp creates the directory 0700, exclusive to this process.
    char* created = ::mkdtemp(buf.data());
    if (!created) {
        const int e = errno;
        return Result::Fail(ErrorKind::kIo, "mkdtemp failed: " + std::string(std::strerror(e)), e);
    }

    out.path_ = created;
    return Result::Ok();
}

ScratchDirectory::ScratchDirectory() = default;

ScratchDirectory::ScratchDirectory(ScratchDirectory&& other) noexcept : path_(std::move(other.path_)) {
    other.path_.clear();
}

ScratchDirectory& ScratchDirectory::operator=(ScratchDirectory&& other) noexcept {
    if (this != &other) {
        Discard();
        path_ = std::move(other.path_);
        other.path_.clear();
    }
    return *this;
}

ScratchDirectory::~ScratchDirectory() { Discard(); }

void ScratchDirectory::Discard() {
    if (path_.empty()) return;
    std::error_code ec;
    fs::remove_all(path_, ec);
    if (ec) {
        LogWarn("cannot remove scratch directory %s: %s", path_.c_str(), ec.message().c_str());
    }
    path_.clear();
}

} // namespace packguard
