#pragma once

#include "packguard/io.hpp"

#include <archive.h>
#include <archive_entry.h>
#include <algorithm>
#include <array>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <sys/stat.h>
#include <unistd.h>
#include <utility>
#include <vector>

namespace testutil {

class TemporaryDirectory {
  public:
    TemporaryDirectory() {
        char tpl[] = "/tmp/packguard_tests_XXXXXX";
        char* p = ::mkdtemp(tpl);
        if (!p) {
            throw std::runtime_error("mkdtemp failed");
        }
        path_ = p;
    }

    ~TemporaryDirectory() {
        if (!path_.empty()) {
            std::string cmd = "rm -rf '" + path_ + "'";
            (void)::system(cmd.c_str());
        }
    }

    TemporaryDirectory(const TemporaryDirectory&) = delete;
    TemporaryDirectory& operator=(const TemporaryDirectory&) = delete;

    const std::string& Path() const { return path_; }

  private:
    std::string path_;
};

class MemoryReader final : public packguard::IReader {
  public:
    explicit MemoryReader(std::string data) : data_(data.begin(), data.end()) {}

    explicit MemoryReader(std::vector<std::uint8_t> data) : data_(std::move(data)) {}

    ssize_t Read(std::span<std::uint8_t> out) override {
        if (pos_ >= data_.size())
            return 0;
        const size_t n = std::min(out.size(), data_.size() - pos_);
        std::copy(data_.begin() + static_cast<std::ptrdiff_t>(pos_),
                  data_.begin() + static_cast<std::ptrdiff_t>(pos_ + n),
                  out.begin());
        pos_ += n;
        return static_cast<ssize_t>(n);
    }

    std::optional<std::uint64_t> TotalSize() const override {
        return static_cast<std::uint64_t>(data_.size());
    }

  private:
    std::vector<std::uint8_t> data_;
    size_t pos_ = 0;
};

struct TarEntry {
    std::string path;
    std::string contents;
    mode_t file_type = AE_IFREG;
    // AE_IFLNK: symlink target; hardlinks use archive_entry_set_hardlink.
    std::string link_target;
};

enum class ArchiveFormat { kTar, kZip };

inline std::vector<std::uint8_t> BuildArchive(const std::vector<TarEntry>& entries, ArchiveFormat format) {
    std::vector<std::uint8_t> out(4 * 1024 * 1024);
    size_t used = 0;

    archive* a = archive_write_new();
    if (!a)
        throw std::runtime_error("archive_write_new failed");
    const int fr = format == ArchiveFormat::kZip ? archive_write_set_format_zip(a)
                                                 : archive_write_set_format_pax_restricted(a);
    if (fr != ARCHIVE_OK) {
        (void)archive_write_free(a);
        throw std::runtime_error("archive_write_set_format failed");
    }
    if (archive_write_open_memory(a, out.data(), out.size(), &used) != ARCHIVE_OK) {
        (void)archive_write_free(a);
        throw std::runtime_error("archive_write_open_memory failed");
    }

    for (const auto& entry : entries) {
        archive_entry* hdr = archive_entry_new();
        if (!hdr) {
            (void)archive_write_free(a);
            throw std::runtime_error("archive_entry_new failed");
        }
        archive_entry_set_pathname(hdr, entry.path.c_str());
        archive_entry_set_filetype(hdr, entry.file_type);
        archive_entry_set_perm(hdr, entry.file_type == AE_IFDIR ? 0755 : 0644);
        if (entry.file_type == AE_IFLNK) {
            archive_entry_set_symlink(hdr, entry.link_target.c_str());
            archive_entry_set_size(hdr, 0);
        } else if (!entry.link_target.empty()) {
            archive_entry_set_hardlink(hdr, entry.link_target.c_str());
            archive_entry_set_size(hdr, 0);
        } else {
            archive_entry_set_size(hdr, static_cast<la_int64_t>(entry.contents.size()));
        }
        if (archive_write_header(a, hdr) != ARCHIVE_OK) {
            archive_entry_free(hdr);
            (void)archive_write_free(a);
            throw std::runtime_error("archive_write_header failed");
        }
        if (entry.file_type == AE_IFREG && entry.link_target.empty() && !entry.contents.empty()) {
            if (archive_write_data(a, entry.contents.data(), entry.contents.size()) < 0) {
                archive_entry_free(hdr);
                (void)archive_write_free(a);
                throw std::runtime_error("archive_write_data failed");
            }
        }
        archive_entry_free(hdr);
    }

    if (archive_write_close(a) != ARCHIVE_OK) {
        (void)archive_write_free(a);
        throw std::runtime_error("archive_write_close failed");
    }
    if (archive_write_free(a) != ARCHIVE_OK) {
        throw std::runtime_error("archive_write_free failed");
    }
    out.resize(used);
    return out;
}

inline std::vector<std::uint8_t> BuildTar(const std::vector<TarEntry>& entries) {
    return BuildArchive(entries, ArchiveFormat::kTar);
}

inline std::vector<std::uint8_t> BuildZip(const std::vector<TarEntry>& entries) {
    return BuildArchive(entries, ArchiveFormat::kZip);
}

inline TarEntry File(std::string path, std::string contents) {
    return TarEntry{std::move(path), std::move(contents), AE_IFREG, {}};
}

inline TarEntry Dir(std::string path) {
    return TarEntry{std::move(path), {}, AE_IFDIR, {}};
}

inline TarEntry Symlink(std::string path, std::string target) {
    return TarEntry{std::move(path), {}, AE_IFLNK, std::move(target)};
}

// Minimal RIFF/WAVE header padded with silence to `total` bytes.
inline std::string WavBytes(size_t total = 1024) {
    std::string s = "RIFF";
    s.append("\x24\x00\x00\x00", 4);
    s += "WAVEfmt ";
    if (s.size() < total) s.append(total - s.size(), '\0');
    return s;
}

inline std::string OggBytes(size_t total = 256) {
    std::string s = "OggS";
    if (s.size() < total) s.append(total - s.size(), '\0');
    return s;
}

inline std::string Mp3Id3Bytes(size_t total = 256) {
    std::string s = "ID3";
    s.push_back('\x04');
    if (s.size() < total) s.append(total - s.size(), '\0');
    return s;
}

inline void WriteFile(const std::string& path, const std::string& contents) {
    std::ofstream os(path, std::ios::binary | std::ios::trunc);
    if (!os.good())
        throw std::runtime_error("cannot write " + path);
    os.write(contents.data(), static_cast<std::streamsize>(contents.size()));
}

inline void WriteFile(const std::string& path, const std::vector<std::uint8_t>& contents) {
    WriteFile(path, std::string(contents.begin(), contents.end()));
}

inline std::string ReadFileText(const std::string& path) {
    std::ifstream is(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(is), std::istreambuf_iterator<char>());
}

inline void MakeDirs(const std::string& path) {
    std::string cmd = "mkdir -p '" + path + "'";
    if (::system(cmd.c_str()) != 0)
        throw std::runtime_error("mkdir -p failed: " + path);
}

inline bool Exists(const std::string& path) {
    struct stat st{};
    return ::lstat(path.c_str(), &st) == 0;
}

inline std::string ReadAll(packguard::IReader& reader) {
    std::string out;
    std::array<std::uint8_t, 1024> buf{};
    while (true) {
        const ssize_t n = reader.Read(std::span<std::uint8_t>(buf.data(), buf.size()));
        if (n == 0)
            break;
        if (n < 0)
            return {};
        out.append(reinterpret_cast<const char*>(buf.data()), static_cast<size_t>(n));
    }
    return out;
}

} // namespace testutil
