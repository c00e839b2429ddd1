#pragma once

#include "packguard/fd.hpp"
#include "packguard/io.hpp"
#include "packguard/result.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>

namespace packguard {

// Sequential reader over a regular file. Archives are read more than once
// (listing, then extraction, then hashing), so pipes and devices are refused
// at open time.
class FileReader final : public IReader {
public:
    static Result Open(std::string path, FileReader &out);

    const std::string &Path() const { return path_; }
    std::optional<std::uint64_t> TotalSize() const override;
    ssize_t Read(std::span<std::uint8_t> out) override;

private:
    std::string path_;
    Fd fd_;
    std::uint64_t size_ = 0;
};

} // namespace packguard
