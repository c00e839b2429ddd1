#pragma once

#include "packguard/result.hpp"

#include <string>
#include <string_view>

namespace packguard {

// Uniquely named directory owned by one operation; removed with everything
// under it when the owner goes out of scope.
class ScratchDirectory {
public:
    static Result Create(std::string_view parent_dir, std::string_view prefix, ScratchDirectory& out);

    ScratchDirectory();
    ScratchDirectory(const ScratchDirectory&) = delete;
    ScratchDirectory& operator=(const ScratchDirectory&) = delete;
    ScratchDirectory(ScratchDirectory&& other) noexcept;
    ScratchDirectory& operator=(ScratchDirectory&& other) noexcept;
    ~ScratchDirectory();

    const std::string& Path() const { return path_; }
    bool Valid() const { return !path_.empty(); }

    // Remove now instead of at destruction.
    void Discard();

private:
    std::string path_;
};

} // namespace packguard
