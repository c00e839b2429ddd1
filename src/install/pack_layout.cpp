#include "packguard/pack_layout.hpp"

#include "packguard/pack_rules.hpp"

#include <filesystem>

namespace fs = std::filesystem;

namespace packguard {

Result PackLayout::LiveDir(std::string_view pack_id, std::string& out) const {
    if (!IsValidPackId(pack_id)) {
        return Result::Fail(ErrorKind::kInvalidPackId, "invalid pack id: '" + std::string(pack_id) + "'");
    }
    out = root_ + "/" + std::string(pack_id);
    return Result::Ok();
}

Result PackLayout::EnsureCreated() const {
    if (root_.empty()) return Result::Fail(ErrorKind::kConfig, "sounds directory is empty");
    for (const auto& dir : {root_, StagingRoot(), LockRoot()}) {
        std::error_code ec;
        fs::create_directories(dir, ec);
        if (ec) {
            return Result::Fail(ErrorKind::kIo, "create_directories failed: " + dir + ": " + ec.message(), ec.value());
        }
    }
    return Result::Ok();
}

} // namespace packguard
