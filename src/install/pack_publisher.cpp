#include "packguard/pack_publisher.hpp"

#include "packguard/logger.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>

namespace packguard {

namespace {

Result RenameError(const char* op, const std::string& from, const std::string& to, int e) {
    return Result::Fail(ErrorKind::kInstallFailed,
                        std::string(op) + " " + from + " -> " + to + ": " + std::strerror(e), e);
}

bool ExchangeUnsupported(int e) {
    return e == EINVAL || e == ENOSYS || e == EOPNOTSUPP;
}

class PosixSystemOps final : public PackPublisher::ISystemOps {
  public:
    bool Exists(const std::string& path) const override {
        struct stat st{};
        return ::lstat(path.c_str(), &st) == 0;
    }

    Result Exchange(const std::string& a, const std::string& b) const override {
        if (::renameat2(AT_FDCWD, a.c_str(), AT_FDCWD, b.c_str(), RENAME_EXCHANGE) != 0) {
            return RenameError("exchange", a, b, errno);
        }
        return Result::Ok();
    }

    Result RenameNoReplace(const std::string& from, const std::string& to) const override {
        if (::renameat2(AT_FDCWD, from.c_str(), AT_FDCWD, to.c_str(), RENAME_NOREPLACE) != 0) {
            return RenameError("rename", from, to, errno);
        }
        return Result::Ok();
    }

    Result Rename(const std::string& from, const std::string& to) const override {
        if (::rename(from.c_str(), to.c_str()) != 0) {
            return RenameError("rename", from, to, errno);
        }
        return Result::Ok();
    }
};

} // namespace

std::shared_ptr<const PackPublisher::ISystemOps> PackPublisher::DefaultSystemOps() {
    static const std::shared_ptr<const ISystemOps> kDefault = std::make_shared<PosixSystemOps>();
    return kDefault;
}

PackPublisher::PackPublisher() : system_ops_(DefaultSystemOps()) {}

PackPublisher::PackPublisher(std::shared_ptr<const ISystemOps> system_ops)
    : system_ops_(system_ops ? std::move(system_ops) : DefaultSystemOps()) {}

Result PackPublisher::ReplaceInTwoSteps(const std::string& staged_dir, const std::string& live_dir) const {
    // Readers may briefly see no pack, but never a mix of versions.
    const std::string aside = staged_dir + ".prev";

    auto r = system_ops_->RenameNoReplace(live_dir, aside);
    if (!r.is_ok() && ExchangeUnsupported(r.err)) {
        // No renameat2 flags here; aside is private to the scratch directory.
        if (system_ops_->Exists(aside)) {
            return Result::Fail(ErrorKind::kInstallFailed, "aside path already exists: " + aside, EEXIST);
        }
        r = system_ops_->Rename(live_dir, aside);
    }
    if (!r.is_ok()) return r;

    auto in = system_ops_->Rename(staged_dir, live_dir);
    if (!in.is_ok()) {
        auto restore = system_ops_->Rename(aside, live_dir);
        if (!restore.is_ok()) {
            LogError("cannot restore %s from %s: %s", live_dir.c_str(), aside.c_str(), restore.msg.c_str());
        }
        return in;
    }

    // Leave the previous version where the caller discards staged content.
    auto back = system_ops_->Rename(aside, staged_dir);
    if (!back.is_ok()) {
        LogWarn("previous version left at %s: %s", aside.c_str(), back.msg.c_str());
    }
    return Result::Ok();
}

Result PackPublisher::Publish(const std::string& staged_dir, const std::string& live_dir) const {
    if (!system_ops_->Exists(staged_dir)) {
        return Result::Fail(ErrorKind::kInstallFailed, "staged directory missing: " + staged_dir);
    }

    if (!system_ops_->Exists(live_dir)) {
        auto r = system_ops_->RenameNoReplace(staged_dir, live_dir);
        if (r.is_ok()) {
            LogInfo("published %s", live_dir.c_str());
            return r;
        }
        if (r.err != EEXIST && !ExchangeUnsupported(r.err)) return r;
        if (r.err != EEXIST) {
            auto plain = system_ops_->Rename(staged_dir, live_dir);
            if (plain.is_ok()) LogInfo("published %s", live_dir.c_str());
            return plain;
        }
        // Appeared since the check; fall through to replacement.
    }

    auto ex = system_ops_->Exchange(staged_dir, live_dir);
    if (ex.is_ok()) {
        LogInfo("replaced %s", live_dir.c_str());
        return ex;
    }
    if (!ExchangeUnsupported(ex.err)) return ex;

    LogDebug("atomic exchange unsupported for %s, renaming aside", live_dir.c_str());
    auto r = ReplaceInTwoSteps(staged_dir, live_dir);
    if (r.is_ok()) LogInfo("replaced %s", live_dir.c_str());
    return r;
}

} // namespace packguard
