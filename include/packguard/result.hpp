#pragma once
#include <string>
#include <utility>

namespace packguard {

enum class ErrorKind : int {
    kNone = 0,
    kInvalidPackId,
    kArchiveUnreadable,
    kStructuralViolation,
    kExtractionFailed,
    kContentRejected,
    kInstallFailed,
    kDownloadFailed,
    kChecksumMismatch,
    kCancelled,
    kConfig,
    kIo,
};

const char* ErrorKindName(ErrorKind kind);

struct Result {
    bool ok{true};
    ErrorKind kind{ErrorKind::kNone};
    int err{0};
    std::string msg;

    bool is_ok() const { return ok; }
    const std::string& message() const { return msg; }

    static Result Ok() { return {}; }
    static Result Fail(int e, std::string m) {
        return {.ok = false, .kind = ErrorKind::kIo, .err = e, .msg = std::move(m)};
    }
    static Result Fail(ErrorKind k, std::string m, int e = 0) {
        return {.ok = false, .kind = k, .err = e, .msg = std::move(m)};
    }

    // Re-tag a lower-level failure with the stage it surfaced in.
    Result As(ErrorKind k) const& {
        Result r = *this;
        if (!r.ok) r.kind = k;
        return r;
    }
};

} // namespace packguard
