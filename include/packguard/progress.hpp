#pragma once
#include <cstdint>
#include <string_view>

namespace packguard {

struct ProgressEvent {
    std::string_view label;
    std::uint64_t done = 0;
    std::uint64_t total = 0; // 0 => unknown

    double Fraction() const {
        if (total == 0) return 0.0;
        const double f = static_cast<double>(done) / static_cast<double>(total);
        return f > 1.0 ? 1.0 : f;
    }
};

class IProgress {
  public:
    virtual ~IProgress() = default;
    virtual void OnProgress(const ProgressEvent& e) = 0;
};

} // namespace packguard
