#pragma once

#include "packguard/progress.hpp"

#include <string>

namespace packguard {

class ConsoleProgressSink final : public IProgress {
public:
    ConsoleProgressSink() = default;

    void OnProgress(const ProgressEvent& e) override;

private:
    int last_pct_ = -1;
};

bool IsProgressLineActive();
void ClearProgressLine();

} // namespace packguard
