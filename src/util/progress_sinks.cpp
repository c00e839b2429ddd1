#include "packguard/progress_sinks.hpp"

#include <atomic>
#include <cstdio>

namespace packguard {

namespace {
std::atomic_bool g_progress_line_active{false};
} // namespace

void ConsoleProgressSink::OnProgress(const ProgressEvent& e) {
    if (e.total == 0) {
        std::fprintf(stderr,
                     "\r[%.*s] %llu bytes",
                     (int)e.label.size(),
                     e.label.data(),
                     (unsigned long long)e.done);
        std::fflush(stderr);
        g_progress_line_active = true;
        return;
    }

    const int pct = static_cast<int>(e.Fraction() * 100.0);
    if (pct == last_pct_)
        return;
    last_pct_ = pct;

    std::fprintf(stderr, "\r[%.*s] %3d%%", (int)e.label.size(), e.label.data(), pct);
    std::fflush(stderr);
    g_progress_line_active = true;

    if (pct >= 100) {
        std::fprintf(stderr, "\n");
        g_progress_line_active = false;
    }
}

bool IsProgressLineActive() { return g_progress_line_active; }

void ClearProgressLine() {
    if (g_progress_line_active.exchange(false)) {
        std::fprintf(stderr, "\n");
    }
}

} // namespace packguard
