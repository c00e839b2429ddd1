// signals.cpp - Cancellation flag driven by SIGINT/SIGTERM.

#include "packguard/signals.hpp"

#include "packguard/logger.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>

namespace packguard {

std::atomic_bool g_cancel{false};

namespace {

std::atomic_int g_cancel_signal{0};

void HandleSignal(int sig) {
    int none = 0;
    g_cancel_signal.compare_exchange_strong(none, sig, std::memory_order_relaxed);
    g_cancel.store(true, std::memory_order_relaxed);
}

} // namespace

bool InstallSignalHandlers() {
    struct sigaction sa {};
    sa.sa_handler = HandleSignal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;

    for (int sig : {SIGINT, SIGTERM}) {
        if (::sigaction(sig, &sa, nullptr) != 0) {
            LogWarn("sigaction(%s) failed: %s", strsignal(sig), std::strerror(errno));
            return false;
        }
    }
    return true;
}

int CancelSignal() { return g_cancel_signal.load(std::memory_order_relaxed); }

void ResetCancel() {
    g_cancel_signal.store(0, std::memory_order_relaxed);
    g_cancel.store(false, std::memory_order_relaxed);
}

} // namespace packguard
