#pragma once

#include <atomic>

namespace packguard {

// Set by SIGINT/SIGTERM; archive reads, downloads and lock waits poll it.
extern std::atomic_bool g_cancel;

// Handlers are installed without SA_RESTART so a blocked flock() or read()
// returns EINTR and the caller sees g_cancel.
bool InstallSignalHandlers();

// Number of the first signal that requested cancellation, 0 if none.
int CancelSignal();

// Clears the cancel state. Used between independent operations in tests.
void ResetCancel();

} // namespace packguard
