#pragma once

#include <atomic>

namespace uplink {

// Set by SIGINT/SIGTERM; upload sessions poll it between chunks.
extern std::atomic_bool g_cancel;

void InstallSignalHandlers();

} // namespace uplink
