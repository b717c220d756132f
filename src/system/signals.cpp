// signals.cpp - Signal handling and shared cancel flag.

#include "system/signals.hpp"

#include "util/logger.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>

namespace uplink {

std::atomic_bool g_cancel{false};

static void HandleSignal(int) {
    g_cancel.store(true, std::memory_order_relaxed);
}

void InstallSignalHandlers() {
    struct sigaction sa {};
    sa.sa_handler = HandleSignal;
    sigemptyset(&sa.sa_mask);
    // No SA_RESTART: a blocked read or sleep should return early.
    sa.sa_flags = 0;
    for (int sig : {SIGINT, SIGTERM}) {
        if (sigaction(sig, &sa, nullptr) != 0) {
            LogWarn("sigaction(%d) failed: %s; Ctrl-C will not cancel cleanly", sig, std::strerror(errno));
        }
    }
}

} // namespace uplink
