#include "core/cancellation.h"

#include "logging/logger.h"

#include <cerrno>
#include <cstring>
#include <signal.h>

namespace mp3sanitize {

namespace {

std::atomic<CancellationFlag*> g_flag{nullptr};
volatile sig_atomic_t g_lastSignal = 0;

static_assert(std::atomic<CancellationFlag*>::is_always_lock_free,
              "handler target must be readable from a signal handler");

}  // namespace

// Async-signal-safe signal handler - ONLY sets flags
void interruptSignalHandler(int sig) {
    g_lastSignal = sig;
    CancellationFlag* flag = g_flag.load(std::memory_order_acquire);
    if (flag != nullptr) {
        flag->request();
    }
}

bool installInterruptHandler(CancellationFlag& flag) {
    g_flag.store(&flag, std::memory_order_release);

    struct sigaction action {};
    action.sa_handler = interruptSignalHandler;
    sigemptyset(&action.sa_mask);
    action.sa_flags = SA_RESTART;  // in-flight frame writes complete; the flag is polled after

    for (int sig : {SIGINT, SIGTERM}) {
        if (sigaction(sig, &action, nullptr) != 0) {
            LOG_ERROR("Cannot install handler for signal {}: {}", sig, std::strerror(errno));
            return false;
        }
    }
    return true;
}

void removeInterruptHandler() {
    struct sigaction action {};
    action.sa_handler = SIG_DFL;
    sigemptyset(&action.sa_mask);
    for (int sig : {SIGINT, SIGTERM}) {
        if (sigaction(sig, &action, nullptr) != 0) {
            LOG_WARN("Cannot restore default handler for signal {}: {}", sig,
                     std::strerror(errno));
        }
    }
    g_flag.store(nullptr, std::memory_order_release);
}

int lastInterruptSignal() {
    return g_lastSignal;
}

}  // namespace mp3sanitize
