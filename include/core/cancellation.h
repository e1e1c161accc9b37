#pragma once

#include <atomic>
#include <csignal>

namespace mp3sanitize {

// ========== Cancellation Flag ==========
// Set once by the interrupt handler, polled by the pipeline between frame writes.
// Never reset during a run; a new run needs a new process (or a new flag in tests).

class CancellationFlag {
   public:
    CancellationFlag() = default;

    CancellationFlag(const CancellationFlag&) = delete;
    CancellationFlag& operator=(const CancellationFlag&) = delete;

    // Async-signal-safe: a single lock-free store
    void request() noexcept {
        requested_.store(true, std::memory_order_release);
    }

    bool isRequested() const noexcept {
        return requested_.load(std::memory_order_acquire);
    }

   private:
    std::atomic<bool> requested_{false};

    static_assert(std::atomic<bool>::is_always_lock_free,
                  "cancellation must be settable from a signal handler");
};

// ========== Signal Handler ==========
// Installs SIGINT/SIGTERM handlers that only call flag.request() and record the signal
// number. The flag must outlive the process run (normally a local in main()).
bool installInterruptHandler(CancellationFlag& flag);

// Restore default dispositions and detach the flag.
void removeInterruptHandler();

// Last signal number received by the handler (0 if none), for logging.
int lastInterruptSignal();

// Handler body, exposed so tests can drive it without delivering a real signal.
void interruptSignalHandler(int sig);

}  // namespace mp3sanitize
