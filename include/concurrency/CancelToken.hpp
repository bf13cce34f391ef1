#pragma once

#include <atomic>
#include <chrono>

namespace hs::concurrency {

// Run-scoped cancellation flag. cancel() only touches a lock-free atomic,
// so it may be called from a signal handler.
class CancelToken {
public:
    CancelToken() = default;
    CancelToken(const CancelToken&) = delete;
    CancelToken& operator=(const CancelToken&) = delete;

    void cancel() noexcept { cancelled_.store(true, std::memory_order_relaxed); }
    [[nodiscard]] bool isCancelled() const noexcept { return cancelled_.load(std::memory_order_relaxed); }

    // Sleeps for d unless cancelled first. Returns false if cancelled.
    [[nodiscard]] bool waitFor(std::chrono::milliseconds d) const;

    // Throws sync::CancelledError once cancelled.
    void throwIfCancelled() const;

private:
    static constexpr std::chrono::milliseconds POLL_INTERVAL{20};

    std::atomic<bool> cancelled_{false};
    static_assert(std::atomic<bool>::is_always_lock_free);
};

}
