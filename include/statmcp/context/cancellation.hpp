#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <map>
#include <mutex>

namespace statmcp {

// ─────────────────────────────────────────────────────────────────────────────
// Cancellation Token
// ─────────────────────────────────────────────────────────────────────────────
// One per in-flight request. cancel() is sticky and fires every registered
// callback exactly once, outside the lock. A callback registered after
// cancellation runs immediately.

class CancellationToken {
public:
    using Callback = std::function<void()>;
    using Registration = std::size_t;

    CancellationToken() = default;
    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    [[nodiscard]] bool is_cancelled() const noexcept {
        return cancelled_.load(std::memory_order_acquire);
    }

    /// Returns false if the token was already cancelled.
    bool cancel();

    /// Returns 0 when the callback ran immediately (already cancelled).
    Registration on_cancel(Callback callback);

    void remove(Registration registration);

private:
    std::atomic<bool> cancelled_{false};
    std::mutex mutex_;
    std::map<Registration, Callback> callbacks_;
    Registration next_{1};
};

}  // namespace statmcp
