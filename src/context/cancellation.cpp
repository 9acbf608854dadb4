#include "statmcp/context/cancellation.hpp"

namespace statmcp {

bool CancellationToken::cancel() {
    std::map<Registration, Callback> pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (cancelled_.exchange(true, std::memory_order_acq_rel)) {
            return false;
        }
        pending.swap(callbacks_);
    }
    for (auto& [id, callback] : pending) {
        callback();
    }
    return true;
}

CancellationToken::Registration CancellationToken::on_cancel(Callback callback) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (cancelled_.load(std::memory_order_acquire) == false) {
            const Registration id = next_++;
            callbacks_.emplace(id, std::move(callback));
            return id;
        }
    }
    callback();
    return 0;
}

void CancellationToken::remove(Registration registration) {
    std::lock_guard<std::mutex> lock(mutex_);
    callbacks_.erase(registration);
}

}  // namespace statmcp
