#include "core/Cancellation.h"

namespace core {

void CancellationToken::requestCancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_.store(true, std::memory_order_release);
    }
    cv_.notify_all();
}

bool CancellationToken::sleepFor(std::chrono::milliseconds duration) {
    if (duration.count() <= 0) {
        return !isCancelled();
    }
    std::unique_lock<std::mutex> lock(mutex_);
    return !cv_.wait_for(lock, duration, [this] { return cancelled_.load(std::memory_order_acquire); });
}

}  // namespace core
