#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace core {

// Shared stop flag. Waits routed through sleepFor() wake up as soon as a stop is requested.
class CancellationToken {
public:
    void requestCancel();
    bool isCancelled() const noexcept { return cancelled_.load(std::memory_order_acquire); }

    // Returns false when the wait was cut short by cancellation.
    bool sleepFor(std::chrono::milliseconds duration);

private:
    std::atomic<bool> cancelled_{false};
    std::mutex mutex_;
    std::condition_variable cv_;
};

}  // namespace core
