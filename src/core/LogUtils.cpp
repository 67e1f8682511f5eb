#include "core/LogUtils.h"

namespace core {

bool RateLogger::allow(const std::string& key, std::chrono::milliseconds interval) {
    const auto now = std::chrono::steady_clock::now();
    std::scoped_lock lk(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        entries_[key].nextAllowed = now + interval;
        return true;
    }
    if (now >= it->second.nextAllowed) {
        it->second.nextAllowed = now + interval;
        return true;
    }
    ++it->second.suppressed;
    return false;
}

std::size_t RateLogger::takeSuppressed(const std::string& key) {
    std::scoped_lock lk(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return 0;
    }
    const auto count = it->second.suppressed;
    it->second.suppressed = 0;
    return count;
}

void RateLogger::reset(const std::string& key) {
    std::scoped_lock lk(mutex_);
    entries_.erase(key);
}

}  // namespace core
