#pragma once

#include <chrono>
#include <cstddef>
#include <mutex>
#include <string>
#include <unordered_map>

namespace core {

// Per-key throttle for repetitive log lines. Counts what it suppresses so the
// next emitted line can report how many were skipped.
class RateLogger {
public:
    bool allow(const std::string& key, std::chrono::milliseconds interval);
    std::size_t takeSuppressed(const std::string& key);
    void reset(const std::string& key);

private:
    struct Entry {
        std::chrono::steady_clock::time_point nextAllowed{};
        std::size_t suppressed = 0;
    };

    std::mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
};

}  // namespace core
