#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <random>
#include <string>

#include <boost/system/error_code.hpp>

namespace adapters::scan {

struct RetryConfig {
    int maxRetries = 6;
    std::chrono::milliseconds baseDelay{1000};
    std::chrono::milliseconds maxDelay{30000};
    std::chrono::milliseconds cooldown{10000};
    std::chrono::milliseconds cooldownMax{60000};
    int cooldownCycles = 2;
    double jitterRatio = 0.3;
    std::chrono::milliseconds cooldownJitter{5000};
};

class RetryPolicy {
public:
    explicit RetryPolicy(RetryConfig config = {});
    RetryPolicy(RetryConfig config, std::uint32_t seed);

    // 429 and the transient 5xx family.
    static bool isRetryableStatus(unsigned status) noexcept;
    // Timeouts, resets, refused or aborted connections, broken pipes, DNS failures and
    // truncated streams. stage is the TransportError stage.
    static bool isRetryableTransport(const boost::system::error_code& ec, const std::string& stage) noexcept;

    // min(maxDelay, baseDelay * 2^attempt) without jitter.
    std::chrono::milliseconds baseBackoff(int attempt) const noexcept;
    // baseBackoff plus up to jitterRatio of it.
    std::chrono::milliseconds backoffDelay(int attempt);
    // min(cooldownMax, cooldown * 2^cycle) plus up to cooldownJitter.
    std::chrono::milliseconds cooldownDelay(int cycle);

    const RetryConfig& config() const noexcept { return config_; }

private:
    std::int64_t jitter_(std::int64_t upperMs);

    RetryConfig config_;
    std::mutex rngMutex_;
    std::mt19937 rng_;
};

}  // namespace adapters::scan
