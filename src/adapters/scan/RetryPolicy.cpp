#include "adapters/scan/RetryPolicy.hpp"

#include <algorithm>

#include <boost/asio/error.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/http/error.hpp>

namespace adapters::scan {
namespace {

std::int64_t exponential(std::int64_t base, int exponent, std::int64_t cap) {
    std::int64_t value = std::max<std::int64_t>(base, 0);
    for (int i = 0; i < exponent && value < cap; ++i) {
        value *= 2;
    }
    return std::min(value, cap);
}

}  // namespace

RetryPolicy::RetryPolicy(RetryConfig config) : RetryPolicy(config, std::random_device{}()) {}

RetryPolicy::RetryPolicy(RetryConfig config, std::uint32_t seed) : config_(config), rng_(seed) {}

bool RetryPolicy::isRetryableStatus(unsigned status) noexcept {
    switch (status) {
    case 429U:
    case 500U:
    case 502U:
    case 503U:
    case 504U:
        return true;
    default:
        return false;
    }
}

bool RetryPolicy::isRetryableTransport(const boost::system::error_code& ec, const std::string& stage) noexcept {
    namespace error = boost::asio::error;

    if (stage == "resolve") {
        return true;
    }
    if (ec == boost::beast::error::timeout || ec == error::timed_out || ec == error::connection_reset ||
        ec == error::connection_refused || ec == error::connection_aborted || ec == error::broken_pipe ||
        ec == error::host_not_found || ec == error::host_not_found_try_again || ec == error::network_down ||
        ec == error::network_unreachable || ec == error::host_unreachable || ec == error::eof ||
        ec == error::operation_aborted || ec == boost::asio::ssl::error::stream_truncated ||
        ec == boost::beast::http::error::partial_message || ec == boost::beast::http::error::end_of_stream) {
        return true;
    }
    // A handshake or read cut short by the peer shows up as an SSL category error.
    return (stage == "handshake" || stage == "read") && ec.category() == boost::asio::error::get_ssl_category();
}

std::chrono::milliseconds RetryPolicy::baseBackoff(int attempt) const noexcept {
    return std::chrono::milliseconds(
        exponential(config_.baseDelay.count(), std::max(attempt, 0), config_.maxDelay.count()));
}

std::chrono::milliseconds RetryPolicy::backoffDelay(int attempt) {
    const auto base = baseBackoff(attempt).count();
    const auto jitter = jitter_(static_cast<std::int64_t>(static_cast<double>(base) * config_.jitterRatio));
    return std::chrono::milliseconds(base + jitter);
}

std::chrono::milliseconds RetryPolicy::cooldownDelay(int cycle) {
    const auto base = exponential(config_.cooldown.count(), std::max(cycle, 0), config_.cooldownMax.count());
    return std::chrono::milliseconds(base + jitter_(config_.cooldownJitter.count()));
}

std::int64_t RetryPolicy::jitter_(std::int64_t upperMs) {
    if (upperMs <= 0) {
        return 0;
    }
    std::lock_guard<std::mutex> lock(rngMutex_);
    std::uniform_int_distribution<std::int64_t> dist(0, upperMs);
    return dist(rng_);
}

}  // namespace adapters::scan
