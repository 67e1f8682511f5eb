#include <chrono>
#include <iostream>

#include <boost/asio/error.hpp>
#include <boost/system/error_code.hpp>

#include "adapters/scan/RetryPolicy.hpp"

using adapters::scan::RetryConfig;
using adapters::scan::RetryPolicy;
using std::chrono::milliseconds;

int main() {
    for (unsigned status : {429U, 500U, 502U, 503U, 504U}) {
        if (!RetryPolicy::isRetryableStatus(status)) {
            std::cerr << "HTTP " << status << " should be retried\n";
            return 1;
        }
    }
    for (unsigned status : {200U, 400U, 401U, 404U, 501U}) {
        if (RetryPolicy::isRetryableStatus(status)) {
            std::cerr << "HTTP " << status << " must not be retried\n";
            return 1;
        }
    }

    const boost::system::error_code reset = boost::asio::error::connection_reset;
    const boost::system::error_code refused = boost::asio::error::connection_refused;
    const boost::system::error_code denied = boost::asio::error::access_denied;
    if (!RetryPolicy::isRetryableTransport(reset, "read") || !RetryPolicy::isRetryableTransport(refused, "connect") ||
        !RetryPolicy::isRetryableTransport(denied, "resolve")) {
        std::cerr << "Transient transport failures should be retried\n";
        return 1;
    }
    if (RetryPolicy::isRetryableTransport(denied, "connect")) {
        std::cerr << "Permission errors are permanent\n";
        return 1;
    }

    RetryConfig config;
    config.baseDelay = milliseconds(1000);
    config.maxDelay = milliseconds(30000);
    config.jitterRatio = 0.3;
    config.cooldown = milliseconds(10000);
    config.cooldownMax = milliseconds(60000);
    config.cooldownJitter = milliseconds(5000);
    RetryPolicy policy(config, 42U);

    const milliseconds expected[] = {milliseconds(1000), milliseconds(2000), milliseconds(4000),
                                     milliseconds(8000), milliseconds(16000), milliseconds(30000),
                                     milliseconds(30000)};
    for (int attempt = 0; attempt < 7; ++attempt) {
        if (policy.baseBackoff(attempt) != expected[attempt]) {
            std::cerr << "Backoff for attempt " << attempt << " is " << policy.baseBackoff(attempt).count()
                      << " ms\n";
            return 1;
        }
        for (int sample = 0; sample < 20; ++sample) {
            const auto delay = policy.backoffDelay(attempt);
            if (delay < expected[attempt] || delay > expected[attempt] + expected[attempt] * 3 / 10) {
                std::cerr << "Jittered delay " << delay.count() << " ms outside its band\n";
                return 1;
            }
        }
    }

    for (int cycle = 0; cycle < 5; ++cycle) {
        const auto delay = policy.cooldownDelay(cycle);
        const auto base = cycle == 0 ? milliseconds(10000) : cycle == 1 ? milliseconds(20000)
                                   : cycle == 2 ? milliseconds(40000) : milliseconds(60000);
        if (delay < base || delay > base + milliseconds(5000)) {
            std::cerr << "Cooldown " << cycle << " is " << delay.count() << " ms\n";
            return 1;
        }
    }

    return 0;
}
