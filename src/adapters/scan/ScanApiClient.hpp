#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <boost/json/object.hpp>

#include "adapters/scan/RetryPolicy.hpp"
#include "domain/ILedgerSource.hpp"
#include "infra/http/TlsHttpClient.hpp"

namespace core {
class CancellationToken;
}

namespace adapters::scan {

// Valid bound named by a "requested time outside the migration range" 400 body: the newest
// ISO-8601 timestamp in the text that lies below requestedBefore.
std::optional<domain::TimestampMs> extractOutOfRangeBound(const std::string& body,
                                                          domain::TimestampMs requestedBefore);

class ScanApiClient : public domain::ILedgerSource {
public:
    // POSTs body to basePath + path. Replaced in tests.
    using Transport = std::function<infra::http::JsonResponse(const std::string& path, const std::string& body)>;

    struct Options {
        std::string baseUrl;
        int timeoutSec = 30;
        RetryConfig retry;
    };

    explicit ScanApiClient(Options options, core::CancellationToken* cancel = nullptr);
    ScanApiClient(Options options, Transport transport, core::CancellationToken* cancel = nullptr);

    domain::FetchResult fetchUpdatesBefore(domain::MigrationId migrationId, const std::string& synchronizerId,
                                           domain::TimestampMs before, std::optional<domain::TimestampMs> atOrAfter,
                                           std::size_t count) override;

    domain::FetchResult fetchUpdatesAfter(std::optional<domain::MigrationId> afterMigrationId,
                                          const std::optional<std::string>& afterRecordTime,
                                          std::size_t pageSize) override;

    // Throws std::runtime_error when the lookup fails for any reason other than 404.
    std::optional<domain::MigrationInfo> getMigrationInfo(domain::MigrationId migrationId) override;

    std::vector<domain::MigrationId> detectMigrations() override;

private:
    struct Exchange {
        infra::http::JsonResponse response;
        int attempts{0};
    };

    // Returns the response once it is 2xx or a non-retryable status; FetchFailure after
    // the retry and cooldown cycles are exhausted, on a permanent transport error, or on cancellation.
    std::variant<Exchange, domain::FetchFailure> post_(const char* label, const std::string& path,
                                                      const boost::json::object& body);
    bool sleep_(std::chrono::milliseconds delay);

    Options options_;
    infra::http::Endpoint endpoint_;
    Transport transport_;
    RetryPolicy retry_;
    core::CancellationToken* cancel_;
};

}  // namespace adapters::scan
