#include "adapters/scan/ScanApiClient.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <utility>

#include <boost/json.hpp>

#include "adapters/scan/RecordDecoder.hpp"
#include "common/JsonUtils.hpp"
#include "core/Cancellation.h"
#include "core/TimeUtils.h"
#include "logging/Log.h"

namespace adapters::scan {
namespace {

constexpr auto kLogCategory = logging::LogCategory::NET;
constexpr std::size_t kMaxPageSize = 1000;
constexpr domain::MigrationId kMaxMigrationProbe = 1000;
constexpr std::size_t kMaxBodyInLog = 512;

constexpr const char* kUpdatesBeforePath = "/v0/backfilling/updates-before";
constexpr const char* kUpdatesAfterPath = "/v2/updates";
constexpr const char* kMigrationInfoPath = "/v0/backfilling/migration-info";

namespace json = ldg::common::json;

std::string truncateBody(const std::string& body) {
    if (body.size() <= kMaxBodyInLog) {
        return body;
    }
    return body.substr(0, kMaxBodyInLog) + "...";
}

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

bool looksLikeRangeError(const std::string& body) {
    const std::string lower = toLower(body);
    return lower.find("range") != std::string::npos || lower.find("outside") != std::string::npos ||
           lower.find("bound") != std::string::npos;
}

domain::FetchFailure httpFailure(const char* label, const infra::http::JsonResponse& response, int attempts) {
    domain::FetchFailure failure;
    failure.status = response.status;
    failure.body = response.body;
    failure.error = std::string{label} + " returned HTTP " + std::to_string(response.status);
    failure.attempts = attempts;
    failure.retryable = false;
    return failure;
}

std::optional<boost::json::value> parseBody(const std::string& body, std::string& error) {
    boost::system::error_code ec;
    boost::json::value parsed = boost::json::parse(body, ec);
    if (ec) {
        error = "Failed to parse response: " + ec.message();
        return std::nullopt;
    }
    return parsed;
}

const boost::json::array* transactionsOf(const boost::json::value& document) {
    if (document.is_array()) {
        return &document.as_array();
    }
    if (const auto* object = document.if_object()) {
        if (const auto* value = json::find(*object, "transactions")) {
            return value->if_array();
        }
    }
    return nullptr;
}

}  // namespace

std::optional<domain::TimestampMs> extractOutOfRangeBound(const std::string& body,
                                                          domain::TimestampMs requestedBefore) {
    std::optional<domain::TimestampMs> best;
    for (std::size_t i = 0; i + 19 <= body.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(body[i])) || body[i + 4] != '-' || body[i + 10] != 'T') {
            continue;
        }
        std::size_t end = i;
        while (end < body.size()) {
            const char ch = body[end];
            if (std::isdigit(static_cast<unsigned char>(ch)) || ch == '-' || ch == ':' || ch == '.' || ch == 'T' ||
                ch == 'Z' || ch == '+') {
                ++end;
            } else {
                break;
            }
        }
        const auto parsed = core::time::parseIso8601Ms(std::string_view{body}.substr(i, end - i));
        if (parsed && *parsed < requestedBefore && (!best || *parsed > *best)) {
            best = parsed;
        }
        i = end;
    }
    return best;
}

ScanApiClient::ScanApiClient(Options options, core::CancellationToken* cancel)
    : ScanApiClient(std::move(options), Transport{}, cancel) {}

ScanApiClient::ScanApiClient(Options options, Transport transport, core::CancellationToken* cancel)
    : options_(std::move(options)),
      endpoint_(infra::http::parseBaseUrl(options_.baseUrl)),
      transport_(std::move(transport)),
      retry_(options_.retry),
      cancel_(cancel) {
    if (!transport_) {
        transport_ = [endpoint = endpoint_, timeout = options_.timeoutSec](const std::string& path,
                                                                           const std::string& body) {
            return infra::http::https_post_json(endpoint, path, body, timeout);
        };
    }
}

bool ScanApiClient::sleep_(std::chrono::milliseconds delay) {
    if (cancel_ != nullptr) {
        return cancel_->sleepFor(delay);
    }
    std::this_thread::sleep_for(delay);
    return true;
}

std::variant<ScanApiClient::Exchange, domain::FetchFailure> ScanApiClient::post_(const char* label,
                                                                                const std::string& path,
                                                                                const boost::json::object& body) {
    const std::string payload = json::serialize_json(body);
    const auto& config = retry_.config();

    domain::FetchFailure last;
    last.retryable = true;
    int attempts = 0;

    for (int cycle = 0; cycle <= config.cooldownCycles; ++cycle) {
        if (cycle > 0) {
            const auto cooldown = retry_.cooldownDelay(cycle - 1);
            LOG_WARN(kLogCategory, "%s: retries exhausted (%s), cooling down %lld ms before cycle %d/%d", label,
                     last.error.c_str(), static_cast<long long>(cooldown.count()), cycle, config.cooldownCycles);
            if (!sleep_(cooldown)) {
                break;
            }
        }

        for (int attempt = 0; attempt <= config.maxRetries; ++attempt) {
            if (cancel_ != nullptr && cancel_->isCancelled()) {
                last.error = std::string{label} + " cancelled";
                last.attempts = attempts;
                last.retryable = false;
                return last;
            }

            ++attempts;
            try {
                auto response = transport_(path, payload);
                if (response.status >= 200U && response.status < 300U) {
                    return Exchange{std::move(response), attempts};
                }
                if (!RetryPolicy::isRetryableStatus(response.status)) {
                    return Exchange{std::move(response), attempts};
                }
                last.status = response.status;
                last.body = response.body;
                last.error = std::string{label} + " returned HTTP " + std::to_string(response.status);
            } catch (const infra::http::TransportError& ex) {
                last.status = 0;
                last.body.clear();
                last.error = ex.what();
                if (!RetryPolicy::isRetryableTransport(ex.code(), ex.stage())) {
                    last.attempts = attempts;
                    last.retryable = false;
                    return last;
                }
            } catch (const std::runtime_error& ex) {
                last.status = 0;
                last.body.clear();
                last.error = ex.what();
                last.attempts = attempts;
                last.retryable = false;
                return last;
            }

            if (attempt == config.maxRetries) {
                break;
            }
            const auto delay = retry_.backoffDelay(attempt);
            LOG_WARN(kLogCategory, "%s attempt %d/%d failed: %s; retrying in %lld ms", label, attempt + 1,
                     config.maxRetries + 1, last.error.c_str(), static_cast<long long>(delay.count()));
            if (!sleep_(delay)) {
                break;
            }
        }
    }

    last.attempts = attempts;
    if (cancel_ != nullptr && cancel_->isCancelled()) {
        last.error = std::string{label} + " cancelled after: " + last.error;
        last.retryable = false;
    }
    return last;
}

domain::FetchResult ScanApiClient::fetchUpdatesBefore(domain::MigrationId migrationId,
                                                      const std::string& synchronizerId, domain::TimestampMs before,
                                                      std::optional<domain::TimestampMs> atOrAfter,
                                                      std::size_t count) {
    boost::json::object body;
    body["migration_id"] = migrationId;
    body["synchronizer_id"] = synchronizerId;
    body["before"] = core::time::formatIso8601Ms(before);
    if (atOrAfter) {
        body["at_or_after"] = core::time::formatIso8601Ms(*atOrAfter);
    }
    body["count"] = std::clamp<std::size_t>(count, 1, kMaxPageSize);

    LOG_DEBUG(kLogCategory, "updates-before migration=%lld before=%s at_or_after=%s count=%zu",
              static_cast<long long>(migrationId), core::time::formatIso8601Ms(before).c_str(),
              atOrAfter ? core::time::formatIso8601Ms(*atOrAfter).c_str() : "-", count);

    auto outcome = post_("updates-before", kUpdatesBeforePath, body);
    if (auto* failure = std::get_if<domain::FetchFailure>(&outcome)) {
        return *failure;
    }
    auto& exchange = std::get<Exchange>(outcome);
    const auto& response = exchange.response;

    if (response.status == 400U && looksLikeRangeError(response.body)) {
        if (const auto bound = extractOutOfRangeBound(response.body, before)) {
            return domain::FetchOutOfRange{*bound, truncateBody(response.body)};
        }
    }
    if (response.status != 200U) {
        return httpFailure("updates-before", response, exchange.attempts);
    }

    std::string error;
    const auto document = parseBody(response.body, error);
    const boost::json::array* items = document ? transactionsOf(*document) : nullptr;
    if (items == nullptr) {
        domain::FetchFailure failure;
        failure.status = response.status;
        failure.body = truncateBody(response.body);
        failure.error = error.empty() ? std::string{"updates-before response has no transactions array"} : error;
        failure.attempts = exchange.attempts;
        return failure;
    }
    if (items->empty()) {
        return domain::FetchEmpty{exchange.attempts};
    }

    const RecordDecoder decoder(migrationId, synchronizerId);
    auto page = decoder.decodePage(*items);

    domain::FetchData data;
    data.rawCount = items->size();
    data.rejected = page.rejected;
    data.oldest = page.oldest;
    data.newest = page.newest;
    data.attempts = exchange.attempts;
    data.updates = std::move(page.updates);
    return data;
}

domain::FetchResult ScanApiClient::fetchUpdatesAfter(std::optional<domain::MigrationId> afterMigrationId,
                                                     const std::optional<std::string>& afterRecordTime,
                                                     std::size_t pageSize) {
    boost::json::object body;
    body["page_size"] = std::clamp<std::size_t>(pageSize, 1, kMaxPageSize);
    body["daml_value_encoding"] = "compact_json";
    if (afterMigrationId && afterRecordTime) {
        boost::json::object after;
        after["after_migration_id"] = *afterMigrationId;
        after["after_record_time"] = *afterRecordTime;
        body["after"] = std::move(after);
    }

    auto outcome = post_("updates", kUpdatesAfterPath, body);
    if (auto* failure = std::get_if<domain::FetchFailure>(&outcome)) {
        return *failure;
    }
    auto& exchange = std::get<Exchange>(outcome);
    const auto& response = exchange.response;

    if (response.status == 404U) {
        return domain::FetchEmpty{exchange.attempts};
    }
    if (response.status != 200U) {
        return httpFailure("updates", response, exchange.attempts);
    }

    std::string error;
    const auto document = parseBody(response.body, error);
    const boost::json::array* items = document ? transactionsOf(*document) : nullptr;
    if (items == nullptr) {
        domain::FetchFailure failure;
        failure.status = response.status;
        failure.body = truncateBody(response.body);
        failure.error = error.empty() ? std::string{"updates response has no transactions array"} : error;
        failure.attempts = exchange.attempts;
        return failure;
    }
    if (items->empty()) {
        return domain::FetchEmpty{exchange.attempts};
    }

    const RecordDecoder decoder(afterMigrationId);
    auto page = decoder.decodePage(*items);

    domain::FetchData data;
    data.rawCount = items->size();
    data.rejected = page.rejected;
    data.oldest = page.oldest;
    data.newest = page.newest;
    data.attempts = exchange.attempts;

    // The next marker comes from the raw last item, even when it was rejected by the decoder.
    if (const auto* last = items->back().if_object()) {
        const auto* data0 = json::find_object(*last, "transaction");
        if (data0 == nullptr) {
            data0 = json::find_object(*last, "reassignment");
        }
        const boost::json::object& source = data0 != nullptr ? *data0 : *last;
        data.lastMigrationId = json::get_int64(*last, "migration_id");
        if (!data.lastMigrationId) {
            data.lastMigrationId = json::get_int64(source, "migration_id");
        }
        data.lastRecordTime = json::get_string(source, "record_time");
        if (!data.lastRecordTime) {
            data.lastRecordTime = json::get_string(*last, "record_time");
        }
    }
    data.updates = std::move(page.updates);
    return data;
}

std::optional<domain::MigrationInfo> ScanApiClient::getMigrationInfo(domain::MigrationId migrationId) {
    boost::json::object body;
    body["migration_id"] = migrationId;

    auto outcome = post_("migration-info", kMigrationInfoPath, body);
    if (auto* failure = std::get_if<domain::FetchFailure>(&outcome)) {
        throw std::runtime_error("migration-info for migration " + std::to_string(migrationId) +
                                 " failed after " + std::to_string(failure->attempts) +
                                 " attempts: " + failure->error);
    }
    const auto& exchange = std::get<Exchange>(outcome);
    const auto& response = exchange.response;
    if (response.status == 404U) {
        return std::nullopt;
    }
    if (response.status != 200U) {
        throw std::runtime_error("migration-info for migration " + std::to_string(migrationId) + " returned HTTP " +
                                 std::to_string(response.status) + ": " + truncateBody(response.body));
    }

    std::string error;
    const auto document = parseBody(response.body, error);
    if (!document || !document->is_object()) {
        throw std::runtime_error("migration-info for migration " + std::to_string(migrationId) +
                                 " returned an invalid document: " + error);
    }

    domain::MigrationInfo info;
    info.migrationId = migrationId;
    const auto* ranges = json::find(document->as_object(), "record_time_range");
    if (ranges == nullptr || !ranges->is_array()) {
        return info;
    }
    for (const auto& entry : ranges->as_array()) {
        const auto* range = entry.if_object();
        if (range == nullptr) {
            continue;
        }
        const auto synchronizer = json::get_string(*range, "synchronizer_id");
        const auto minTime = json::get_time_ms(*range, "min");
        const auto maxTime = json::get_time_ms(*range, "max");
        if (!synchronizer || !minTime || !maxTime) {
            LOG_WARN(kLogCategory, "Ignoring incomplete record_time_range entry for migration %lld",
                     static_cast<long long>(migrationId));
            continue;
        }
        info.ranges.push_back(domain::SynchronizerRange{*synchronizer, *minTime, *maxTime});
    }
    return info;
}

std::vector<domain::MigrationId> ScanApiClient::detectMigrations() {
    std::vector<domain::MigrationId> migrations;
    for (domain::MigrationId id = 0; id < kMaxMigrationProbe; ++id) {
        if (!getMigrationInfo(id)) {
            break;
        }
        migrations.push_back(id);
    }
    LOG_INFO(kLogCategory, "Detected %zu migrations", migrations.size());
    return migrations;
}

}  // namespace adapters::scan
