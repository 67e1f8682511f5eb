#include <chrono>
#include <iostream>
#include <string>
#include <vector>

#include <boost/asio/error.hpp>
#include <boost/json.hpp>

#include "adapters/scan/ScanApiClient.hpp"
#include "TestSupport.hpp"

using adapters::scan::ScanApiClient;
using infra::http::JsonResponse;

namespace {

struct Call {
    std::string path;
    std::string body;
};

ScanApiClient::Options fastOptions() {
    ScanApiClient::Options options;
    options.baseUrl = "https://scan.example.org/api/scan";
    options.retry.maxRetries = 2;
    options.retry.baseDelay = std::chrono::milliseconds(0);
    options.retry.maxDelay = std::chrono::milliseconds(0);
    options.retry.cooldown = std::chrono::milliseconds(0);
    options.retry.cooldownMax = std::chrono::milliseconds(0);
    options.retry.cooldownJitter = std::chrono::milliseconds(0);
    options.retry.cooldownCycles = 1;
    return options;
}

JsonResponse respond(unsigned status, std::string body) {
    JsonResponse response;
    response.status = status;
    response.body = std::move(body);
    return response;
}

bool dataPageIsDecoded() {
    std::vector<Call> calls;
    ScanApiClient client(fastOptions(), [&](const std::string& path, const std::string& body) {
        calls.push_back({path, body});
        return respond(200, R"({"transactions": [
            {"update_id": "u2", "migration_id": 1, "record_time": "2024-06-03T10:00:02Z", "events_by_id": {}},
            {"update_id": "u1", "migration_id": 1, "record_time": "2024-06-03T10:00:01Z", "events_by_id": {}}
        ]})");
    });

    const auto before = ldg::testing::isoMs("2024-06-03T11:00:00Z");
    const auto result = client.fetchUpdatesBefore(1, "sync-1", before, before - 3600000, 5000);
    const auto* data = std::get_if<domain::FetchData>(&result);
    if (data == nullptr || data->rawCount != 2 || data->updates.size() != 2 ||
        data->oldest.value_or(0) != ldg::testing::isoMs("2024-06-03T10:00:01Z")) {
        std::cerr << "Expected a two-record page\n";
        return false;
    }
    if (calls.size() != 1 || calls[0].path != "/v0/backfilling/updates-before") {
        std::cerr << "Unexpected request path\n";
        return false;
    }
    const auto request = boost::json::parse(calls[0].body).as_object();
    if (request.at("count").to_number<std::int64_t>() != 1000 || request.at("before").as_string() != "2024-06-03T11:00:00.000Z" ||
        request.at("at_or_after").as_string() != "2024-06-03T10:00:00.000Z" ||
        request.at("synchronizer_id").as_string() != "sync-1") {
        std::cerr << "Unexpected request body " << calls[0].body << "\n";
        return false;
    }
    return true;
}

bool emptyPageIsEmpty() {
    ScanApiClient client(fastOptions(), [](const std::string&, const std::string&) {
        return respond(200, R"({"transactions": []})");
    });
    const auto result = client.fetchUpdatesBefore(1, "sync-1", 5000, std::nullopt, 10);
    if (!std::holds_alternative<domain::FetchEmpty>(result)) {
        std::cerr << "An empty transactions array is FetchEmpty\n";
        return false;
    }
    return true;
}

bool outOfRangeReportsBound() {
    const auto requested = ldg::testing::isoMs("2024-06-03T00:00:00Z");
    ScanApiClient client(fastOptions(), [](const std::string&, const std::string&) {
        return respond(400, R"({"error": "Requested before 2024-06-03T00:00:00Z is outside the migration range )"
                            R"([2024-01-01T00:00:00Z, 2024-05-31T12:00:00.500Z]"})");
    });
    const auto result = client.fetchUpdatesBefore(1, "sync-1", requested, std::nullopt, 10);
    const auto* outOfRange = std::get_if<domain::FetchOutOfRange>(&result);
    if (outOfRange == nullptr || outOfRange->validBound != ldg::testing::isoMs("2024-05-31T12:00:00.500Z")) {
        std::cerr << "Expected the newest valid bound below the request\n";
        return false;
    }
    return true;
}

bool retriesThenFails() {
    int attempts = 0;
    ScanApiClient client(fastOptions(), [&](const std::string&, const std::string&) {
        ++attempts;
        return respond(503, "unavailable");
    });
    const auto result = client.fetchUpdatesBefore(1, "sync-1", 5000, std::nullopt, 10);
    const auto* failure = std::get_if<domain::FetchFailure>(&result);
    // Two cycles of three attempts.
    if (failure == nullptr || attempts != 6 || failure->attempts != 6 || failure->status != 503) {
        std::cerr << "Expected six attempts ending in a 503 failure, got " << attempts << "\n";
        return false;
    }
    return true;
}

bool transientTransportErrorRecovers() {
    int attempts = 0;
    ScanApiClient client(fastOptions(), [&](const std::string&, const std::string&) -> JsonResponse {
        if (++attempts < 3) {
            throw infra::http::TransportError("reset", boost::asio::error::connection_reset, "read");
        }
        return respond(200, R"({"transactions": []})");
    });
    const auto result = client.fetchUpdatesBefore(1, "sync-1", 5000, std::nullopt, 10);
    if (!std::holds_alternative<domain::FetchEmpty>(result) || attempts != 3) {
        std::cerr << "Connection resets should be retried\n";
        return false;
    }
    return true;
}

bool clientErrorIsNotRetried() {
    int attempts = 0;
    ScanApiClient client(fastOptions(), [&](const std::string&, const std::string&) {
        ++attempts;
        return respond(401, "unauthorized");
    });
    const auto result = client.fetchUpdatesBefore(1, "sync-1", 5000, std::nullopt, 10);
    const auto* failure = std::get_if<domain::FetchFailure>(&result);
    if (failure == nullptr || attempts != 1 || failure->status != 401 || failure->body != "unauthorized") {
        std::cerr << "A 401 fails on the first attempt\n";
        return false;
    }
    return true;
}

bool forwardPageCarriesMarker() {
    std::string sentBody;
    ScanApiClient client(fastOptions(), [&](const std::string&, const std::string& body) {
        sentBody = body;
        return respond(200, R"({"transactions": [
            {"update_id": "n1", "migration_id": 4, "record_time": "2024-07-01T00:00:01Z", "events_by_id": {}},
            {"update_id": "n2", "migration_id": 4, "record_time": "2024-07-01T00:00:02.123456Z", "events_by_id": {}}
        ]})");
    });
    const auto result = client.fetchUpdatesAfter(4, std::string("2024-07-01T00:00:00Z"), 100);
    const auto* data = std::get_if<domain::FetchData>(&result);
    if (data == nullptr || data->lastMigrationId.value_or(-1) != 4 ||
        data->lastRecordTime.value_or("") != "2024-07-01T00:00:02.123456Z") {
        std::cerr << "Forward page marker not taken from the last item\n";
        return false;
    }
    const auto request = boost::json::parse(sentBody).as_object();
    if (request.at("after").as_object().at("after_migration_id").to_number<std::int64_t>() != 4) {
        std::cerr << "Forward request lacks its marker\n";
        return false;
    }

    ScanApiClient notFound(fastOptions(), [](const std::string&, const std::string&) {
        return respond(404, "");
    });
    if (!std::holds_alternative<domain::FetchEmpty>(notFound.fetchUpdatesAfter(std::nullopt, std::nullopt, 10))) {
        std::cerr << "404 on the forward endpoint means nothing new\n";
        return false;
    }
    return true;
}

bool migrationDiscovery() {
    ScanApiClient client(fastOptions(), [](const std::string& path, const std::string& body) {
        if (path != "/v0/backfilling/migration-info") {
            return respond(500, "");
        }
        const auto id = boost::json::parse(body).as_object().at("migration_id").to_number<std::int64_t>();
        if (id > 2) {
            return respond(404, "");
        }
        return respond(200, R"({"record_time_range": [
            {"synchronizer_id": "sync-1", "min": "2024-01-01T00:00:00Z", "max": "2024-02-01T00:00:00Z"},
            {"synchronizer_id": "sync-2", "min": "2024-01-05T00:00:00Z"}
        ]})");
    });

    const auto migrations = client.detectMigrations();
    if (migrations != std::vector<domain::MigrationId>{0, 1, 2}) {
        std::cerr << "Expected migrations 0..2\n";
        return false;
    }
    const auto info = client.getMigrationInfo(1);
    if (!info || info->ranges.size() != 1 || info->ranges[0].synchronizerId != "sync-1" ||
        info->ranges[0].maxTime != ldg::testing::isoMs("2024-02-01T00:00:00Z")) {
        std::cerr << "Incomplete ranges must be skipped\n";
        return false;
    }
    if (client.getMigrationInfo(9)) {
        std::cerr << "Unknown migration should be std::nullopt\n";
        return false;
    }

    ScanApiClient broken(fastOptions(), [](const std::string&, const std::string&) {
        return respond(403, "forbidden");
    });
    try {
        broken.getMigrationInfo(0);
    } catch (const std::runtime_error&) {
        return true;
    }
    std::cerr << "A refused migration lookup must throw\n";
    return false;
}

}  // namespace

int main() {
    if (!dataPageIsDecoded() || !emptyPageIsEmpty() || !outOfRangeReportsBound() || !retriesThenFails() ||
        !transientTransportErrorRecovers() || !clientErrorIsNotRetried() || !forwardPageCarriesMarker() ||
        !migrationDiscovery()) {
        return 1;
    }
    return 0;
}
