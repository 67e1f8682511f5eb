#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "domain/LedgerRecords.hpp"
#include "domain/Types.h"

namespace domain {

struct FetchData {
    std::vector<LedgerUpdate> updates;
    std::size_t rawCount{0};
    std::size_t rejected{0};
    std::optional<TimestampMs> oldest;
    std::optional<TimestampMs> newest;
    // Forward marker carried by the last item of an ascending page.
    std::optional<MigrationId> lastMigrationId;
    std::optional<std::string> lastRecordTime;
    int attempts{1};
};

struct FetchEmpty {
    int attempts{1};
};

// The server rejected the request because the requested time lies outside the
// migration's range and reported the nearest valid bound.
struct FetchOutOfRange {
    TimestampMs validBound{0};
    std::string detail;
};

struct FetchFailure {
    unsigned status{0};
    std::string body;
    std::string error;
    int attempts{0};
    bool retryable{false};
};

using FetchResult = std::variant<FetchData, FetchEmpty, FetchOutOfRange, FetchFailure>;

inline bool isFailure(const FetchResult& result) noexcept {
    return std::holds_alternative<FetchFailure>(result);
}

}  // namespace domain
