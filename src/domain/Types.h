#pragma once

#include <cstdint>
#include <string>

namespace domain {

using TimestampMs = long long;
using MigrationId = std::int64_t;

// Half-open [start, end) span of ledger record time.
struct TimeRange {
    TimestampMs start{0};
    TimestampMs end{0};
    bool empty() const noexcept { return end <= start; }
    TimestampMs length() const noexcept { return empty() ? 0 : end - start; }
};

// One fetch window produced by the backward walk.
struct FetchWindow {
    TimestampMs before{0};
    TimestampMs atOrAfter{0};
    TimestampMs rangeMs{0};
};

// Identity of one resumable ingestion stream.
struct StreamKey {
    MigrationId migrationId{0};
    std::string synchronizerId;
    int shardIndex{-1};
    int shardTotal{1};

    bool sharded() const noexcept { return shardIndex >= 0; }
};

}  // namespace domain
