#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "domain/Types.h"

namespace core::integrity {

struct BatchRecord {
    std::string batchId;
    std::uint64_t updates{0};
    std::uint64_t events{0};
    domain::TimeRange range;
};

struct BatchVerification {
    bool match{false};
    std::uint64_t expectedUpdates{0};
    std::uint64_t expectedEvents{0};
    std::uint64_t actualUpdates{0};
    std::uint64_t actualEvents{0};
    // actual - expected
    std::int64_t updateDifference{0};
    std::int64_t eventDifference{0};
};

struct BatchSummary {
    std::uint64_t batchCount{0};
    std::uint64_t totalUpdates{0};
    std::uint64_t totalEvents{0};
    std::optional<domain::TimeRange> covered;
    std::optional<BatchRecord> firstBatch;
    std::optional<BatchRecord> lastBatch;
};

// Running totals over the batches of one session, for reconciliation against an
// independently obtained count. Never gates the pipeline.
class BatchIntegrityTracker {
public:
    void recordBatch(std::string batchId, std::uint64_t updates, std::uint64_t events, domain::TimeRange range);

    BatchVerification verify(std::uint64_t expectedUpdates, std::uint64_t expectedEvents) const;

    BatchSummary getSummary() const { return summary_; }

private:
    BatchSummary summary_;
};

}  // namespace core::integrity
