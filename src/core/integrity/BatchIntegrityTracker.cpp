#include "core/integrity/BatchIntegrityTracker.h"

#include <algorithm>
#include <utility>

#include "logging/Log.h"

namespace core::integrity {

void BatchIntegrityTracker::recordBatch(std::string batchId, std::uint64_t updates, std::uint64_t events,
                                        domain::TimeRange range) {
    BatchRecord record{std::move(batchId), updates, events, range};

    ++summary_.batchCount;
    summary_.totalUpdates += updates;
    summary_.totalEvents += events;

    if (!range.empty()) {
        if (summary_.covered) {
            summary_.covered->start = std::min(summary_.covered->start, range.start);
            summary_.covered->end = std::max(summary_.covered->end, range.end);
        } else {
            summary_.covered = range;
        }
    }

    if (!summary_.firstBatch) {
        summary_.firstBatch = record;
    }
    summary_.lastBatch = std::move(record);
}

BatchVerification BatchIntegrityTracker::verify(std::uint64_t expectedUpdates, std::uint64_t expectedEvents) const {
    BatchVerification result;
    result.expectedUpdates = expectedUpdates;
    result.expectedEvents = expectedEvents;
    result.actualUpdates = summary_.totalUpdates;
    result.actualEvents = summary_.totalEvents;
    result.updateDifference = static_cast<std::int64_t>(summary_.totalUpdates) - static_cast<std::int64_t>(expectedUpdates);
    result.eventDifference = static_cast<std::int64_t>(summary_.totalEvents) - static_cast<std::int64_t>(expectedEvents);
    result.match = result.updateDifference == 0 && result.eventDifference == 0;

    if (!result.match) {
        LOG_WARN(logging::LogCategory::INTEGRITY,
                 "Batch totals differ from expectation: updates %+lld, events %+lld over %llu batches",
                 static_cast<long long>(result.updateDifference), static_cast<long long>(result.eventDifference),
                 static_cast<unsigned long long>(summary_.batchCount));
    }
    return result;
}

}  // namespace core::integrity
