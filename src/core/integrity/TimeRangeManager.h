#pragma once

#include <optional>
#include <vector>

#include "domain/Types.h"

namespace core::integrity {

// Walks [minTime, maxTime) backward from maxTime. Every window reaches overlapMs further
// back than its nominal start so records near a window edge are fetched twice rather than lost.
class TimeRangeManager {
public:
    static constexpr domain::TimestampMs kDefaultOverlapMs = 1000;
    static constexpr domain::TimestampMs kDefaultGapThresholdMs = 60000;

    TimeRangeManager(domain::TimestampMs minTime, domain::TimestampMs maxTime,
                     domain::TimestampMs overlapMs = kDefaultOverlapMs);

    // std::nullopt once the walk pointer has reached minTime.
    std::optional<domain::FetchWindow> getNextRange(domain::TimestampMs stepMs) const;

    // Moves the walk pointer down to the oldest time actually processed. Never moves it up.
    void advance(domain::TimestampMs oldestProcessedTime);

    // Repositions the pointer without recording the skipped span as processed
    // (resume from a cursor, upstream range corrections). Clamped to [minTime, maxTime].
    void snapTo(domain::TimestampMs before);

    double getProgress() const;

    std::vector<domain::TimeRange> detectGaps(domain::TimestampMs thresholdMs = kDefaultGapThresholdMs) const;

    domain::TimestampMs currentBefore() const noexcept { return currentBefore_; }
    domain::TimestampMs minTime() const noexcept { return minTime_; }
    domain::TimestampMs maxTime() const noexcept { return maxTime_; }
    domain::TimestampMs overlapMs() const noexcept { return overlapMs_; }
    bool exhausted() const noexcept { return currentBefore_ <= minTime_; }
    const std::vector<domain::TimeRange>& processedRanges() const noexcept { return processed_; }

private:
    domain::TimestampMs minTime_;
    domain::TimestampMs maxTime_;
    domain::TimestampMs overlapMs_;
    domain::TimestampMs currentBefore_;
    std::vector<domain::TimeRange> processed_;
};

}  // namespace core::integrity
