#include "core/integrity/TimeRangeManager.h"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace core::integrity {

TimeRangeManager::TimeRangeManager(domain::TimestampMs minTime, domain::TimestampMs maxTime,
                                   domain::TimestampMs overlapMs)
    : minTime_(minTime), maxTime_(maxTime), overlapMs_(overlapMs), currentBefore_(maxTime) {
    if (overlapMs < 0) {
        throw std::invalid_argument("TimeRangeManager: negative overlap " + std::to_string(overlapMs));
    }
}

std::optional<domain::FetchWindow> TimeRangeManager::getNextRange(domain::TimestampMs stepMs) const {
    if (currentBefore_ <= minTime_) {
        return std::nullopt;
    }

    const domain::TimestampMs rangeEnd = currentBefore_;
    const domain::TimestampMs rangeStart = std::max(minTime_, currentBefore_ - stepMs);
    const domain::TimestampMs atOrAfter = std::max(minTime_, rangeStart - overlapMs_);

    domain::FetchWindow window;
    window.before = rangeEnd;
    window.atOrAfter = atOrAfter;
    window.rangeMs = rangeEnd - atOrAfter;
    return window;
}

void TimeRangeManager::advance(domain::TimestampMs oldestProcessedTime) {
    if (oldestProcessedTime >= currentBefore_) {
        return;
    }

    // Consecutive advances form one contiguous span; merge to keep the log small.
    if (!processed_.empty() && processed_.back().start == currentBefore_) {
        processed_.back().start = oldestProcessedTime;
    } else {
        processed_.push_back(domain::TimeRange{oldestProcessedTime, currentBefore_});
    }
    currentBefore_ = oldestProcessedTime;
}

void TimeRangeManager::snapTo(domain::TimestampMs before) {
    currentBefore_ = std::clamp(before, minTime_, maxTime_);
}

double TimeRangeManager::getProgress() const {
    const domain::TimestampMs totalRange = maxTime_ - minTime_;
    if (totalRange <= 0) {
        return 100.0;
    }
    const double processed = static_cast<double>(maxTime_ - currentBefore_);
    return std::clamp(processed / static_cast<double>(totalRange) * 100.0, 0.0, 100.0);
}

std::vector<domain::TimeRange> TimeRangeManager::detectGaps(domain::TimestampMs thresholdMs) const {
    std::vector<domain::TimeRange> sorted = processed_;
    std::sort(sorted.begin(), sorted.end(), [](const auto& a, const auto& b) { return a.start < b.start; });

    std::vector<domain::TimeRange> gaps;
    for (std::size_t i = 1; i < sorted.size(); ++i) {
        const auto& prev = sorted[i - 1];
        const auto& curr = sorted[i];
        if (curr.start - prev.end > thresholdMs) {
            gaps.push_back(domain::TimeRange{prev.end, curr.start});
        }
    }
    return gaps;
}

}  // namespace core::integrity
