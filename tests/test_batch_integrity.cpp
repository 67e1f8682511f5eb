#include <iostream>

#include "core/integrity/BatchIntegrityTracker.h"

namespace {

bool emptyTrackerMatchesNothing() {
    core::integrity::BatchIntegrityTracker tracker;
    const auto summary = tracker.getSummary();
    if (summary.batchCount != 0 || summary.covered || summary.firstBatch || summary.lastBatch) {
        std::cerr << "A fresh tracker has no batches\n";
        return false;
    }
    if (!tracker.verify(0, 0).match || tracker.verify(1, 0).updateDifference != -1) {
        std::cerr << "A fresh tracker matches zero and nothing else\n";
        return false;
    }
    return true;
}

bool batchTrackerReportsSignedDifference() {
    core::integrity::BatchIntegrityTracker tracker;
    tracker.recordBatch("w1", 100, 250, domain::TimeRange{9000, 10000});
    tracker.recordBatch("w2", 50, 80, domain::TimeRange{8000, 9000});

    const auto summary = tracker.getSummary();
    if (summary.batchCount != 2 || summary.totalUpdates != 150 || summary.totalEvents != 330) {
        std::cerr << "Unexpected batch totals\n";
        return false;
    }
    if (!summary.covered || summary.covered->start != 8000 || summary.covered->end != 10000) {
        std::cerr << "Covered range should span both batches\n";
        return false;
    }
    if (!summary.firstBatch || summary.firstBatch->batchId != "w1" || !summary.lastBatch ||
        summary.lastBatch->batchId != "w2") {
        std::cerr << "First and last batch not tracked\n";
        return false;
    }

    const auto exact = tracker.verify(150, 330);
    if (!exact.match || exact.updateDifference != 0) {
        std::cerr << "Matching expectation reported a mismatch\n";
        return false;
    }
    const auto off = tracker.verify(160, 300);
    if (off.match || off.updateDifference != -10 || off.eventDifference != 30) {
        std::cerr << "Expected differences -10 / +30, got " << off.updateDifference << " / " << off.eventDifference
                  << "\n";
        return false;
    }
    return true;
}

bool emptyRangesDoNotWidenCoverage() {
    core::integrity::BatchIntegrityTracker tracker;
    tracker.recordBatch("empty", 0, 0, domain::TimeRange{500, 500});
    tracker.recordBatch("w1", 4, 6, domain::TimeRange{2000, 3000});
    const auto summary = tracker.getSummary();
    if (!summary.covered || summary.covered->start != 2000 || summary.covered->end != 3000) {
        std::cerr << "An empty range must not count as coverage\n";
        return false;
    }
    if (summary.batchCount != 2 || summary.firstBatch->batchId != "empty") {
        std::cerr << "Empty batches are still counted\n";
        return false;
    }
    return true;
}

}  // namespace

int main() {
    if (!emptyTrackerMatchesNothing() || !batchTrackerReportsSignedDifference() || !emptyRangesDoNotWidenCoverage()) {
        return 1;
    }
    return 0;
}
