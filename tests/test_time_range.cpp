#include <cmath>
#include <iostream>
#include <stdexcept>

#include "core/integrity/TimeRangeManager.h"
#include "TestSupport.hpp"

using core::integrity::TimeRangeManager;
using ldg::testing::isoMs;

namespace {

bool backwardWalkFromMaxTime() {
    const auto minTime = isoMs("2024-01-01T00:00:00Z");
    const auto maxTime = isoMs("2024-01-02T00:00:00Z");
    TimeRangeManager ranges(minTime, maxTime, 1000);

    const auto window = ranges.getNextRange(3600000);
    if (!window) {
        std::cerr << "Expected a first window\n";
        return false;
    }
    if (window->before != maxTime || window->atOrAfter != isoMs("2024-01-01T22:59:59Z")) {
        std::cerr << "Unexpected first window before=" << window->before << " atOrAfter=" << window->atOrAfter << "\n";
        return false;
    }

    ranges.advance(isoMs("2024-01-01T23:15:00Z"));
    if (ranges.currentBefore() != isoMs("2024-01-01T23:15:00Z")) {
        std::cerr << "advance() did not move the pointer to the oldest processed time\n";
        return false;
    }
    if (std::fabs(ranges.getProgress() - 3.125) > 0.01) {
        std::cerr << "Expected ~3.1% progress, got " << ranges.getProgress() << "\n";
        return false;
    }
    return true;
}

bool windowsReachOverlapBelowNominalStart() {
    const domain::TimestampMs minTime = 10000;
    const domain::TimestampMs maxTime = 100000;
    TimeRangeManager ranges(minTime, maxTime, 500);

    for (int i = 0; i < 20; ++i) {
        const auto window = ranges.getNextRange(7000);
        if (!window) {
            break;
        }
        const domain::TimestampMs nominalStart = window->before - 7000;
        const domain::TimestampMs bound = std::max(minTime, nominalStart - 500);
        if (window->atOrAfter > bound || window->atOrAfter < minTime) {
            std::cerr << "Window atOrAfter " << window->atOrAfter << " outside the overlap bound " << bound << "\n";
            return false;
        }
        ranges.advance(std::max(minTime, nominalStart));
    }
    if (!ranges.exhausted() || ranges.getNextRange(7000)) {
        std::cerr << "Walk should have reached minTime\n";
        return false;
    }
    if (ranges.getProgress() != 100.0) {
        std::cerr << "Exhausted walk should report 100%\n";
        return false;
    }
    return true;
}

bool advanceNeverMovesUp() {
    TimeRangeManager ranges(0, 100000, 1000);
    ranges.advance(50000);
    ranges.advance(70000);
    if (ranges.currentBefore() != 50000) {
        std::cerr << "advance() moved the pointer up to " << ranges.currentBefore() << "\n";
        return false;
    }
    ranges.advance(50000);
    if (ranges.currentBefore() != 50000) {
        std::cerr << "advance() to the current pointer changed it\n";
        return false;
    }
    return true;
}

bool snapToClampsAndLeavesGap() {
    TimeRangeManager ranges(1000, 1000000, 0);
    ranges.advance(900000);
    ranges.snapTo(500000);
    ranges.advance(400000);
    ranges.snapTo(-5);
    if (ranges.currentBefore() != 1000) {
        std::cerr << "snapTo() should clamp to minTime, got " << ranges.currentBefore() << "\n";
        return false;
    }

    const auto gaps = ranges.detectGaps(60000);
    if (gaps.size() != 1 || gaps.front().start != 500000 || gaps.front().end != 900000) {
        std::cerr << "Expected one gap [500000, 900000), got " << gaps.size() << " gaps\n";
        return false;
    }
    if (!ranges.detectGaps(500000).empty()) {
        std::cerr << "A gap below the threshold must not be reported\n";
        return false;
    }
    return true;
}

bool rejectsNegativeOverlap() {
    try {
        TimeRangeManager ranges(0, 1000, -1);
    } catch (const std::invalid_argument&) {
        return true;
    }
    std::cerr << "Negative overlap should be rejected\n";
    return false;
}

}  // namespace

int main() {
    if (!backwardWalkFromMaxTime() || !windowsReachOverlapBelowNominalStart() || !advanceNeverMovesUp() ||
        !snapToClampsAndLeavesGap() || !rejectsNegativeOverlap()) {
        return 1;
    }
    return 0;
}
