#include <iostream>
#include <stdexcept>
#include <vector>

#include "core/integrity/EmptyResponseHandler.h"

using core::integrity::EmptyAction;
using core::integrity::EmptyResponseHandler;
using core::integrity::EmptyStepTier;

namespace {

bool stepGrowsOnlyAfterSustainedEmptiness() {
    EmptyResponseHandler handler;
    domain::TimestampMs before = 10'000'000'000LL;
    core::integrity::EmptyDecision decision;
    for (int i = 0; i < 150; ++i) {
        decision = handler.handleEmpty(before, 0);
        before = decision.newBefore;
    }
    if (decision.stepMs != 100 || decision.consecutiveEmpty != 150) {
        std::cerr << "After 150 empties expected a 100ms step, got " << decision.stepMs << "ms at "
                  << decision.consecutiveEmpty << "\n";
        return false;
    }

    const auto previous = handler.resetOnData();
    if (previous != 150) {
        std::cerr << "resetOnData() should report 150 preceding empties, got " << previous << "\n";
        return false;
    }
    const auto next = handler.handleEmpty(before, 0);
    if (next.stepMs != 1 || next.newBefore != before - 1) {
        std::cerr << "After data the step must fall back to 1ms, got " << next.stepMs << "ms\n";
        return false;
    }
    if (handler.getStats().totalEmpty != 151) {
        std::cerr << "Total empty count should survive resetOnData()\n";
        return false;
    }
    return true;
}

bool pointerNeverJumpsPastTheTierStep() {
    EmptyResponseHandler handler;
    const domain::TimestampMs lowerBound = 5'000'000'000LL;
    domain::TimestampMs before = lowerBound + 2'000'000'000LL;

    for (std::size_t k = 1; k <= 20000; ++k) {
        const auto decision = handler.handleEmpty(before, lowerBound);
        if (decision.newBefore > before) {
            std::cerr << "Pointer moved up at empty #" << k << "\n";
            return false;
        }
        if (before - decision.newBefore > handler.stepFor(k)) {
            std::cerr << "Pointer moved " << (before - decision.newBefore) << "ms at empty #" << k
                      << ", more than the tier step " << handler.stepFor(k) << "\n";
            return false;
        }
        if (decision.newBefore < lowerBound) {
            std::cerr << "Pointer crossed the lower bound at empty #" << k << "\n";
            return false;
        }
        before = decision.newBefore;
        if (decision.action == EmptyAction::Done) {
            if (before != lowerBound) {
                std::cerr << "Done must land exactly on the lower bound\n";
                return false;
            }
            return true;
        }
    }
    std::cerr << "Walk never reached the lower bound\n";
    return false;
}

bool doneOnlyWhenCrossingLowerBound() {
    EmptyResponseHandler handler({{0, 10}});
    auto decision = handler.handleEmpty(100, 85);
    if (decision.action != EmptyAction::Continue || decision.newBefore != 90) {
        std::cerr << "Expected continue at 90\n";
        return false;
    }
    decision = handler.handleEmpty(90, 85);
    if (decision.action != EmptyAction::Done || decision.newBefore != 85) {
        std::cerr << "Expected done at the lower bound\n";
        return false;
    }
    return true;
}

bool rejectsBadTierTables() {
    const std::vector<std::vector<EmptyStepTier>> invalid = {
        {},
        {{1, 10}},
        {{0, 1}, {100, 10}, {100, 20}},
        {{0, 0}},
    };
    for (const auto& tiers : invalid) {
        try {
            EmptyResponseHandler handler(tiers);
            std::cerr << "Tier table of " << tiers.size() << " entries should have been rejected\n";
            return false;
        } catch (const std::invalid_argument&) {
        }
    }
    return true;
}

}  // namespace

int main() {
    if (!stepGrowsOnlyAfterSustainedEmptiness() || !pointerNeverJumpsPastTheTierStep() ||
        !doneOnlyWhenCrossingLowerBound() || !rejectsBadTierTables()) {
        return 1;
    }
    return 0;
}
