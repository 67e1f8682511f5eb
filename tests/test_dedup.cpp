#include <iostream>
#include <string>
#include <vector>

#include "core/integrity/DedupTracker.h"
#include "TestSupport.hpp"

using ldg::testing::makeUpdate;

namespace {

bool dropsRepeatedIds() {
    core::integrity::DedupTracker tracker;
    std::vector<domain::LedgerUpdate> page = {makeUpdate("a", 3), makeUpdate("b", 2), makeUpdate("a", 3),
                                              makeUpdate("c", 1)};
    const auto unique = tracker.deduplicate(page);
    if (unique.size() != page.size() - 1 || tracker.duplicateCount() != 1) {
        std::cerr << "Expected one duplicate dropped, got " << unique.size() << " records and "
                  << tracker.duplicateCount() << " duplicates\n";
        return false;
    }

    // The overlap of the next window brings "c" back.
    const auto next = tracker.deduplicate({makeUpdate("c", 1), makeUpdate("d", 0)});
    if (next.size() != 1 || *next.front().updateId != "d" || tracker.duplicateCount() != 2) {
        std::cerr << "Ids must be remembered across pages\n";
        return false;
    }
    return true;
}

bool passesRecordsWithoutId() {
    core::integrity::DedupTracker tracker;
    const auto unique = tracker.deduplicate({makeUpdate("", 1), makeUpdate("", 1), makeUpdate("", 2)});
    if (unique.size() != 3 || tracker.duplicateCount() != 0 || tracker.size() != 0) {
        std::cerr << "Records without an id must pass unfiltered\n";
        return false;
    }
    return true;
}

bool resetReportsAndClears() {
    core::integrity::DedupTracker tracker;
    tracker.deduplicate({makeUpdate("a", 1), makeUpdate("a", 1), makeUpdate("b", 1), makeUpdate("b", 1)});
    const auto stats = tracker.reset();
    if (stats.uniqueCount != 2 || stats.duplicateCount != 2 || stats.dedupRate != 50.0 || stats.seenIds != 2) {
        std::cerr << "Unexpected reset stats: unique=" << stats.uniqueCount << " dup=" << stats.duplicateCount
                  << " rate=" << stats.dedupRate << "\n";
        return false;
    }
    if (tracker.size() != 0 || tracker.getStats().uniqueCount != 0) {
        std::cerr << "reset() must clear the seen set and counters\n";
        return false;
    }
    if (tracker.deduplicate({makeUpdate("a", 1)}).size() != 1) {
        std::cerr << "An id seen before reset() must pass again\n";
        return false;
    }
    return true;
}

bool resetRetainingKeepsCarryOver() {
    core::integrity::DedupTracker tracker;
    tracker.deduplicate({makeUpdate("a", 5), makeUpdate("b", 4), makeUpdate("c", 3)});
    tracker.resetRetaining({"c"});
    if (tracker.size() != 1) {
        std::cerr << "Only the carried-over id should remain, got " << tracker.size() << "\n";
        return false;
    }
    const auto unique = tracker.deduplicate({makeUpdate("c", 3), makeUpdate("a", 5)});
    if (unique.size() != 1 || *unique.front().updateId != "a") {
        std::cerr << "Carried-over id must still be filtered\n";
        return false;
    }
    return true;
}

bool forgottenIdsPassAgain() {
    core::integrity::DedupTracker tracker;
    tracker.deduplicate({makeUpdate("old", 9)});
    tracker.deduplicate({makeUpdate("new1", 5), makeUpdate("new2", 4)});
    tracker.forget({"new1", "new2"});

    const auto retried = tracker.deduplicate({makeUpdate("old", 9), makeUpdate("new1", 5), makeUpdate("new2", 4)});
    if (retried.size() != 2 || *retried.front().updateId != "new1") {
        std::cerr << "Forgotten ids must pass while older ids stay filtered\n";
        return false;
    }
    return true;
}

}  // namespace

int main() {
    if (!dropsRepeatedIds() || !passesRecordsWithoutId() || !resetReportsAndClears() ||
        !resetRetainingKeepsCarryOver() || !forgottenIdsPassAgain()) {
        return 1;
    }
    return 0;
}
