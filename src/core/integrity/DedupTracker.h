#pragma once

#include <cstddef>
#include <string>
#include <unordered_set>
#include <vector>

#include "domain/LedgerRecords.hpp"

namespace core::integrity {

struct DedupStats {
    std::size_t uniqueCount{0};
    std::size_t duplicateCount{0};
    double dedupRate{0.0};  // percent of inspected records that were duplicates
    std::size_t seenIds{0};
};

// Session-scoped set of update ids already handed to the writer.
class DedupTracker {
public:
    // Drops updates whose id was already seen. Updates without an id always pass.
    std::vector<domain::LedgerUpdate> deduplicate(std::vector<domain::LedgerUpdate> updates);

    DedupStats getStats() const;

    // Clears the seen set and counters, returning the statistics of the finished interval.
    DedupStats reset();
    // Same, then marks carryOverIds as seen so the overlap re-fetched by the next window
    // is still filtered.
    DedupStats resetRetaining(const std::vector<std::string>& carryOverIds);

    // Un-sees ids whose hand-off was not confirmed, so a retried page passes them again.
    void forget(const std::vector<std::string>& ids);

    std::size_t duplicateCount() const noexcept { return duplicateCount_; }
    std::size_t uniqueCount() const noexcept { return uniqueCount_; }
    std::size_t size() const noexcept { return seen_.size(); }

private:
    std::unordered_set<std::string> seen_;
    std::size_t uniqueCount_{0};
    std::size_t duplicateCount_{0};
};

}  // namespace core::integrity
