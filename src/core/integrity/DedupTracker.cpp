#include "core/integrity/DedupTracker.h"

#include <utility>

namespace core::integrity {

std::vector<domain::LedgerUpdate> DedupTracker::deduplicate(std::vector<domain::LedgerUpdate> updates) {
    std::vector<domain::LedgerUpdate> unique;
    unique.reserve(updates.size());

    for (auto& update : updates) {
        if (update.updateId.has_value()) {
            if (!seen_.insert(*update.updateId).second) {
                ++duplicateCount_;
                continue;
            }
        }
        ++uniqueCount_;
        unique.push_back(std::move(update));
    }
    return unique;
}

DedupStats DedupTracker::getStats() const {
    DedupStats stats;
    stats.uniqueCount = uniqueCount_;
    stats.duplicateCount = duplicateCount_;
    const std::size_t total = uniqueCount_ + duplicateCount_;
    stats.dedupRate = total > 0 ? static_cast<double>(duplicateCount_) / static_cast<double>(total) * 100.0 : 0.0;
    stats.seenIds = seen_.size();
    return stats;
}

DedupStats DedupTracker::reset() {
    DedupStats stats = getStats();
    seen_.clear();
    uniqueCount_ = 0;
    duplicateCount_ = 0;
    return stats;
}

DedupStats DedupTracker::resetRetaining(const std::vector<std::string>& carryOverIds) {
    DedupStats stats = reset();
    seen_.insert(carryOverIds.begin(), carryOverIds.end());
    return stats;
}

void DedupTracker::forget(const std::vector<std::string>& ids) {
    for (const auto& id : ids) {
        if (seen_.erase(id) > 0 && uniqueCount_ > 0) {
            --uniqueCount_;
        }
    }
}

}  // namespace core::integrity
