#pragma once

#include <cstddef>
#include <vector>

#include "domain/Types.h"

namespace core::integrity {

// Step applied once consecutiveEmpty reaches threshold.
struct EmptyStepTier {
    std::size_t threshold{0};
    domain::TimestampMs stepMs{1};
};

enum class EmptyAction { Continue, Done };

struct EmptyDecision {
    EmptyAction action{EmptyAction::Continue};
    domain::TimestampMs newBefore{0};
    std::size_t consecutiveEmpty{0};
    domain::TimestampMs stepMs{0};
};

struct EmptyStats {
    std::size_t consecutiveEmpty{0};
    std::size_t totalEmpty{0};
    domain::TimestampMs currentStepMs{0};
};

// Steps the walk pointer past empty windows. The step only grows after a sustained run
// of empty responses and falls back to the finest tier as soon as data shows up.
class EmptyResponseHandler {
public:
    static std::vector<EmptyStepTier> defaultTiers();

    EmptyResponseHandler();
    // Throws std::invalid_argument unless tiers are non-empty, start at threshold 0,
    // are strictly increasing and have positive steps.
    explicit EmptyResponseHandler(std::vector<EmptyStepTier> tiers);

    EmptyDecision handleEmpty(domain::TimestampMs currentBefore, domain::TimestampMs lowerBound);

    // Returns the number of consecutive empties that preceded this data page.
    std::size_t resetOnData();

    domain::TimestampMs stepFor(std::size_t consecutiveEmpty) const;

    EmptyStats getStats() const;
    const std::vector<EmptyStepTier>& tiers() const noexcept { return tiers_; }

private:
    std::vector<EmptyStepTier> tiers_;
    std::size_t consecutiveEmpty_{0};
    std::size_t totalEmpty_{0};
};

}  // namespace core::integrity
