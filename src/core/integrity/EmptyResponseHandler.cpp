#include "core/integrity/EmptyResponseHandler.h"

#include <stdexcept>
#include <string>
#include <utility>

#include "core/TimeUtils.h"
#include "logging/Log.h"

namespace core::integrity {
namespace {

constexpr auto kLogCategory = logging::LogCategory::INTEGRITY;
constexpr std::size_t kResetLogThreshold = 100;

void validateTiers(const std::vector<EmptyStepTier>& tiers) {
    if (tiers.empty()) {
        throw std::invalid_argument("empty step tier table is empty");
    }
    if (tiers.front().threshold != 0) {
        throw std::invalid_argument("empty step tier table must start at threshold 0");
    }
    for (std::size_t i = 0; i < tiers.size(); ++i) {
        if (tiers[i].stepMs <= 0) {
            throw std::invalid_argument("empty step tier " + std::to_string(i) + " has non-positive step");
        }
        if (i > 0 && tiers[i].threshold <= tiers[i - 1].threshold) {
            throw std::invalid_argument("empty step tier thresholds must be strictly increasing");
        }
    }
}

}  // namespace

std::vector<EmptyStepTier> EmptyResponseHandler::defaultTiers() {
    return {
        {0, 1},
        {100, 100},
        {200, 1000},
        {500, 10000},
        {1000, 60000},
        {2000, 300000},
        {5000, 3600000},
    };
}

EmptyResponseHandler::EmptyResponseHandler() : EmptyResponseHandler(defaultTiers()) {}

EmptyResponseHandler::EmptyResponseHandler(std::vector<EmptyStepTier> tiers) : tiers_(std::move(tiers)) {
    validateTiers(tiers_);
}

domain::TimestampMs EmptyResponseHandler::stepFor(std::size_t consecutiveEmpty) const {
    domain::TimestampMs step = tiers_.front().stepMs;
    for (const auto& tier : tiers_) {
        if (consecutiveEmpty >= tier.threshold) {
            step = tier.stepMs;
        } else {
            break;
        }
    }
    return step;
}

EmptyDecision EmptyResponseHandler::handleEmpty(domain::TimestampMs currentBefore, domain::TimestampMs lowerBound) {
    const domain::TimestampMs previousStep = stepFor(consecutiveEmpty_);
    ++consecutiveEmpty_;
    ++totalEmpty_;
    const domain::TimestampMs step = stepFor(consecutiveEmpty_);

    if (step != previousStep) {
        LOG_INFO(kLogCategory, "%zu consecutive empty responses, step %lldms -> %lldms", consecutiveEmpty_,
                 previousStep, step);
    }

    EmptyDecision decision;
    decision.consecutiveEmpty = consecutiveEmpty_;
    decision.stepMs = step;
    decision.newBefore = currentBefore - step;
    if (decision.newBefore <= lowerBound) {
        decision.action = EmptyAction::Done;
        decision.newBefore = lowerBound;
        LOG_INFO(kLogCategory, "Empty walk reached lower bound %s after %zu empty responses",
                 core::time::formatIso8601Ms(lowerBound).c_str(), consecutiveEmpty_);
    }
    return decision;
}

std::size_t EmptyResponseHandler::resetOnData() {
    const std::size_t previous = consecutiveEmpty_;
    if (previous > kResetLogThreshold) {
        LOG_INFO(kLogCategory, "Data found after %zu consecutive empty responses, step back to %lldms", previous,
                 tiers_.front().stepMs);
    }
    consecutiveEmpty_ = 0;
    return previous;
}

EmptyStats EmptyResponseHandler::getStats() const {
    return EmptyStats{consecutiveEmpty_, totalEmpty_, stepFor(consecutiveEmpty_)};
}

}  // namespace core::integrity
