#include "app/BackfillOrchestrator.hpp"

#include <stdexcept>
#include <string>

#include "app/ShardPlanner.hpp"
#include "core/Cancellation.h"
#include "core/TimeUtils.h"
#include "logging/Log.h"

namespace app {
namespace {

constexpr auto kLogCategory = logging::LogCategory::APP;

}  // namespace

BackfillOrchestrator::BackfillOrchestrator(const ldg::common::Config& config, domain::ILedgerSource& source,
                                           infra::storage::DurableWriter& writer, core::CancellationToken& cancel)
    : config_(config), source_(source), writer_(writer), cancel_(cancel) {}

BackfillReport BackfillOrchestrator::run() {
    BackfillReport report;

    std::vector<domain::MigrationId> migrations;
    if (config_.targetMigration) {
        migrations.push_back(*config_.targetMigration);
    } else {
        migrations = source_.detectMigrations();
        LOG_INFO(kLogCategory, "Detected %zu migrations", migrations.size());
    }

    for (const auto migrationId : migrations) {
        if (cancel_.isCancelled()) {
            break;
        }
        runMigration_(migrationId, report);
    }

    // Migrations can appear while a long backfill runs.
    for (int round = 0; !config_.targetMigration && round < kMaxRescanRounds && !cancel_.isCancelled(); ++round) {
        std::vector<domain::MigrationId> known;
        try {
            known = source_.detectMigrations();
        } catch (const std::runtime_error& ex) {
            LOG_WARN(kLogCategory, "Migration rescan failed: %s", ex.what());
            break;
        }
        std::vector<domain::MigrationId> fresh;
        for (const auto migrationId : known) {
            if (processed_.count(migrationId) == 0) {
                fresh.push_back(migrationId);
            }
        }
        if (fresh.empty()) {
            break;
        }
        LOG_INFO(kLogCategory, "Rescan %d found %zu new migrations", round + 1, fresh.size());
        for (const auto migrationId : fresh) {
            if (cancel_.isCancelled()) {
                break;
            }
            runMigration_(migrationId, report);
        }
    }

    report.cancelled = cancel_.isCancelled();
    LOG_INFO(kLogCategory,
             "Backfill finished: %zu migrations, %zu sessions (%zu completed, %zu already complete, %zu failed), "
             "%llu updates, %llu events confirmed%s",
             report.migrations, report.sessions, report.completed, report.alreadyComplete, report.failed,
             static_cast<unsigned long long>(report.confirmedUpdates),
             static_cast<unsigned long long>(report.confirmedEvents), report.cancelled ? " (cancelled)" : "");
    return report;
}

void BackfillOrchestrator::runMigration_(domain::MigrationId migrationId, BackfillReport& report) {
    processed_.insert(migrationId);

    std::optional<domain::MigrationInfo> info;
    try {
        info = source_.getMigrationInfo(migrationId);
    } catch (const std::runtime_error& ex) {
        LOG_ERROR(kLogCategory, "Migration %lld: info lookup failed: %s", static_cast<long long>(migrationId),
                  ex.what());
        ++report.failed;
        return;
    }
    if (!info) {
        LOG_WARN(kLogCategory, "Migration %lld does not exist upstream", static_cast<long long>(migrationId));
        return;
    }

    ++report.migrations;
    LOG_INFO(kLogCategory, "Migration %lld: %zu synchronizers", static_cast<long long>(migrationId),
             info->ranges.size());
    for (const auto& range : info->ranges) {
        if (cancel_.isCancelled()) {
            return;
        }
        runStream_(migrationId, range, report);
    }
}

void BackfillOrchestrator::runStream_(domain::MigrationId migrationId, const domain::SynchronizerRange& range,
                                      BackfillReport& report) {
    if (range.maxTime <= range.minTime) {
        LOG_WARN(kLogCategory, "Migration %lld synchronizer %s has an empty range, skipping",
                 static_cast<long long>(migrationId), range.synchronizerId.c_str());
        return;
    }

    domain::StreamKey key;
    key.migrationId = migrationId;
    key.synchronizerId = range.synchronizerId;

    domain::TimeRange slice{range.minTime, range.maxTime};
    if (config_.shardTotal > 1) {
        key.shardIndex = config_.shardIndex;
        key.shardTotal = config_.shardTotal;
        slice = ShardPlanner::shardRange(range.minTime, range.maxTime, config_.shardIndex, config_.shardTotal);
        LOG_INFO(kLogCategory, "Shard %d/%d of %s: %s .. %s", config_.shardIndex, config_.shardTotal,
                 range.synchronizerId.c_str(), core::time::formatIso8601Ms(slice.start).c_str(),
                 core::time::formatIso8601Ms(slice.end).c_str());
    }

    ++report.sessions;
    IngestSession session(config_, key, slice, source_, writer_, cancel_);
    auto result = session.run();

    report.confirmedUpdates += result.confirmedUpdates;
    report.confirmedEvents += result.confirmedEvents;
    switch (result.outcome) {
    case SessionOutcome::Complete:
        ++report.completed;
        break;
    case SessionOutcome::AlreadyComplete:
        ++report.alreadyComplete;
        break;
    case SessionOutcome::Failed:
        ++report.failed;
        break;
    case SessionOutcome::Cancelled:
        break;
    }
    results_.push_back(std::move(result));
}

}  // namespace app
