#include "app/StorageAuditor.hpp"

#include <algorithm>
#include <map>
#include <set>
#include <stdexcept>
#include <system_error>
#include <utility>

#include "core/TimeUtils.h"
#include "core/integrity/IntegrityCursor.h"
#include "infra/storage/AtomicFile.hpp"
#include "infra/storage/PartitionPath.hpp"
#include "infra/storage/RecordEncoder.hpp"
#include "logging/Log.h"

namespace app {
namespace {

constexpr auto kLogCategory = logging::LogCategory::INTEGRITY;
constexpr const char* kMigrationDirPrefix = "migration=";

bool startsWith(const std::string& value, const std::string& prefix) {
    return value.size() >= prefix.size() && value.compare(0, prefix.size(), prefix) == 0;
}

bool endsWith(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() && value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool isCursorFile(const std::string& name) {
    return startsWith(name, "cursor-") && endsWith(name, ".json");
}

std::vector<core::integrity::CursorState> cursorsOf(const std::filesystem::path& cursorDir,
                                                    std::optional<domain::MigrationId> migrationId) {
    std::vector<core::integrity::CursorState> states;
    std::error_code ec;
    std::filesystem::directory_iterator it(cursorDir, ec);
    for (const std::filesystem::directory_iterator end; !ec && it != end; it.increment(ec)) {
        if (!isCursorFile(it->path().filename().string())) {
            continue;
        }
        auto state = core::integrity::IntegrityCursor::readFile(it->path());
        if (!state) {
            LOG_WARN(kLogCategory, "Skipping unreadable cursor %s", it->path().string().c_str());
            continue;
        }
        if (!migrationId || state->migrationId == *migrationId) {
            states.push_back(std::move(*state));
        }
    }
    return states;
}

// Spans between covered ranges (and before the first one) that are at least thresholdMs long.
std::vector<domain::TimeRange> uncovered(std::vector<domain::TimeRange> covered, domain::TimestampMs lower,
                                         domain::TimestampMs upper, domain::TimestampMs thresholdMs) {
    std::sort(covered.begin(), covered.end(), [](const auto& a, const auto& b) { return a.start < b.start; });

    std::vector<domain::TimeRange> gaps;
    domain::TimestampMs reached = lower;
    for (const auto& range : covered) {
        if (range.start - reached >= thresholdMs) {
            gaps.push_back(domain::TimeRange{reached, range.start});
        }
        reached = std::max(reached, range.end);
    }
    if (upper - reached >= thresholdMs) {
        gaps.push_back(domain::TimeRange{reached, upper});
    }
    return gaps;
}

}  // namespace

StorageAuditor::StorageAuditor(std::filesystem::path dataRoot, std::filesystem::path cursorDir,
                               domain::TimestampMs gapThresholdMs)
    : dataRoot_(std::move(dataRoot)), cursorDir_(std::move(cursorDir)), gapThresholdMs_(gapThresholdMs) {}

AuditReport StorageAuditor::audit(domain::MigrationId migrationId) const {
    AuditReport report;
    report.migrationId = migrationId;

    core::integrity::BatchIntegrityTracker stored;
    const auto migrationDir = dataRoot_ / (kMigrationDirPrefix + std::to_string(migrationId));
    std::error_code ec;
    if (std::filesystem::exists(migrationDir, ec)) {
        std::filesystem::recursive_directory_iterator it(migrationDir, ec);
        for (const std::filesystem::recursive_directory_iterator end; !ec && it != end; it.increment(ec)) {
            const std::string name = it->path().filename().string();
            if (!it->is_regular_file(ec) || !endsWith(name, infra::storage::kPartitionFileExtension)) {
                continue;
            }
            const bool isUpdates = startsWith(name, "updates-");
            if (!isUpdates && !startsWith(name, "events-")) {
                continue;
            }

            ++report.files;
            const auto bytes = infra::storage::readWholeFile(it->path());
            if (!bytes) {
                ++report.unreadableFiles;
                LOG_WARN(kLogCategory, "Cannot read %s", it->path().string().c_str());
                continue;
            }
            try {
                if (isUpdates) {
                    const auto batch = infra::storage::RecordEncoder::decodeUpdates(*bytes);
                    domain::TimeRange span{0, 0};
                    for (const auto& record : batch.records()) {
                        const domain::TimestampMs t = record.record_time() != 0 ? record.record_time()
                                                                                : record.effective_at();
                        if (t == 0) {
                            continue;
                        }
                        span.start = span.start == 0 ? t : std::min(span.start, t);
                        span.end = std::max(span.end, t + 1);
                        if (!report.newestStoredRecordTime || t > *report.newestStoredRecordTime) {
                            report.newestStoredRecordTime = t;
                        }
                    }
                    stored.recordBatch(name, static_cast<std::uint64_t>(batch.records_size()), 0, span);
                } else {
                    const auto batch = infra::storage::RecordEncoder::decodeEvents(*bytes);
                    stored.recordBatch(name, 0, static_cast<std::uint64_t>(batch.records_size()), domain::TimeRange{});
                }
            } catch (const std::runtime_error& ex) {
                ++report.unreadableFiles;
                LOG_WARN(kLogCategory, "Corrupt partition file %s: %s", it->path().string().c_str(), ex.what());
            }
        }
        if (ec) {
            LOG_WARN(kLogCategory, "Partition scan of %s stopped early: %s", migrationDir.string().c_str(),
                     ec.message().c_str());
        }
    }
    const auto summary = stored.getSummary();
    report.storedUpdates = summary.totalUpdates;
    report.storedEvents = summary.totalEvents;

    std::map<std::string, std::vector<core::integrity::CursorState>> bySynchronizer;
    for (auto& state : cursorsOf(cursorDir_, migrationId)) {
        ++report.cursors;
        if (state.complete) {
            ++report.completeCursors;
        }
        report.cursorUpdates += state.confirmedUpdates;
        report.cursorEvents += state.confirmedEvents;
        bySynchronizer[state.synchronizerId].push_back(std::move(state));
    }

    report.verification = stored.verify(report.cursorUpdates, report.cursorEvents);

    for (const auto& [synchronizerId, states] : bySynchronizer) {
        std::optional<domain::TimestampMs> lower;
        std::optional<domain::TimestampMs> upper;
        std::vector<domain::TimeRange> covered;
        for (const auto& state : states) {
            if (!state.minTime || !state.maxTime) {
                continue;
            }
            lower = lower ? std::min(*lower, *state.minTime) : *state.minTime;
            upper = upper ? std::max(*upper, *state.maxTime) : *state.maxTime;
            if (state.complete) {
                covered.push_back(domain::TimeRange{*state.minTime, *state.maxTime});
            } else if (state.lastConfirmedBefore) {
                covered.push_back(domain::TimeRange{*state.lastConfirmedBefore, *state.maxTime});
            }
        }
        if (!lower || !upper) {
            continue;
        }
        for (const auto& gap : uncovered(std::move(covered), *lower, *upper, gapThresholdMs_)) {
            report.gaps.push_back(CoverageGap{synchronizerId, gap});
        }
    }

    LOG_INFO(kLogCategory,
             "Audit migration %lld: %zu files (%zu unreadable), stored %llu updates / %llu events, cursors (%zu, %zu "
             "complete) confirmed %llu / %llu, difference %+lld / %+lld, %zu coverage gaps",
             static_cast<long long>(migrationId), report.files, report.unreadableFiles,
             static_cast<unsigned long long>(report.storedUpdates), static_cast<unsigned long long>(report.storedEvents),
             report.cursors, report.completeCursors, static_cast<unsigned long long>(report.cursorUpdates),
             static_cast<unsigned long long>(report.cursorEvents),
             static_cast<long long>(report.verification.updateDifference),
             static_cast<long long>(report.verification.eventDifference), report.gaps.size());
    if (report.newestStoredRecordTime) {
        LOG_INFO(kLogCategory, "Audit migration %lld: newest stored record_time %s", static_cast<long long>(migrationId),
                 core::time::formatIso8601Ms(*report.newestStoredRecordTime).c_str());
    }
    for (const auto& gap : report.gaps) {
        LOG_WARN(kLogCategory, "Audit migration %lld: %s uncovered %s .. %s", static_cast<long long>(migrationId),
                 gap.synchronizerId.c_str(), core::time::formatIso8601Ms(gap.range.start).c_str(),
                 core::time::formatIso8601Ms(gap.range.end).c_str());
    }
    return report;
}

std::vector<domain::MigrationId> StorageAuditor::knownMigrations() const {
    std::set<domain::MigrationId> ids;

    std::error_code ec;
    std::filesystem::directory_iterator it(dataRoot_, ec);
    for (const std::filesystem::directory_iterator end; !ec && it != end; it.increment(ec)) {
        const std::string name = it->path().filename().string();
        if (!startsWith(name, kMigrationDirPrefix)) {
            continue;
        }
        try {
            ids.insert(std::stoll(name.substr(std::string{kMigrationDirPrefix}.size())));
        } catch (const std::exception&) {
            LOG_WARN(kLogCategory, "Ignoring partition directory %s", name.c_str());
        }
    }
    for (const auto& state : cursorsOf(cursorDir_, std::nullopt)) {
        ids.insert(state.migrationId);
    }
    return {ids.begin(), ids.end()};
}

}  // namespace app
