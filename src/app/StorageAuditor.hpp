#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "core/integrity/BatchIntegrityTracker.h"
#include "domain/Types.h"

namespace app {

struct CoverageGap {
    std::string synchronizerId;
    domain::TimeRange range;
};

struct AuditReport {
    domain::MigrationId migrationId{0};
    std::size_t files{0};
    std::size_t unreadableFiles{0};
    std::uint64_t storedUpdates{0};
    std::uint64_t storedEvents{0};
    std::optional<domain::TimestampMs> newestStoredRecordTime;

    std::size_t cursors{0};
    std::size_t completeCursors{0};
    std::uint64_t cursorUpdates{0};
    std::uint64_t cursorEvents{0};

    // Stored counts against the sum of confirmed counts; differences are stored minus confirmed.
    core::integrity::BatchVerification verification;
    std::vector<CoverageGap> gaps;

    bool clean() const noexcept { return verification.match && gaps.empty() && unreadableFiles == 0; }
};

// Offline reconciliation of the partition tree against the cursor files of one migration.
class StorageAuditor {
public:
    StorageAuditor(std::filesystem::path dataRoot, std::filesystem::path cursorDir,
                   domain::TimestampMs gapThresholdMs = 60000);

    AuditReport audit(domain::MigrationId migrationId) const;

    // Migrations that have a partition directory or a cursor file.
    std::vector<domain::MigrationId> knownMigrations() const;

private:
    std::filesystem::path dataRoot_;
    std::filesystem::path cursorDir_;
    domain::TimestampMs gapThresholdMs_;
};

}  // namespace app
