#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "domain/FetchResult.hpp"
#include "domain/Types.h"

namespace domain {

struct SynchronizerRange {
    std::string synchronizerId;
    TimestampMs minTime{0};
    TimestampMs maxTime{0};
};

struct MigrationInfo {
    MigrationId migrationId{0};
    std::vector<SynchronizerRange> ranges;
};

class ILedgerSource {
 public:
  virtual ~ILedgerSource() = default;

  // Backward, time-windowed page: records with atOrAfter <= t < before, newest first.
  virtual FetchResult fetchUpdatesBefore(MigrationId migrationId,
                                         const std::string& synchronizerId,
                                         TimestampMs before,
                                         std::optional<TimestampMs> atOrAfter,
                                         std::size_t count) = 0;

  // Forward page after a (migration, record_time) marker, oldest first.
  virtual FetchResult fetchUpdatesAfter(std::optional<MigrationId> afterMigrationId,
                                        const std::optional<std::string>& afterRecordTime,
                                        std::size_t pageSize) = 0;

  // std::nullopt when the migration does not exist.
  virtual std::optional<MigrationInfo> getMigrationInfo(MigrationId migrationId) = 0;

  virtual std::vector<MigrationId> detectMigrations() = 0;
};

}  // namespace domain
