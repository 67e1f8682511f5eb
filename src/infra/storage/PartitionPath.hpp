#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "domain/LedgerRecords.hpp"
#include "infra/storage/RecordEncoder.hpp"

namespace infra::storage {

constexpr const char* kPartitionFileExtension = ".pb.gz";

// root/migration=<id>/year=YYYY/month=M/day=D, from the UTC date of partitionTime.
// Month and day are not zero-padded.
std::filesystem::path partitionDir(const std::filesystem::path& root, domain::MigrationId migrationId,
                                   domain::TimestampMs partitionTime);

// 8 hex digits from RAND_bytes. Throws std::runtime_error if the RNG fails.
std::string randomSuffix();

// <type>-<epochMs>-<8 hex>.pb.gz
std::string partitionFileName(RecordType type, domain::TimestampMs epochMs, const std::string& suffix);

// First record's effective time, else its record time, else the wall clock.
domain::TimestampMs partitionTimeFor(const std::vector<domain::LedgerUpdate>& updates);
domain::TimestampMs partitionTimeFor(const std::vector<domain::LedgerEvent>& events);

}  // namespace infra::storage
