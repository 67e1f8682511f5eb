#include "infra/storage/PartitionPath.hpp"

#include <array>
#include <cstdio>
#include <stdexcept>

#include <openssl/err.h>
#include <openssl/rand.h>

#include "core/TimeUtils.h"

namespace infra::storage {

std::filesystem::path partitionDir(const std::filesystem::path& root, domain::MigrationId migrationId,
                                   domain::TimestampMs partitionTime) {
    const auto date = core::time::utcDate(partitionTime);
    return root / ("migration=" + std::to_string(migrationId)) / ("year=" + std::to_string(date.year)) /
           ("month=" + std::to_string(date.month)) / ("day=" + std::to_string(date.day));
}

std::string randomSuffix() {
    std::array<unsigned char, 4> bytes{};
    if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
        const unsigned long err = ::ERR_get_error();
        const char* reason = err != 0 ? ::ERR_reason_error_string(err) : nullptr;
        throw std::runtime_error(std::string{"RAND_bytes failed"} + (reason != nullptr ? ": " : "") +
                                 (reason != nullptr ? reason : ""));
    }
    char hex[9];
    std::snprintf(hex, sizeof(hex), "%02x%02x%02x%02x", bytes[0], bytes[1], bytes[2], bytes[3]);
    return hex;
}

std::string partitionFileName(RecordType type, domain::TimestampMs epochMs, const std::string& suffix) {
    return std::string{to_string(type)} + "-" + std::to_string(epochMs) + "-" + suffix + kPartitionFileExtension;
}

domain::TimestampMs partitionTimeFor(const std::vector<domain::LedgerUpdate>& updates) {
    if (!updates.empty()) {
        const auto& first = updates.front();
        if (first.effectiveAt) {
            return *first.effectiveAt;
        }
        if (first.recordTime) {
            return *first.recordTime;
        }
    }
    return core::time::nowMs();
}

domain::TimestampMs partitionTimeFor(const std::vector<domain::LedgerEvent>& events) {
    if (!events.empty() && events.front().effectiveAt > 0) {
        return events.front().effectiveAt;
    }
    return core::time::nowMs();
}

}  // namespace infra::storage
