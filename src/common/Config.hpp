#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "config/Config.h"
#include "core/integrity/EmptyResponseHandler.h"

namespace ldg::common {

struct DedupResetPolicy {
    enum class Mode { Advance, Count };

    Mode mode = Mode::Advance;
    std::size_t count = 0;  // Count mode: reset once the seen set holds this many ids
};

struct Config {
    std::string scanUrl = "https://scan.sv-1.global.canton.network.sync.global/api/scan";
    std::size_t pageSize = 1000;
    std::int64_t windowStepMs = 3600000;
    std::int64_t overlapMs = 1000;

    int maxRetries = 6;
    std::int64_t retryBaseMs = 1000;
    std::int64_t retryMaxMs = 30000;
    std::int64_t cooldownMs = 10000;
    std::int64_t cooldownMaxMs = 60000;
    int cooldownCycles = 2;
    int fetchTimeoutSec = 30;

    std::size_t writerThreads = 4;
    std::size_t maxRowsPerFile = 5000;
    std::size_t highWatermarkJobs = 50;
    std::size_t lowWatermarkJobs = 25;
    std::size_t highWatermarkBytes = 256U * 1024U * 1024U;
    std::size_t lowWatermarkBytes = 128U * 1024U * 1024U;
    int gzipLevel = 1;
    std::int64_t verifyTimeoutMs = 30000;

    std::vector<core::integrity::EmptyStepTier> emptyTiers = core::integrity::EmptyResponseHandler::defaultTiers();

    std::string dataDir = "./data/raw";
    std::string cursorDir = "./data/cursors";

    std::optional<std::int64_t> targetMigration;
    int shardIndex = 0;
    int shardTotal = 1;

    bool live = false;
    bool liveOnly = false;
    std::int64_t pollIntervalMs = 10000;

    DedupResetPolicy dedupReset;
    config::LogLevel logLevel = config::LogLevel::Info;
    std::string logFile = "./logs/ledger-ingest-debug.log";  // Debug/Trace sink
    bool audit = false;

    // Defaults, then environment, then flags (--key value, --key=value, bare switches).
    // Throws std::runtime_error naming the offending setting.
    static Config fromArgs(int argc, char** argv);
};

}  // namespace ldg::common
