#include "common/Config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

#include "logging/Log.h"

namespace ldg::common {
namespace {

constexpr auto kLogCategory = logging::LogCategory::APP;
constexpr std::size_t kMaxPageSize = 1000;

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

std::string trim(std::string value) {
    auto isSpace = [](unsigned char ch) { return std::isspace(ch) != 0; };
    value.erase(value.begin(), std::find_if(value.begin(), value.end(), [&](unsigned char ch) {
                   return !isSpace(ch);
               }));
    value.erase(std::find_if(value.rbegin(), value.rend(), [&](unsigned char ch) {
                    return !isSpace(ch);
                }).base(),
                value.end());
    return value;
}

std::int64_t parseInteger(const std::string& value, const std::string& label, std::int64_t minValue,
                          std::int64_t maxValue = std::numeric_limits<std::int64_t>::max()) {
    try {
        std::size_t consumed = 0;
        const auto parsed = std::stoll(value, &consumed);
        if (consumed != value.size() || parsed < minValue || parsed > maxValue) {
            throw std::out_of_range("value out of range");
        }
        return parsed;
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid value for " + label + ": " + value);
    }
}

std::size_t parseSize(const std::string& value, const std::string& label, std::size_t minValue = 0) {
    return static_cast<std::size_t>(parseInteger(value, label, static_cast<std::int64_t>(minValue)));
}

bool parseBool(const std::string& value, const std::string& label) {
    const auto normalized = toLower(value);
    if (normalized == "true" || normalized == "1" || normalized == "yes" || normalized == "on") {
        return true;
    }
    if (normalized == "false" || normalized == "0" || normalized == "no" || normalized == "off") {
        return false;
    }
    throw std::runtime_error("Invalid boolean for " + label + ": " + value);
}

std::vector<std::string> parseCsvList(const std::string& value) {
    std::vector<std::string> parts;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ',')) {
        auto trimmed = trim(item);
        if (!trimmed.empty()) {
            parts.push_back(std::move(trimmed));
        }
    }
    return parts;
}

std::vector<core::integrity::EmptyStepTier> parseEmptyTiers(const std::string& value, const std::string& label) {
    std::vector<core::integrity::EmptyStepTier> tiers;
    for (const auto& entry : parseCsvList(value)) {
        const auto colon = entry.find(':');
        if (colon == std::string::npos) {
            throw std::runtime_error("Invalid tier '" + entry + "' in " + label + " (expected threshold:stepMs)");
        }
        core::integrity::EmptyStepTier tier;
        tier.threshold = parseSize(trim(entry.substr(0, colon)), label);
        tier.stepMs = parseInteger(trim(entry.substr(colon + 1)), label, 1);
        tiers.push_back(tier);
    }
    if (tiers.empty() || tiers.front().threshold != 0) {
        throw std::runtime_error("Invalid " + label + ": table must start at threshold 0");
    }
    for (std::size_t i = 1; i < tiers.size(); ++i) {
        if (tiers[i].threshold <= tiers[i - 1].threshold) {
            throw std::runtime_error("Invalid " + label + ": thresholds must be strictly increasing");
        }
    }
    return tiers;
}

DedupResetPolicy parseDedupReset(const std::string& value, const std::string& label) {
    const auto normalized = toLower(trim(value));
    DedupResetPolicy policy;
    if (normalized == "advance") {
        return policy;
    }
    const std::string prefix = "count:";
    if (normalized.rfind(prefix, 0) == 0) {
        policy.mode = DedupResetPolicy::Mode::Count;
        policy.count = parseSize(normalized.substr(prefix.size()), label, 1);
        return policy;
    }
    throw std::runtime_error("Invalid value for " + label + ": " + value + " (expected advance or count:<n>)");
}

config::LogLevel parseLogLevel(const std::string& value, const std::string& label) {
    const auto level = config::parseLogLevel(trim(value));
    if (!level) {
        throw std::runtime_error("Invalid value for " + label + ": " + value);
    }
    return *level;
}

std::string valueFromArgs(int argc, char** argv, const std::string& key) {
    const std::string withEquals = key + '=';
    for (int i = 1; i < argc; ++i) {
        std::string arg{argv[i]};
        if (arg == key) {
            if (i + 1 >= argc || std::string{argv[i + 1]}.rfind("--", 0) == 0) {
                throw std::runtime_error("Missing value for " + key);
            }
            return argv[i + 1];
        }
        if (arg.rfind(withEquals, 0) == 0) {
            return arg.substr(withEquals.size());
        }
    }
    return {};
}

// Bare "--key" means true; "--key=<bool>" is parsed.
std::optional<bool> switchFromArgs(int argc, char** argv, const std::string& key) {
    const std::string withEquals = key + '=';
    for (int i = 1; i < argc; ++i) {
        std::string arg{argv[i]};
        if (arg == key) {
            return true;
        }
        if (arg.rfind(withEquals, 0) == 0) {
            return parseBool(arg.substr(withEquals.size()), key);
        }
    }
    return std::nullopt;
}

std::string envValue(const char* name) {
    if (const char* raw = std::getenv(name)) {
        return trim(raw);
    }
    return {};
}

void ensureDirectory(const std::string& dir, const char* label) {
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        throw std::runtime_error(std::string{"Could not create "} + label + " (" + dir + "): " + ec.message());
    }
}

}  // namespace

Config Config::fromArgs(int argc, char** argv) {
    Config config{};

    if (auto env = envValue("SCAN_URL"); !env.empty()) {
        config.scanUrl = env;
    }
    if (auto env = envValue("BATCH_SIZE"); !env.empty()) {
        config.pageSize = parseSize(env, "BATCH_SIZE", 1);
    }
    if (auto env = envValue("WINDOW_STEP_MS"); !env.empty()) {
        config.windowStepMs = parseInteger(env, "WINDOW_STEP_MS", 1);
    }
    if (auto env = envValue("OVERLAP_MS"); !env.empty()) {
        config.overlapMs = parseInteger(env, "OVERLAP_MS", 0);
    }
    if (auto env = envValue("MAX_RETRIES"); !env.empty()) {
        config.maxRetries = static_cast<int>(parseInteger(env, "MAX_RETRIES", 0, 100));
    }
    if (auto env = envValue("RETRY_BASE_DELAY_MS"); !env.empty()) {
        config.retryBaseMs = parseInteger(env, "RETRY_BASE_DELAY_MS", 0);
    }
    if (auto env = envValue("RETRY_MAX_DELAY_MS"); !env.empty()) {
        config.retryMaxMs = parseInteger(env, "RETRY_MAX_DELAY_MS", 0);
    }
    if (auto env = envValue("COOLDOWN_MS"); !env.empty()) {
        config.cooldownMs = parseInteger(env, "COOLDOWN_MS", 0);
    }
    if (auto env = envValue("COOLDOWN_MAX_MS"); !env.empty()) {
        config.cooldownMaxMs = parseInteger(env, "COOLDOWN_MAX_MS", 0);
    }
    if (auto env = envValue("COOLDOWN_CYCLES"); !env.empty()) {
        config.cooldownCycles = static_cast<int>(parseInteger(env, "COOLDOWN_CYCLES", 0, 100));
    }
    if (auto env = envValue("FETCH_TIMEOUT_S"); !env.empty()) {
        config.fetchTimeoutSec = static_cast<int>(parseInteger(env, "FETCH_TIMEOUT_S", 1, 3600));
    }
    if (auto env = envValue("WRITER_THREADS"); !env.empty()) {
        config.writerThreads = parseSize(env, "WRITER_THREADS", 1);
    }
    if (auto env = envValue("MAX_ROWS_PER_FILE"); !env.empty()) {
        config.maxRowsPerFile = parseSize(env, "MAX_ROWS_PER_FILE", 1);
    }
    if (auto env = envValue("MAX_PENDING_WRITES"); !env.empty()) {
        config.highWatermarkJobs = parseSize(env, "MAX_PENDING_WRITES", 1);
    }
    if (auto env = envValue("RESUME_PENDING_WRITES"); !env.empty()) {
        config.lowWatermarkJobs = parseSize(env, "RESUME_PENDING_WRITES");
    }
    if (auto env = envValue("MAX_PENDING_BYTES"); !env.empty()) {
        config.highWatermarkBytes = parseSize(env, "MAX_PENDING_BYTES", 1);
    }
    if (auto env = envValue("RESUME_PENDING_BYTES"); !env.empty()) {
        config.lowWatermarkBytes = parseSize(env, "RESUME_PENDING_BYTES");
    }
    if (auto env = envValue("GZIP_LEVEL"); !env.empty()) {
        config.gzipLevel = static_cast<int>(parseInteger(env, "GZIP_LEVEL", 0, 9));
    }
    if (auto env = envValue("WRITE_VERIFY_TIMEOUT_MS"); !env.empty()) {
        config.verifyTimeoutMs = parseInteger(env, "WRITE_VERIFY_TIMEOUT_MS", 1);
    }
    if (auto env = envValue("EMPTY_TIERS"); !env.empty()) {
        config.emptyTiers = parseEmptyTiers(env, "EMPTY_TIERS");
    }
    if (auto env = envValue("DATA_DIR"); !env.empty()) {
        config.dataDir = env;
    }
    if (auto env = envValue("CURSOR_DIR"); !env.empty()) {
        config.cursorDir = env;
    }
    if (auto env = envValue("TARGET_MIGRATION"); !env.empty()) {
        config.targetMigration = parseInteger(env, "TARGET_MIGRATION", 0);
    }
    if (auto env = envValue("SHARD_INDEX"); !env.empty()) {
        config.shardIndex = static_cast<int>(parseInteger(env, "SHARD_INDEX", 0, 1024));
    }
    if (auto env = envValue("SHARD_TOTAL"); !env.empty()) {
        config.shardTotal = static_cast<int>(parseInteger(env, "SHARD_TOTAL", 1, 1024));
    }
    if (auto env = envValue("LIVE_MODE"); !env.empty()) {
        config.live = parseBool(env, "LIVE_MODE");
    }
    if (auto env = envValue("POLL_INTERVAL_MS"); !env.empty()) {
        config.pollIntervalMs = parseInteger(env, "POLL_INTERVAL_MS", 1);
    }
    if (auto env = envValue("DEDUP_RESET"); !env.empty()) {
        config.dedupReset = parseDedupReset(env, "DEDUP_RESET");
    }
    if (auto env = envValue("LOG_LEVEL"); !env.empty()) {
        config.logLevel = parseLogLevel(env, "LOG_LEVEL");
    }
    if (auto env = envValue("LOG_FILE"); !env.empty()) {
        config.logFile = env;
    }

    if (auto arg = valueFromArgs(argc, argv, "--scan-url"); !arg.empty()) {
        config.scanUrl = trim(arg);
    }
    if (auto arg = valueFromArgs(argc, argv, "--page-size"); !arg.empty()) {
        config.pageSize = parseSize(arg, "--page-size", 1);
    }
    if (auto arg = valueFromArgs(argc, argv, "--window-step-ms"); !arg.empty()) {
        config.windowStepMs = parseInteger(arg, "--window-step-ms", 1);
    }
    if (auto arg = valueFromArgs(argc, argv, "--overlap-ms"); !arg.empty()) {
        config.overlapMs = parseInteger(arg, "--overlap-ms", 0);
    }
    if (auto arg = valueFromArgs(argc, argv, "--max-retries"); !arg.empty()) {
        config.maxRetries = static_cast<int>(parseInteger(arg, "--max-retries", 0, 100));
    }
    if (auto arg = valueFromArgs(argc, argv, "--retry-base-ms"); !arg.empty()) {
        config.retryBaseMs = parseInteger(arg, "--retry-base-ms", 0);
    }
    if (auto arg = valueFromArgs(argc, argv, "--retry-max-ms"); !arg.empty()) {
        config.retryMaxMs = parseInteger(arg, "--retry-max-ms", 0);
    }
    if (auto arg = valueFromArgs(argc, argv, "--cooldown-ms"); !arg.empty()) {
        config.cooldownMs = parseInteger(arg, "--cooldown-ms", 0);
    }
    if (auto arg = valueFromArgs(argc, argv, "--cooldown-max-ms"); !arg.empty()) {
        config.cooldownMaxMs = parseInteger(arg, "--cooldown-max-ms", 0);
    }
    if (auto arg = valueFromArgs(argc, argv, "--cooldown-cycles"); !arg.empty()) {
        config.cooldownCycles = static_cast<int>(parseInteger(arg, "--cooldown-cycles", 0, 100));
    }
    if (auto arg = valueFromArgs(argc, argv, "--fetch-timeout-s"); !arg.empty()) {
        config.fetchTimeoutSec = static_cast<int>(parseInteger(arg, "--fetch-timeout-s", 1, 3600));
    }
    if (auto arg = valueFromArgs(argc, argv, "--writer-threads"); !arg.empty()) {
        config.writerThreads = parseSize(arg, "--writer-threads", 1);
    }
    if (auto arg = valueFromArgs(argc, argv, "--max-rows-per-file"); !arg.empty()) {
        config.maxRowsPerFile = parseSize(arg, "--max-rows-per-file", 1);
    }
    if (auto arg = valueFromArgs(argc, argv, "--high-watermark"); !arg.empty()) {
        config.highWatermarkJobs = parseSize(arg, "--high-watermark", 1);
    }
    if (auto arg = valueFromArgs(argc, argv, "--low-watermark"); !arg.empty()) {
        config.lowWatermarkJobs = parseSize(arg, "--low-watermark");
    }
    if (auto arg = valueFromArgs(argc, argv, "--high-watermark-bytes"); !arg.empty()) {
        config.highWatermarkBytes = parseSize(arg, "--high-watermark-bytes", 1);
    }
    if (auto arg = valueFromArgs(argc, argv, "--low-watermark-bytes"); !arg.empty()) {
        config.lowWatermarkBytes = parseSize(arg, "--low-watermark-bytes");
    }
    if (auto arg = valueFromArgs(argc, argv, "--gzip-level"); !arg.empty()) {
        config.gzipLevel = static_cast<int>(parseInteger(arg, "--gzip-level", 0, 9));
    }
    if (auto arg = valueFromArgs(argc, argv, "--verify-timeout-ms"); !arg.empty()) {
        config.verifyTimeoutMs = parseInteger(arg, "--verify-timeout-ms", 1);
    }
    if (auto arg = valueFromArgs(argc, argv, "--empty-tiers"); !arg.empty()) {
        config.emptyTiers = parseEmptyTiers(arg, "--empty-tiers");
    }
    if (auto arg = valueFromArgs(argc, argv, "--data-dir"); !arg.empty()) {
        config.dataDir = trim(arg);
    }
    if (auto arg = valueFromArgs(argc, argv, "--cursor-dir"); !arg.empty()) {
        config.cursorDir = trim(arg);
    }
    if (auto arg = valueFromArgs(argc, argv, "--migration"); !arg.empty()) {
        config.targetMigration = parseInteger(arg, "--migration", 0);
    }
    if (auto arg = valueFromArgs(argc, argv, "--shard-index"); !arg.empty()) {
        config.shardIndex = static_cast<int>(parseInteger(arg, "--shard-index", 0, 1024));
    }
    if (auto arg = valueFromArgs(argc, argv, "--shard-total"); !arg.empty()) {
        config.shardTotal = static_cast<int>(parseInteger(arg, "--shard-total", 1, 1024));
    }
    if (auto arg = valueFromArgs(argc, argv, "--poll-interval-ms"); !arg.empty()) {
        config.pollIntervalMs = parseInteger(arg, "--poll-interval-ms", 1);
    }
    if (auto arg = valueFromArgs(argc, argv, "--dedup-reset"); !arg.empty()) {
        config.dedupReset = parseDedupReset(arg, "--dedup-reset");
    }
    if (auto arg = valueFromArgs(argc, argv, "--log-level"); !arg.empty()) {
        config.logLevel = parseLogLevel(arg, "--log-level");
    }
    if (auto arg = valueFromArgs(argc, argv, "--log-file"); !arg.empty()) {
        config.logFile = trim(arg);
    }

    if (const auto live = switchFromArgs(argc, argv, "--live")) {
        config.live = *live;
    }
    if (const auto liveOnly = switchFromArgs(argc, argv, "--live-only")) {
        config.liveOnly = *liveOnly;
    }
    if (const auto audit = switchFromArgs(argc, argv, "--audit")) {
        config.audit = *audit;
    }

    if (config.pageSize == 0 || config.pageSize > kMaxPageSize) {
        throw std::runtime_error("Page size must be between 1 and " + std::to_string(kMaxPageSize) + ", got " +
                                 std::to_string(config.pageSize));
    }
    if (config.lowWatermarkJobs > config.highWatermarkJobs) {
        throw std::runtime_error("Low watermark (" + std::to_string(config.lowWatermarkJobs) +
                                 ") exceeds high watermark (" + std::to_string(config.highWatermarkJobs) + ")");
    }
    if (config.lowWatermarkBytes > config.highWatermarkBytes) {
        throw std::runtime_error("Low byte watermark exceeds high byte watermark");
    }
    if (config.shardIndex >= config.shardTotal) {
        throw std::runtime_error("Shard index " + std::to_string(config.shardIndex) + " must be below shard total " +
                                 std::to_string(config.shardTotal));
    }
    if (config.retryMaxMs < config.retryBaseMs) {
        throw std::runtime_error("Retry cap is below the base delay");
    }
    if (config.scanUrl.empty()) {
        throw std::runtime_error("Scan URL must not be empty");
    }
    if (config.liveOnly) {
        config.live = true;
    }

    ensureDirectory(config.dataDir, "data directory");
    ensureDirectory(config.cursorDir, "cursor directory");

    LOG_INFO(kLogCategory, "Data dir: %s, cursor dir: %s", config.dataDir.c_str(), config.cursorDir.c_str());

    return config;
}

}  // namespace ldg::common
