#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "adapters/scan/ScanApiClient.hpp"
#include "app/BackfillOrchestrator.hpp"
#include "app/LiveIngestor.hpp"
#include "app/StorageAuditor.hpp"
#include "common/Config.hpp"
#include "common/Metrics.hpp"
#include "core/Cancellation.h"
#include "infra/storage/DurableWriter.hpp"
#include "logging/Log.h"

namespace {

constexpr auto kLogCategory = logging::LogCategory::APP;

volatile std::sig_atomic_t gSignalStatus = 0;

void handleSignal(int signal) {
    gSignalStatus = signal;
}

adapters::scan::ScanApiClient::Options clientOptions(const ldg::common::Config& config) {
    adapters::scan::ScanApiClient::Options options;
    options.baseUrl = config.scanUrl;
    options.timeoutSec = config.fetchTimeoutSec;
    options.retry.maxRetries = config.maxRetries;
    options.retry.baseDelay = std::chrono::milliseconds(config.retryBaseMs);
    options.retry.maxDelay = std::chrono::milliseconds(config.retryMaxMs);
    options.retry.cooldown = std::chrono::milliseconds(config.cooldownMs);
    options.retry.cooldownMax = std::chrono::milliseconds(config.cooldownMaxMs);
    options.retry.cooldownCycles = config.cooldownCycles;
    return options;
}

infra::storage::DurableWriterConfig writerConfig(const ldg::common::Config& config) {
    infra::storage::DurableWriterConfig writer;
    writer.root = config.dataDir;
    writer.maxRowsPerFile = config.maxRowsPerFile;
    writer.pool.threads = config.writerThreads;
    writer.pool.highWatermarkJobs = config.highWatermarkJobs;
    writer.pool.lowWatermarkJobs = config.lowWatermarkJobs;
    writer.pool.highWatermarkBytes = config.highWatermarkBytes;
    writer.pool.lowWatermarkBytes = config.lowWatermarkBytes;
    writer.pool.gzipLevel = config.gzipLevel;
    return writer;
}

int runAudit(const ldg::common::Config& config) {
    app::StorageAuditor auditor(config.dataDir, config.cursorDir);
    std::vector<domain::MigrationId> migrations;
    if (config.targetMigration) {
        migrations.push_back(*config.targetMigration);
    } else {
        migrations = auditor.knownMigrations();
    }
    if (migrations.empty()) {
        LOG_WARN(kLogCategory, "Nothing to audit under %s", config.dataDir.c_str());
        return EXIT_SUCCESS;
    }

    bool clean = true;
    for (const auto migrationId : migrations) {
        clean = auditor.audit(migrationId).clean() && clean;
    }
    LOG_INFO(kLogCategory, "Audit %s", clean ? "passed" : "found discrepancies");
    return clean ? EXIT_SUCCESS : EXIT_FAILURE;
}

}  // namespace

int main(int argc, char** argv) {
    std::set_terminate([] {
        if (auto eptr = std::current_exception()) {
            try {
                std::rethrow_exception(eptr);
            } catch (const std::exception& ex) {
                std::fprintf(stderr, "std::terminate: %s\n", ex.what());
            } catch (...) {
                std::fprintf(stderr, "std::terminate: unknown exception\n");
            }
        } else {
            std::fprintf(stderr, "std::terminate without current_exception\n");
        }
        logging::Log::flush();
        std::_Exit(1);
    });

    int exitCode = EXIT_SUCCESS;
    try {
        const auto config = ldg::common::Config::fromArgs(argc, argv);
        logging::LogOptions logOptions;
        logOptions.level = config.logLevel;
        logOptions.debugFile = config.logFile;
        logging::Log::configure(logOptions);

        LOG_INFO(kLogCategory, "Configuration loaded");
        LOG_INFO(kLogCategory, "  Scan URL: %s", config.scanUrl.c_str());
        LOG_INFO(kLogCategory, "  Log level: %s", config::toString(config.logLevel));
        LOG_INFO(kLogCategory, "  Page size: %zu, window step: %lld ms, overlap: %lld ms", config.pageSize,
                 static_cast<long long>(config.windowStepMs), static_cast<long long>(config.overlapMs));
        LOG_INFO(kLogCategory, "  Writer: %zu threads, %zu rows/file, watermarks %zu/%zu jobs, gzip %d",
                 config.writerThreads, config.maxRowsPerFile, config.highWatermarkJobs, config.lowWatermarkJobs,
                 config.gzipLevel);
        LOG_INFO(kLogCategory, "  Shard: %d/%d, migration: %s, live: %s%s", config.shardIndex, config.shardTotal,
                 config.targetMigration ? std::to_string(*config.targetMigration).c_str() : "all",
                 config.live ? "yes" : "no", config.liveOnly ? " (live only)" : "");

        if (config.audit) {
            exitCode = runAudit(config);
            logging::Log::flush();
            return exitCode;
        }

        std::signal(SIGINT, handleSignal);
        std::signal(SIGTERM, handleSignal);

        core::CancellationToken cancel;
        std::atomic<bool> finished{false};
        std::thread signalWatcher([&cancel, &finished]() {
            while (!finished.load(std::memory_order_acquire)) {
                if (gSignalStatus != 0) {
                    LOG_INFO(kLogCategory, "Signal %d received, finishing the current step", static_cast<int>(gSignalStatus));
                    cancel.requestCancel();
                    return;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(200));
            }
        });

        try {
            adapters::scan::ScanApiClient client(clientOptions(config), &cancel);
            infra::storage::DurableWriter writer(writerConfig(config), &cancel);

            bool backfillOk = true;
            if (!config.liveOnly) {
                app::BackfillOrchestrator orchestrator(config, client, writer, cancel);
                const auto report = orchestrator.run();
                backfillOk = report.failed == 0;
                if (!backfillOk) {
                    exitCode = EXIT_FAILURE;
                }
            }

            if (config.live && backfillOk && !cancel.isCancelled()) {
                app::LiveIngestor live(config, client, writer, cancel);
                live.run();
                LOG_INFO(kLogCategory, "Live ingestion running, polling every %lld ms",
                         static_cast<long long>(config.pollIntervalMs));
                live.join();
            }

            writer.shutdown();
        } catch (const std::exception&) {
            finished.store(true, std::memory_order_release);
            signalWatcher.join();
            throw;
        }

        finished.store(true, std::memory_order_release);
        signalWatcher.join();

        LOG_INFO(kLogCategory, "Metrics: %s",
                 ldg::common::metrics::Registry::instance().snapshot().toLogLine().c_str());
        const auto logStats = logging::Log::stats();
        LOG_INFO(kLogCategory, "Log lines: %llu written, %llu dropped, %llu throttled, %llu rotations",
                 static_cast<unsigned long long>(logStats.written), static_cast<unsigned long long>(logStats.dropped),
                 static_cast<unsigned long long>(logStats.suppressed),
                 static_cast<unsigned long long>(logStats.rotations));
        LOG_INFO(kLogCategory, "Shutdown complete");
    } catch (const std::exception& ex) {
        LOG_ERROR(kLogCategory, "Fatal error: %s", ex.what());
        exitCode = EXIT_FAILURE;
    }

    logging::Log::flush();
    return exitCode;
}
