#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "adapters/scan/RetryPolicy.hpp"
#include "common/Config.hpp"
#include "core/Cancellation.h"
#include "core/integrity/DedupTracker.h"
#include "core/integrity/WriteVerifier.h"
#include "domain/ILedgerSource.hpp"

namespace infra::storage {
class DurableWriter;
}

namespace app {

// Forward position of the live stream: the (migration, record_time) of the last confirmed item.
struct LiveMarker {
    domain::MigrationId migrationId{0};
    std::string recordTime;
};

// Polls the forward endpoint from the live cursor and writes each page through the same
// verify-then-advance path as the backfill.
class LiveIngestor {
public:
    static constexpr const char* kCursorFileName = "live-cursor.json";
    static constexpr std::size_t kMaxSeenIds = 100000;

    enum class PollOutcome { Data, CaughtUp, Failed, Cancelled };

    LiveIngestor(const ldg::common::Config& config, domain::ILedgerSource& source,
                 infra::storage::DurableWriter& writer, core::CancellationToken& cancel);
    ~LiveIngestor();

    LiveIngestor(const LiveIngestor&) = delete;
    LiveIngestor& operator=(const LiveIngestor&) = delete;

    // Starts the polling thread. Polling continues until stop() or cancellation.
    void run();
    void stop();
    // Blocks until the polling thread exits.
    void join();

    // One fetch, write and confirm pass.
    PollOutcome pollOnce();

    std::optional<LiveMarker> marker() const;
    std::uint64_t confirmedUpdates() const noexcept { return confirmedUpdates_.load(std::memory_order_relaxed); }
    std::uint64_t confirmedEvents() const noexcept { return confirmedEvents_.load(std::memory_order_relaxed); }

    // std::nullopt when the file is missing, incomplete, or its record_time lies after nowMs.
    static std::optional<LiveMarker> loadMarker(const std::filesystem::path& path, domain::TimestampMs nowMs);
    static void saveMarker(const std::filesystem::path& path, const LiveMarker& marker);
    // Newest max_time among completed backfill cursors in cursorDir.
    static std::optional<LiveMarker> markerFromBackfill(const std::filesystem::path& cursorDir);

private:
    void runWorker_();
    void initMarker_();
    bool sleep_(std::chrono::milliseconds delay);
    bool stopping_() const;

    const ldg::common::Config& config_;
    domain::ILedgerSource& source_;
    infra::storage::DurableWriter& writer_;
    core::CancellationToken& cancel_;
    std::filesystem::path cursorPath_;

    adapters::scan::RetryPolicy cooldown_;
    core::integrity::DedupTracker dedup_;
    core::integrity::WriteVerifier verifier_;

    std::unique_ptr<core::CancellationToken> stop_;
    std::thread worker_;

    mutable std::mutex markerMutex_;
    std::optional<LiveMarker> marker_;
    bool markerReady_{false};
    int failureStreak_{0};

    std::atomic<std::uint64_t> confirmedUpdates_{0};
    std::atomic<std::uint64_t> confirmedEvents_{0};
};

}  // namespace app
