#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "adapters/scan/RetryPolicy.hpp"
#include "common/Config.hpp"
#include "core/integrity/BatchIntegrityTracker.h"
#include "core/integrity/DedupTracker.h"
#include "core/integrity/EmptyResponseHandler.h"
#include "core/integrity/IntegrityCursor.h"
#include "core/integrity/TimeRangeManager.h"
#include "core/integrity/WriteVerifier.h"
#include "domain/ILedgerSource.hpp"
#include "domain/Types.h"

namespace core {
class CancellationToken;
}

namespace infra::storage {
class DurableWriter;
}

namespace app {

struct HandOffCounts {
    std::uint64_t updates{0};
    std::uint64_t events{0};
};

// Buffers a deduplicated page in the writer: the updates, and their flattened events
// into the events stream. Blocks while the writer signals backpressure.
HandOffCounts bufferPage(infra::storage::DurableWriter& writer, std::vector<domain::LedgerUpdate> updates);

enum class SessionOutcome { Complete, AlreadyComplete, Cancelled, Failed };

const char* to_string(SessionOutcome outcome) noexcept;

struct SessionResult {
    SessionOutcome outcome{SessionOutcome::Failed};
    std::string streamId;
    std::uint64_t confirmedUpdates{0};  // this run only
    std::uint64_t confirmedEvents{0};
    std::uint64_t pages{0};
    std::uint64_t emptyPages{0};
    std::uint64_t duplicates{0};
    std::uint64_t verifyFailures{0};
    std::optional<domain::FetchFailure> failure;
    core::integrity::BatchVerification batchCheck;
    std::vector<domain::TimeRange> gaps;
};

// One resumable backward walk over a (migration, synchronizer[, shard]) stream. Owns every
// piece of per-stream state; nothing here is shared with other sessions.
//
// A cycle is fetch, decode, dedup, record pending, hand off to the writer, then verify and
// confirm. The walk pointer only moves after the cursor confirmed the write.
class IngestSession {
public:
    static constexpr std::uint64_t kProgressLogPages = 10;
    static constexpr std::size_t kEmptyCheckpointInterval = 100;

    IngestSession(const ldg::common::Config& config, domain::StreamKey key, domain::TimeRange range,
                  domain::ILedgerSource& source, infra::storage::DurableWriter& writer,
                  core::CancellationToken& cancel);

    SessionResult run();

    const core::integrity::IntegrityCursor& cursor() const noexcept { return cursor_; }
    const core::integrity::TimeRangeManager& ranges() const noexcept { return ranges_; }
    const core::integrity::DedupTracker& dedup() const noexcept { return dedup_; }
    const core::integrity::EmptyResponseHandler& emptyHandler() const noexcept { return empty_; }
    const core::integrity::BatchIntegrityTracker& batches() const noexcept { return batches_; }

private:
    enum class Step { Continue, Cancelled, Failed };

    Step handleData_(const domain::FetchWindow& window, domain::FetchData data, SessionResult& result);
    Step handleEmpty_(SessionResult& result);
    Step handleOutOfRange_(const domain::FetchOutOfRange& outOfRange, SessionResult& result);
    Step handleFailure_(const domain::FetchFailure& failure, SessionResult& result);

    // Flush, verify and confirm everything pending against `before`. baseline is the file count
    // taken before the records were handed off. False leaves the cursor as it was.
    bool confirm_(domain::TimestampMs before, core::integrity::FileCounts baseline, SessionResult& result,
                  std::uint64_t& confirmedUpdates, std::uint64_t& confirmedEvents);
    bool finish_(SessionResult& result);
    void applyDedupPolicy_(const std::vector<std::string>& carryOverIds);
    void logProgress_(const SessionResult& result, const char* reason) const;

    const ldg::common::Config& config_;
    domain::StreamKey key_;
    domain::TimeRange range_;
    domain::ILedgerSource& source_;
    infra::storage::DurableWriter& writer_;
    core::CancellationToken& cancel_;

    core::integrity::IntegrityCursor cursor_;
    core::integrity::TimeRangeManager ranges_;
    core::integrity::DedupTracker dedup_;
    core::integrity::EmptyResponseHandler empty_;
    core::integrity::BatchIntegrityTracker batches_;
    core::integrity::WriteVerifier verifier_;
    // Paces re-fetches of a window whose write keeps failing.
    adapters::scan::RetryPolicy writeRetry_;

    // Set after a failed verification; the retried window re-buffers records already counted as pending.
    bool retryingWindow_{false};
    int verifyFailureStreak_{0};
    std::uint64_t startConfirmedUpdates_{0};
    std::uint64_t startConfirmedEvents_{0};
    double startProgress_{0.0};
    std::chrono::steady_clock::time_point startedAt_;
};

}  // namespace app
