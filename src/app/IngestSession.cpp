#include "app/IngestSession.hpp"

#include <algorithm>
#include <future>
#include <stdexcept>
#include <utility>

#include "common/Metrics.hpp"
#include "core/Cancellation.h"
#include "core/TimeUtils.h"
#include "infra/storage/DurableWriter.hpp"
#include "logging/Log.h"

namespace app {
namespace {

constexpr auto kLogCategory = logging::LogCategory::APP;
constexpr std::size_t kMaxLoggedBody = 2000;

namespace metric_names = ldg::common::metrics::names;

ldg::common::metrics::Registry& metrics() {
    return ldg::common::metrics::Registry::instance();
}

std::string iso(domain::TimestampMs ms) {
    return core::time::formatIso8601Ms(ms);
}

adapters::scan::RetryConfig writeRetryConfig(const ldg::common::Config& config) {
    adapters::scan::RetryConfig retry;
    retry.baseDelay = std::chrono::milliseconds(config.retryBaseMs);
    retry.maxDelay = std::chrono::milliseconds(config.retryMaxMs);
    return retry;
}

}  // namespace

HandOffCounts bufferPage(infra::storage::DurableWriter& writer, std::vector<domain::LedgerUpdate> updates) {
    HandOffCounts counts;
    std::vector<domain::LedgerEvent> events;
    events.reserve(domain::countEvents(updates));
    for (const auto& update : updates) {
        events.insert(events.end(), update.events.begin(), update.events.end());
    }
    counts.updates = updates.size();
    counts.events = events.size();

    writer.bufferUpdates(std::move(updates));
    writer.bufferEvents(std::move(events));
    return counts;
}

const char* to_string(SessionOutcome outcome) noexcept {
    switch (outcome) {
    case SessionOutcome::Complete:
        return "complete";
    case SessionOutcome::AlreadyComplete:
        return "already-complete";
    case SessionOutcome::Cancelled:
        return "cancelled";
    case SessionOutcome::Failed:
        return "failed";
    }
    return "unknown";
}

IngestSession::IngestSession(const ldg::common::Config& config, domain::StreamKey key, domain::TimeRange range,
                             domain::ILedgerSource& source, infra::storage::DurableWriter& writer,
                             core::CancellationToken& cancel)
    : config_(config),
      key_(std::move(key)),
      range_(range),
      source_(source),
      writer_(writer),
      cancel_(cancel),
      cursor_(config.cursorDir, key_),
      ranges_(range.start, range.end, config.overlapMs),
      empty_(config.emptyTiers),
      verifier_(writer.root(), &cancel),
      writeRetry_(writeRetryConfig(config)) {}

SessionResult IngestSession::run() {
    SessionResult result;
    result.streamId = cursor_.state().id;

    if (cursor_.load() && cursor_.isComplete()) {
        LOG_INFO(kLogCategory, "%s already complete (%llu updates, %llu events), skipping", result.streamId.c_str(),
                 static_cast<unsigned long long>(cursor_.state().confirmedUpdates),
                 static_cast<unsigned long long>(cursor_.state().confirmedEvents));
        result.outcome = SessionOutcome::AlreadyComplete;
        return result;
    }

    cursor_.setTimeBounds(range_.start, range_.end);
    if (const auto resume = cursor_.getResumePosition()) {
        ranges_.snapTo(*resume);
        dedup_.resetRetaining(cursor_.state().boundaryIds);
        LOG_INFO(kLogCategory, "%s resuming from %s (%llu updates confirmed)", result.streamId.c_str(),
                 iso(ranges_.currentBefore()).c_str(),
                 static_cast<unsigned long long>(cursor_.state().confirmedUpdates));
    } else {
        LOG_INFO(kLogCategory, "%s starting fresh: %s .. %s", result.streamId.c_str(), iso(range_.start).c_str(),
                 iso(range_.end).c_str());
    }

    startConfirmedUpdates_ = cursor_.state().confirmedUpdates;
    startConfirmedEvents_ = cursor_.state().confirmedEvents;
    startProgress_ = ranges_.getProgress();
    startedAt_ = std::chrono::steady_clock::now();

    while (true) {
        if (cancel_.isCancelled()) {
            result.outcome = SessionOutcome::Cancelled;
            break;
        }

        const auto window = ranges_.getNextRange(config_.windowStepMs);
        if (!window) {
            if (finish_(result)) {
                result.outcome = SessionOutcome::Complete;
            } else {
                result.outcome = cancel_.isCancelled() ? SessionOutcome::Cancelled : SessionOutcome::Failed;
            }
            break;
        }

        domain::FetchResult fetched;
        {
            ldg::common::metrics::Registry::ScopedTimer timer(metric_names::kFetchStage);
            fetched = source_.fetchUpdatesBefore(key_.migrationId, key_.synchronizerId, window->before,
                                                 window->atOrAfter, config_.pageSize);
        }

        Step step = Step::Continue;
        if (auto* data = std::get_if<domain::FetchData>(&fetched)) {
            step = handleData_(*window, std::move(*data), result);
        } else if (std::holds_alternative<domain::FetchEmpty>(fetched)) {
            step = handleEmpty_(result);
        } else if (const auto* outOfRange = std::get_if<domain::FetchOutOfRange>(&fetched)) {
            step = handleOutOfRange_(*outOfRange, result);
        } else {
            step = handleFailure_(std::get<domain::FetchFailure>(fetched), result);
        }

        if (step == Step::Failed) {
            result.outcome = SessionOutcome::Failed;
            break;
        }
        if (step == Step::Cancelled) {
            result.outcome = SessionOutcome::Cancelled;
            break;
        }
    }

    const auto& state = cursor_.state();
    result.batchCheck = batches_.verify(state.confirmedUpdates - startConfirmedUpdates_,
                                        state.confirmedEvents - startConfirmedEvents_);
    result.gaps = ranges_.detectGaps();
    for (const auto& gap : result.gaps) {
        LOG_WARN(kLogCategory, "%s: uncovered span %s .. %s", result.streamId.c_str(), iso(gap.start).c_str(),
                 iso(gap.end).c_str());
    }
    logProgress_(result, to_string(result.outcome));
    return result;
}

IngestSession::Step IngestSession::handleData_(const domain::FetchWindow& window, domain::FetchData data,
                                               SessionResult& result) {
    ++result.pages;
    metrics().incrementCounter(metric_names::kPages);
    empty_.resetOnData();

    const domain::TimestampMs current = ranges_.currentBefore();
    domain::TimestampMs nextBefore = current - 1;
    if (data.oldest) {
        nextBefore = *data.oldest + 1;
        if (nextBefore >= current) {
            if (data.rawCount >= config_.pageSize) {
                // A full page inside one millisecond: records beyond the page in that millisecond are not reachable.
                LOG_WARN(kLogCategory, "%s: full page of %zu records all at %s, stepping 1ms past it; "
                         "records beyond the page in that millisecond are skipped",
                         result.streamId.c_str(), data.rawCount, iso(current - 1).c_str());
                metrics().incrementCounter(metric_names::kSaturatedMillis);
            } else {
                LOG_DEBUG(kLogCategory, "%s: page at %s does not move the pointer, stepping 1ms",
                          result.streamId.c_str(), iso(current).c_str());
            }
            nextBefore = current - 1;
        }
    } else {
        LOG_WARN(kLogCategory, "%s: %zu items at %s, none decodable; stepping 1ms", result.streamId.c_str(),
                 data.rawCount, iso(current).c_str());
    }
    // A short page drained the window.
    if (data.rawCount < config_.pageSize) {
        const domain::TimestampMs nominalStart = std::max(ranges_.minTime(), window.before - config_.windowStepMs);
        nextBefore = std::min(nextBefore, nominalStart);
    }
    nextBefore = std::max(nextBefore, ranges_.minTime());

    // Records below nextBefore come back with the next window, duplicates of this page included.
    std::vector<std::string> boundaryIds;
    for (const auto& update : data.updates) {
        if (update.updateId && update.orderingTime().value_or(nextBefore) < nextBefore) {
            boundaryIds.push_back(*update.updateId);
        }
    }

    const std::size_t fetchedCount = data.updates.size();
    auto unique = dedup_.deduplicate(std::move(data.updates));
    const std::size_t duplicates = fetchedCount - unique.size();
    if (duplicates > 0) {
        result.duplicates += duplicates;
        metrics().incrementCounter(metric_names::kDuplicates, duplicates);
    }

    std::vector<std::string> newIds;
    newIds.reserve(unique.size());
    for (const auto& update : unique) {
        if (update.updateId) {
            newIds.push_back(*update.updateId);
        }
    }

    const std::uint64_t pageUpdates = unique.size();
    const std::uint64_t pageEvents = domain::countEvents(unique);
    if (retryingWindow_) {
        const auto& state = cursor_.state();
        cursor_.recordPending(pageUpdates > state.pendingUpdates ? pageUpdates - state.pendingUpdates : 0,
                              pageEvents > state.pendingEvents ? pageEvents - state.pendingEvents : 0);
    } else {
        cursor_.recordPending(pageUpdates, pageEvents);
    }

    const auto baseline = verifier_.countFiles();
    try {
        bufferPage(writer_, std::move(unique));
    } catch (const std::runtime_error& ex) {
        if (cancel_.isCancelled()) {
            LOG_INFO(kLogCategory, "%s: hand-off interrupted by shutdown", result.streamId.c_str());
            return Step::Continue;
        }
        throw;
    }

    std::uint64_t confirmedUpdates = 0;
    std::uint64_t confirmedEvents = 0;
    cursor_.stageBoundary(boundaryIds);
    if (!confirm_(nextBefore, baseline, result, confirmedUpdates, confirmedEvents)) {
        // Same window next cycle; the records must reach the writer again.
        retryingWindow_ = true;
        dedup_.forget(newIds);
        const auto delay = writeRetry_.backoffDelay(verifyFailureStreak_++);
        LOG_WARN(kLogCategory, "%s: write not confirmed (%d in a row), retrying window before %s in %lld ms",
                 result.streamId.c_str(), verifyFailureStreak_, iso(current).c_str(),
                 static_cast<long long>(delay.count()));
        if (!cancel_.sleepFor(delay)) {
            return Step::Cancelled;
        }
        return Step::Continue;
    }
    retryingWindow_ = false;
    verifyFailureStreak_ = 0;

    batches_.recordBatch(result.streamId + "@" + std::to_string(nextBefore), confirmedUpdates, confirmedEvents,
                         domain::TimeRange{nextBefore, window.before});
    ranges_.advance(nextBefore);
    applyDedupPolicy_(boundaryIds);
    metrics().setGauge(metric_names::kProgressPct, ranges_.getProgress());

    if (result.pages % kProgressLogPages == 0) {
        logProgress_(result, "progress");
    }
    return Step::Continue;
}

IngestSession::Step IngestSession::handleEmpty_(SessionResult& result) {
    ++result.emptyPages;
    metrics().incrementCounter(metric_names::kEmptyPages);

    const auto decision = empty_.handleEmpty(ranges_.currentBefore(), ranges_.minTime());
    if (decision.action == core::integrity::EmptyAction::Done) {
        LOG_INFO(kLogCategory, "%s: empty responses reached the lower bound after %zu in a row",
                 result.streamId.c_str(), decision.consecutiveEmpty);
        ranges_.advance(ranges_.minTime());
        return Step::Continue;
    }

    LOG_INFO_EVERY(result.streamId.c_str(), 10000, kLogCategory, "%s: %zu consecutive empty responses, step %lldms, at %s",
                   result.streamId.c_str(), decision.consecutiveEmpty, decision.stepMs,
                   iso(decision.newBefore).c_str());
    ranges_.advance(decision.newBefore);

    // Long empty stretches are checkpointed so a restart does not walk them again.
    if (decision.consecutiveEmpty % kEmptyCheckpointInterval == 0 && !cursor_.hasPending()) {
        std::uint64_t updates = 0;
        std::uint64_t events = 0;
        cursor_.stageBoundary({});
        confirm_(ranges_.currentBefore(), verifier_.countFiles(), result, updates, events);
    }
    return Step::Continue;
}

IngestSession::Step IngestSession::handleOutOfRange_(const domain::FetchOutOfRange& outOfRange,
                                                     SessionResult& result) {
    const domain::TimestampMs current = ranges_.currentBefore();
    const domain::TimestampMs target = std::min(outOfRange.validBound, current - 1);
    LOG_WARN(kLogCategory, "%s: %s is outside the migration range, moving to %s (%s)", result.streamId.c_str(),
             iso(current).c_str(), iso(target).c_str(), outOfRange.detail.c_str());
    ranges_.snapTo(target);
    return Step::Continue;
}

IngestSession::Step IngestSession::handleFailure_(const domain::FetchFailure& failure, SessionResult& result) {
    // A shutdown cuts retries short; that is not an exhausted fetch.
    if (cancel_.isCancelled()) {
        LOG_INFO(kLogCategory, "%s: fetch at %s interrupted by shutdown (%s)", result.streamId.c_str(),
                 iso(ranges_.currentBefore()).c_str(), failure.error.c_str());
        return Step::Cancelled;
    }
    const std::string body = failure.body.substr(0, kMaxLoggedBody);
    LOG_ERROR(kLogCategory, "%s: fetch failed at %s after %d attempts: status=%u error=%s body=%s",
              result.streamId.c_str(), iso(ranges_.currentBefore()).c_str(), failure.attempts, failure.status,
              failure.error.c_str(), body.c_str());
    result.failure = failure;
    return Step::Failed;
}

bool IngestSession::confirm_(domain::TimestampMs before, core::integrity::FileCounts baseline, SessionResult& result,
                             std::uint64_t& confirmedUpdates, std::uint64_t& confirmedEvents) {
    const std::uint64_t pendingUpdates = cursor_.state().pendingUpdates;
    const std::uint64_t pendingEvents = cursor_.state().pendingEvents;
    const std::chrono::milliseconds timeout{config_.verifyTimeoutMs};

    std::vector<std::future<infra::storage::WriteResult>> futures;
    auto flushFn = [&]() { futures = writer_.flush(); };
    auto waitFn = [&]() {
        const std::size_t expectedFiles = futures.size();
        if (!infra::storage::DurableWriter::awaitAll(futures)) {
            return false;
        }
        return expectedFiles == 0 || verifier_.waitForWrites(expectedFiles, timeout, baseline);
    };

    core::integrity::VerifyResult verified;
    {
        ldg::common::metrics::Registry::ScopedTimer timer(metric_names::kVerifyStage);
        verified = verifier_.verifyAndConfirm(cursor_, pendingUpdates, pendingEvents, before, flushFn, waitFn,
                                              baseline);
    }
    if (!verified.success) {
        ++result.verifyFailures;
        metrics().incrementCounter(metric_names::kVerifyFailures);
        return false;
    }

    confirmedUpdates = verified.confirmedUpdates;
    confirmedEvents = verified.confirmedEvents;
    result.confirmedUpdates += confirmedUpdates;
    result.confirmedEvents += confirmedEvents;
    metrics().incrementCounter(metric_names::kUpdatesConfirmed, confirmedUpdates);
    metrics().incrementCounter(metric_names::kEventsConfirmed, confirmedEvents);
    return true;
}

bool IngestSession::finish_(SessionResult& result) {
    LOG_INFO(kLogCategory, "%s: reached %s, confirming the tail", result.streamId.c_str(),
             iso(ranges_.minTime()).c_str());
    std::uint64_t updates = 0;
    std::uint64_t events = 0;
    cursor_.stageBoundary({});
    if (!confirm_(ranges_.minTime(), verifier_.countFiles(), result, updates, events)) {
        LOG_ERROR(kLogCategory, "%s: final write verification failed; cursor left incomplete",
                  result.streamId.c_str());
        return false;
    }
    cursor_.markComplete();
    metrics().setGauge(metric_names::kProgressPct, 100.0);
    return true;
}

void IngestSession::applyDedupPolicy_(const std::vector<std::string>& carryOverIds) {
    if (config_.dedupReset.mode == ldg::common::DedupResetPolicy::Mode::Count) {
        if (dedup_.size() >= config_.dedupReset.count) {
            const auto stats = dedup_.reset();
            LOG_DEBUG(kLogCategory, "Dedup set reset at %zu ids (%.1f%% duplicates)", stats.seenIds,
                      stats.dedupRate);
        }
        return;
    }
    dedup_.resetRetaining(carryOverIds);
}

void IngestSession::logProgress_(const SessionResult& result, const char* reason) const {
    const auto& state = cursor_.state();
    const auto elapsedMs = std::chrono::duration_cast<std::chrono::milliseconds>(
                               std::chrono::steady_clock::now() - startedAt_)
                               .count();
    const double elapsedSec = static_cast<double>(std::max<long long>(elapsedMs, 1)) / 1000.0;
    const double rate = static_cast<double>(state.confirmedUpdates - startConfirmedUpdates_) / elapsedSec;

    const double progress = ranges_.getProgress();
    const double progressed = progress - startProgress_;
    std::string eta = "n/a";
    if (progressed > 0.0 && progress < 100.0) {
        const double remainingMs = static_cast<double>(elapsedMs) * (100.0 - progress) / progressed;
        eta = core::time::formatDuration(static_cast<std::int64_t>(remainingMs));
    }

    const auto dedupStats = dedup_.getStats();
    const auto writerStats = writer_.stats();
    LOG_INFO(kLogCategory,
             "[%s] %s: %llu updates / %llu events confirmed, %llu pages (%llu empty), %.1f upd/s, %.2f%%, ETA %s, "
             "dedup %.1f%% (%llu dropped this run), writer %zu jobs queued, %.1f MB, ratio %.2fx",
             reason, result.streamId.c_str(), static_cast<unsigned long long>(state.confirmedUpdates),
             static_cast<unsigned long long>(state.confirmedEvents), static_cast<unsigned long long>(result.pages),
             static_cast<unsigned long long>(result.emptyPages), rate, progress, eta.c_str(), dedupStats.dedupRate,
             static_cast<unsigned long long>(result.duplicates), writerStats.pool.outstandingJobs,
             writerStats.pool.mbWritten, writerStats.pool.compressionRatio);
}

}  // namespace app
