#include "app/LiveIngestor.hpp"

#include <algorithm>
#include <exception>
#include <future>
#include <stdexcept>
#include <system_error>
#include <utility>
#include <vector>

#include <boost/json.hpp>

#include "app/IngestSession.hpp"
#include "common/JsonUtils.hpp"
#include "common/Metrics.hpp"
#include "core/TimeUtils.h"
#include "core/integrity/IntegrityCursor.h"
#include "infra/storage/AtomicFile.hpp"
#include "infra/storage/DurableWriter.hpp"
#include "logging/Log.h"

namespace app {
namespace {

constexpr auto kLogCategory = logging::LogCategory::DATA;
constexpr std::size_t kMaxLoggedBody = 500;

namespace json = ldg::common::json;
namespace metric_names = ldg::common::metrics::names;

adapters::scan::RetryConfig liveCooldownConfig(const ldg::common::Config& config) {
    adapters::scan::RetryConfig retry;
    retry.cooldown = std::chrono::milliseconds(config.cooldownMs);
    retry.cooldownMax = std::chrono::milliseconds(config.cooldownMaxMs);
    return retry;
}

bool isBackfillCursorName(const std::string& name) {
    const std::string prefix = "cursor-";
    const std::string suffix = ".json";
    return name.size() > prefix.size() + suffix.size() && name.compare(0, prefix.size(), prefix) == 0 &&
           name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0;
}

}  // namespace

LiveIngestor::LiveIngestor(const ldg::common::Config& config, domain::ILedgerSource& source,
                           infra::storage::DurableWriter& writer, core::CancellationToken& cancel)
    : config_(config),
      source_(source),
      writer_(writer),
      cancel_(cancel),
      cursorPath_(std::filesystem::path(config.cursorDir) / kCursorFileName),
      cooldown_(liveCooldownConfig(config)),
      verifier_(writer.root(), &cancel),
      stop_(std::make_unique<core::CancellationToken>()) {}

LiveIngestor::~LiveIngestor() {
    stop();
}

void LiveIngestor::run() {
    if (worker_.joinable()) {
        stop();
    }
    stop_ = std::make_unique<core::CancellationToken>();

    worker_ = std::thread([this]() {
        try {
            LOG_INFO(kLogCategory, "Live ingestion thread starting");
            runWorker_();
            LOG_INFO(kLogCategory, "Live ingestion thread finished cleanly");
        } catch (const std::exception& ex) {
            LOG_ERROR(kLogCategory, "Live ingestion thread crashed: %s", ex.what());
        }
    });
}

void LiveIngestor::stop() {
    if (stop_) {
        stop_->requestCancel();
    }
    join();
}

void LiveIngestor::join() {
    if (worker_.joinable()) {
        worker_.join();
    }
}

bool LiveIngestor::stopping_() const {
    return cancel_.isCancelled() || (stop_ && stop_->isCancelled());
}

bool LiveIngestor::sleep_(std::chrono::milliseconds delay) {
    // Slice the wait so that either token ends it promptly.
    constexpr std::chrono::milliseconds kSlice{250};
    auto remaining = delay;
    while (remaining.count() > 0) {
        if (stopping_()) {
            return false;
        }
        const auto chunk = std::min(remaining, kSlice);
        if (!stop_->sleepFor(chunk)) {
            return false;
        }
        remaining -= chunk;
    }
    return !stopping_();
}

void LiveIngestor::runWorker_() {
    const std::chrono::milliseconds pollInterval{config_.pollIntervalMs};
    while (!stopping_()) {
        switch (pollOnce()) {
        case PollOutcome::Data:
            break;
        case PollOutcome::CaughtUp:
            sleep_(pollInterval);
            break;
        case PollOutcome::Failed: {
            const auto delay = cooldown_.cooldownDelay(std::max(0, failureStreak_ - 1));
            LOG_WARN(kLogCategory, "Live polling failed %d time(s) in a row, cooling down %lldms", failureStreak_,
                     static_cast<long long>(delay.count()));
            sleep_(delay);
            break;
        }
        case PollOutcome::Cancelled:
            return;
        }
    }
}

void LiveIngestor::initMarker_() {
    markerReady_ = true;
    auto initial = loadMarker(cursorPath_, core::time::nowMs());
    if (initial) {
        LOG_INFO(kLogCategory, "Live cursor: migration %lld after %s", static_cast<long long>(initial->migrationId),
                 initial->recordTime.c_str());
    } else {
        initial = markerFromBackfill(config_.cursorDir);
        if (initial) {
            LOG_INFO(kLogCategory, "Live ingestion starts at the backfill edge: migration %lld after %s",
                     static_cast<long long>(initial->migrationId), initial->recordTime.c_str());
        } else {
            LOG_WARN(kLogCategory, "No live cursor and no completed backfill; polling from the start of the ledger");
        }
    }
    std::lock_guard<std::mutex> lock(markerMutex_);
    marker_ = std::move(initial);
}

LiveIngestor::PollOutcome LiveIngestor::pollOnce() {
    if (stopping_()) {
        return PollOutcome::Cancelled;
    }
    if (!markerReady_) {
        initMarker_();
    }

    const auto current = marker();
    std::optional<domain::MigrationId> afterMigration;
    std::optional<std::string> afterTime;
    if (current) {
        afterMigration = current->migrationId;
        afterTime = current->recordTime;
    }

    auto fetched = source_.fetchUpdatesAfter(afterMigration, afterTime, config_.pageSize);

    if (const auto* failure = std::get_if<domain::FetchFailure>(&fetched)) {
        ++failureStreak_;
        LOG_WARN(kLogCategory, "Live fetch failed after %d attempts: status=%u error=%s body=%s", failure->attempts,
                 failure->status, failure->error.c_str(), failure->body.substr(0, kMaxLoggedBody).c_str());
        return stopping_() ? PollOutcome::Cancelled : PollOutcome::Failed;
    }
    failureStreak_ = 0;

    if (std::holds_alternative<domain::FetchEmpty>(fetched)) {
        return PollOutcome::CaughtUp;
    }
    if (const auto* outOfRange = std::get_if<domain::FetchOutOfRange>(&fetched)) {
        LOG_WARN(kLogCategory, "Live fetch reported an out-of-range marker: %s", outOfRange->detail.c_str());
        return PollOutcome::CaughtUp;
    }

    auto& data = std::get<domain::FetchData>(fetched);
    auto& registry = ldg::common::metrics::Registry::instance();
    registry.incrementCounter(metric_names::kPages);

    LiveMarker next;
    if (data.lastMigrationId && data.lastRecordTime) {
        next.migrationId = *data.lastMigrationId;
        next.recordTime = *data.lastRecordTime;
    } else if (data.newest) {
        next.migrationId = current ? current->migrationId : 0;
        next.recordTime = core::time::formatIso8601Ms(*data.newest);
    } else {
        LOG_WARN(kLogCategory, "Live page of %zu items carries no position; not advancing", data.rawCount);
        return PollOutcome::Failed;
    }

    const std::size_t fetchedCount = data.updates.size();
    auto unique = dedup_.deduplicate(std::move(data.updates));
    if (fetchedCount > unique.size()) {
        registry.incrementCounter(metric_names::kDuplicates, fetchedCount - unique.size());
    }

    std::vector<std::string> newIds;
    newIds.reserve(unique.size());
    for (const auto& update : unique) {
        if (update.updateId) {
            newIds.push_back(*update.updateId);
        }
    }

    const auto baseline = verifier_.countFiles();
    HandOffCounts counts;
    std::vector<std::future<infra::storage::WriteResult>> futures;
    try {
        counts = bufferPage(writer_, std::move(unique));
        futures = writer_.flush();
    } catch (const std::runtime_error& ex) {
        if (stopping_()) {
            return PollOutcome::Cancelled;
        }
        throw;
    }

    const std::size_t expectedFiles = futures.size();
    const bool written = infra::storage::DurableWriter::awaitAll(futures) &&
                         (expectedFiles == 0 ||
                          verifier_.waitForWrites(expectedFiles, std::chrono::milliseconds(config_.verifyTimeoutMs),
                                                  baseline));
    if (!written) {
        registry.incrementCounter(metric_names::kVerifyFailures);
        dedup_.forget(newIds);
        LOG_WARN(kLogCategory, "Live page after %s not confirmed on disk; it will be fetched again",
                 current ? current->recordTime.c_str() : "start");
        return stopping_() ? PollOutcome::Cancelled : PollOutcome::Failed;
    }

    saveMarker(cursorPath_, next);
    {
        std::lock_guard<std::mutex> lock(markerMutex_);
        marker_ = next;
    }
    confirmedUpdates_.fetch_add(counts.updates, std::memory_order_relaxed);
    confirmedEvents_.fetch_add(counts.events, std::memory_order_relaxed);
    registry.incrementCounter(metric_names::kUpdatesConfirmed, counts.updates);
    registry.incrementCounter(metric_names::kEventsConfirmed, counts.events);

    if (dedup_.size() >= kMaxSeenIds) {
        dedup_.reset();
    }

    LOG_INFO_EVERY("live-progress", 30000, kLogCategory, "Live: %llu updates, %llu events confirmed, at %s",
                   static_cast<unsigned long long>(confirmedUpdates()),
                   static_cast<unsigned long long>(confirmedEvents()), next.recordTime.c_str());

    return data.rawCount < config_.pageSize ? PollOutcome::CaughtUp : PollOutcome::Data;
}

std::optional<LiveMarker> LiveIngestor::marker() const {
    std::lock_guard<std::mutex> lock(markerMutex_);
    return marker_;
}

std::optional<LiveMarker> LiveIngestor::loadMarker(const std::filesystem::path& path, domain::TimestampMs nowMs) {
    const auto text = infra::storage::readWholeFile(path);
    if (!text) {
        return std::nullopt;
    }

    boost::system::error_code ec;
    const boost::json::value parsed = boost::json::parse(*text, ec);
    if (ec || !parsed.is_object()) {
        LOG_WARN(kLogCategory, "Ignoring unreadable live cursor %s", path.string().c_str());
        return std::nullopt;
    }

    const auto& obj = parsed.as_object();
    std::optional<std::int64_t> migration;
    std::optional<std::string> recordTime;
    try {
        migration = json::get_int64(obj, "migration_id");
        recordTime = json::get_string(obj, "record_time");
    } catch (const std::runtime_error& ex) {
        LOG_WARN(kLogCategory, "Ignoring live cursor %s: %s", path.string().c_str(), ex.what());
        return std::nullopt;
    }
    if (!migration || !recordTime) {
        LOG_WARN(kLogCategory, "Ignoring live cursor %s: missing migration_id or record_time", path.string().c_str());
        return std::nullopt;
    }

    const auto recordMs = core::time::parseIso8601Ms(*recordTime);
    if (!recordMs || *recordMs > nowMs) {
        LOG_WARN(kLogCategory, "Ignoring live cursor %s: record_time %s is invalid or in the future",
                 path.string().c_str(), recordTime->c_str());
        return std::nullopt;
    }

    LiveMarker marker;
    marker.migrationId = *migration;
    marker.recordTime = *recordTime;
    return marker;
}

void LiveIngestor::saveMarker(const std::filesystem::path& path, const LiveMarker& marker) {
    boost::json::object obj;
    obj["migration_id"] = marker.migrationId;
    obj["record_time"] = marker.recordTime;
    obj["updated_at"] = core::time::formatIso8601Ms(core::time::nowMs());
    obj["mode"] = "live";
    infra::storage::writeFileAtomic(path, json::serialize_json(obj));
}

std::optional<LiveMarker> LiveIngestor::markerFromBackfill(const std::filesystem::path& cursorDir) {
    std::error_code ec;
    std::filesystem::directory_iterator it(cursorDir, ec);
    if (ec) {
        return std::nullopt;
    }

    std::optional<core::integrity::CursorState> newest;
    for (const std::filesystem::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            break;
        }
        if (!isBackfillCursorName(it->path().filename().string())) {
            continue;
        }
        const auto state = core::integrity::IntegrityCursor::readFile(it->path());
        if (!state || !state->complete || !state->maxTime) {
            continue;
        }
        if (!newest || *state->maxTime > *newest->maxTime ||
            (*state->maxTime == *newest->maxTime && state->migrationId > newest->migrationId)) {
            newest = state;
        }
    }
    if (!newest) {
        return std::nullopt;
    }

    LiveMarker marker;
    marker.migrationId = newest->migrationId;
    marker.recordTime = core::time::formatIso8601Ms(*newest->maxTime);
    return marker;
}

}  // namespace app
