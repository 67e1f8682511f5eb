#include "infra/storage/DurableWriter.hpp"

#include <algorithm>
#include <iterator>
#include <stdexcept>
#include <utility>

#include "core/Cancellation.h"
#include "logging/Log.h"

namespace infra::storage {
namespace {

constexpr auto kLogCategory = logging::LogCategory::STORAGE;
constexpr std::size_t kRecordOverheadBytes = 128;

std::size_t estimateBytes(const domain::LedgerUpdate& update) {
    return update.updateDataJson.size() + update.traceContextJson.size() + kRecordOverheadBytes;
}

std::size_t estimateBytes(const domain::LedgerEvent& event) {
    return event.rawJson.size() + event.payloadJson.size() + event.exerciseResultJson.size() + kRecordOverheadBytes;
}

template <typename Record>
std::vector<Record> takeFront(std::vector<Record>& rows, std::size_t count, std::size_t& bytes) {
    count = std::min(count, rows.size());
    std::vector<Record> chunk;
    chunk.reserve(count);
    std::move(rows.begin(), rows.begin() + static_cast<std::ptrdiff_t>(count), std::back_inserter(chunk));
    rows.erase(rows.begin(), rows.begin() + static_cast<std::ptrdiff_t>(count));

    std::size_t chunkBytes = 0;
    for (const auto& row : chunk) {
        chunkBytes += estimateBytes(row);
    }
    bytes -= std::min(bytes, chunkBytes);
    return chunk;
}

}  // namespace

DurableWriter::DurableWriter(DurableWriterConfig config, core::CancellationToken* cancel,
                             BinaryWriterPool::Executor executor)
    : config_(std::move(config)),
      cancel_(cancel),
      pool_(std::make_unique<BinaryWriterPool>(config_.pool, std::move(executor))) {
    if (config_.maxRowsPerFile == 0) {
        throw std::invalid_argument("maxRowsPerFile must be positive");
    }
}

DurableWriter::~DurableWriter() {
    try {
        shutdown();
    } catch (const std::exception& ex) {
        LOG_ERROR(kLogCategory, "Durable writer shutdown failed: %s", ex.what());
    }
}

void DurableWriter::waitForCapacity_() {
    if (!pool_->shouldPauseWrites()) {
        return;
    }
    if (!pool_->drainUploads(cancel_)) {
        throw std::runtime_error("cancelled while waiting for writer backpressure to clear");
    }
}

void DurableWriter::bufferUpdates(std::vector<domain::LedgerUpdate> updates) {
    if (updates.empty()) {
        return;
    }
    waitForCapacity_();

    for (auto& update : updates) {
        auto& buffers = buffers_[update.migrationId];
        buffers.updateBytes += estimateBytes(update);
        buffers.updates.push_back(std::move(update));
    }
    for (auto& [migrationId, buffers] : buffers_) {
        while (buffers.updates.size() >= config_.maxRowsPerFile) {
            submitUpdates_(migrationId, buffers);
        }
    }
}

void DurableWriter::bufferEvents(std::vector<domain::LedgerEvent> events) {
    if (events.empty()) {
        return;
    }
    waitForCapacity_();

    for (auto& event : events) {
        auto& buffers = buffers_[event.migrationId];
        buffers.eventBytes += estimateBytes(event);
        buffers.events.push_back(std::move(event));
    }
    for (auto& [migrationId, buffers] : buffers_) {
        while (buffers.events.size() >= config_.maxRowsPerFile) {
            submitEvents_(migrationId, buffers);
        }
    }
}

void DurableWriter::submitUpdates_(domain::MigrationId migrationId, MigrationBuffers& buffers) {
    WriteJob job;
    job.type = RecordType::Updates;
    job.migrationId = migrationId;
    job.root = config_.root;
    std::size_t before = buffers.updateBytes;
    job.records = takeFront(buffers.updates, config_.maxRowsPerFile, buffers.updateBytes);
    job.estimatedBytes = before - buffers.updateBytes;
    inFlight_.push_back(pool_->submit(std::move(job)));
}

void DurableWriter::submitEvents_(domain::MigrationId migrationId, MigrationBuffers& buffers) {
    WriteJob job;
    job.type = RecordType::Events;
    job.migrationId = migrationId;
    job.root = config_.root;
    std::size_t before = buffers.eventBytes;
    job.records = takeFront(buffers.events, config_.maxRowsPerFile, buffers.eventBytes);
    job.estimatedBytes = before - buffers.eventBytes;
    inFlight_.push_back(pool_->submit(std::move(job)));
}

std::vector<std::future<WriteResult>> DurableWriter::flush() {
    waitForCapacity_();

    for (auto& [migrationId, buffers] : buffers_) {
        while (!buffers.updates.empty()) {
            submitUpdates_(migrationId, buffers);
        }
        while (!buffers.events.empty()) {
            submitEvents_(migrationId, buffers);
        }
    }
    buffers_.clear();

    std::vector<std::future<WriteResult>> futures;
    futures.swap(inFlight_);
    return futures;
}

bool DurableWriter::awaitAll(std::vector<std::future<WriteResult>>& futures) {
    bool ok = true;
    for (auto& future : futures) {
        if (!future.valid()) {
            continue;
        }
        try {
            future.get();
        } catch (const std::exception& ex) {
            LOG_WARN(kLogCategory, "Write job failed: %s", ex.what());
            ok = false;
        }
    }
    futures.clear();
    return ok;
}

void DurableWriter::shutdown() {
    if (shutDown_) {
        return;
    }
    shutDown_ = true;
    std::vector<std::future<WriteResult>> futures;
    try {
        futures = flush();
    } catch (const std::runtime_error& ex) {
        LOG_WARN(kLogCategory, "Final flush skipped: %s", ex.what());
    }
    pool_->drain();
    if (!awaitAll(futures)) {
        LOG_WARN(kLogCategory, "Some writes failed during shutdown");
    }
    pool_->shutdown();
    const auto stats = pool_->stats();
    LOG_INFO(kLogCategory, "Writer shut down: %llu files, %llu records, %.1f MB, ratio %.2fx",
             static_cast<unsigned long long>(stats.completedJobs), static_cast<unsigned long long>(stats.records),
             stats.mbWritten, stats.compressionRatio);
}

DurableWriterStats DurableWriter::stats() const {
    DurableWriterStats stats;
    for (const auto& [migrationId, buffers] : buffers_) {
        stats.bufferedUpdates += buffers.updates.size();
        stats.bufferedEvents += buffers.events.size();
    }
    stats.pool = pool_->stats();
    return stats;
}

}  // namespace infra::storage
