#include "infra/storage/BinaryWriterPool.hpp"

#include <algorithm>
#include <memory>
#include <stdexcept>
#include <utility>

#include "common/Metrics.hpp"
#include "core/Cancellation.h"
#include "core/TimeUtils.h"
#include "infra/storage/AtomicFile.hpp"
#include "infra/storage/PartitionPath.hpp"
#include "logging/Log.h"

namespace infra::storage {
namespace {

constexpr auto kLogCategory = logging::LogCategory::STORAGE;
constexpr auto kDrainPoll = std::chrono::milliseconds(100);

namespace metrics = ldg::common::metrics;

}  // namespace

std::size_t WriteJob::recordCount() const noexcept {
    return std::visit([](const auto& rows) { return rows.size(); }, records);
}

BinaryWriterPool::BinaryWriterPool(WriterPoolConfig config, Executor executor)
    : config_(config), executor_(std::move(executor)), startedAt_(std::chrono::steady_clock::now()) {
    if (config_.threads == 0) {
        throw std::invalid_argument("writer pool needs at least one thread");
    }
    if (config_.lowWatermarkJobs > config_.highWatermarkJobs ||
        config_.lowWatermarkBytes > config_.highWatermarkBytes) {
        throw std::invalid_argument("writer pool low watermark exceeds high watermark");
    }
    if (!executor_) {
        auto encoder = std::make_shared<RecordEncoder>(config_.gzipLevel);
        executor_ = [encoder](const WriteJob& job) { return writePartitionFile(job, *encoder); };
    }

    workers_.reserve(config_.threads);
    for (std::size_t i = 0; i < config_.threads; ++i) {
        workers_.emplace_back([this]() { workerLoop_(); });
    }
    LOG_INFO(kLogCategory, "Writer pool started with %zu workers (high %zu jobs / %zu MB, low %zu jobs / %zu MB)",
             config_.threads, config_.highWatermarkJobs, config_.highWatermarkBytes / (1024U * 1024U),
             config_.lowWatermarkJobs, config_.lowWatermarkBytes / (1024U * 1024U));
}

BinaryWriterPool::~BinaryWriterPool() {
    shutdown();
}

std::future<WriteResult> BinaryWriterPool::submit(WriteJob job) {
    Task task{std::move(job), std::promise<WriteResult>{}};
    auto future = task.promise.get_future();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            throw std::runtime_error("writer pool is shut down");
        }
        ++outstandingJobs_;
        outstandingBytes_ += task.job.estimatedBytes;
        queue_.push_back(std::move(task));
        updatePauseLocked_();
        metrics::Registry::instance().setGauge(metrics::names::kOutstandingJobs,
                                               static_cast<double>(outstandingJobs_));
    }
    queueCv_.notify_one();
    return future;
}

bool BinaryWriterPool::shouldPauseWrites() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return paused_;
}

bool BinaryWriterPool::drainUploads(core::CancellationToken* cancel) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (paused_) {
        LOG_DEBUG(kLogCategory, "Backpressure: waiting for %zu outstanding jobs to drain", outstandingJobs_);
    }
    while (paused_) {
        if (cancel != nullptr && cancel->isCancelled()) {
            return false;
        }
        stateCv_.wait_for(lock, kDrainPoll);
    }
    return true;
}

void BinaryWriterPool::drain() {
    std::unique_lock<std::mutex> lock(mutex_);
    stateCv_.wait(lock, [this]() { return outstandingJobs_ == 0; });
}

void BinaryWriterPool::shutdown() {
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (stopping_ && workers_.empty()) {
            return;
        }
        stateCv_.wait(lock, [this]() { return outstandingJobs_ == 0; });
        stopping_ = true;
    }
    queueCv_.notify_all();
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
}

WriterPoolStats BinaryWriterPool::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    WriterPoolStats stats;
    stats.threads = config_.threads;
    stats.outstandingJobs = outstandingJobs_;
    stats.outstandingBytes = outstandingBytes_;
    stats.completedJobs = completedJobs_;
    stats.failedJobs = failedJobs_;
    stats.records = records_;
    stats.rawBytes = rawBytes_;
    stats.compressedBytes = compressedBytes_;
    stats.compressionRatio = compressedBytes_ > 0 ? static_cast<double>(rawBytes_) / compressedBytes_ : 0.0;
    stats.mbWritten = static_cast<double>(compressedBytes_) / (1024.0 * 1024.0);
    const auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - startedAt_).count();
    stats.recordsPerSec = elapsed > 0.0 ? static_cast<double>(records_) / elapsed : 0.0;
    stats.paused = paused_;
    return stats;
}

WriteResult BinaryWriterPool::writePartitionFile(const WriteJob& job, const RecordEncoder& encoder) {
    EncodedBatch encoded;
    domain::TimestampMs partitionTime = 0;
    if (const auto* updates = std::get_if<std::vector<domain::LedgerUpdate>>(&job.records)) {
        encoded = encoder.encodeUpdates(*updates);
        partitionTime = partitionTimeFor(*updates);
    } else {
        const auto& events = std::get<std::vector<domain::LedgerEvent>>(job.records);
        encoded = encoder.encodeEvents(events);
        partitionTime = partitionTimeFor(events);
    }

    const auto dir = partitionDir(job.root, job.migrationId, partitionTime);
    const auto path = dir / partitionFileName(job.type, core::time::nowMs(), randomSuffix());
    writeFileAtomic(path, encoded.bytes);

    WriteResult result;
    result.path = path;
    result.type = job.type;
    result.recordCount = encoded.recordCount;
    result.rawBytes = encoded.rawBytes;
    result.compressedBytes = encoded.bytes.size();
    return result;
}

void BinaryWriterPool::workerLoop_() {
    while (true) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            queueCv_.wait(lock, [this]() { return stopping_ || !queue_.empty(); });
            if (queue_.empty()) {
                return;
            }
            task = std::move(queue_.front());
            queue_.pop_front();
        }

        const std::size_t jobBytes = task.job.estimatedBytes;
        bool ok = false;
        WriteResult result;
        try {
            result = executor_(task.job);
            ok = true;
            task.promise.set_value(result);
        } catch (const std::exception& ex) {
            LOG_ERROR(kLogCategory, "Write of %zu %s for migration %lld failed: %s", task.job.recordCount(),
                      to_string(task.job.type), static_cast<long long>(task.job.migrationId), ex.what());
            task.promise.set_exception(std::current_exception());
        }

        if (ok) {
            metrics::Registry::instance().incrementCounter(metrics::names::kFilesWritten);
            LOG_DEBUG(kLogCategory, "Wrote %s (%zu records, %zu -> %zu bytes)", result.path.string().c_str(),
                      result.recordCount, result.rawBytes, result.compressedBytes);
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            --outstandingJobs_;
            outstandingBytes_ -= std::min(outstandingBytes_, jobBytes);
            if (ok) {
                ++completedJobs_;
                records_ += result.recordCount;
                rawBytes_ += result.rawBytes;
                compressedBytes_ += result.compressedBytes;
            } else {
                ++failedJobs_;
            }
            updatePauseLocked_();
            metrics::Registry::instance().setGauge(metrics::names::kOutstandingJobs,
                                                   static_cast<double>(outstandingJobs_));
        }
        stateCv_.notify_all();
    }
}

void BinaryWriterPool::updatePauseLocked_() {
    if (!paused_) {
        if (outstandingJobs_ >= config_.highWatermarkJobs || outstandingBytes_ >= config_.highWatermarkBytes) {
            paused_ = true;
            LOG_INFO(kLogCategory, "Backpressure on: %zu jobs, %zu MB outstanding", outstandingJobs_,
                     outstandingBytes_ / (1024U * 1024U));
        }
    } else if (outstandingJobs_ <= config_.lowWatermarkJobs && outstandingBytes_ <= config_.lowWatermarkBytes) {
        paused_ = false;
        LOG_INFO(kLogCategory, "Backpressure off: %zu jobs outstanding", outstandingJobs_);
    }
}

}  // namespace infra::storage
