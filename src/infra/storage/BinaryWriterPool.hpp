#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <functional>
#include <future>
#include <mutex>
#include <thread>
#include <variant>
#include <vector>

#include "domain/LedgerRecords.hpp"
#include "infra/storage/RecordEncoder.hpp"

namespace core {
class CancellationToken;
}

namespace infra::storage {

struct WriteJob {
    RecordType type{RecordType::Updates};
    domain::MigrationId migrationId{0};
    std::filesystem::path root;
    std::variant<std::vector<domain::LedgerUpdate>, std::vector<domain::LedgerEvent>> records;
    std::size_t estimatedBytes{0};

    std::size_t recordCount() const noexcept;
};

struct WriteResult {
    std::filesystem::path path;
    RecordType type{RecordType::Updates};
    std::size_t recordCount{0};
    std::size_t rawBytes{0};
    std::size_t compressedBytes{0};
};

struct WriterPoolConfig {
    std::size_t threads = 4;
    std::size_t highWatermarkJobs = 50;
    std::size_t lowWatermarkJobs = 25;
    std::size_t highWatermarkBytes = 256U * 1024U * 1024U;
    std::size_t lowWatermarkBytes = 128U * 1024U * 1024U;
    int gzipLevel = 1;
};

struct WriterPoolStats {
    std::size_t threads{0};
    std::size_t outstandingJobs{0};
    std::size_t outstandingBytes{0};
    std::uint64_t completedJobs{0};
    std::uint64_t failedJobs{0};
    std::uint64_t records{0};
    std::uint64_t rawBytes{0};
    std::uint64_t compressedBytes{0};
    double compressionRatio{0.0};
    double mbWritten{0.0};
    double recordsPerSec{0.0};
    bool paused{false};
};

// Fixed set of long-lived workers that encode, compress and write partition files.
// Jobs are handed over through a blocking queue; each submission gets a future that resolves
// once the file is durable (or carries the write exception).
//
// Backpressure: shouldPauseWrites() turns true when outstanding jobs or bytes reach the high
// watermark and stays true until both fall to the low watermark.
class BinaryWriterPool {
public:
    using Executor = std::function<WriteResult(const WriteJob&)>;

    // executor defaults to writePartitionFile with an encoder at config.gzipLevel.
    explicit BinaryWriterPool(WriterPoolConfig config, Executor executor = {});
    ~BinaryWriterPool();

    BinaryWriterPool(const BinaryWriterPool&) = delete;
    BinaryWriterPool& operator=(const BinaryWriterPool&) = delete;

    // Never blocks. Throws std::runtime_error after shutdown().
    std::future<WriteResult> submit(WriteJob job);

    bool shouldPauseWrites() const;

    // Blocks until the pool is below the low watermarks. Returns false if cancelled first.
    bool drainUploads(core::CancellationToken* cancel = nullptr);

    // Blocks until every submitted job has finished.
    void drain();

    // Drains, stops and joins the workers. Idempotent.
    void shutdown();

    WriterPoolStats stats() const;

    static WriteResult writePartitionFile(const WriteJob& job, const RecordEncoder& encoder);

private:
    struct Task {
        WriteJob job;
        std::promise<WriteResult> promise;
    };

    void workerLoop_();
    void updatePauseLocked_();

    WriterPoolConfig config_;
    Executor executor_;

    mutable std::mutex mutex_;
    std::condition_variable queueCv_;
    std::condition_variable stateCv_;
    std::deque<Task> queue_;
    std::vector<std::thread> workers_;
    bool stopping_{false};
    bool paused_{false};

    std::size_t outstandingJobs_{0};
    std::size_t outstandingBytes_{0};
    std::uint64_t completedJobs_{0};
    std::uint64_t failedJobs_{0};
    std::uint64_t records_{0};
    std::uint64_t rawBytes_{0};
    std::uint64_t compressedBytes_{0};
    std::chrono::steady_clock::time_point startedAt_;
};

}  // namespace infra::storage
