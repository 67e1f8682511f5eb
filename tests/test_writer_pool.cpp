#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <future>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

#include "core/Cancellation.h"
#include "core/integrity/WriteVerifier.h"
#include "infra/storage/BinaryWriterPool.hpp"
#include "infra/storage/DurableWriter.hpp"
#include "TestSupport.hpp"

using infra::storage::BinaryWriterPool;
using infra::storage::DurableWriter;
using infra::storage::WriteJob;
using infra::storage::WriteResult;
using ldg::testing::TempDir;
using ldg::testing::makeUpdate;

namespace {

// Executor that holds every job until open() is called.
class Gate {
public:
    WriteResult operator()(const WriteJob& job) {
        std::unique_lock<std::mutex> lock(mutex_);
        ++entered_;
        cv_.notify_all();
        cv_.wait(lock, [this]() { return open_; });
        WriteResult result;
        result.type = job.type;
        result.recordCount = job.recordCount();
        return result;
    }

    void open() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            open_ = true;
        }
        cv_.notify_all();
    }

    bool waitEntered(int count) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, std::chrono::seconds(5), [&]() { return entered_ >= count; });
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    bool open_{false};
    int entered_{0};
};

WriteJob updateJob(std::size_t bytes = 10) {
    WriteJob job;
    job.records = std::vector<domain::LedgerUpdate>{makeUpdate("u", 1)};
    job.estimatedBytes = bytes;
    return job;
}

bool backpressureFollowsWatermarks() {
    auto gate = std::make_shared<Gate>();
    infra::storage::WriterPoolConfig config;
    config.threads = 2;
    config.highWatermarkJobs = 3;
    config.lowWatermarkJobs = 1;
    BinaryWriterPool pool(config, [gate](const WriteJob& job) { return (*gate)(job); });

    std::vector<std::future<WriteResult>> futures;
    futures.push_back(pool.submit(updateJob()));
    futures.push_back(pool.submit(updateJob()));
    if (pool.shouldPauseWrites()) {
        gate->open();
        std::cerr << "Paused below the high watermark\n";
        return false;
    }
    futures.push_back(pool.submit(updateJob()));
    if (!pool.shouldPauseWrites()) {
        gate->open();
        std::cerr << "Expected backpressure at 3 outstanding jobs\n";
        return false;
    }

    std::atomic<bool> drained{false};
    std::thread waiter([&]() {
        pool.drainUploads();
        drained = true;
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(150));
    const bool drainedEarly = drained.load();
    gate->open();
    waiter.join();
    if (drainedEarly) {
        std::cerr << "drainUploads returned while still paused\n";
        return false;
    }

    for (auto& future : futures) {
        if (future.get().recordCount != 1) {
            std::cerr << "Future carried the wrong result\n";
            return false;
        }
    }
    pool.drain();
    const auto stats = pool.stats();
    if (pool.shouldPauseWrites() || stats.outstandingJobs != 0 || stats.completedJobs != 3) {
        std::cerr << "Pool should be idle after draining\n";
        return false;
    }
    return true;
}

bool byteWatermarkPauses() {
    auto gate = std::make_shared<Gate>();
    infra::storage::WriterPoolConfig config;
    config.threads = 1;
    config.highWatermarkBytes = 100;
    config.lowWatermarkBytes = 10;
    BinaryWriterPool pool(config, [gate](const WriteJob& job) { return (*gate)(job); });

    auto future = pool.submit(updateJob(150));
    const bool paused = pool.shouldPauseWrites();
    gate->open();
    future.get();
    pool.drain();
    if (!paused || pool.shouldPauseWrites()) {
        std::cerr << "Byte watermark did not drive backpressure\n";
        return false;
    }
    return true;
}

bool drainUploadsHonoursCancel() {
    auto gate = std::make_shared<Gate>();
    infra::storage::WriterPoolConfig config;
    config.threads = 1;
    config.highWatermarkJobs = 1;
    config.lowWatermarkJobs = 0;
    BinaryWriterPool pool(config, [gate](const WriteJob& job) { return (*gate)(job); });
    auto future = pool.submit(updateJob());

    core::CancellationToken cancel;
    cancel.requestCancel();
    const bool result = pool.drainUploads(&cancel);
    gate->open();
    future.get();
    if (result) {
        std::cerr << "drainUploads should give up once cancelled\n";
        return false;
    }
    return true;
}

bool failedJobRejectsFuture() {
    BinaryWriterPool pool(infra::storage::WriterPoolConfig{},
                          [](const WriteJob&) -> WriteResult { throw std::runtime_error("no space left"); });
    auto future = pool.submit(updateJob());
    try {
        future.get();
    } catch (const std::runtime_error&) {
        pool.drain();
        return pool.stats().failedJobs == 1;
    }
    std::cerr << "A failing write must surface through its future\n";
    return false;
}

bool submitAfterShutdownThrows() {
    BinaryWriterPool pool(infra::storage::WriterPoolConfig{}, [](const WriteJob& job) {
        WriteResult result;
        result.recordCount = job.recordCount();
        return result;
    });
    pool.shutdown();
    try {
        pool.submit(updateJob());
    } catch (const std::runtime_error&) {
        return true;
    }
    std::cerr << "submit() after shutdown() must throw\n";
    return false;
}

bool durableWriterFlushWaitsForCapacity() {
    TempDir root("writer-flush-block");
    auto gate = std::make_shared<Gate>();
    infra::storage::DurableWriterConfig config;
    config.root = root.path();
    config.maxRowsPerFile = 1;
    config.pool.threads = 1;
    config.pool.highWatermarkJobs = 1;
    config.pool.lowWatermarkJobs = 0;
    DurableWriter writer(config, nullptr, [gate](const WriteJob& job) { return (*gate)(job); });

    // Reaching maxRowsPerFile submits immediately and engages backpressure.
    writer.bufferUpdates({makeUpdate("a", 1)});
    if (!gate->waitEntered(1) || !writer.shouldPauseWrites()) {
        gate->open();
        std::cerr << "Expected a size-triggered write and backpressure\n";
        return false;
    }

    std::atomic<bool> flushed{false};
    std::vector<std::future<WriteResult>> futures;
    std::thread flusher([&]() {
        futures = writer.flush();
        flushed = true;
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(150));
    const bool flushedEarly = flushed.load();
    gate->open();
    flusher.join();
    if (flushedEarly) {
        std::cerr << "flush() must wait while writes are paused\n";
        return false;
    }
    if (futures.size() != 1 || !DurableWriter::awaitAll(futures)) {
        std::cerr << "The size-triggered write should be returned by the next flush\n";
        return false;
    }
    return true;
}

bool durableWriterProducesPartitionFiles() {
    TempDir root("writer-files");
    infra::storage::DurableWriterConfig config;
    config.root = root.path();
    config.maxRowsPerFile = 2;
    config.pool.threads = 2;
    DurableWriter writer(config);

    const auto t = ldg::testing::isoMs("2024-06-03T12:00:00Z");
    std::vector<domain::LedgerEvent> events;
    std::vector<domain::LedgerUpdate> updates = {makeUpdate("a", t, 2, 3), makeUpdate("b", t, 1, 3),
                                                 makeUpdate("c", t, 0, 3)};
    for (const auto& update : updates) {
        events.insert(events.end(), update.events.begin(), update.events.end());
    }
    writer.bufferUpdates(std::move(updates));
    writer.bufferEvents(std::move(events));
    auto futures = writer.flush();
    if (futures.size() != 4 || !DurableWriter::awaitAll(futures)) {
        std::cerr << "Expected two update files and two event files\n";
        return false;
    }

    core::integrity::WriteVerifier verifier(root.path());
    const auto counts = verifier.countFiles();
    if (counts.updates != 2 || counts.events != 2) {
        std::cerr << "Partition tree holds " << counts.updates << " update and " << counts.events
                  << " event files\n";
        return false;
    }
    if (!std::filesystem::is_directory(root / "migration=3/year=2024/month=6/day=3")) {
        std::cerr << "Files not placed in their day partition\n";
        return false;
    }
    writer.shutdown();
    return writer.stats().pool.records == 6;
}

}  // namespace

int main() {
    if (!backpressureFollowsWatermarks() || !byteWatermarkPauses() || !drainUploadsHonoursCancel() ||
        !failedJobRejectsFuture() || !submitAfterShutdownThrows() || !durableWriterFlushWaitsForCapacity() ||
        !durableWriterProducesPartitionFiles()) {
        return 1;
    }
    return 0;
}
