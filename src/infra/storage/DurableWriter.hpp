#pragma once

#include <cstddef>
#include <filesystem>
#include <future>
#include <map>
#include <memory>
#include <vector>

#include "domain/LedgerRecords.hpp"
#include "infra/storage/BinaryWriterPool.hpp"

namespace core {
class CancellationToken;
}

namespace infra::storage {

struct DurableWriterConfig {
    std::filesystem::path root;
    std::size_t maxRowsPerFile = 5000;
    WriterPoolConfig pool;
};

struct DurableWriterStats {
    std::size_t bufferedUpdates{0};
    std::size_t bufferedEvents{0};
    WriterPoolStats pool;
};

// Per-migration buffering in front of BinaryWriterPool. Buffers become partition files when
// they reach maxRowsPerFile or on flush(). While the pool signals backpressure no buffer grows.
class DurableWriter {
public:
    DurableWriter(DurableWriterConfig config, core::CancellationToken* cancel = nullptr,
                  BinaryWriterPool::Executor executor = {});
    ~DurableWriter();

    DurableWriter(const DurableWriter&) = delete;
    DurableWriter& operator=(const DurableWriter&) = delete;

    // Both throw std::runtime_error when cancelled while waiting for backpressure to clear.
    void bufferUpdates(std::vector<domain::LedgerUpdate> updates);
    void bufferEvents(std::vector<domain::LedgerEvent> events);

    // Submits every non-empty buffer and returns the futures of this flush together with
    // those of size-triggered writes since the previous flush.
    std::vector<std::future<WriteResult>> flush();

    // Waits on a set of futures. False if any write failed.
    static bool awaitAll(std::vector<std::future<WriteResult>>& futures);

    void shutdown();

    bool shouldPauseWrites() const { return pool_->shouldPauseWrites(); }
    DurableWriterStats stats() const;
    const std::filesystem::path& root() const noexcept { return config_.root; }

private:
    struct MigrationBuffers {
        std::vector<domain::LedgerUpdate> updates;
        std::vector<domain::LedgerEvent> events;
        std::size_t updateBytes{0};
        std::size_t eventBytes{0};
    };

    void waitForCapacity_();
    void submitUpdates_(domain::MigrationId migrationId, MigrationBuffers& buffers);
    void submitEvents_(domain::MigrationId migrationId, MigrationBuffers& buffers);

    DurableWriterConfig config_;
    core::CancellationToken* cancel_;
    std::unique_ptr<BinaryWriterPool> pool_;
    std::map<domain::MigrationId, MigrationBuffers> buffers_;
    std::vector<std::future<WriteResult>> inFlight_;
    bool shutDown_{false};
};

}  // namespace infra::storage
