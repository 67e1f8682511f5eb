#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>

#include "domain/Types.h"

namespace core {
class CancellationToken;
}

namespace core::integrity {

class IntegrityCursor;

struct FileCounts {
    std::size_t updates{0};
    std::size_t events{0};
    std::size_t total() const noexcept { return updates + events; }
};

struct VerifyResult {
    bool success{false};
    std::size_t newFiles{0};
    std::uint64_t confirmedUpdates{0};
    std::uint64_t confirmedEvents{0};
};

// Confirms that data handed to the asynchronous writer actually reached the partition tree
// before the cursor is allowed to move.
class WriteVerifier {
public:
    static constexpr std::chrono::milliseconds kDefaultTimeout{30000};
    static constexpr std::chrono::milliseconds kPollInterval{100};

    using FlushFn = std::function<void()>;
    // Returns true when the writer acknowledged every submitted job.
    using WaitFn = std::function<bool()>;

    explicit WriteVerifier(std::filesystem::path dataRoot, core::CancellationToken* cancel = nullptr);

    // Recursive count of finished partition files (updates-*.pb.gz / events-*.pb.gz).
    FileCounts countFiles() const;

    // Polls until the file count grew by expectedNewFiles over baseline (the current count when
    // not given). False on timeout or cancellation.
    bool waitForWrites(std::size_t expectedNewFiles, std::chrono::milliseconds timeout = kDefaultTimeout,
                       std::optional<FileCounts> baseline = std::nullopt) const;

    // flushFn, then waitFn, then a recount. Calls cursor.confirmWrite() only if the writer
    // acknowledged and new files appeared, or if nothing was pending. Otherwise the cursor
    // is left untouched. baseline is the count taken before the records were handed to the
    // writer; without it the count is taken before flushFn.
    VerifyResult verifyAndConfirm(IntegrityCursor& cursor, std::uint64_t pendingUpdates,
                                  std::uint64_t pendingEvents, domain::TimestampMs beforeTimestamp,
                                  const FlushFn& flushFn, const WaitFn& waitFn,
                                  std::optional<FileCounts> baseline = std::nullopt) const;

    const std::filesystem::path& dataRoot() const noexcept { return dataRoot_; }

private:
    std::filesystem::path dataRoot_;
    core::CancellationToken* cancel_;
};

}  // namespace core::integrity
