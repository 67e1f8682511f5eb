#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "domain/Types.h"

namespace core::integrity {

struct CursorState {
    std::string id;
    domain::MigrationId migrationId{0};
    std::string synchronizerId;
    int shardIndex{-1};
    int shardTotal{1};

    std::optional<domain::TimestampMs> lastConfirmedBefore;
    std::uint64_t confirmedUpdates{0};
    std::uint64_t confirmedEvents{0};
    std::uint64_t pendingUpdates{0};
    std::uint64_t pendingEvents{0};
    // Ids of confirmed records at or below the marker that the next window fetches again.
    std::vector<std::string> boundaryIds;

    std::optional<domain::TimestampMs> minTime;
    std::optional<domain::TimestampMs> maxTime;
    bool complete{false};
    std::optional<domain::TimestampMs> updatedAt;
    std::optional<domain::TimestampMs> completedAt;
};

// Resume state of one backfill stream.
//
// Pending counts are in-memory only and describe records handed to the writer but not yet
// verified on disk. confirmWrite() is the single mutator of the confirmed counts and of the
// resume marker, and it persists before returning. A crash can therefore only cause an
// already-confirmed range to be fetched again, never an unconfirmed one to be skipped.
class IntegrityCursor {
public:
    IntegrityCursor(std::filesystem::path cursorDir, domain::StreamKey key);

    static std::string sanitizeSynchronizer(const std::string& synchronizerId);
    static std::filesystem::path pathFor(const std::filesystem::path& cursorDir, const domain::StreamKey& key);

    // Parses a cursor file. Returns std::nullopt when it is missing or not a valid cursor document.
    static std::optional<CursorState> readFile(const std::filesystem::path& path);

    // Restores persisted state, falling back to the backup copy. Pending counts found on
    // disk are discarded. Returns false when nothing usable was found.
    bool load();

    void setTimeBounds(domain::TimestampMs minTime, domain::TimestampMs maxTime);

    void recordPending(std::uint64_t updates, std::uint64_t events);
    // Held in memory and persisted by the next confirmWrite() that moves the marker.
    void stageBoundary(std::vector<std::string> ids) { stagedBoundary_ = std::move(ids); }
    void confirmWrite(std::uint64_t writtenUpdates, std::uint64_t writtenEvents, domain::TimestampMs beforeTimestamp);

    // Throws std::logic_error while anything is pending.
    void markComplete();

    std::optional<domain::TimestampMs> getResumePosition() const noexcept { return state_.lastConfirmedBefore; }
    bool isComplete() const noexcept { return state_.complete; }
    bool hasPending() const noexcept { return state_.pendingUpdates > 0 || state_.pendingEvents > 0; }

    const CursorState& state() const noexcept { return state_; }
    const std::filesystem::path& path() const noexcept { return path_; }
    const domain::StreamKey& key() const noexcept { return key_; }

private:
    void persist_(CursorState& next) const;

    domain::StreamKey key_;
    std::filesystem::path path_;
    CursorState state_;
    std::vector<std::string> stagedBoundary_;
};

}  // namespace core::integrity
