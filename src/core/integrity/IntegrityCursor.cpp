#include "core/integrity/IntegrityCursor.h"

#include <algorithm>
#include <stdexcept>
#include <system_error>
#include <utility>

#include <boost/json.hpp>

#include "common/JsonUtils.hpp"
#include "core/TimeUtils.h"
#include "infra/storage/AtomicFile.hpp"
#include "logging/Log.h"

namespace core::integrity {
namespace {

constexpr auto kLogCategory = logging::LogCategory::CURSOR;
constexpr std::size_t kMaxSanitizedLength = 50;

namespace json = ldg::common::json;

boost::json::value timeOrNull(const std::optional<domain::TimestampMs>& value) {
    if (!value) {
        return nullptr;
    }
    return boost::json::value(core::time::formatIso8601Ms(*value));
}

std::uint64_t countOrZero(const boost::json::object& object, std::string_view key, std::string_view legacyKey = {}) {
    auto value = json::get_int64(object, key);
    if (!value && !legacyKey.empty()) {
        value = json::get_int64(object, legacyKey);
    }
    return value && *value > 0 ? static_cast<std::uint64_t>(*value) : 0;
}

std::string toJson(const CursorState& state) {
    boost::json::object obj;
    obj["id"] = state.id;
    obj["migration_id"] = state.migrationId;
    obj["synchronizer_id"] = state.synchronizerId;
    if (state.shardIndex >= 0) {
        obj["shard_index"] = state.shardIndex;
        obj["shard_total"] = state.shardTotal;
    } else {
        obj["shard_index"] = nullptr;
        obj["shard_total"] = nullptr;
    }
    obj["last_confirmed_before"] = timeOrNull(state.lastConfirmedBefore);
    obj["confirmed_updates"] = state.confirmedUpdates;
    obj["confirmed_events"] = state.confirmedEvents;
    obj["pending_updates"] = state.pendingUpdates;
    obj["pending_events"] = state.pendingEvents;
    boost::json::array boundary;
    for (const auto& id : state.boundaryIds) {
        boundary.emplace_back(id);
    }
    obj["boundary_update_ids"] = std::move(boundary);
    obj["min_time"] = timeOrNull(state.minTime);
    obj["max_time"] = timeOrNull(state.maxTime);
    obj["complete"] = state.complete;
    obj["updated_at"] = timeOrNull(state.updatedAt);
    obj["completed_at"] = timeOrNull(state.completedAt);
    return json::serialize_json(obj);
}

std::optional<CursorState> fromJson(const std::string& text) {
    boost::system::error_code ec;
    const boost::json::value parsed = boost::json::parse(text, ec);
    if (ec || !parsed.is_object()) {
        return std::nullopt;
    }
    const auto& obj = parsed.as_object();

    CursorState state;
    try {
        const auto migration = json::get_int64(obj, "migration_id");
        const auto synchronizer = json::get_string(obj, "synchronizer_id");
        if (!migration || !synchronizer) {
            return std::nullopt;
        }
        state.migrationId = *migration;
        state.synchronizerId = *synchronizer;
        state.id = json::get_string(obj, "id").value_or(std::string{});
        if (const auto shard = json::get_int64(obj, "shard_index")) {
            state.shardIndex = static_cast<int>(*shard);
            state.shardTotal = static_cast<int>(json::get_int64(obj, "shard_total").value_or(1));
        }

        // Older cursor files use total_* and last_before.
        state.lastConfirmedBefore = json::get_time_ms(obj, "last_confirmed_before");
        if (!state.lastConfirmedBefore) {
            state.lastConfirmedBefore = json::get_time_ms(obj, "last_before");
        }
        state.confirmedUpdates = countOrZero(obj, "confirmed_updates", "total_updates");
        state.confirmedEvents = countOrZero(obj, "confirmed_events", "total_events");
        state.pendingUpdates = countOrZero(obj, "pending_updates");
        state.pendingEvents = countOrZero(obj, "pending_events");
        if (const auto* boundary = json::find(obj, "boundary_update_ids"); boundary && boundary->is_array()) {
            for (const auto& id : boundary->as_array()) {
                if (id.is_string()) {
                    state.boundaryIds.emplace_back(id.as_string().c_str());
                }
            }
        }

        state.minTime = json::get_time_ms(obj, "min_time");
        state.maxTime = json::get_time_ms(obj, "max_time");
        state.complete = json::get_bool(obj, "complete").value_or(false);
        state.updatedAt = json::get_time_ms(obj, "updated_at");
        state.completedAt = json::get_time_ms(obj, "completed_at");
    } catch (const std::exception& ex) {
        LOG_WARN(kLogCategory, "Malformed cursor field: %s", ex.what());
        return std::nullopt;
    }
    return state;
}

std::string streamId(const domain::StreamKey& key) {
    std::string id = std::to_string(key.migrationId) + "-" + IntegrityCursor::sanitizeSynchronizer(key.synchronizerId);
    if (key.sharded()) {
        id += "-shard" + std::to_string(key.shardIndex);
    }
    return id;
}

}  // namespace

IntegrityCursor::IntegrityCursor(std::filesystem::path cursorDir, domain::StreamKey key)
    : key_(std::move(key)), path_(pathFor(cursorDir, key_)) {
    state_.id = streamId(key_);
    state_.migrationId = key_.migrationId;
    state_.synchronizerId = key_.synchronizerId;
    state_.shardIndex = key_.shardIndex;
    state_.shardTotal = key_.shardTotal;
}

std::string IntegrityCursor::sanitizeSynchronizer(const std::string& synchronizerId) {
    std::string out;
    out.reserve(std::min(synchronizerId.size(), kMaxSanitizedLength));
    for (const char ch : synchronizerId) {
        if (out.size() == kMaxSanitizedLength) {
            break;
        }
        const bool keep = (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || (ch >= '0' && ch <= '9') ||
                          ch == '-' || ch == '_';
        out.push_back(keep ? ch : '_');
    }
    return out;
}

std::filesystem::path IntegrityCursor::pathFor(const std::filesystem::path& cursorDir, const domain::StreamKey& key) {
    return cursorDir / ("cursor-" + streamId(key) + ".json");
}

std::optional<CursorState> IntegrityCursor::readFile(const std::filesystem::path& path) {
    const auto text = infra::storage::readWholeFile(path);
    if (!text) {
        return std::nullopt;
    }
    return fromJson(*text);
}

bool IntegrityCursor::load() {
    auto loaded = readFile(path_);
    if (!loaded) {
        const auto backup = infra::storage::backupPathFor(path_);
        loaded = readFile(backup);
        if (!loaded) {
            return false;
        }
        LOG_WARN(kLogCategory, "Cursor %s unreadable, recovered from backup", path_.string().c_str());
        const auto backupText = infra::storage::readWholeFile(backup);
        if (backupText) {
            infra::storage::writeFileAtomic(path_, *backupText);
        }
    }

    if (loaded->migrationId != key_.migrationId || loaded->synchronizerId != key_.synchronizerId) {
        throw std::runtime_error("Cursor " + path_.string() + " belongs to migration " +
                                 std::to_string(loaded->migrationId) + " synchronizer " + loaded->synchronizerId);
    }
    if (loaded->shardIndex != key_.shardIndex || loaded->shardTotal != key_.shardTotal) {
        throw std::runtime_error("Cursor " + path_.string() + " was written for shard " +
                                 std::to_string(loaded->shardIndex) + "/" + std::to_string(loaded->shardTotal) +
                                 ", expected " + std::to_string(key_.shardIndex) + "/" +
                                 std::to_string(key_.shardTotal));
    }

    if (loaded->pendingUpdates > 0 || loaded->pendingEvents > 0) {
        LOG_WARN(kLogCategory,
                 "Cursor %s has %llu pending updates and %llu pending events from an interrupted run; "
                 "resuming from last confirmed position",
                 loaded->id.c_str(), static_cast<unsigned long long>(loaded->pendingUpdates),
                 static_cast<unsigned long long>(loaded->pendingEvents));
        loaded->pendingUpdates = 0;
        loaded->pendingEvents = 0;
    }

    if (loaded->id.empty()) {
        loaded->id = state_.id;
    }
    state_ = std::move(*loaded);
    LOG_INFO(kLogCategory, "Loaded cursor %s: confirmed %llu updates, %llu events, resume before %s%s",
             state_.id.c_str(), static_cast<unsigned long long>(state_.confirmedUpdates),
             static_cast<unsigned long long>(state_.confirmedEvents),
             state_.lastConfirmedBefore ? core::time::formatIso8601Ms(*state_.lastConfirmedBefore).c_str() : "(none)",
             state_.complete ? " [complete]" : "");
    return true;
}

void IntegrityCursor::setTimeBounds(domain::TimestampMs minTime, domain::TimestampMs maxTime) {
    CursorState next = state_;
    next.minTime = minTime;
    next.maxTime = maxTime;
    persist_(next);
    state_ = std::move(next);
}

void IntegrityCursor::recordPending(std::uint64_t updates, std::uint64_t events) {
    state_.pendingUpdates += updates;
    state_.pendingEvents += events;
}

void IntegrityCursor::confirmWrite(std::uint64_t writtenUpdates, std::uint64_t writtenEvents,
                                   domain::TimestampMs beforeTimestamp) {
    CursorState next = state_;
    next.pendingUpdates -= std::min(writtenUpdates, next.pendingUpdates);
    next.pendingEvents -= std::min(writtenEvents, next.pendingEvents);
    next.confirmedUpdates += writtenUpdates;
    next.confirmedEvents += writtenEvents;

    if (next.lastConfirmedBefore && beforeTimestamp > *next.lastConfirmedBefore) {
        LOG_WARN(kLogCategory, "Cursor %s: refusing to move resume marker up from %s to %s", state_.id.c_str(),
                 core::time::formatIso8601Ms(*next.lastConfirmedBefore).c_str(),
                 core::time::formatIso8601Ms(beforeTimestamp).c_str());
    } else {
        next.lastConfirmedBefore = beforeTimestamp;
        next.boundaryIds = stagedBoundary_;
    }

    persist_(next);
    state_ = std::move(next);
    stagedBoundary_.clear();
}

void IntegrityCursor::markComplete() {
    if (hasPending()) {
        throw std::logic_error("Cursor " + state_.id + " cannot be completed with " +
                               std::to_string(state_.pendingUpdates) + " pending updates and " +
                               std::to_string(state_.pendingEvents) + " pending events");
    }
    CursorState next = state_;
    next.complete = true;
    next.completedAt = core::time::nowMs();
    persist_(next);
    state_ = std::move(next);
    LOG_INFO(kLogCategory, "Cursor %s complete: %llu updates, %llu events", state_.id.c_str(),
             static_cast<unsigned long long>(state_.confirmedUpdates),
             static_cast<unsigned long long>(state_.confirmedEvents));
}

void IntegrityCursor::persist_(CursorState& next) const {
    next.updatedAt = core::time::nowMs();
    std::error_code ec;
    const bool hasPrevious = std::filesystem::exists(path_, ec);
    infra::storage::writeFileAtomic(path_, toJson(next), hasPrevious);
}

}  // namespace core::integrity
