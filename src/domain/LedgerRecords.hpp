#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "domain/Types.h"

namespace domain {

struct ReassignmentInfo {
    std::string sourceSynchronizer;
    std::string targetSynchronizer;
    std::string unassignId;
    std::string submitter;
    std::optional<std::int64_t> counter;
};

struct LedgerEvent {
    std::string eventId;
    std::string updateId;
    std::string eventType;          // created, archived, exercised, reassign_create, reassign_archive
    std::string eventTypeOriginal;  // created_event, archived_event, exercised_event
    std::string synchronizerId;
    MigrationId migrationId{0};

    TimestampMs effectiveAt{0};
    TimestampMs recordedAt{0};
    TimestampMs createdAt{0};

    std::string contractId;
    std::string templateId;
    std::string packageName;

    std::vector<std::string> signatories;
    std::vector<std::string> observers;
    std::vector<std::string> actingParties;
    std::vector<std::string> witnessParties;

    std::string payloadJson;
    std::string contractKeyJson;

    std::string choice;
    std::optional<bool> consuming;
    std::string interfaceId;
    std::vector<std::string> childEventIds;
    std::string exerciseResultJson;

    ReassignmentInfo reassignment;
    std::string rawJson;
};

struct Transaction {
    std::string commandId;
    std::string workflowId;
    std::vector<std::string> rootEventIds;
    std::size_t eventCount{0};
};

struct Reassignment {
    ReassignmentInfo info;
};

enum class UpdateKind { Transaction, Reassignment };

// Validated form of one remote update. Everything downstream of the decoder works on this type.
struct LedgerUpdate {
    std::optional<std::string> updateId;
    MigrationId migrationId{0};
    std::string synchronizerId;

    std::optional<TimestampMs> recordTime;
    std::optional<TimestampMs> effectiveAt;
    TimestampMs recordedAt{0};
    std::optional<std::int64_t> offset;

    std::string kind;
    std::string traceContextJson;
    std::string updateDataJson;

    std::variant<Transaction, Reassignment> body;
    std::vector<LedgerEvent> events;

    UpdateKind updateKind() const noexcept {
        return std::holds_alternative<Reassignment>(body) ? UpdateKind::Reassignment : UpdateKind::Transaction;
    }

    // Primary ordering key of the ledger stream.
    std::optional<TimestampMs> orderingTime() const noexcept { return recordTime ? recordTime : effectiveAt; }
};

inline const char* to_string(UpdateKind kind) {
    return kind == UpdateKind::Reassignment ? "reassignment" : "transaction";
}

inline std::size_t countEvents(const std::vector<LedgerUpdate>& updates) {
    std::size_t total = 0;
    for (const auto& update : updates) {
        total += update.events.size();
    }
    return total;
}

}  // namespace domain
