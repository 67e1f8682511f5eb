#include <iostream>
#include <string>

#include <boost/json.hpp>

#include "adapters/scan/RecordDecoder.hpp"
#include "infra/storage/PartitionPath.hpp"
#include "infra/storage/RecordEncoder.hpp"
#include "TestSupport.hpp"

using adapters::scan::RecordDecoder;
using infra::storage::RecordEncoder;

namespace {

constexpr const char* kTransactionPage = R"([
  {
    "update_id": "1220tx",
    "migration_id": 3,
    "synchronizer_id": "global-domain::1220aa",
    "record_time": "2024-06-03T10:00:00.250Z",
    "effective_at": "2024-06-03T10:00:00.000Z",
    "offset": 77,
    "command_id": "cmd-1",
    "workflow_id": "",
    "root_event_ids": ["#tx:0"],
    "events_by_id": {
      "#tx:2": {"event_type": "archived_event", "event_id": "#tx:2", "contract_id": "c-old",
                "template_id": "splice:Amulet:Amulet"},
      "#tx:0": {"event_type": "exercised_event", "event_id": "#tx:0", "contract_id": "c-old",
                "template_id": "splice:Amulet:Amulet", "choice": "Transfer", "consuming": true,
                "acting_parties": ["alice::1220"], "child_event_ids": ["#tx:1", "#tx:2"],
                "choice_argument": {"amount": "10.0"}, "exercise_result": {"ok": true}},
      "#tx:1": {"event_type": "created_event", "event_id": "#tx:1", "contract_id": "c-new",
                "template_id": "splice:Amulet:Amulet", "signatories": ["dso::1220"],
                "create_arguments": {"amount": "10.0"}},
      "#tx:9": {"event_type": "created_event", "event_id": "#tx:9", "contract_id": "c-orphan",
                "template_id": "other:Mod:T"}
    }
  },
  {"unexpected": true},
  "not an object"
])";

constexpr const char* kReassignment = R"({
  "update_id": "1220re",
  "migration_id": 4,
  "record_time": "2024-06-04T00:00:00Z",
  "event": {
    "source": "sync-a",
    "target": "sync-b",
    "unassign_id": "u-1",
    "submitter": "bob::1220",
    "counter": 2,
    "created_event": {"contract_id": "c-moved", "template_id": "splice:Amulet:Amulet",
                      "created_at": "2024-06-01T00:00:00Z"}
  }
})";

bool decodesEventTreeInOrder() {
    RecordDecoder decoder(3, "fallback-sync");
    const auto page = decoder.decodePage(boost::json::parse(kTransactionPage).as_array());
    if (page.updates.size() != 1 || page.rejected != 2) {
        std::cerr << "Expected one update and two rejected items, got " << page.updates.size() << " / "
                  << page.rejected << "\n";
        return false;
    }

    const auto& update = page.updates.front();
    if (update.updateKind() != domain::UpdateKind::Transaction || update.updateId.value_or("") != "1220tx" ||
        update.migrationId != 3 || update.synchronizerId != "global-domain::1220aa" ||
        update.offset.value_or(0) != 77) {
        std::cerr << "Update header decoded incorrectly\n";
        return false;
    }
    if (update.recordTime.value_or(0) != ldg::testing::isoMs("2024-06-03T10:00:00.250Z") ||
        page.oldest != update.recordTime || page.newest != update.recordTime) {
        std::cerr << "Record time or page bounds wrong\n";
        return false;
    }

    const char* expectedOrder[] = {"#tx:0", "#tx:1", "#tx:2", "#tx:9"};
    if (update.events.size() != 4) {
        std::cerr << "Expected four events, got " << update.events.size() << "\n";
        return false;
    }
    for (std::size_t i = 0; i < 4; ++i) {
        if (update.events[i].eventId != expectedOrder[i]) {
            std::cerr << "Event " << i << " is " << update.events[i].eventId << ", expected " << expectedOrder[i]
                      << "\n";
            return false;
        }
    }

    const auto& exercised = update.events[0];
    if (exercised.eventType != "exercised" || exercised.choice != "Transfer" || !exercised.consuming ||
        !*exercised.consuming || exercised.childEventIds.size() != 2 || exercised.packageName != "splice") {
        std::cerr << "Exercised event fields wrong\n";
        return false;
    }
    // Events without created_at inherit the update's record time.
    if (exercised.effectiveAt != *update.recordTime) {
        std::cerr << "Exercised event should fall back to the record time\n";
        return false;
    }
    if (update.events[1].eventType != "created" || update.events[1].signatories.size() != 1 ||
        update.events[1].payloadJson.find("10.0") == std::string::npos) {
        std::cerr << "Created event fields wrong\n";
        return false;
    }
    if (update.events[2].eventType != "archived" || update.events[3].packageName != "other") {
        std::cerr << "Archived or orphan event fields wrong\n";
        return false;
    }
    return true;
}

bool decodesReassignment() {
    RecordDecoder decoder(std::nullopt, "sync-b");
    const auto update = decoder.decode(boost::json::parse(kReassignment));
    if (!update || update->updateKind() != domain::UpdateKind::Reassignment || update->migrationId != 4) {
        std::cerr << "Reassignment not recognised\n";
        return false;
    }
    const auto& info = std::get<domain::Reassignment>(update->body).info;
    if (info.sourceSynchronizer != "sync-a" || info.targetSynchronizer != "sync-b" || info.unassignId != "u-1" ||
        info.submitter != "bob::1220" || info.counter.value_or(0) != 2) {
        std::cerr << "Reassignment details wrong\n";
        return false;
    }
    if (update->events.size() != 1 || update->events[0].eventType != "reassign_create" ||
        update->events[0].effectiveAt != ldg::testing::isoMs("2024-06-01T00:00:00Z") ||
        update->events[0].reassignment.targetSynchronizer != "sync-b") {
        std::cerr << "Reassigned contract event wrong\n";
        return false;
    }
    return true;
}

bool encodedBatchDecodes() {
    const auto t = ldg::testing::isoMs("2024-06-03T12:00:00Z");
    std::vector<domain::LedgerUpdate> updates = {ldg::testing::makeUpdate("a", t, 2, 3),
                                                 ldg::testing::makeUpdate("b", t - 1000, 0, 3)};
    RecordEncoder encoder(6);
    const auto encoded = encoder.encodeUpdates(updates);
    if (encoded.recordCount != 2 || encoded.rawBytes == 0 || encoded.bytes.size() < 2 ||
        static_cast<unsigned char>(encoded.bytes[0]) != 0x1f || static_cast<unsigned char>(encoded.bytes[1]) != 0x8b) {
        std::cerr << "Encoded batch is not a gzip stream\n";
        return false;
    }
    const auto batch = RecordEncoder::decodeUpdates(encoded.bytes);
    if (batch.records_size() != 2 || batch.records(0).id() != "a" || batch.records(0).record_time() != t ||
        batch.records(0).event_count() != 2 || batch.records(1).migration_id() != 3) {
        std::cerr << "Decoded batch does not match the input\n";
        return false;
    }

    bool threw = false;
    try {
        RecordEncoder::decodeEvents("definitely not gzip");
    } catch (const std::runtime_error&) {
        threw = true;
    }
    if (!threw) {
        std::cerr << "Corrupt input must throw\n";
        return false;
    }
    return true;
}

bool partitionLayout() {
    const auto dir = infra::storage::partitionDir("/data", 3, ldg::testing::isoMs("2024-06-03T23:59:59Z"));
    if (dir != std::filesystem::path("/data/migration=3/year=2024/month=6/day=3")) {
        std::cerr << "Unexpected partition dir " << dir << "\n";
        return false;
    }
    const auto suffix = infra::storage::randomSuffix();
    if (suffix.size() != 8 || suffix.find_first_not_of("0123456789abcdef") != std::string::npos) {
        std::cerr << "Unexpected random suffix " << suffix << "\n";
        return false;
    }
    const auto name =
        infra::storage::partitionFileName(infra::storage::RecordType::Events, 1717372800000, "0a1b2c3d");
    if (name != "events-1717372800000-0a1b2c3d.pb.gz") {
        std::cerr << "Unexpected file name " << name << "\n";
        return false;
    }
    return true;
}

}  // namespace

int main() {
    if (!decodesEventTreeInOrder() || !decodesReassignment() || !encodedBatchDecodes() || !partitionLayout()) {
        return 1;
    }
    return 0;
}
