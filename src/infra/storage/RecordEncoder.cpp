#include "infra/storage/RecordEncoder.hpp"

#include <array>
#include <climits>
#include <stdexcept>

#include <zlib.h>

namespace infra::storage {
namespace {

// 15 window bits plus 16 selects gzip framing instead of raw zlib.
constexpr int kGzipWindowBits = 15 + 16;
constexpr int kMemLevel = 8;
constexpr std::size_t kChunkSize = 64 * 1024;

void toProto(const domain::LedgerUpdate& in, ledger::Update& out) {
    out.set_id(in.updateId.value_or(std::string{}));
    out.set_type(domain::to_string(in.updateKind()));
    out.set_migration_id(in.migrationId);
    out.set_synchronizer(in.synchronizerId);
    out.set_effective_at(in.effectiveAt.value_or(0));
    out.set_recorded_at(in.recordedAt);
    out.set_record_time(in.recordTime.value_or(0));
    out.set_kind(in.kind);
    out.set_offset(in.offset.value_or(0));
    out.set_trace_context_json(in.traceContextJson);
    out.set_update_data_json(in.updateDataJson);

    if (const auto* tx = std::get_if<domain::Transaction>(&in.body)) {
        out.set_command_id(tx->commandId);
        out.set_workflow_id(tx->workflowId);
        for (const auto& id : tx->rootEventIds) {
            out.add_root_event_ids(id);
        }
        out.set_event_count(static_cast<std::int32_t>(tx->eventCount));
    } else if (const auto* re = std::get_if<domain::Reassignment>(&in.body)) {
        out.set_source_synchronizer(re->info.sourceSynchronizer);
        out.set_target_synchronizer(re->info.targetSynchronizer);
        out.set_unassign_id(re->info.unassignId);
        out.set_submitter(re->info.submitter);
        out.set_reassignment_counter(re->info.counter.value_or(0));
        out.set_event_count(static_cast<std::int32_t>(in.events.size()));
    }
}

void toProto(const domain::LedgerEvent& in, ledger::Event& out) {
    out.set_id(in.eventId);
    out.set_update_id(in.updateId);
    out.set_type(in.eventType);
    out.set_type_original(in.eventTypeOriginal);
    out.set_synchronizer(in.synchronizerId);
    out.set_migration_id(in.migrationId);
    out.set_effective_at(in.effectiveAt);
    out.set_recorded_at(in.recordedAt);
    out.set_created_at_ts(in.createdAt);
    out.set_contract_id(in.contractId);
    out.set_template_id(in.templateId);
    out.set_package_name(in.packageName);
    for (const auto& party : in.signatories) {
        out.add_signatories(party);
    }
    for (const auto& party : in.observers) {
        out.add_observers(party);
    }
    for (const auto& party : in.actingParties) {
        out.add_acting_parties(party);
    }
    for (const auto& party : in.witnessParties) {
        out.add_witness_parties(party);
    }
    out.set_payload_json(in.payloadJson);
    out.set_contract_key_json(in.contractKeyJson);
    out.set_choice(in.choice);
    out.set_has_consuming(in.consuming.has_value());
    out.set_consuming(in.consuming.value_or(false));
    out.set_interface_id(in.interfaceId);
    for (const auto& child : in.childEventIds) {
        out.add_child_event_ids(child);
    }
    out.set_exercise_result_json(in.exerciseResultJson);
    out.set_source_synchronizer(in.reassignment.sourceSynchronizer);
    out.set_target_synchronizer(in.reassignment.targetSynchronizer);
    out.set_unassign_id(in.reassignment.unassignId);
    out.set_submitter(in.reassignment.submitter);
    out.set_reassignment_counter(in.reassignment.counter.value_or(0));
    out.set_raw_json(in.rawJson);
}

template <typename Batch>
Batch parseBatch(std::string_view compressed, const char* what) {
    const std::string raw = RecordEncoder::gunzip(compressed);
    Batch batch;
    if (raw.size() > static_cast<std::size_t>(INT_MAX) || !batch.ParseFromArray(raw.data(), static_cast<int>(raw.size()))) {
        throw std::runtime_error(std::string{"Failed to parse "} + what + " batch");
    }
    return batch;
}

}  // namespace

const char* to_string(RecordType type) noexcept {
    return type == RecordType::Updates ? "updates" : "events";
}

RecordEncoder::RecordEncoder(int gzipLevel) : level_(gzipLevel) {
    if (gzipLevel < 0 || gzipLevel > 9) {
        throw std::invalid_argument("gzip level must be between 0 and 9, got " + std::to_string(gzipLevel));
    }
}

EncodedBatch RecordEncoder::encodeUpdates(const std::vector<domain::LedgerUpdate>& updates) const {
    ledger::UpdateBatch batch;
    batch.mutable_records()->Reserve(static_cast<int>(updates.size()));
    for (const auto& update : updates) {
        toProto(update, *batch.add_records());
    }

    std::string raw;
    if (!batch.SerializeToString(&raw)) {
        throw std::runtime_error("Failed to serialize update batch");
    }
    EncodedBatch encoded;
    encoded.rawBytes = raw.size();
    encoded.recordCount = updates.size();
    encoded.bytes = gzip(raw, level_);
    return encoded;
}

EncodedBatch RecordEncoder::encodeEvents(const std::vector<domain::LedgerEvent>& events) const {
    ledger::EventBatch batch;
    batch.mutable_records()->Reserve(static_cast<int>(events.size()));
    for (const auto& event : events) {
        toProto(event, *batch.add_records());
    }

    std::string raw;
    if (!batch.SerializeToString(&raw)) {
        throw std::runtime_error("Failed to serialize event batch");
    }
    EncodedBatch encoded;
    encoded.rawBytes = raw.size();
    encoded.recordCount = events.size();
    encoded.bytes = gzip(raw, level_);
    return encoded;
}

ledger::UpdateBatch RecordEncoder::decodeUpdates(std::string_view compressed) {
    return parseBatch<ledger::UpdateBatch>(compressed, "update");
}

ledger::EventBatch RecordEncoder::decodeEvents(std::string_view compressed) {
    return parseBatch<ledger::EventBatch>(compressed, "event");
}

std::string RecordEncoder::gzip(std::string_view data, int level) {
    z_stream zs{};
    if (deflateInit2(&zs, level, Z_DEFLATED, kGzipWindowBits, kMemLevel, Z_DEFAULT_STRATEGY) != Z_OK) {
        throw std::runtime_error("deflateInit2 failed");
    }

    zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
    zs.avail_in = static_cast<uInt>(data.size());

    std::string out;
    out.reserve(deflateBound(&zs, static_cast<uLong>(data.size())));
    std::array<char, kChunkSize> buffer{};
    int ret = Z_OK;
    do {
        zs.next_out = reinterpret_cast<Bytef*>(buffer.data());
        zs.avail_out = static_cast<uInt>(buffer.size());
        ret = deflate(&zs, Z_FINISH);
        if (ret == Z_STREAM_ERROR) {
            deflateEnd(&zs);
            throw std::runtime_error("deflate failed");
        }
        out.append(buffer.data(), buffer.size() - zs.avail_out);
    } while (ret != Z_STREAM_END);

    deflateEnd(&zs);
    return out;
}

std::string RecordEncoder::gunzip(std::string_view data) {
    z_stream zs{};
    if (inflateInit2(&zs, kGzipWindowBits) != Z_OK) {
        throw std::runtime_error("inflateInit2 failed");
    }

    zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
    zs.avail_in = static_cast<uInt>(data.size());

    std::string out;
    std::array<char, kChunkSize> buffer{};
    int ret = Z_OK;
    while (ret != Z_STREAM_END) {
        zs.next_out = reinterpret_cast<Bytef*>(buffer.data());
        zs.avail_out = static_cast<uInt>(buffer.size());
        ret = inflate(&zs, Z_NO_FLUSH);
        if (ret != Z_OK && ret != Z_STREAM_END) {
            const std::string message = zs.msg != nullptr ? zs.msg : "inflate error " + std::to_string(ret);
            inflateEnd(&zs);
            throw std::runtime_error("gunzip failed: " + message);
        }
        out.append(buffer.data(), buffer.size() - zs.avail_out);
        if (ret == Z_OK && zs.avail_in == 0 && zs.avail_out != 0) {
            inflateEnd(&zs);
            throw std::runtime_error("gunzip failed: truncated stream");
        }
    }

    inflateEnd(&zs);
    return out;
}

}  // namespace infra::storage
