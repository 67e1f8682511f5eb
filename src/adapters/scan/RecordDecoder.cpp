#include "adapters/scan/RecordDecoder.hpp"

#include <algorithm>
#include <initializer_list>
#include <string_view>
#include <unordered_set>
#include <utility>

#include <boost/json.hpp>

#include "common/JsonUtils.hpp"
#include "core/TimeUtils.h"
#include "logging/Log.h"

namespace adapters::scan {
namespace {

constexpr auto kLogCategory = logging::LogCategory::DATA;

namespace json = ldg::common::json;

using ObjectList = std::initializer_list<const boost::json::object*>;

// First non-null value for key among the given objects.
const boost::json::value* lookup(ObjectList objects, std::string_view key) {
    for (const auto* object : objects) {
        if (object == nullptr) {
            continue;
        }
        if (const auto* value = json::find(*object, key)) {
            return value;
        }
    }
    return nullptr;
}

std::string lookupString(ObjectList objects, std::string_view key) {
    const auto* value = lookup(objects, key);
    if (value == nullptr || !value->is_string()) {
        return {};
    }
    return std::string{value->as_string().c_str()};
}

std::string lookupJson(ObjectList objects, std::string_view key) {
    const auto* value = lookup(objects, key);
    return value != nullptr ? json::serialize_json(*value) : std::string{};
}

std::vector<std::string> lookupList(ObjectList objects, std::string_view key) {
    std::vector<std::string> out;
    const auto* value = lookup(objects, key);
    if (value == nullptr || !value->is_array()) {
        return out;
    }
    for (const auto& entry : value->as_array()) {
        if (entry.is_string()) {
            out.emplace_back(entry.as_string().c_str());
        }
    }
    return out;
}

std::optional<domain::TimestampMs> lookupTime(ObjectList objects, std::string_view key) {
    const auto* value = lookup(objects, key);
    if (value == nullptr) {
        return std::nullopt;
    }
    if (value->is_string()) {
        const auto& text = value->as_string();
        return core::time::parseIso8601Ms(std::string_view{text.data(), text.size()});
    }
    if (value->is_number()) {
        return json::json_to_int64(*value);
    }
    return std::nullopt;
}

std::optional<std::int64_t> lookupInt(ObjectList objects, std::string_view key) {
    const auto* value = lookup(objects, key);
    if (value == nullptr) {
        return std::nullopt;
    }
    return json::json_to_int64(*value);
}

std::string packageFromTemplate(const std::string& templateId) {
    const auto pos = templateId.find(':');
    return pos == std::string::npos ? std::string{} : templateId.substr(0, pos);
}

std::vector<std::string> childIdsOf(const boost::json::object& event) {
    return lookupList({json::find_object(event, "exercised_event"), &event}, "child_event_ids");
}

struct EventContext {
    const domain::LedgerUpdate& update;
    const domain::ReassignmentInfo& reassignment;
};

// Returns std::nullopt when the event has no usable time.
std::optional<domain::LedgerEvent> decodeEvent(const boost::json::object& event, const std::string& eventIdHint,
                                               const EventContext& ctx) {
    const auto* created = json::find_object(event, "created_event");
    const auto* archived = json::find_object(event, "archived_event");
    const auto* exercised = json::find_object(event, "exercised_event");
    const boost::json::object* inner = created ? created : archived ? archived : exercised ? exercised : &event;

    domain::LedgerEvent out;
    out.updateId = ctx.update.updateId.value_or(std::string{});
    out.migrationId = ctx.update.migrationId;
    out.synchronizerId = ctx.update.synchronizerId;

    out.eventId = lookupString({&event, inner}, "event_id");
    if (out.eventId.empty()) {
        out.eventId = eventIdHint;
    }

    const std::string declaredType = lookupString({&event}, "event_type");
    if (created) {
        out.eventType = "created";
        out.eventTypeOriginal = "created_event";
    } else if (archived) {
        out.eventType = "archived";
        out.eventTypeOriginal = "archived_event";
    } else if (exercised) {
        out.eventType = "exercised";
        out.eventTypeOriginal = "exercised_event";
    } else {
        out.eventTypeOriginal = declaredType;
        if (declaredType.find("created") != std::string::npos) {
            out.eventType = "created";
        } else if (declaredType.find("archived") != std::string::npos) {
            out.eventType = "archived";
        } else if (declaredType.find("exercised") != std::string::npos) {
            out.eventType = "exercised";
        } else {
            out.eventType = declaredType.empty() ? std::string{"unknown"} : declaredType;
        }
    }

    out.contractId = lookupString({inner, &event}, "contract_id");
    out.templateId = lookupString({inner, &event}, "template_id");
    out.packageName = lookupString({inner, &event}, "package_name");
    if (out.packageName.empty()) {
        out.packageName = packageFromTemplate(out.templateId);
    }

    const auto createdAt = lookupTime({inner, &event}, "created_at");
    const auto effective = createdAt ? createdAt : ctx.update.recordTime;
    if (!effective) {
        return std::nullopt;
    }
    out.effectiveAt = *effective;
    out.createdAt = *effective;
    out.recordedAt = ctx.update.recordedAt;

    out.signatories = lookupList({created, &event}, "signatories");
    out.observers = lookupList({created, &event}, "observers");
    out.witnessParties = lookupList({created, inner, &event}, "witness_parties");
    out.actingParties = lookupList({exercised, inner, &event}, "acting_parties");

    if (created != nullptr && json::find(*created, "create_arguments")) {
        out.payloadJson = lookupJson({created}, "create_arguments");
    } else if (exercised != nullptr && json::find(*exercised, "choice_argument")) {
        out.payloadJson = lookupJson({exercised}, "choice_argument");
    } else {
        out.payloadJson = lookupJson({&event}, "create_arguments");
        if (out.payloadJson.empty()) {
            out.payloadJson = lookupJson({&event}, "choice_argument");
        }
        if (out.payloadJson.empty()) {
            out.payloadJson = lookupJson({&event}, "payload");
        }
    }
    out.contractKeyJson = lookupJson({created, inner, &event}, "contract_key");

    out.choice = lookupString({exercised, inner, &event}, "choice");
    if (const auto* consuming = lookup({exercised, inner, &event}, "consuming"); consuming && consuming->is_bool()) {
        out.consuming = consuming->as_bool();
    }
    out.interfaceId = lookupString({exercised, inner, &event}, "interface_id");
    out.childEventIds = lookupList({exercised, inner, &event}, "child_event_ids");
    out.exerciseResultJson = lookupJson({exercised, inner, &event}, "exercise_result");

    out.reassignment = ctx.reassignment;
    if (out.reassignment.sourceSynchronizer.empty()) {
        out.reassignment.sourceSynchronizer = lookupString({&event}, "source");
    }
    if (out.reassignment.targetSynchronizer.empty()) {
        out.reassignment.targetSynchronizer = lookupString({&event}, "target");
    }
    if (out.reassignment.unassignId.empty()) {
        out.reassignment.unassignId = lookupString({&event}, "unassign_id");
    }
    if (out.reassignment.submitter.empty()) {
        out.reassignment.submitter = lookupString({&event}, "submitter");
    }
    if (!out.reassignment.counter) {
        out.reassignment.counter = lookupInt({&event}, "counter");
    }

    out.rawJson = json::serialize_json(event);
    return out;
}

void appendEvent(domain::LedgerUpdate& update, std::optional<domain::LedgerEvent> event, const std::string& label) {
    if (!event) {
        LOG_WARN_EVERY("decode-untimed-event", 5000, kLogCategory, "Skipping %s with no effective time: update=%s",
                       label.c_str(), update.updateId.value_or("?").c_str());
        return;
    }
    update.events.push_back(std::move(*event));
}

}  // namespace

RecordDecoder::RecordDecoder(std::optional<domain::MigrationId> migrationId, std::string synchronizerId)
    : migrationId_(migrationId), synchronizerId_(std::move(synchronizerId)) {}

std::optional<domain::LedgerUpdate> RecordDecoder::decode(const boost::json::value& itemValue) const {
    const auto* item = itemValue.if_object();
    if (item == nullptr) {
        return std::nullopt;
    }

    const auto* txWrapper = json::find_object(*item, "transaction");
    const auto* reWrapper = json::find_object(*item, "reassignment");
    const boost::json::object* data = txWrapper ? txWrapper : reWrapper ? reWrapper : item;

    const auto* reassignEvent = json::find_object(*item, "event");
    if (reassignEvent == nullptr && reWrapper != nullptr) {
        reassignEvent = json::find_object(*reWrapper, "event");
    }

    const bool isReassignment = reassignEvent != nullptr || reWrapper != nullptr;
    const bool isTransaction = txWrapper != nullptr || (!isReassignment && json::find_object(*data, "events_by_id"));
    if (!isTransaction && !isReassignment) {
        return std::nullopt;
    }

    domain::LedgerUpdate update;
    const std::string updateId = lookupString({item, txWrapper, reWrapper}, "update_id");
    if (!updateId.empty()) {
        update.updateId = updateId;
    }

    const auto migration = lookupInt({item, data, reassignEvent}, "migration_id");
    update.migrationId = migration ? *migration : migrationId_.value_or(0);
    update.synchronizerId = lookupString({data, item}, "synchronizer_id");
    if (update.synchronizerId.empty()) {
        update.synchronizerId = synchronizerId_;
    }

    update.recordTime = lookupTime({data, item}, "record_time");
    if (!update.recordTime) {
        update.recordTime = lookupTime({reassignEvent}, "record_time");
    }
    update.effectiveAt = lookupTime({data, item}, "effective_at");
    update.recordedAt = core::time::nowMs();
    update.offset = lookupInt({data, item}, "offset");
    update.kind = lookupString({data, reassignEvent}, "kind");
    update.traceContextJson = lookupJson({data}, "trace_context");
    update.updateDataJson = json::serialize_json(*data);

    if (isReassignment) {
        domain::Reassignment body;
        auto& info = body.info;
        info.sourceSynchronizer = lookupString({data, reassignEvent}, "source");
        if (info.sourceSynchronizer.empty()) {
            info.sourceSynchronizer = lookupString({reassignEvent}, "source_synchronizer");
        }
        info.targetSynchronizer = lookupString({data, reassignEvent}, "target");
        if (info.targetSynchronizer.empty()) {
            info.targetSynchronizer = lookupString({reassignEvent}, "target_synchronizer");
        }
        info.unassignId = lookupString({data, reassignEvent}, "unassign_id");
        info.submitter = lookupString({data, reassignEvent}, "submitter");
        info.counter = lookupInt({data, reassignEvent}, "counter");
        if (!info.counter) {
            info.counter = lookupInt({reassignEvent}, "reassignment_counter");
        }
        update.body = body;

        const EventContext ctx{update, info};
        if (reassignEvent != nullptr) {
            if (const auto* created = json::find_object(*reassignEvent, "created_event")) {
                auto event = decodeEvent(*created, {}, ctx);
                if (event) {
                    event->eventType = "reassign_create";
                    event->eventTypeOriginal = "created_event";
                }
                appendEvent(update, std::move(event), "reassign_create");
            }
            if (const auto* archived = json::find_object(*reassignEvent, "archived_event")) {
                auto event = decodeEvent(*archived, {}, ctx);
                if (event) {
                    event->eventType = "reassign_archive";
                    event->eventTypeOriginal = "archived_event";
                }
                appendEvent(update, std::move(event), "reassign_archive");
            }
        }
        return update;
    }

    domain::Transaction body;
    body.commandId = lookupString({data}, "command_id");
    body.workflowId = lookupString({data}, "workflow_id");
    body.rootEventIds = lookupList({data}, "root_event_ids");

    const domain::ReassignmentInfo noReassignment;
    const auto* eventsById = json::find_object(*data, "events_by_id");
    if (eventsById == nullptr) {
        eventsById = json::find_object(*item, "events_by_id");
    }
    body.eventCount = eventsById != nullptr ? eventsById->size() : 0;
    update.body = body;

    if (eventsById == nullptr) {
        return update;
    }

    // Pre-order walk of the event tree, then whatever the roots did not reach.
    const EventContext ctx{update, noReassignment};
    std::unordered_set<std::string> visited;
    std::vector<std::string> stack(body.rootEventIds.rbegin(), body.rootEventIds.rend());
    while (!stack.empty()) {
        const std::string eventId = std::move(stack.back());
        stack.pop_back();
        if (!visited.insert(eventId).second) {
            continue;
        }
        const auto* event = json::find_object(*eventsById, eventId);
        if (event == nullptr) {
            continue;
        }
        appendEvent(update, decodeEvent(*event, eventId, ctx), "event " + eventId);
        const auto children = childIdsOf(*event);
        stack.insert(stack.end(), children.rbegin(), children.rend());
    }
    for (const auto& entry : *eventsById) {
        const std::string eventId(entry.key().data(), entry.key().size());
        if (visited.count(eventId) > 0 || !entry.value().is_object()) {
            continue;
        }
        visited.insert(eventId);
        appendEvent(update, decodeEvent(entry.value().as_object(), eventId, ctx), "event " + eventId);
    }
    return update;
}

DecodedPage RecordDecoder::decodePage(const boost::json::array& items) const {
    DecodedPage page;
    page.updates.reserve(items.size());

    for (const auto& item : items) {
        std::optional<domain::LedgerUpdate> update;
        try {
            update = decode(item);
        } catch (const std::exception& ex) {
            LOG_WARN(kLogCategory, "Rejecting malformed update: %s", ex.what());
            ++page.rejected;
            continue;
        }
        if (!update) {
            ++page.rejected;
            std::string keys;
            if (const auto* object = item.if_object()) {
                for (const auto& entry : *object) {
                    if (!keys.empty()) {
                        keys += ", ";
                    }
                    keys.append(entry.key().data(), entry.key().size());
                }
            }
            LOG_WARN(kLogCategory, "Rejecting item that is neither a transaction nor a reassignment, keys [%s]",
                     keys.c_str());
            continue;
        }

        if (const auto t = update->orderingTime()) {
            page.oldest = page.oldest ? std::min(*page.oldest, *t) : *t;
            page.newest = page.newest ? std::max(*page.newest, *t) : *t;
        }
        page.updates.push_back(std::move(*update));
    }
    return page;
}

}  // namespace adapters::scan
