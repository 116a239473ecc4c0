/// @file json.hpp
/// @brief nlohmann/json serialization of peersync types.
///
/// Provides ADL `to_json`/`from_json` for the CRDT states, snapshots and
/// sync items. Keys are camelCase; the result is the record format stored
/// on a remote and exchanged between nodes.

#pragma once

#include <peersync/crdt/g_counter.hpp>
#include <peersync/crdt/lww_register.hpp>
#include <peersync/crdt/or_set.hpp>
#include <peersync/crdt_snapshot.hpp>
#include <peersync/encryption.hpp>
#include <peersync/sync_item.hpp>
#include <peersync/vector_clock.hpp>

#include <nlohmann/json.hpp>

#include <optional>
#include <string_view>

namespace peersync {

// -- Clocks and CRDT states ---------------------------------------------------

void to_json(nlohmann::json& j, const VectorClock& clock);
void from_json(const nlohmann::json& j, VectorClock& clock);

void to_json(nlohmann::json& j, const GCounterState& s);
void from_json(const nlohmann::json& j, GCounterState& s);

void to_json(nlohmann::json& j, const PNCounterState& s);
void from_json(const nlohmann::json& j, PNCounterState& s);

/// `{"value": ..., "timestamp": ..., "nodeId": ...}`
template <typename T>
void to_json(nlohmann::json& j, const LwwRegisterState<T>& s) {
    j = nlohmann::json{{"value", s.value}, {"timestamp", s.timestamp}, {"nodeId", s.node_id}};
}

template <typename T>
void from_json(const nlohmann::json& j, LwwRegisterState<T>& s) {
    s.value = j.at("value").get<T>();
    s.timestamp = j.at("timestamp").get<Timestamp>();
    s.node_id = j.at("nodeId").get<NodeId>();
}

/// `{"elements": [{"key", "value", "tags"}...], "tombstones": [...]}`
template <typename T>
void to_json(nlohmann::json& j, const OrSetState<T>& s) {
    auto elements = nlohmann::json::array();
    for (const auto& [key, element] : s.elements) {
        elements.push_back({{"key", key}, {"value", element.value}, {"tags", element.tags}});
    }
    j = nlohmann::json{{"elements", std::move(elements)}, {"tombstones", s.tombstones}};
}

template <typename T>
void from_json(const nlohmann::json& j, OrSetState<T>& s) {
    s.elements.clear();
    for (const auto& e : j.at("elements")) {
        s.elements.insert_or_assign(e.at("key").get<std::string>(), TaggedElement<T>{
            .value = e.at("value").get<T>(),
            .tags = e.at("tags").get<std::set<Tag>>(),
        });
    }
    s.tombstones = j.at("tombstones").get<std::set<Tag>>();
}

// -- Snapshots and items ------------------------------------------------------

/// `{"type": "<kind>", "nodeId", "timestamp", "vectorClock", "state"?}`
void to_json(nlohmann::json& j, const CrdtSnapshot& s);
void from_json(const nlohmann::json& j, CrdtSnapshot& s);

void to_json(nlohmann::json& j, const KdfParams& k);
void from_json(const nlohmann::json& j, KdfParams& k);

void to_json(nlohmann::json& j, const EncryptedEnvelope& e);
void from_json(const nlohmann::json& j, EncryptedEnvelope& e);

void to_json(nlohmann::json& j, const ChunkedPayload& p);
void from_json(const nlohmann::json& j, ChunkedPayload& p);

void to_json(nlohmann::json& j, const SyncItem& item);
void from_json(const nlohmann::json& j, SyncItem& item);

/// Parse a serialized SyncItem record.
/// @return nullopt if the text is not valid JSON or not a valid record.
auto parse_sync_item(std::string_view text) -> std::optional<SyncItem>;

}  // namespace peersync
