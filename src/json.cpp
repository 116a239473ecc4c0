#include <peersync/error.hpp>
#include <peersync/json.hpp>

#include <string>
#include <type_traits>
#include <utility>

namespace peersync {

using json = nlohmann::json;

// =============================================================================
// Clocks and CRDT states
// =============================================================================

void to_json(json& j, const VectorClock& clock) {
    j = json::object();
    for (const auto& [node, counter] : clock.entries()) j[node] = counter;
}

void from_json(const json& j, VectorClock& clock) {
    clock = VectorClock{j.get<VectorClock::Entries>()};
}

void to_json(json& j, const GCounterState& s) {
    j = json{{"counts", s.counts}};
}

void from_json(const json& j, GCounterState& s) {
    s.counts = j.at("counts").get<std::map<NodeId, std::uint64_t>>();
}

void to_json(json& j, const PNCounterState& s) {
    j = json{{"positive", s.positive}, {"negative", s.negative}};
}

void from_json(const json& j, PNCounterState& s) {
    s.positive = j.at("positive").get<GCounterState>();
    s.negative = j.at("negative").get<GCounterState>();
}

// =============================================================================
// Snapshots
// =============================================================================

void to_json(json& j, const CrdtSnapshot& s) {
    j = json{
        {"type", to_string_view(s.kind)},
        {"nodeId", s.node_id},
        {"timestamp", s.timestamp},
        {"vectorClock", s.clock},
    };
    if (s.state) {
        std::visit([&j](const auto& state) { j["state"] = state; }, *s.state);
    }
}

void from_json(const json& j, CrdtSnapshot& s) {
    const auto type = j.at("type").get<std::string>();
    auto kind = parse_crdt_kind(type);
    if (!kind) throw SyncError{ErrorKind::decoding_error, "unknown CRDT type: " + type};

    s.kind = *kind;
    s.node_id = j.at("nodeId").get<NodeId>();
    s.timestamp = j.at("timestamp").get<Timestamp>();
    s.clock = j.value("vectorClock", VectorClock{});
    s.state.reset();

    auto it = j.find("state");
    if (it == j.end() || it->is_null()) return;
    switch (s.kind) {
        case CrdtKind::lww_register:
            s.state = it->get<LwwRegisterState<json>>();
            break;
        case CrdtKind::g_counter:
            s.state = it->get<GCounterState>();
            break;
        case CrdtKind::or_set:
            s.state = it->get<OrSetState<json>>();
            break;
    }
}

// =============================================================================
// Envelopes and payload descriptors
// =============================================================================

void to_json(json& j, const KdfParams& k) {
    j = json{{"algorithm", k.algorithm}, {"salt", k.salt}, {"iterations", k.iterations}};
}

void from_json(const json& j, KdfParams& k) {
    k.algorithm = j.at("algorithm").get<std::string>();
    k.salt = j.at("salt").get<std::string>();
    k.iterations = j.at("iterations").get<std::uint32_t>();
}

void to_json(json& j, const EncryptedEnvelope& e) {
    j = json{
        {"algorithm", e.algorithm},
        {"iv", e.iv},
        {"authTag", e.auth_tag},
        {"ciphertext", e.ciphertext},
        {"keyId", e.key_id},
        {"version", e.version},
    };
    if (e.kdf) j["kdf"] = *e.kdf;
}

void from_json(const json& j, EncryptedEnvelope& e) {
    e.algorithm = j.at("algorithm").get<std::string>();
    e.iv = j.at("iv").get<std::string>();
    e.auth_tag = j.value("authTag", std::string{});
    e.ciphertext = j.at("ciphertext").get<std::string>();
    e.key_id = j.value("keyId", std::string{});
    e.version = j.value("version", std::uint32_t{1});
    if (auto it = j.find("kdf"); it != j.end() && !it->is_null()) {
        e.kdf = it->get<KdfParams>();
    } else {
        e.kdf.reset();
    }
}

void to_json(json& j, const ChunkedPayload& p) {
    j = json{
        {"size", p.size},
        {"totalChunks", p.total_chunks},
        {"chunkSize", p.chunk_size},
        {"contentHash", p.content_hash},
        {"compressed", p.compressed},
    };
}

void from_json(const json& j, ChunkedPayload& p) {
    p.size = j.at("size").get<std::size_t>();
    p.total_chunks = j.at("totalChunks").get<std::uint32_t>();
    p.chunk_size = j.at("chunkSize").get<std::size_t>();
    p.content_hash = j.at("contentHash").get<std::string>();
    p.compressed = j.value("compressed", false);
}

// =============================================================================
// SyncItem
// =============================================================================

void to_json(json& j, const SyncItem& item) {
    j = json{
        {"id", item.id},
        {"type", item.type},
        {"name", item.name},
        {"content", item.content},
        {"contentHash", item.content_hash},
        {"version", item.version},
        {"createdAt", item.created_at},
        {"updatedAt", item.updated_at},
        {"modifiedBy", item.modified_by},
        {"encrypted", item.encrypted},
        {"metadata", item.metadata},
    };
    if (item.crdt) j["crdt"] = *item.crdt;
    if (item.envelope) j["envelope"] = *item.envelope;
    if (item.payload) j["payload"] = *item.payload;
}

void from_json(const json& j, SyncItem& item) {
    item.id = j.at("id").get<std::string>();
    item.type = j.at("type").get<ItemType>();
    item.name = j.value("name", std::string{});
    item.content = j.value("content", json{});
    item.content_hash = j.value("contentHash", std::string{});
    item.version = j.value("version", std::uint64_t{1});
    item.created_at = j.value("createdAt", Timestamp{0});
    item.updated_at = j.value("updatedAt", Timestamp{0});
    item.modified_by = j.value("modifiedBy", NodeId{});
    item.encrypted = j.value("encrypted", false);
    item.metadata = j.value("metadata", json::object());

    auto optional_field = [&j](const char* key, auto& out) {
        using T = typename std::decay_t<decltype(out)>::value_type;
        if (auto it = j.find(key); it != j.end() && !it->is_null()) {
            out = it->template get<T>();
        } else {
            out.reset();
        }
    };
    optional_field("crdt", item.crdt);
    optional_field("envelope", item.envelope);
    optional_field("payload", item.payload);
}

auto parse_sync_item(std::string_view text) -> std::optional<SyncItem> {
    auto j = json::parse(text, nullptr, false);
    if (j.is_discarded() || !j.is_object()) return std::nullopt;
    try {
        return j.get<SyncItem>();
    } catch (const json::exception&) {
        return std::nullopt;
    } catch (const SyncError&) {
        return std::nullopt;
    }
}

}  // namespace peersync
