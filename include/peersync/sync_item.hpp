/// @file sync_item.hpp
/// @brief The unit of synchronization.

#pragma once

#include <peersync/crdt_snapshot.hpp>
#include <peersync/encryption.hpp>
#include <peersync/types.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace peersync {

/// Descriptor of an item body that was stored remotely in chunks.
struct ChunkedPayload {
    std::size_t size = 0;            ///< Uncompressed body size in bytes.
    std::uint32_t total_chunks = 0;
    std::size_t chunk_size = 0;
    std::string content_hash;        ///< SHA-256 hex of the whole body.
    bool compressed = false;

    auto operator==(const ChunkedPayload&) const -> bool = default;
};

/// A typed, versioned piece of user data.
///
/// `content_hash` is the SHA-256 hex digest of `content.dump()` and is
/// always computed over the plaintext. On a remote record whose body is
/// sealed (`envelope` or `payload` set) `content` is null and the CRDT
/// snapshot carries no state.
struct SyncItem {
    std::string id;
    ItemType type;
    std::string name;
    nlohmann::json content;
    std::string content_hash;
    std::uint64_t version = 1;
    Timestamp created_at = 0;
    Timestamp updated_at = 0;
    NodeId modified_by;
    std::optional<CrdtSnapshot> crdt;
    bool encrypted = false;
    std::optional<EncryptedEnvelope> envelope;
    std::optional<ChunkedPayload> payload;
    nlohmann::json metadata = nlohmann::json::object();

    /// True if the body lives in an envelope or in remote chunks.
    auto sealed() const -> bool { return envelope.has_value() || payload.has_value(); }

    auto operator==(const SyncItem&) const -> bool = default;
};

/// SHA-256 hex digest of a JSON value's compact serialization.
auto compute_content_hash(const nlohmann::json& content) -> std::string;

/// Parameters of SyncEngine::create_sync_item.
struct CreateItemParams {
    std::string id;                  ///< Generated when empty.
    ItemType type;
    std::string name;
    nlohmann::json content;
    std::optional<CrdtKind> crdt;    ///< Attach CRDT state of this kind.
    nlohmann::json metadata = nlohmann::json::object();
};

}  // namespace peersync
