/// @file types.hpp
/// @brief Core identity and value types: NodeId, Timestamp, Bytes, ItemType.

#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace peersync {

/// Opaque identifier of a replica.
///
/// Node ids are compared lexicographically when a tie must be broken
/// (see LwwRegister and TieBias).
using NodeId = std::string;

/// Wall-clock milliseconds since the Unix epoch.
///
/// Used for tie-breaking and ordering hints, never as the sole
/// correctness guarantee: causality is tracked by VectorClock.
using Timestamp = std::int64_t;

/// A byte array payload.
using Bytes = std::vector<std::byte>;

/// The category of a sync item ("skill", "workflow", "config", ...).
using ItemType = std::string;

/// The item types enumerated when sync() is called without a type.
inline auto default_item_types() -> std::vector<ItemType> {
    return {"skill", "workflow", "config", "plugin", "template"};
}

/// Current wall-clock time in milliseconds.
auto now_millis() -> Timestamp;

/// A random lowercase hex string of `num_bytes * 2` characters.
auto random_hex(std::size_t num_bytes) -> std::string;

/// Generate a fresh random NodeId (16 random bytes, hex encoded).
auto generate_node_id() -> NodeId;

/// Copy a string's characters into a byte vector.
auto to_bytes(std::string_view s) -> Bytes;

/// Interpret a byte sequence as a string.
auto to_string(std::span<const std::byte> bytes) -> std::string;

// -- Variant visitor helper ---------------------------------------------------

/// Helper for constructing ad-hoc visitors from lambdas.
///
/// @code
/// std::visit(overload{
///     [](const GCounterState& s) { ... },
///     [](const auto&) { ... },
/// }, snapshot.state);
/// @endcode
template <typename... Ts>
struct overload : Ts... { using Ts::operator()...; };

template <typename... Ts>
overload(Ts...) -> overload<Ts...>;

}  // namespace peersync
