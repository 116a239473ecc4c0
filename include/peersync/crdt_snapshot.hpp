/// @file crdt_snapshot.hpp
/// @brief The CRDT state attached to a sync item.

#pragma once

#include <peersync/crdt/g_counter.hpp>
#include <peersync/crdt/lww_register.hpp>
#include <peersync/crdt/or_set.hpp>
#include <peersync/types.hpp>
#include <peersync/vector_clock.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string_view>
#include <variant>

namespace peersync {

/// The CRDT kinds a sync item can carry.
enum class CrdtKind : std::uint8_t {
    lww_register,
    g_counter,
    or_set,
};

/// Wire name of a CrdtKind ("lww-register", "g-counter", "or-set").
constexpr auto to_string_view(CrdtKind kind) noexcept -> std::string_view {
    switch (kind) {
        case CrdtKind::lww_register: return "lww-register";
        case CrdtKind::g_counter:    return "g-counter";
        case CrdtKind::or_set:       return "or-set";
    }
    return "unknown";
}

/// Parse a wire name. Returns nullopt for an unknown name.
auto parse_crdt_kind(std::string_view name) -> std::optional<CrdtKind>;

/// One merge-capable state per CRDT kind. Values are JSON so the same
/// snapshot type serves every item type.
using CrdtState = std::variant<
    LwwRegisterState<nlohmann::json>,
    GCounterState,
    OrSetState<nlohmann::json>
>;

/// The kind that a state alternative belongs to.
auto kind_of(const CrdtState& state) -> CrdtKind;

/// CRDT metadata of a sync item.
///
/// `state` is absent on a remote record whose body was sealed into an
/// encrypted envelope or a chunked payload; it is restored when the body
/// is materialized.
struct CrdtSnapshot {
    CrdtKind kind = CrdtKind::lww_register;
    NodeId node_id;
    Timestamp timestamp = 0;
    VectorClock clock;
    std::optional<CrdtState> state;

    /// The user-visible value of the state: the register value, the
    /// counter total, or the OR-Set's live values as an array.
    /// Null when the state is absent.
    auto value() const -> nlohmann::json;

    auto operator==(const CrdtSnapshot&) const -> bool = default;
};

/// Build the initial snapshot for content created on `node`.
///
/// - lww-register: the content is the register value.
/// - g-counter: the content must be a non-negative integer; it becomes
///   the node's count.
/// - or-set: the content must be an array; each element is added.
/// @throws SyncError (invalid_argument) if the content does not fit the kind.
auto make_snapshot(CrdtKind kind, const NodeId& node,
                   const nlohmann::json& content, Timestamp timestamp) -> CrdtSnapshot;

/// Apply a local content change from `node` to a snapshot's state.
///
/// - lww-register: set the new value at `timestamp`.
/// - g-counter: increment by the difference; a decrease throws.
/// - or-set: add elements that are new, remove elements that are gone.
/// The node's clock entry is advanced.
/// @throws SyncError (invalid_argument) if the content does not fit the kind
///         or the snapshot has no state.
void apply_content(CrdtSnapshot& snapshot, const NodeId& node,
                   const nlohmann::json& content, Timestamp timestamp);

/// Merge two snapshots structurally by kind.
///
/// The result carries the merged state, the per-node maximum of both
/// clocks and the greater timestamp; its node id is `self`. The clock is
/// not advanced here.
/// @return nullopt if the kinds differ or either state is absent.
auto merge_snapshots(const CrdtSnapshot& local, const CrdtSnapshot& remote,
                     const NodeId& self) -> std::optional<CrdtSnapshot>;

}  // namespace peersync
