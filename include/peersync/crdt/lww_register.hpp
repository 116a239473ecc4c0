/// @file lww_register.hpp
/// @brief Last-writer-wins register.

#pragma once

#include <peersync/types.hpp>

#include <algorithm>
#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>

namespace peersync {

/// How an exact timestamp tie between two writes is broken.
enum class TieBias : std::uint8_t {
    last,   ///< The lexicographically greater node id wins.
    first,  ///< The lexicographically smaller node id wins.
};

constexpr auto to_string_view(TieBias bias) noexcept -> std::string_view {
    switch (bias) {
        case TieBias::last:  return "last";
        case TieBias::first: return "first";
    }
    return "unknown";
}

/// Serializable state of an LwwRegister.
template <typename T>
struct LwwRegisterState {
    T value{};
    Timestamp timestamp = 0;
    NodeId node_id;

    auto operator==(const LwwRegisterState&) const -> bool = default;
};

/// A register holding a single value where the write with the greatest
/// timestamp wins.
///
/// An exact timestamp tie is broken by node id according to the register's
/// TieBias, so every replica picks the same winner regardless of the order
/// in which it sees the writes.
///
/// @code
/// auto reg = LwwRegister<std::string>{"node-a"};
/// reg.set("hello", 100);
/// reg.merge({.value = "world", .timestamp = 100, .node_id = "node-b"});
/// // reg.value() == "world" ("node-b" > "node-a")
/// @endcode
template <typename T>
class LwwRegister {
public:
    using State = LwwRegisterState<T>;

    explicit LwwRegister(NodeId node_id, TieBias bias = TieBias::last)
        : node_id_{std::move(node_id)}, bias_{bias} {
        state_.node_id = node_id_;
    }

    /// Restore a register from a captured state.
    LwwRegister(NodeId node_id, State state, TieBias bias = TieBias::last)
        : node_id_{std::move(node_id)}, bias_{bias}, state_{std::move(state)} {}

    /// Write a value from this node.
    ///
    /// Without an explicit timestamp the write is stamped with
    /// `max(now, current + 1)` and therefore always applies.
    /// @return true if the write was applied, false if it lost to the
    ///         current value (a silent no-op).
    auto set(T value, std::optional<Timestamp> timestamp = std::nullopt) -> bool {
        const auto ts = timestamp.value_or(std::max(now_millis(), state_.timestamp + 1));
        if (!should_update(ts, node_id_)) return false;
        state_ = State{.value = std::move(value), .timestamp = ts, .node_id = node_id_};
        return true;
    }

    /// Adopt the remote state if it wins against the current one.
    /// @return true if the register changed.
    auto merge(const State& remote) -> bool {
        if (!should_update(remote.timestamp, remote.node_id)) return false;
        state_ = remote;
        return true;
    }

    /// True iff a write stamped (timestamp, node) would replace the
    /// current value.
    auto should_update(Timestamp timestamp, const NodeId& node) const -> bool {
        if (timestamp != state_.timestamp) return timestamp > state_.timestamp;
        if (node == state_.node_id) return false;
        return bias_ == TieBias::last ? node > state_.node_id : node < state_.node_id;
    }

    auto value() const -> const T& { return state_.value; }
    auto timestamp() const -> Timestamp { return state_.timestamp; }
    auto writer() const -> const NodeId& { return state_.node_id; }
    auto state() const -> const State& { return state_; }
    auto node_id() const -> const NodeId& { return node_id_; }
    auto bias() const -> TieBias { return bias_; }

private:
    NodeId node_id_;
    TieBias bias_;
    State state_;
};

}  // namespace peersync
