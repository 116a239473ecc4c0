/// @file g_counter.hpp
/// @brief Grow-only and positive/negative counters.

#pragma once

#include <peersync/types.hpp>

#include <cstdint>
#include <map>

namespace peersync {

/// Serializable state of a GCounter: NodeId -> count.
struct GCounterState {
    std::map<NodeId, std::uint64_t> counts;  ///< Per-node contribution.

    auto operator==(const GCounterState&) const -> bool = default;
};

/// Serializable state of a PNCounter.
struct PNCounterState {
    GCounterState positive;  ///< Sum of increments.
    GCounterState negative;  ///< Sum of decrements.

    auto operator==(const PNCounterState&) const -> bool = default;
};

/// A grow-only counter.
///
/// Each node only ever increments its own entry; merge takes the per-node
/// maximum, so the total is monotone and replicas converge regardless of
/// merge order.
///
/// @code
/// auto a = GCounter{"a"};
/// auto b = GCounter{"b"};
/// a.increment(3);
/// b.increment(5);
/// a.merge(b.state());
/// b.merge(a.state());
/// // a.value() == b.value() == 8
/// @endcode
class GCounter {
public:
    using State = GCounterState;

    explicit GCounter(NodeId node_id);

    /// Restore a counter from a previously captured state.
    GCounter(NodeId node_id, State state);

    /// Add `amount` to this node's entry.
    /// @throws SyncError (invalid_argument) if amount is negative.
    void increment(std::int64_t amount = 1);

    /// Sum of all per-node counts.
    auto value() const -> std::uint64_t;

    /// The count contributed by one node (0 if unknown).
    auto count_for(const NodeId& node) const -> std::uint64_t;

    /// Merge a remote state by per-node maximum. Unknown nodes are adopted.
    /// @return true if any entry changed.
    auto merge(const State& remote) -> bool;

    auto state() const -> const State& { return state_; }
    auto node_id() const -> const NodeId& { return node_id_; }

private:
    NodeId node_id_;
    State state_;
};

/// A counter supporting both increments and decrements.
///
/// Internally a pair of GCounters. A negative increment is routed to the
/// negative counter and a negative decrement to the positive one, so
/// neither inner counter ever sees a negative amount.
class PNCounter {
public:
    using State = PNCounterState;

    explicit PNCounter(NodeId node_id);
    PNCounter(NodeId node_id, State state);

    void increment(std::int64_t amount = 1);
    void decrement(std::int64_t amount = 1);

    /// positive.value() - negative.value()
    auto value() const -> std::int64_t;

    /// Merge both halves of a remote state.
    /// @return true if either half changed.
    auto merge(const State& remote) -> bool;

    auto state() const -> State;
    auto node_id() const -> const NodeId& { return positive_.node_id(); }

private:
    GCounter positive_;
    GCounter negative_;
};

}  // namespace peersync
