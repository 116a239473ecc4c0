/// @file vector_clock.hpp
/// @brief Per-node counters for detecting causal order between replicas.

#pragma once

#include <peersync/types.hpp>

#include <cstdint>
#include <initializer_list>
#include <map>
#include <string_view>
#include <utility>

namespace peersync {

/// The causal relation of one clock to another.
enum class ClockOrder : std::uint8_t {
    equal,       ///< Both clocks hold the same entries.
    before,      ///< This clock is dominated by the other.
    after,       ///< This clock dominates the other.
    concurrent,  ///< Neither clock dominates.
};

/// Convert a ClockOrder to its string representation.
constexpr auto to_string_view(ClockOrder order) noexcept -> std::string_view {
    switch (order) {
        case ClockOrder::equal:      return "equal";
        case ClockOrder::before:     return "before";
        case ClockOrder::after:      return "after";
        case ClockOrder::concurrent: return "concurrent";
    }
    return "unknown";
}

/// A vector clock: NodeId -> counter.
///
/// Missing entries read as zero. Clock A is causally newer than B iff
/// A's entry is >= B's for every node and strictly greater for at least
/// one. If neither clock is newer (and they are not equal) the updates
/// they describe are concurrent.
///
/// Entries hold millisecond timestamps when produced by the sync engine,
/// but any monotonically increasing counter works.
class VectorClock {
public:
    using Entries = std::map<NodeId, std::uint64_t>;

    VectorClock() = default;

    /// Construct from explicit entries.
    VectorClock(std::initializer_list<Entries::value_type> init)
        : entries_{init} {}

    /// Construct from an entry map.
    explicit VectorClock(Entries entries) : entries_{std::move(entries)} {}

    /// The counter for a node (0 if absent).
    auto get(const NodeId& node) const -> std::uint64_t;

    /// Set a node's counter unconditionally.
    void set(const NodeId& node, std::uint64_t value);

    /// Advance a node's entry to `max(current + 1, at_least)`.
    /// @return The new counter value.
    auto advance(const NodeId& node, std::uint64_t at_least = 0) -> std::uint64_t;

    /// Take the per-node maximum with another clock.
    /// @return true if any entry changed.
    auto merge(const VectorClock& other) -> bool;

    /// Compare causal order against another clock.
    auto compare(const VectorClock& other) const -> ClockOrder;

    /// True iff this clock is causally newer than `other`.
    auto dominates(const VectorClock& other) const -> bool {
        return compare(other) == ClockOrder::after;
    }

    /// True iff neither clock dominates and they are not equal.
    auto concurrent_with(const VectorClock& other) const -> bool {
        return compare(other) == ClockOrder::concurrent;
    }

    auto entries() const -> const Entries& { return entries_; }
    auto empty() const -> bool { return entries_.empty(); }
    auto size() const -> std::size_t { return entries_.size(); }

    auto operator==(const VectorClock& other) const -> bool {
        return compare(other) == ClockOrder::equal;
    }

private:
    Entries entries_;
};

}  // namespace peersync
