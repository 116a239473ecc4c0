#include <peersync/vector_clock.hpp>

#include <algorithm>

namespace peersync {

auto VectorClock::get(const NodeId& node) const -> std::uint64_t {
    auto it = entries_.find(node);
    return it == entries_.end() ? 0 : it->second;
}

void VectorClock::set(const NodeId& node, std::uint64_t value) {
    entries_[node] = value;
}

auto VectorClock::advance(const NodeId& node, std::uint64_t at_least) -> std::uint64_t {
    auto& entry = entries_[node];
    entry = std::max(entry + 1, at_least);
    return entry;
}

auto VectorClock::merge(const VectorClock& other) -> bool {
    bool changed = false;
    for (const auto& [node, value] : other.entries_) {
        auto& entry = entries_[node];
        if (value > entry) {
            entry = value;
            changed = true;
        }
    }
    return changed;
}

auto VectorClock::compare(const VectorClock& other) const -> ClockOrder {
    bool greater = false;
    bool less = false;

    // Walk the union of both key sets; both maps are sorted by node id.
    auto a = entries_.begin();
    auto b = other.entries_.begin();
    while (a != entries_.end() || b != other.entries_.end()) {
        std::uint64_t av = 0;
        std::uint64_t bv = 0;
        if (b == other.entries_.end() || (a != entries_.end() && a->first < b->first)) {
            av = a->second;
            ++a;
        } else if (a == entries_.end() || b->first < a->first) {
            bv = b->second;
            ++b;
        } else {
            av = a->second;
            bv = b->second;
            ++a;
            ++b;
        }
        if (av > bv) greater = true;
        if (av < bv) less = true;
        if (greater && less) return ClockOrder::concurrent;
    }

    if (greater) return ClockOrder::after;
    if (less) return ClockOrder::before;
    return ClockOrder::equal;
}

}  // namespace peersync
