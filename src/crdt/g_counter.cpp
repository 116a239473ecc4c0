#include <peersync/crdt/g_counter.hpp>
#include <peersync/error.hpp>

#include <limits>
#include <numeric>
#include <string>
#include <utility>

namespace peersync {

// -- GCounter -----------------------------------------------------------------

GCounter::GCounter(NodeId node_id)
    : node_id_{std::move(node_id)} {}

GCounter::GCounter(NodeId node_id, State state)
    : node_id_{std::move(node_id)}, state_{std::move(state)} {}

void GCounter::increment(std::int64_t amount) {
    if (amount < 0) {
        throw SyncError{ErrorKind::invalid_argument,
                        "GCounter cannot be decremented (amount " +
                        std::to_string(amount) + ")"};
    }
    state_.counts[node_id_] += static_cast<std::uint64_t>(amount);
}

auto GCounter::value() const -> std::uint64_t {
    return std::accumulate(state_.counts.begin(), state_.counts.end(), std::uint64_t{0},
        [](std::uint64_t sum, const auto& entry) { return sum + entry.second; });
}

auto GCounter::count_for(const NodeId& node) const -> std::uint64_t {
    auto it = state_.counts.find(node);
    return it == state_.counts.end() ? 0 : it->second;
}

auto GCounter::merge(const State& remote) -> bool {
    bool changed = false;
    for (const auto& [node, count] : remote.counts) {
        auto [it, inserted] = state_.counts.try_emplace(node, count);
        if (inserted) {
            changed = changed || count != 0;
        } else if (count > it->second) {
            it->second = count;
            changed = true;
        }
    }
    return changed;
}

// -- PNCounter ----------------------------------------------------------------

PNCounter::PNCounter(NodeId node_id)
    : positive_{node_id}, negative_{std::move(node_id)} {}

PNCounter::PNCounter(NodeId node_id, State state)
    : positive_{node_id, std::move(state.positive)},
      negative_{std::move(node_id), std::move(state.negative)} {}

namespace {

// -amount must be representable.
void require_negatable(std::int64_t amount) {
    if (amount == std::numeric_limits<std::int64_t>::min()) {
        throw SyncError{ErrorKind::invalid_argument,
                        "PNCounter amount out of range: " + std::to_string(amount)};
    }
}

}  // namespace

void PNCounter::increment(std::int64_t amount) {
    require_negatable(amount);
    if (amount < 0) {
        negative_.increment(-amount);
    } else {
        positive_.increment(amount);
    }
}

void PNCounter::decrement(std::int64_t amount) {
    require_negatable(amount);
    if (amount < 0) {
        positive_.increment(-amount);
    } else {
        negative_.increment(amount);
    }
}

auto PNCounter::value() const -> std::int64_t {
    return static_cast<std::int64_t>(positive_.value()) -
           static_cast<std::int64_t>(negative_.value());
}

auto PNCounter::merge(const State& remote) -> bool {
    // Evaluate both; short-circuiting would skip the negative half.
    const bool pos = positive_.merge(remote.positive);
    const bool neg = negative_.merge(remote.negative);
    return pos || neg;
}

auto PNCounter::state() const -> State {
    return State{.positive = positive_.state(), .negative = negative_.state()};
}

}  // namespace peersync
