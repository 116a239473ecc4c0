#include <peersync/crdt_snapshot.hpp>
#include <peersync/error.hpp>

#include <algorithm>
#include <set>
#include <string>
#include <utility>

namespace peersync {

using json = nlohmann::json;

namespace {

using JsonRegister = LwwRegister<json>;
using JsonSet = OrSet<json>;

auto counter_amount(const json& content) -> std::uint64_t {
    if (!content.is_number_integer() || content.get<std::int64_t>() < 0) {
        throw SyncError{ErrorKind::invalid_argument,
                        "g-counter content must be a non-negative integer"};
    }
    return content.get<std::uint64_t>();
}

void require_array(const json& content) {
    if (!content.is_array()) {
        throw SyncError{ErrorKind::invalid_argument, "or-set content must be an array"};
    }
}

}  // namespace

auto parse_crdt_kind(std::string_view name) -> std::optional<CrdtKind> {
    for (auto kind : {CrdtKind::lww_register, CrdtKind::g_counter, CrdtKind::or_set}) {
        if (to_string_view(kind) == name) return kind;
    }
    return std::nullopt;
}

auto kind_of(const CrdtState& state) -> CrdtKind {
    return std::visit(overload{
        [](const LwwRegisterState<json>&) { return CrdtKind::lww_register; },
        [](const GCounterState&) { return CrdtKind::g_counter; },
        [](const OrSetState<json>&) { return CrdtKind::or_set; },
    }, state);
}

auto CrdtSnapshot::value() const -> json {
    if (!state) return nullptr;
    return std::visit(overload{
        [](const LwwRegisterState<json>& s) -> json { return s.value; },
        [](const GCounterState& s) -> json {
            auto counter = GCounter{{}, s};
            return counter.value();
        },
        [](const OrSetState<json>& s) -> json {
            auto result = json::array();
            for (const auto& [key, element] : s.elements) {
                if (!element.tags.empty()) result.push_back(element.value);
            }
            return result;
        },
    }, *state);
}

auto make_snapshot(CrdtKind kind, const NodeId& node,
                   const json& content, Timestamp timestamp) -> CrdtSnapshot {
    auto snapshot = CrdtSnapshot{
        .kind = kind,
        .node_id = node,
        .timestamp = timestamp,
        .clock = VectorClock{},
        .state = std::nullopt,
    };
    snapshot.clock.advance(node, static_cast<std::uint64_t>(timestamp));

    switch (kind) {
        case CrdtKind::lww_register:
            snapshot.state = LwwRegisterState<json>{
                .value = content, .timestamp = timestamp, .node_id = node};
            break;
        case CrdtKind::g_counter: {
            auto counter = GCounter{node};
            counter.increment(static_cast<std::int64_t>(counter_amount(content)));
            snapshot.state = counter.state();
            break;
        }
        case CrdtKind::or_set: {
            require_array(content);
            auto set = JsonSet{node};
            for (const auto& element : content) set.add(element);
            snapshot.state = set.state();
            break;
        }
    }
    return snapshot;
}

void apply_content(CrdtSnapshot& snapshot, const NodeId& node,
                   const json& content, Timestamp timestamp) {
    if (!snapshot.state) {
        throw SyncError{ErrorKind::invalid_argument, "snapshot has no state to update"};
    }

    std::visit(overload{
        [&](LwwRegisterState<json>& s) {
            auto reg = JsonRegister{node, s};
            reg.set(content, std::max(timestamp, s.timestamp + 1));
            s = reg.state();
        },
        [&](GCounterState& s) {
            auto counter = GCounter{node, s};
            const auto target = counter_amount(content);
            if (target < counter.value()) {
                throw SyncError{ErrorKind::invalid_argument,
                                "g-counter value cannot decrease"};
            }
            counter.increment(static_cast<std::int64_t>(target - counter.value()));
            s = counter.state();
        },
        [&](OrSetState<json>& s) {
            require_array(content);
            auto set = JsonSet::from_state(node, s);
            auto wanted = std::set<std::string>{};
            for (const auto& element : content) {
                wanted.insert(JsonSet::default_key(element));
                if (!set.contains(element)) set.add(element);
            }
            for (const auto& element : set.values()) {
                if (!wanted.contains(JsonSet::default_key(element))) set.remove(element);
            }
            s = set.state();
        },
    }, *snapshot.state);

    snapshot.node_id = node;
    snapshot.timestamp = std::max(timestamp, snapshot.timestamp);
    snapshot.clock.advance(node, static_cast<std::uint64_t>(timestamp));
}

auto merge_snapshots(const CrdtSnapshot& local, const CrdtSnapshot& remote,
                     const NodeId& self) -> std::optional<CrdtSnapshot> {
    if (local.kind != remote.kind || !local.state || !remote.state) return std::nullopt;
    if (kind_of(*local.state) != kind_of(*remote.state)) return std::nullopt;

    auto merged = local;
    merged.node_id = self;
    merged.timestamp = std::max(local.timestamp, remote.timestamp);
    merged.clock.merge(remote.clock);

    std::visit(overload{
        [&](LwwRegisterState<json>& s) {
            auto reg = JsonRegister{self, s};
            reg.merge(std::get<LwwRegisterState<json>>(*remote.state));
            s = reg.state();
        },
        [&](GCounterState& s) {
            auto counter = GCounter{self, s};
            counter.merge(std::get<GCounterState>(*remote.state));
            s = counter.state();
        },
        [&](OrSetState<json>& s) {
            auto set = JsonSet::from_state(self, s);
            set.merge(std::get<OrSetState<json>>(*remote.state));
            s = set.state();
        },
    }, *merged.state);

    return merged;
}

}  // namespace peersync
