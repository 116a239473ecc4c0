#include <peersync/crdt/or_set.hpp>

namespace peersync {

auto make_tag(const NodeId& node) -> Tag {
    return node + "-" + std::to_string(now_millis()) + "-" + random_hex(4);
}

}  // namespace peersync
