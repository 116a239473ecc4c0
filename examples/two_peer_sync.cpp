// two_peer_sync: two nodes meeting at a shared in-memory remote
//
// Demonstrates: SyncEngine, create_sync_item/update_sync_item,
//               bidirectional sync, concurrent g-counter merge,
//               conflict reporting

#include <peersync/peersync.hpp>

#include <cstdio>
#include <memory>
#include <string>

namespace ps = peersync;

static void print_result(const char* label, const ps::SyncResult& r) {
    std::printf("%-10s pushed=%zu pulled=%zu merged=%zu unchanged=%zu conflicts=%zu errors=%zu\n",
                label, r.pushed.size(), r.pulled.size(), r.merged.size(),
                r.unchanged.size(), r.conflicts.size(), r.errors.size());
}

int main() {
    auto remote = std::make_shared<ps::MemoryRemote>();

    auto laptop = ps::SyncEngine{{.node_id = "laptop"}};
    auto desktop = ps::SyncEngine{{.node_id = "desktop"}};
    laptop.set_remote_store(remote);
    desktop.set_remote_store(remote);
    laptop.initialize();
    desktop.initialize();

    // --- Scenario 1: One-way sync ---
    std::printf("=== Scenario 1: One-way sync ===\n");

    auto greeting = laptop.create_sync_item({
        .id = "greeting", .type = "skill", .name = "greet",
        .content = {{"text", "hello"}}, .crdt = ps::CrdtKind::lww_register,
    });
    laptop.local_store()->save(greeting);

    print_result("laptop", laptop.sync());
    print_result("desktop", desktop.sync());
    std::printf("desktop sees: %s\n",
                desktop.local_store()->get("greeting")->content.dump().c_str());

    // --- Scenario 2: Concurrent counter increments ---
    std::printf("\n=== Scenario 2: Concurrent counter ===\n");

    laptop.local_store()->save(laptop.create_sync_item({
        .id = "launches", .type = "config", .content = 0, .crdt = ps::CrdtKind::g_counter,
    }));
    laptop.sync();
    desktop.sync();

    // Both nodes edit offline and stamp the same time.
    const auto stamp = ps::now_millis() + 1000;
    auto on_laptop = laptop.update_sync_item(*laptop.local_store()->get("launches"), 3);
    auto on_desktop = desktop.update_sync_item(*desktop.local_store()->get("launches"), 5);
    on_laptop.updated_at = stamp;
    on_desktop.updated_at = stamp;
    laptop.local_store()->save(on_laptop);
    desktop.local_store()->save(on_desktop);

    print_result("laptop", laptop.sync());
    print_result("desktop", desktop.sync());
    print_result("laptop", laptop.sync());
    std::printf("laptop counter: %s, desktop counter: %s\n",
                laptop.local_store()->get("launches")->content.dump().c_str(),
                desktop.local_store()->get("launches")->content.dump().c_str());

    // --- Scenario 3: A conflict without CRDT state ---
    std::printf("\n=== Scenario 3: Conflict ===\n");

    auto note = laptop.create_sync_item({.id = "note", .type = "template", .content = "draft"});
    laptop.local_store()->save(note);
    auto other = note;
    other.content = "rewrite";
    other.content_hash = ps::compute_content_hash(other.content);
    desktop.local_store()->save(other);

    laptop.sync();
    auto result = desktop.sync();
    print_result("desktop", result);
    for (const auto& c : result.conflicts) {
        std::printf("conflict on %s: %s\n", c.item_id.c_str(), c.reason.c_str());
    }

    return 0;
}
