#include <peersync/error.hpp>
#include <peersync/offline_queue.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace peersync;
using namespace std::chrono_literals;

namespace {

auto fast_config() -> QueueConfig {
    auto c = QueueConfig{};
    c.retry_delay = 0ms;
    return c;
}

auto request(OperationType type, const std::string& item_id) -> EnqueueRequest {
    return EnqueueRequest{
        .type = type,
        .item_type = "skill",
        .item_id = item_id,
        .payload = nlohmann::json{{"item", item_id}},
    };
}

// Records the order in which operations are replayed.
struct Recorder {
    std::vector<std::string> items;
    auto handler() -> OperationHandler {
        return [this](const QueuedOperation& op) { items.push_back(op.item_id); };
    }
};

}  // namespace

// =============================================================================
// Enqueue
// =============================================================================

TEST(OfflineQueue, enqueue_assigns_defaults) {
    auto queue = MemoryQueue{fast_config()};
    const auto op = queue.enqueue(request(OperationType::update, "a"));
    EXPECT_EQ(op.id.size(), 32u);
    EXPECT_EQ(op.priority, default_priority(OperationType::update));
    EXPECT_EQ(op.retry_count, 0u);
    EXPECT_GT(op.created_at, 0);
    EXPECT_EQ(queue.size(), 1u);
    EXPECT_EQ(queue.operation(op.id), op);
}

TEST(OfflineQueue, default_priorities_order_types) {
    EXPECT_LT(default_priority(OperationType::remove), default_priority(OperationType::create));
    EXPECT_LT(default_priority(OperationType::create), default_priority(OperationType::update));
    EXPECT_LT(default_priority(OperationType::update), default_priority(OperationType::merge));
    EXPECT_EQ(to_string_view(OperationType::remove), "delete");
    EXPECT_EQ(parse_operation_type("delete"), OperationType::remove);
    EXPECT_FALSE(parse_operation_type("upsert").has_value());
}

TEST(OfflineQueue, full_queue_rejects) {
    auto config = fast_config();
    config.max_size = 2;
    auto queue = MemoryQueue{config};
    queue.enqueue(request(OperationType::update, "a"));
    queue.enqueue(request(OperationType::update, "b"));
    try {
        queue.enqueue(request(OperationType::update, "c"));
        FAIL() << "expected SyncError";
    } catch (const SyncError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::queue_full);
    }
    EXPECT_EQ(queue.size(), 2u);
}

TEST(OfflineQueue, duplicate_operation_reports_conflict) {
    auto queue = MemoryQueue{fast_config()};
    auto events = std::vector<QueueEvent>{};
    queue.set_listener([&](QueueEvent e, const QueuedOperation*) { events.push_back(e); });

    queue.enqueue(request(OperationType::update, "a"));
    queue.enqueue(request(OperationType::update, "a"));
    EXPECT_EQ(events, (std::vector<QueueEvent>{
        QueueEvent::operation_added, QueueEvent::conflict_detected, QueueEvent::operation_added}));
    EXPECT_EQ(queue.operations_for_item("a").size(), 2u);
}

// =============================================================================
// Replay
// =============================================================================

TEST(OfflineQueue, replays_in_priority_order) {
    auto queue = MemoryQueue{fast_config()};
    queue.enqueue(request(OperationType::merge, "m"));
    queue.enqueue(request(OperationType::update, "u"));
    queue.enqueue(request(OperationType::create, "c"));
    queue.enqueue(request(OperationType::remove, "d"));
    auto custom = request(OperationType::merge, "first");
    custom.priority = -1;
    queue.enqueue(custom);

    auto recorder = Recorder{};
    queue.set_network_status(NetworkStatus::online);
    queue.process(recorder.handler());
    EXPECT_EQ(recorder.items, (std::vector<std::string>{"first", "d", "c", "u", "m"}));
    EXPECT_TRUE(queue.empty());
    EXPECT_TRUE(queue.get_state().last_sync_at.has_value());
}

TEST(OfflineQueue, equal_priorities_keep_insertion_order) {
    auto queue = MemoryQueue{fast_config()};
    for (const auto* id : {"x", "y", "z"}) queue.enqueue(request(OperationType::update, id));
    auto recorder = Recorder{};
    queue.process(recorder.handler());
    EXPECT_EQ(recorder.items, (std::vector<std::string>{"x", "y", "z"}));
}

TEST(OfflineQueue, does_nothing_while_offline) {
    auto queue = MemoryQueue{fast_config()};
    queue.enqueue(request(OperationType::update, "a"));
    queue.set_network_status(NetworkStatus::offline);
    EXPECT_FALSE(queue.is_online());

    auto recorder = Recorder{};
    queue.process(recorder.handler());
    EXPECT_TRUE(recorder.items.empty());
    EXPECT_EQ(queue.size(), 1u);

    queue.set_network_status(NetworkStatus::online);
    queue.process(recorder.handler());
    EXPECT_EQ(recorder.items, (std::vector<std::string>{"a"}));
}

TEST(OfflineQueue, dependencies_run_first) {
    auto queue = MemoryQueue{fast_config()};
    const auto parent = queue.enqueue(request(OperationType::merge, "parent"));
    auto child = request(OperationType::remove, "child");
    child.dependencies = {parent.id};
    const auto child_op = queue.enqueue(child);

    auto recorder = Recorder{};
    queue.process(recorder.handler());
    EXPECT_EQ(recorder.items, (std::vector<std::string>{"parent", "child"}));
    EXPECT_TRUE(queue.is_completed(parent.id));
    EXPECT_TRUE(queue.is_completed(child_op.id));
}

TEST(OfflineQueue, unknown_dependency_does_not_block) {
    auto queue = MemoryQueue{fast_config()};
    auto r = request(OperationType::update, "a");
    r.dependencies = {"no-such-operation"};
    queue.enqueue(r);
    auto recorder = Recorder{};
    queue.process(recorder.handler());
    EXPECT_EQ(recorder.items.size(), 1u);
}

TEST(OfflineQueue, one_operation_per_item_per_batch) {
    auto config = fast_config();
    config.batch_size = 10;
    auto queue = MemoryQueue{config};
    queue.enqueue(request(OperationType::create, "a"));
    queue.enqueue(request(OperationType::update, "a"));
    queue.enqueue(request(OperationType::update, "b"));

    // The update of "a" waits for the next batch, behind "b".
    auto recorder = Recorder{};
    queue.process(recorder.handler());
    EXPECT_EQ(recorder.items, (std::vector<std::string>{"a", "b", "a"}));
    EXPECT_TRUE(queue.empty());
}

TEST(OfflineQueue, batch_size_bounds_each_round) {
    auto config = fast_config();
    config.batch_size = 2;
    auto queue = MemoryQueue{config};
    for (const auto* id : {"a", "b", "c", "d", "e"}) queue.enqueue(request(OperationType::update, id));
    auto recorder = Recorder{};
    queue.process(recorder.handler());
    EXPECT_EQ(recorder.items.size(), 5u);
    EXPECT_TRUE(queue.empty());
}

TEST(OfflineQueue, failing_operation_retries_then_fails) {
    auto config = fast_config();
    config.max_retries = 3;
    auto queue = MemoryQueue{config};
    auto events = std::vector<QueueEvent>{};
    queue.set_listener([&](QueueEvent e, const QueuedOperation*) { events.push_back(e); });
    const auto op = queue.enqueue(request(OperationType::update, "a"));

    auto attempts = 0;
    queue.process([&](const QueuedOperation&) {
        ++attempts;
        throw std::runtime_error{"remote unavailable"};
    });

    EXPECT_EQ(attempts, 3);
    EXPECT_TRUE(queue.empty());
    const auto state = queue.get_state();
    ASSERT_EQ(state.failed.size(), 1u);
    EXPECT_EQ(state.failed[0].retry_count, 3u);
    EXPECT_EQ(state.failed[0].last_error, "remote unavailable");
    EXPECT_EQ(std::count(events.begin(), events.end(), QueueEvent::operation_retrying), 2);
    EXPECT_EQ(std::count(events.begin(), events.end(), QueueEvent::operation_failed), 1);
    EXPECT_EQ(events.back(), QueueEvent::queue_idle);
    EXPECT_EQ(queue.operation(op.id)->retry_count, 3u);
}

TEST(OfflineQueue, retry_failed_requeues) {
    auto config = fast_config();
    config.max_retries = 1;
    auto queue = MemoryQueue{config};
    queue.enqueue(request(OperationType::update, "a"));
    queue.process([](const QueuedOperation&) { throw std::runtime_error{"no"}; });
    ASSERT_EQ(queue.get_state().failed.size(), 1u);

    queue.retry_failed();
    EXPECT_TRUE(queue.get_state().failed.empty());
    ASSERT_EQ(queue.size(), 1u);
    EXPECT_EQ(queue.get_state().pending[0].retry_count, 0u);

    auto recorder = Recorder{};
    queue.process(recorder.handler());
    EXPECT_EQ(recorder.items, (std::vector<std::string>{"a"}));
}

TEST(OfflineQueue, dequeue_and_clear) {
    auto queue = MemoryQueue{fast_config()};
    const auto a = queue.enqueue(request(OperationType::update, "a"));
    queue.enqueue(request(OperationType::update, "b"));
    EXPECT_EQ(queue.dequeue(a.id)->item_id, "a");
    EXPECT_FALSE(queue.dequeue(a.id).has_value());

    auto cleared = false;
    queue.set_listener([&](QueueEvent e, const QueuedOperation*) {
        if (e == QueueEvent::queue_cleared) cleared = true;
    });
    queue.clear();
    EXPECT_TRUE(cleared);
    EXPECT_TRUE(queue.empty());
}

TEST(OfflineQueue, network_events) {
    auto queue = MemoryQueue{fast_config()};
    auto events = std::vector<QueueEvent>{};
    queue.set_listener([&](QueueEvent e, const QueuedOperation*) { events.push_back(e); });
    queue.set_network_status(NetworkStatus::offline);
    queue.set_network_status(NetworkStatus::online);
    EXPECT_EQ(events, (std::vector<QueueEvent>{
        QueueEvent::network_offline, QueueEvent::network_online}));
    EXPECT_EQ(queue.network_status(), NetworkStatus::online);
}

TEST(OfflineQueue, destroy_drops_everything) {
    auto queue = MemoryQueue{fast_config()};
    auto events = 0;
    queue.set_listener([&](QueueEvent, const QueuedOperation*) { ++events; });
    queue.enqueue(request(OperationType::update, "a"));
    queue.destroy();
    EXPECT_TRUE(queue.empty());
    queue.enqueue(request(OperationType::update, "b"));
    EXPECT_EQ(events, 1);
}

// =============================================================================
// Persistence
// =============================================================================

TEST(OfflineQueue, export_import_round_trip) {
    auto queue = MemoryQueue{fast_config()};
    auto r = request(OperationType::merge, "a");
    r.crdt = make_snapshot(CrdtKind::g_counter, "n", nlohmann::json(2), 5);
    const auto op = queue.enqueue(r);

    const auto exported = queue.export_state();
    EXPECT_EQ(exported.at("version"), 1);
    EXPECT_EQ(exported.at("pending").size(), 1u);
    EXPECT_EQ(exported.at("pending")[0].at("itemId"), "a");
    EXPECT_EQ(exported.at("pending")[0].at("type"), "merge");

    auto other = MemoryQueue{fast_config()};
    other.import_state(exported);
    EXPECT_EQ(other.operation(op.id), op);
}

TEST(OfflineQueue, import_rejects_malformed_json) {
    auto queue = MemoryQueue{fast_config()};
    auto bad = nlohmann::json{{"pending", {{{"id", "x"}, {"type", "upsert"}}}}};
    EXPECT_THROW(queue.import_state(bad), SyncError);
}

TEST(OfflineQueue, persists_across_instances) {
    const auto path = std::filesystem::temp_directory_path() / "peersync_queue_test" / "queue.json";
    std::filesystem::remove_all(path.parent_path());

    auto config = fast_config();
    config.persistence = true;
    config.storage_path = path;

    auto id = std::string{};
    {
        auto queue = MemoryQueue{config};
        id = queue.enqueue(request(OperationType::create, "a")).id;
        queue.enqueue(request(OperationType::update, "b"));
    }
    ASSERT_TRUE(std::filesystem::exists(path));

    auto reloaded = MemoryQueue{config};
    EXPECT_EQ(reloaded.size(), 2u);
    EXPECT_TRUE(reloaded.operation(id).has_value());
    std::filesystem::remove_all(path.parent_path());
}

TEST(OfflineQueue, corrupt_queue_file_is_ignored) {
    const auto path = std::filesystem::temp_directory_path() / "peersync_queue_corrupt.json";
    {
        auto out = std::ofstream{path};
        out << "definitely not json";
    }
    auto config = fast_config();
    config.persistence = true;
    config.storage_path = path;
    auto queue = MemoryQueue{config};
    EXPECT_TRUE(queue.empty());
    std::filesystem::remove(path);
}
