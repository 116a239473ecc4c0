/// @file offline_queue.hpp
/// @brief Operations recorded while offline and replayed later.

#pragma once

#include <peersync/config.hpp>
#include <peersync/crdt_snapshot.hpp>
#include <peersync/types.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace peersync {

enum class OperationType : std::uint8_t {
    create,
    update,
    remove,   ///< Wire name "delete".
    merge,
};

constexpr auto to_string_view(OperationType t) noexcept -> std::string_view {
    switch (t) {
        case OperationType::create: return "create";
        case OperationType::update: return "update";
        case OperationType::remove: return "delete";
        case OperationType::merge:  return "merge";
    }
    return "unknown";
}

auto parse_operation_type(std::string_view name) -> std::optional<OperationType>;

/// Replay priority when none is given: delete 0, create 1, update 2,
/// merge 3. Lower runs first.
constexpr auto default_priority(OperationType t) noexcept -> int {
    switch (t) {
        case OperationType::remove: return 0;
        case OperationType::create: return 1;
        case OperationType::update: return 2;
        case OperationType::merge:  return 3;
    }
    return 3;
}

enum class NetworkStatus : std::uint8_t {
    unknown,
    online,
    offline,
};

constexpr auto to_string_view(NetworkStatus s) noexcept -> std::string_view {
    switch (s) {
        case NetworkStatus::unknown: return "unknown";
        case NetworkStatus::online:  return "online";
        case NetworkStatus::offline: return "offline";
    }
    return "unknown";
}

/// Events a queue reports to its listener.
enum class QueueEvent : std::uint8_t {
    operation_added,
    operation_processed,
    operation_failed,
    operation_retrying,
    queue_processing,
    queue_idle,
    queue_cleared,
    network_online,
    network_offline,
    conflict_detected,
};

constexpr auto to_string_view(QueueEvent e) noexcept -> std::string_view {
    switch (e) {
        case QueueEvent::operation_added:     return "operation:added";
        case QueueEvent::operation_processed: return "operation:processed";
        case QueueEvent::operation_failed:    return "operation:failed";
        case QueueEvent::operation_retrying:  return "operation:retrying";
        case QueueEvent::queue_processing:    return "queue:processing";
        case QueueEvent::queue_idle:          return "queue:idle";
        case QueueEvent::queue_cleared:       return "queue:cleared";
        case QueueEvent::network_online:      return "network:online";
        case QueueEvent::network_offline:     return "network:offline";
        case QueueEvent::conflict_detected:   return "conflict:detected";
    }
    return "unknown";
}

/// One recorded operation.
struct QueuedOperation {
    std::string id;
    OperationType type = OperationType::update;
    ItemType item_type;
    std::string item_id;
    nlohmann::json payload;
    Timestamp created_at = 0;
    std::uint32_t retry_count = 0;
    std::optional<Timestamp> last_attempt_at;
    std::optional<std::string> last_error;
    int priority = 0;
    std::vector<std::string> dependencies;   ///< Operation ids that must complete first.
    std::optional<CrdtSnapshot> crdt;

    auto operator==(const QueuedOperation&) const -> bool = default;
};

/// Snapshot of a queue.
struct QueueState {
    std::vector<QueuedOperation> pending;
    std::vector<QueuedOperation> failed;
    std::set<std::string> completed;
    bool processing = false;
    NetworkStatus network_status = NetworkStatus::unknown;
    std::optional<Timestamp> last_sync_at;
};

/// Arguments of OfflineQueue::enqueue.
struct EnqueueRequest {
    OperationType type = OperationType::update;
    ItemType item_type;
    std::string item_id;
    nlohmann::json payload;
    std::optional<int> priority;
    std::vector<std::string> dependencies;
    std::optional<CrdtSnapshot> crdt;
};

/// Replays one operation. Report failure by throwing.
using OperationHandler = std::function<void(const QueuedOperation&)>;

/// Receives queue events. `operation` is null for queue-wide and network
/// events.
using QueueListener = std::function<void(QueueEvent event, const QueuedOperation* operation)>;

/// Queue of operations waiting for connectivity.
class OfflineQueue {
public:
    virtual ~OfflineQueue() = default;

    /// Record an operation.
    /// @throws SyncError (queue_full) when the queue is at capacity.
    virtual auto enqueue(const EnqueueRequest& request) -> QueuedOperation = 0;

    /// Replay pending operations through `handler`. Does nothing while
    /// offline or when already processing.
    virtual void process(const OperationHandler& handler) = 0;

    virtual auto get_state() const -> QueueState = 0;
    virtual void set_network_status(NetworkStatus status) = 0;
    virtual auto is_online() const -> bool = 0;
    virtual void set_listener(QueueListener listener) = 0;
    virtual void update_config(const QueueConfig& config) = 0;

    /// Drop all state and the listener.
    virtual void destroy() = 0;
};

/// Reference OfflineQueue.
///
/// Pending operations are kept in priority order (stable for equal
/// priorities). Replay runs in batches of `batch_size`, skipping an
/// operation whose dependencies are still pending and never putting two
/// operations on the same item into one batch. A failed operation is
/// retried after `retry_delay * retry_count` until `max_retries`, then
/// moved to the failed list. With persistence on, the state is written to
/// `storage_path` after every change and reloaded on construction.
class MemoryQueue : public OfflineQueue {
public:
    explicit MemoryQueue(QueueConfig config = {});

    MemoryQueue(const MemoryQueue&) = delete;
    auto operator=(const MemoryQueue&) -> MemoryQueue& = delete;

    auto enqueue(const EnqueueRequest& request) -> QueuedOperation override;
    void process(const OperationHandler& handler) override;
    auto get_state() const -> QueueState override;
    void set_network_status(NetworkStatus status) override;
    auto is_online() const -> bool override;
    void set_listener(QueueListener listener) override;
    void update_config(const QueueConfig& config) override;
    void destroy() override;

    /// Remove a pending operation. Returns it, or nullopt if unknown.
    auto dequeue(const std::string& operation_id) -> std::optional<QueuedOperation>;

    /// A pending or failed operation by id.
    auto operation(const std::string& operation_id) const -> std::optional<QueuedOperation>;

    auto operations_for_item(const std::string& item_id) const -> std::vector<QueuedOperation>;
    auto is_completed(const std::string& operation_id) const -> bool;
    auto network_status() const -> NetworkStatus;

    auto size() const -> std::size_t;
    auto empty() const -> bool;

    /// Drop every pending operation.
    void clear();
    void clear_failed();

    /// Move failed operations back to pending with their retry count reset.
    void retry_failed();

    /// The queue's contents as JSON (pending, failed, completed, lastSyncAt).
    auto export_state() const -> nlohmann::json;

    /// Replace the queue's contents with a previous export.
    /// @throws SyncError (decoding_error) if the JSON is malformed.
    void import_state(const nlohmann::json& data);

private:
    void insert_by_priority(QueuedOperation operation);
    auto next_batch() const -> std::vector<QueuedOperation>;
    auto dependencies_met(const QueuedOperation& operation) const -> bool;
    auto process_one(const QueuedOperation& operation, const OperationHandler& handler) -> bool;
    void emit(QueueEvent event, const QueuedOperation* operation = nullptr);
    void load();
    void persist() const;
    auto export_locked() const -> nlohmann::json;

    mutable std::mutex mutex_;
    QueueConfig config_;
    QueueState state_;
    QueueListener listener_;
};

void to_json(nlohmann::json& j, const QueuedOperation& op);
void from_json(const nlohmann::json& j, QueuedOperation& op);

}  // namespace peersync
