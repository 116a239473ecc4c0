/// @file sync_engine.hpp
/// @brief The SyncEngine class: the primary API for peersync.

#pragma once

#include <peersync/config.hpp>
#include <peersync/encryption.hpp>
#include <peersync/error.hpp>
#include <peersync/offline_queue.hpp>
#include <peersync/storage.hpp>
#include <peersync/sync_item.hpp>
#include <peersync/thread_pool.hpp>
#include <peersync/transfer.hpp>
#include <peersync/types.hpp>

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace peersync {

enum class SyncDirection : std::uint8_t {
    push,
    pull,
    bidirectional,
};

constexpr auto to_string_view(SyncDirection d) noexcept -> std::string_view {
    switch (d) {
        case SyncDirection::push:          return "push";
        case SyncDirection::pull:          return "pull";
        case SyncDirection::bidirectional: return "bidirectional";
    }
    return "unknown";
}

/// Options of one sync() call.
struct SyncOptions {
    SyncDirection direction = SyncDirection::bidirectional;
    ProgressCallback on_progress;   ///< Progress of chunked transfers.
    bool force = false;             ///< Re-push items that are already consistent.
};

/// An item both sides changed that could not be reconciled automatically.
struct Conflict {
    std::string item_id;
    SyncItem local;
    SyncItem remote;
    std::string reason;
};

/// A per-item failure. One failing item never aborts the batch.
struct ItemError {
    ErrorKind kind;
    std::string message;
    std::string item_id;
};

/// Outcome of one sync() call. Lists hold item ids.
struct SyncResult {
    bool success = false;                ///< True iff `errors` is empty.
    std::vector<std::string> pushed;
    std::vector<std::string> pulled;
    std::vector<std::string> merged;
    std::vector<std::string> unchanged;  ///< Present on both sides with equal content.
    std::vector<Conflict> conflicts;
    std::vector<ItemError> errors;
    std::chrono::milliseconds duration{0};
    Timestamp timestamp = 0;
};

/// Events reported to an EventListener.
enum class EngineEvent : std::uint8_t {
    initialized,
    sync_start,
    sync_complete,
    item_merged,
    conflict,
    queue,          ///< A forwarded OfflineQueue event; see SyncEvent::queue_event.
};

constexpr auto to_string_view(EngineEvent e) noexcept -> std::string_view {
    switch (e) {
        case EngineEvent::initialized:   return "initialized";
        case EngineEvent::sync_start:    return "sync:start";
        case EngineEvent::sync_complete: return "sync:complete";
        case EngineEvent::item_merged:   return "sync:merged";
        case EngineEvent::conflict:      return "sync:conflict";
        case EngineEvent::queue:         return "queue";
    }
    return "unknown";
}

struct SyncEvent {
    EngineEvent kind = EngineEvent::initialized;
    std::optional<QueueEvent> queue_event;  ///< Set iff kind == queue.
    std::string item_id;                    ///< Merged or conflicting item, or the queued item.
    const SyncResult* result = nullptr;     ///< Set for sync_complete.
};

using EventListener = std::function<void(const SyncEvent&)>;

/// Synchronizes a node's items with a shared remote.
///
/// SyncEngine reconciles the items of a LocalStore with the records of a
/// RemoteStore. Items are compared by `updated_at`, then by content hash,
/// then by the vector clocks of their CRDT snapshots; concurrent CRDT
/// changes are merged structurally. Large bodies go through a
/// TransferEngine in chunks, and bodies are sealed with an Encryption
/// capability before they leave the node when encryption is enabled.
///
/// Adapters are shared: several engines may use the same MemoryRemote.
/// sync() calls on one engine run one at a time.
///
/// @code
/// auto remote = std::make_shared<peersync::MemoryRemote>();
/// auto engine = peersync::SyncEngine{{.node_id = "laptop"}};
/// engine.set_remote_store(remote);
/// engine.initialize();
/// auto item = engine.create_sync_item({.type = "skill", .name = "greet",
///                                      .content = {{"text", "hello"}}});
/// engine.local_store()->save(item);
/// auto result = engine.sync();
/// @endcode
class SyncEngine {
public:
    /// Construct from a configuration. An empty node id is generated. The
    /// engine starts with a MemoryStore, a MemoryQueue, no remote store and
    /// no encryption capability.
    /// @throws SyncError (invalid_config) if the configuration is invalid.
    explicit SyncEngine(SyncConfig config = {});

    /// Construct with a shared thread pool for chunk transfers. A null pool
    /// gives the transfer engine its own pool of `max_concurrent` workers.
    SyncEngine(SyncConfig config, std::shared_ptr<thread_pool> pool);

    ~SyncEngine();

    SyncEngine(const SyncEngine&) = delete;
    auto operator=(const SyncEngine&) -> SyncEngine& = delete;

    // -- Identity and configuration -------------------------------------------

    auto node_id() const -> const NodeId&;
    auto config() const -> SyncConfig;

    /// Replace the configuration. The node id cannot change; the
    /// transfer, queue and encryption parts are handed to their owners and
    /// auto-sync is restarted with the new interval.
    /// @throws SyncError (invalid_config) if the configuration is invalid.
    void update_config(const SyncConfig& config);

    // -- Adapters -------------------------------------------------------------

    void set_local_store(std::shared_ptr<LocalStore> store);
    void set_remote_store(std::shared_ptr<RemoteStore> store);
    void set_encryption(std::shared_ptr<Encryption> encryption);

    /// Replace the offline queue. Its events are forwarded to the listener.
    void set_offline_queue(std::shared_ptr<OfflineQueue> queue);

    void set_event_listener(EventListener listener);

    auto local_store() const -> std::shared_ptr<LocalStore>;
    auto remote_store() const -> std::shared_ptr<RemoteStore>;
    auto offline_queue() const -> std::shared_ptr<OfflineQueue>;

    // -- Lifecycle ------------------------------------------------------------

    /// Prepare the engine for sync(). With encryption enabled, initializes
    /// the capability from `password`. Starts auto-sync when
    /// `auto_sync_interval` is positive. A second call does nothing.
    /// @throws SyncError (invalid_argument) if encryption is enabled and no
    ///         password is given, (invalid_config) if encryption is enabled
    ///         and no capability is set.
    void initialize(const std::optional<std::string>& password = std::nullopt);

    /// Stop auto-sync, disconnect the remote, and destroy the queue and
    /// encryption state. initialize() may be called again afterwards.
    void stop();

    auto is_initialized() const -> bool;

    // -- Sync -----------------------------------------------------------------

    /// Synchronize the items of one type, or of every configured type.
    /// @throws SyncError (not_initialized) before initialize(),
    ///         (no_remote_store) without a remote store.
    auto sync(const std::optional<ItemType>& type = std::nullopt,
              const SyncOptions& options = {}) -> SyncResult;

    // -- Items ----------------------------------------------------------------

    /// Build a new item owned by this node, with version 1, fresh
    /// timestamps, its content hash and, if requested, CRDT state.
    /// @throws SyncError (invalid_argument) if the content does not fit the
    ///         requested CRDT kind.
    auto create_sync_item(const CreateItemParams& params) const -> SyncItem;

    /// Return `item` with new content: version + 1, `updated_at` strictly
    /// greater than before, `modified_by` set to this node, hash recomputed
    /// and the CRDT state updated.
    auto update_sync_item(const SyncItem& item, const nlohmann::json& content) const -> SyncItem;

    // -- Offline queue --------------------------------------------------------

    auto queue_operation(const EnqueueRequest& request) -> QueuedOperation;

    /// Replay queued operations: create and update push the local item,
    /// delete removes it from the remote. Does nothing while offline.
    /// @throws SyncError (no_remote_store) without a remote store.
    void process_queue();

    auto queue_state() const -> QueueState;
    void set_network_status(NetworkStatus status);
    auto is_online() const -> bool;

    // -- Transfers ------------------------------------------------------------

    auto transfer_engine() -> TransferEngine&;

private:
    enum class Resolution : std::uint8_t { local, remote, merged, unchanged, conflict };

    struct Reconciled {
        Resolution resolution = Resolution::unchanged;
        std::optional<SyncItem> item;   // merged item, or the materialized remote
        std::string reason;
    };

    void push_item(const SyncItem& item, const ProgressCallback& on_progress);
    void pull_item(const SyncItem& remote, const ProgressCallback& on_progress);
    void discard_transfer(const TransferState& state);
    auto materialize(const SyncItem& remote, const ProgressCallback& on_progress) -> SyncItem;
    auto resolve_items(const SyncItem& local, const SyncItem& remote,
                       const ProgressCallback& on_progress) -> Reconciled;
    auto merge_items(const SyncItem& local, const SyncItem& remote) -> Reconciled;
    void reconcile(SyncResult& result, const SyncItem& local, const SyncItem& remote,
                   const SyncOptions& options);

    void perform_push(SyncResult& result, const std::optional<ItemType>& type,
                      const SyncOptions& options);
    void perform_pull(SyncResult& result, const std::optional<ItemType>& type,
                      const SyncOptions& options);
    void perform_bidirectional(SyncResult& result, const std::optional<ItemType>& type,
                               const SyncOptions& options);

    auto local_items(const std::optional<ItemType>& type) -> std::vector<SyncItem>;
    auto remote_items(const std::optional<ItemType>& type) -> std::vector<SyncItem>;

    void record_error(SyncResult& result, const std::string& item_id, std::string_view action);
    void emit(const SyncEvent& event);
    void forward_queue_events(OfflineQueue& queue);
    void start_auto_sync();
    void stop_auto_sync();
    auto require_remote() const -> std::shared_ptr<RemoteStore>;

    NodeId node_id_;
    mutable std::mutex mutex_;      // guards config_, adapters and listener_
    SyncConfig config_;
    std::shared_ptr<LocalStore> local_;
    std::shared_ptr<RemoteStore> remote_;
    std::shared_ptr<Encryption> encryption_;
    std::shared_ptr<OfflineQueue> queue_;
    EventListener listener_;

    std::unique_ptr<TransferEngine> transfer_;
    std::atomic<bool> initialized_{false};
    std::mutex sync_mutex_;         // serializes sync() and process_queue()
    std::jthread auto_sync_;
};

}  // namespace peersync
