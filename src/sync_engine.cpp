#include <peersync/json.hpp>
#include <peersync/sync_engine.hpp>

#include "log.hpp"

#include <algorithm>
#include <condition_variable>
#include <map>
#include <set>
#include <utility>

namespace peersync {

using json = nlohmann::json;

namespace {

auto stored_chunks(const TransferState& state) -> ChunkedPayload {
    return ChunkedPayload{
        .size = state.total_size,
        .total_chunks = state.total_chunks,
        .chunk_size = state.chunk_size,
        .content_hash = state.content_hash,
        .compressed = state.compressed,
    };
}

}  // namespace

// -- Construction -------------------------------------------------------------

SyncEngine::SyncEngine(SyncConfig config)
    : SyncEngine{std::move(config), nullptr} {}

SyncEngine::SyncEngine(SyncConfig config, std::shared_ptr<thread_pool> pool)
    : config_{std::move(config)} {
    if (config_.node_id.empty()) config_.node_id = generate_node_id();
    validate(config_);
    node_id_ = config_.node_id;

    logging::init(config_.verbose);
    local_ = std::make_shared<MemoryStore>();
    queue_ = std::make_shared<MemoryQueue>(config_.queue);
    transfer_ = pool ? std::make_unique<TransferEngine>(config_.transfer, std::move(pool))
                     : std::make_unique<TransferEngine>(config_.transfer);
    forward_queue_events(*queue_);
    logging::debug("sync engine created for node {}", node_id_);
}

SyncEngine::~SyncEngine() {
    stop_auto_sync();
    auto queue = offline_queue();
    if (queue) queue->set_listener(nullptr);
}

auto SyncEngine::node_id() const -> const NodeId& {
    return node_id_;
}

auto SyncEngine::config() const -> SyncConfig {
    auto lock = std::scoped_lock{mutex_};
    return config_;
}

void SyncEngine::update_config(const SyncConfig& config) {
    auto next = config;
    next.node_id = node_id_;
    validate(next);

    auto queue = std::shared_ptr<OfflineQueue>{};
    auto encryption = std::shared_ptr<Encryption>{};
    auto previous_interval = std::chrono::milliseconds{};
    {
        auto lock = std::scoped_lock{mutex_};
        previous_interval = config_.auto_sync_interval;
        config_ = next;
        queue = queue_;
        encryption = encryption_;
    }
    logging::logger().set_level(next.verbose ? spdlog::level::debug : spdlog::level::info);
    transfer_->update_config(next.transfer);
    if (queue) queue->update_config(next.queue);
    if (encryption) encryption->update_config(next.encryption);

    if (initialized_ && previous_interval != next.auto_sync_interval) {
        stop_auto_sync();
        if (next.auto_sync_interval.count() > 0) start_auto_sync();
    }
}

// -- Adapters -----------------------------------------------------------------

void SyncEngine::set_local_store(std::shared_ptr<LocalStore> store) {
    if (!store) throw SyncError{ErrorKind::invalid_argument, "local store must not be null"};
    auto lock = std::scoped_lock{mutex_};
    local_ = std::move(store);
}

void SyncEngine::set_remote_store(std::shared_ptr<RemoteStore> store) {
    auto lock = std::scoped_lock{mutex_};
    remote_ = std::move(store);
}

void SyncEngine::set_encryption(std::shared_ptr<Encryption> encryption) {
    auto lock = std::scoped_lock{mutex_};
    encryption_ = std::move(encryption);
}

void SyncEngine::set_offline_queue(std::shared_ptr<OfflineQueue> queue) {
    if (!queue) throw SyncError{ErrorKind::invalid_argument, "offline queue must not be null"};
    auto previous = std::shared_ptr<OfflineQueue>{};
    {
        auto lock = std::scoped_lock{mutex_};
        previous = std::exchange(queue_, queue);
    }
    if (previous) previous->set_listener(nullptr);
    forward_queue_events(*queue);
}

void SyncEngine::set_event_listener(EventListener listener) {
    auto lock = std::scoped_lock{mutex_};
    listener_ = std::move(listener);
}

auto SyncEngine::local_store() const -> std::shared_ptr<LocalStore> {
    auto lock = std::scoped_lock{mutex_};
    return local_;
}

auto SyncEngine::remote_store() const -> std::shared_ptr<RemoteStore> {
    auto lock = std::scoped_lock{mutex_};
    return remote_;
}

auto SyncEngine::offline_queue() const -> std::shared_ptr<OfflineQueue> {
    auto lock = std::scoped_lock{mutex_};
    return queue_;
}

auto SyncEngine::require_remote() const -> std::shared_ptr<RemoteStore> {
    auto remote = remote_store();
    if (!remote) {
        throw SyncError{ErrorKind::no_remote_store,
                        "remote store not set; call set_remote_store() first"};
    }
    return remote;
}

// -- Lifecycle ----------------------------------------------------------------

void SyncEngine::initialize(const std::optional<std::string>& password) {
    if (initialized_) return;

    const auto cfg = config();
    if (cfg.encryption.enabled) {
        auto encryption = std::shared_ptr<Encryption>{};
        {
            auto lock = std::scoped_lock{mutex_};
            encryption = encryption_;
        }
        if (!encryption) {
            throw SyncError{ErrorKind::invalid_config,
                            "encryption is enabled but no encryption capability is set"};
        }
        if (!password) {
            throw SyncError{ErrorKind::invalid_argument,
                            "encryption is enabled but no password provided"};
        }
        encryption->update_config(cfg.encryption);
        encryption->initialize(*password);
    }

    initialized_ = true;
    logging::info("node {} initialized", node_id_);
    emit(SyncEvent{.kind = EngineEvent::initialized});

    if (cfg.auto_sync_interval.count() > 0) start_auto_sync();
}

void SyncEngine::stop() {
    stop_auto_sync();

    auto remote = remote_store();
    auto queue = offline_queue();
    auto encryption = std::shared_ptr<Encryption>{};
    {
        auto lock = std::scoped_lock{mutex_};
        encryption = encryption_;
    }

    if (remote) remote->disconnect();
    if (queue) {
        queue->destroy();
        forward_queue_events(*queue);
    }
    if (encryption) encryption->destroy();
    initialized_ = false;
    logging::info("node {} stopped", node_id_);
}

auto SyncEngine::is_initialized() const -> bool {
    return initialized_;
}

void SyncEngine::start_auto_sync() {
    if (auto_sync_.joinable()) return;
    const auto interval = config().auto_sync_interval;

    auto_sync_ = std::jthread{[this, interval](std::stop_token stop) {
        auto mutex = std::mutex{};
        auto cv = std::condition_variable_any{};
        auto lock = std::unique_lock{mutex};
        while (!stop.stop_requested()) {
            if (cv.wait_for(lock, stop, interval, [&stop] { return stop.stop_requested(); })) {
                break;
            }
            if (!is_online()) continue;
            try {
                auto result = sync();
                logging::debug("auto-sync finished: {} pushed, {} pulled, {} merged",
                               result.pushed.size(), result.pulled.size(), result.merged.size());
            } catch (const SyncError& e) {
                logging::warn("auto-sync skipped: {}", e.what());
            }
        }
    }};
    logging::debug("auto-sync every {} ms", interval.count());
}

void SyncEngine::stop_auto_sync() {
    if (!auto_sync_.joinable()) return;
    auto_sync_.request_stop();
    auto_sync_.join();
    auto_sync_ = std::jthread{};
}

// -- Events -------------------------------------------------------------------

void SyncEngine::emit(const SyncEvent& event) {
    auto listener = EventListener{};
    {
        auto lock = std::scoped_lock{mutex_};
        listener = listener_;
    }
    if (listener) listener(event);
}

void SyncEngine::forward_queue_events(OfflineQueue& queue) {
    queue.set_listener([this](QueueEvent event, const QueuedOperation* operation) {
        emit(SyncEvent{
            .kind = EngineEvent::queue,
            .queue_event = event,
            .item_id = operation ? operation->item_id : std::string{},
        });
    });
}

// -- Sync ---------------------------------------------------------------------

auto SyncEngine::sync(const std::optional<ItemType>& type, const SyncOptions& options)
    -> SyncResult {
    if (!initialized_) {
        throw SyncError{ErrorKind::not_initialized,
                        "sync engine not initialized; call initialize() first"};
    }
    require_remote();

    auto lock = std::scoped_lock{sync_mutex_};
    const auto started = std::chrono::steady_clock::now();
    auto result = SyncResult{.timestamp = now_millis()};
    emit(SyncEvent{.kind = EngineEvent::sync_start});

    try {
        switch (options.direction) {
            case SyncDirection::push:
                perform_push(result, type, options);
                break;
            case SyncDirection::pull:
                perform_pull(result, type, options);
                break;
            case SyncDirection::bidirectional:
                perform_bidirectional(result, type, options);
                break;
        }
    } catch (const std::exception&) {
        record_error(result, {}, "sync");
    }

    result.success = result.errors.empty();
    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    logging::info("{} sync of {}: {} pushed, {} pulled, {} merged, {} unchanged, "
                  "{} conflicts, {} errors in {} ms",
                  to_string_view(options.direction), type.value_or("all types"),
                  result.pushed.size(), result.pulled.size(), result.merged.size(),
                  result.unchanged.size(), result.conflicts.size(), result.errors.size(),
                  result.duration.count());
    emit(SyncEvent{.kind = EngineEvent::sync_complete, .result = &result});
    return result;
}

// Must be called from a catch block.
void SyncEngine::record_error(SyncResult& result, const std::string& item_id,
                              std::string_view action) {
    auto kind = ErrorKind::storage_error;
    auto message = std::string{};
    try {
        throw;
    } catch (const SyncError& e) {
        kind = e.kind();
        message = e.what();
    } catch (const std::exception& e) {
        message = e.what();
    }
    if (item_id.empty()) {
        logging::error("{} failed: {}", action, message);
    } else {
        logging::warn("{} of {} failed: {}", action, item_id, message);
    }
    result.errors.push_back(ItemError{.kind = kind, .message = message, .item_id = item_id});
}

auto SyncEngine::local_items(const std::optional<ItemType>& type) -> std::vector<SyncItem> {
    auto local = local_store();
    if (type) return local->get_all(*type);

    auto items = std::vector<SyncItem>{};
    for (const auto& t : config().item_types) {
        auto of_type = local->get_all(t);
        items.insert(items.end(), std::make_move_iterator(of_type.begin()),
                     std::make_move_iterator(of_type.end()));
    }
    return items;
}

auto SyncEngine::remote_items(const std::optional<ItemType>& type) -> std::vector<SyncItem> {
    auto items = require_remote()->list(type);
    if (type) return items;

    const auto types = config().item_types;
    std::erase_if(items, [&](const SyncItem& item) {
        return std::ranges::find(types, item.type) == types.end();
    });
    return items;
}

void SyncEngine::perform_push(SyncResult& result, const std::optional<ItemType>& type,
                              const SyncOptions& options) {
    for (const auto& item : local_items(type)) {
        try {
            push_item(item, options.on_progress);
            result.pushed.push_back(item.id);
        } catch (const std::exception&) {
            record_error(result, item.id, "push");
        }
    }
}

void SyncEngine::perform_pull(SyncResult& result, const std::optional<ItemType>& type,
                              const SyncOptions& options) {
    for (const auto& item : remote_items(type)) {
        try {
            pull_item(item, options.on_progress);
            result.pulled.push_back(item.id);
        } catch (const std::exception&) {
            record_error(result, item.id, "pull");
        }
    }
}

void SyncEngine::perform_bidirectional(SyncResult& result, const std::optional<ItemType>& type,
                                       const SyncOptions& options) {
    auto locals = std::map<std::string, SyncItem>{};
    for (auto& item : local_items(type)) locals.insert_or_assign(item.id, std::move(item));
    auto remotes = std::map<std::string, SyncItem>{};
    for (auto& item : remote_items(type)) remotes.insert_or_assign(item.id, std::move(item));

    auto ids = std::set<std::string>{};
    for (const auto& [id, item] : locals) ids.insert(id);
    for (const auto& [id, item] : remotes) ids.insert(id);

    for (const auto& id : ids) {
        auto local = locals.find(id);
        auto remote = remotes.find(id);
        try {
            if (local == locals.end()) {
                pull_item(remote->second, options.on_progress);
                result.pulled.push_back(id);
            } else if (remote == remotes.end()) {
                push_item(local->second, options.on_progress);
                result.pushed.push_back(id);
            } else {
                reconcile(result, local->second, remote->second, options);
            }
        } catch (const std::exception&) {
            record_error(result, id, "sync");
        }
    }
}

void SyncEngine::reconcile(SyncResult& result, const SyncItem& local, const SyncItem& remote,
                           const SyncOptions& options) {
    auto outcome = resolve_items(local, remote, options.on_progress);
    switch (outcome.resolution) {
        case Resolution::local:
            push_item(local, options.on_progress);
            result.pushed.push_back(local.id);
            break;
        case Resolution::remote:
            pull_item(outcome.item.value_or(remote), options.on_progress);
            result.pulled.push_back(local.id);
            break;
        case Resolution::merged:
            local_store()->save(*outcome.item);
            push_item(*outcome.item, options.on_progress);
            result.merged.push_back(local.id);
            logging::debug("merged {} at version {}", local.id, outcome.item->version);
            emit(SyncEvent{.kind = EngineEvent::item_merged, .item_id = local.id});
            break;
        case Resolution::unchanged:
            if (options.force) {
                push_item(local, options.on_progress);
                result.pushed.push_back(local.id);
            } else {
                result.unchanged.push_back(local.id);
            }
            break;
        case Resolution::conflict:
            logging::warn("conflict on {}: {}", local.id, outcome.reason);
            result.conflicts.push_back(Conflict{
                .item_id = local.id,
                .local = local,
                .remote = remote,
                .reason = outcome.reason,
            });
            emit(SyncEvent{.kind = EngineEvent::conflict, .item_id = local.id});
            break;
    }
}

auto SyncEngine::resolve_items(const SyncItem& local, const SyncItem& remote,
                               const ProgressCallback& on_progress) -> Reconciled {
    if (local.updated_at > remote.updated_at) return {.resolution = Resolution::local};
    if (remote.updated_at > local.updated_at) return {.resolution = Resolution::remote};

    // Hashes are computed over the plaintext on both sides, sealed or not.
    if (local.content_hash == remote.content_hash) return {.resolution = Resolution::unchanged};

    if (!local.crdt || !remote.crdt) {
        return {.resolution = Resolution::conflict,
                .reason = "concurrent modifications with same timestamp"};
    }

    switch (local.crdt->clock.compare(remote.crdt->clock)) {
        case ClockOrder::after:
            return {.resolution = Resolution::local};
        case ClockOrder::before:
            return {.resolution = Resolution::remote};
        case ClockOrder::equal:
        case ClockOrder::concurrent:
            break;
    }
    return merge_items(local, materialize(remote, on_progress));
}

auto SyncEngine::merge_items(const SyncItem& local, const SyncItem& remote) -> Reconciled {
    if (local.crdt->kind != remote.crdt->kind) {
        return {.resolution = Resolution::conflict,
                .reason = "CRDT kinds differ: " + std::string{to_string_view(local.crdt->kind)} +
                          " vs " + std::string{to_string_view(remote.crdt->kind)}};
    }
    auto merged = merge_snapshots(*local.crdt, *remote.crdt, node_id_);
    if (!merged) {
        return {.resolution = Resolution::conflict, .reason = "CRDT state unavailable"};
    }

    auto item = local;
    const auto latest = std::max(local.updated_at, remote.updated_at);
    item.version = std::max(local.version, remote.version) + 1;
    item.updated_at = std::max(now_millis(), latest + 1);
    item.modified_by = node_id_;
    merged->timestamp = item.updated_at;
    merged->clock.advance(node_id_, static_cast<std::uint64_t>(item.updated_at));
    item.content = merged->value();
    item.content_hash = compute_content_hash(item.content);
    item.crdt = std::move(*merged);
    item.encrypted = false;
    item.envelope.reset();
    item.payload.reset();
    return {.resolution = Resolution::merged, .item = std::move(item)};
}

// -- Item transfer ------------------------------------------------------------

// Forget a transfer that is no longer running.
void SyncEngine::discard_transfer(const TransferState& state) {
    if (state.status == TransferStatus::active || state.status == TransferStatus::pending) return;
    logging::debug("discarding {} transfer {}", to_string_view(state.status), state.id);
    transfer_->state_manager().remove(state.id);
}

void SyncEngine::push_item(const SyncItem& item, const ProgressCallback& on_progress) {
    auto remote = require_remote();
    const auto cfg = config();

    auto record = item;
    record.encrypted = false;
    record.envelope.reset();
    record.payload.reset();

    auto envelope = std::optional<EncryptedEnvelope>{};
    auto body = json{
        {"content", item.content},
        {"crdt", item.crdt ? json(*item.crdt) : json(nullptr)},
    }.dump();

    if (cfg.encryption.enabled) {
        auto encryption = std::shared_ptr<Encryption>{};
        {
            auto lock = std::scoped_lock{mutex_};
            encryption = encryption_;
        }
        if (!encryption || !encryption->is_ready()) {
            throw SyncError{ErrorKind::encryption_error,
                            "encryption is enabled but not ready; refusing to push plaintext"};
        }
        envelope = encryption->encrypt(body);
        body = json(*envelope).dump();
        record.encrypted = true;
    }

    if (body.size() > cfg.transfer.chunk_size) {
        const auto bytes = to_bytes(body);
        const auto upload_chunk = UploadHandler{
            [remote, id = item.id](std::span<const std::byte> chunk, const ChunkMetadata& meta,
                                   const ChunkContext&) {
                remote->upload_chunk(id, meta.index, Bytes{chunk.begin(), chunk.end()});
            }};

        // An earlier push of the same bytes that stopped halfway is resumed;
        // other leftover uploads of the item are dropped.
        const auto hash = payload_hash(bytes);
        auto resumable = std::optional<std::string>{};
        for (const auto& previous : transfer_->transfers_for_item(item.id)) {
            if (previous.direction != TransferDirection::upload) continue;
            if (!resumable && previous.content_hash == hash &&
                previous.total_size == bytes.size() &&
                transfer_->state_manager().can_resume(previous.id)) {
                resumable = previous.id;
            } else {
                discard_transfer(previous);
            }
        }

        auto state = resumable
            ? transfer_->resume_upload(*resumable, bytes, upload_chunk, on_progress)
            : transfer_->upload(bytes, item.id, upload_chunk, on_progress);
        if (resumable) logging::info("resumed upload of {} from transfer {}", item.id, state.id);
        record.payload = stored_chunks(state);
        transfer_->state_manager().remove(state.id);
    } else if (envelope) {
        record.envelope = std::move(envelope);
    }

    if (record.sealed()) {
        record.content = nullptr;
        if (record.crdt) record.crdt->state.reset();
    }
    remote->upload_metadata(item.id, record);
}

void SyncEngine::pull_item(const SyncItem& remote, const ProgressCallback& on_progress) {
    local_store()->save(materialize(remote, on_progress));
}

auto SyncEngine::materialize(const SyncItem& remote, const ProgressCallback& on_progress)
    -> SyncItem {
    if (!remote.sealed()) return remote;

    auto text = std::string{};
    if (remote.payload) {
        const auto& payload = *remote.payload;
        auto store = require_remote();
        auto bytes = transfer_->download(
            DownloadSpec{
                .item_id = remote.id,
                .total_size = payload.size,
                .total_chunks = payload.total_chunks,
                .content_hash = payload.content_hash,
                .compressed = payload.compressed,
            },
            [store, id = remote.id](std::uint32_t index, const ChunkContext&) {
                return store->download_chunk(id, index);
            },
            on_progress);
        text = to_string(bytes);
        for (const auto& previous : transfer_->transfers_for_item(remote.id)) {
            if (previous.direction == TransferDirection::download) discard_transfer(previous);
        }
    }

    if (remote.encrypted) {
        auto envelope = remote.envelope;
        if (!envelope) {
            auto parsed = json::parse(text, nullptr, false);
            if (parsed.is_discarded()) {
                throw SyncError{ErrorKind::decoding_error,
                                "sealed payload of " + remote.id + " is not an envelope"};
            }
            try {
                envelope = parsed.get<EncryptedEnvelope>();
            } catch (const json::exception& e) {
                throw SyncError{ErrorKind::decoding_error,
                                "sealed payload of " + remote.id + ": " + e.what()};
            }
        }
        auto encryption = std::shared_ptr<Encryption>{};
        {
            auto lock = std::scoped_lock{mutex_};
            encryption = encryption_;
        }
        if (!encryption || !encryption->is_ready()) {
            throw SyncError{ErrorKind::encryption_error,
                            "item " + remote.id + " is encrypted but encryption is not ready"};
        }
        text = encryption->decrypt(*envelope);
    }

    auto body = json::parse(text, nullptr, false);
    if (body.is_discarded() || !body.is_object()) {
        throw SyncError{ErrorKind::decoding_error, "malformed body of item " + remote.id};
    }

    auto item = remote;
    item.encrypted = false;
    item.envelope.reset();
    item.payload.reset();
    item.content = body.value("content", json{});
    try {
        if (auto it = body.find("crdt"); it != body.end() && !it->is_null()) {
            item.crdt = it->get<CrdtSnapshot>();
        }
    } catch (const json::exception& e) {
        throw SyncError{ErrorKind::decoding_error,
                        "malformed CRDT state of item " + remote.id + ": " + e.what()};
    }

    if (compute_content_hash(item.content) != remote.content_hash) {
        throw SyncError{ErrorKind::integrity_error,
                        "content of item " + remote.id + " does not match its hash"};
    }
    return item;
}

// -- Items --------------------------------------------------------------------

auto SyncEngine::create_sync_item(const CreateItemParams& params) const -> SyncItem {
    const auto now = now_millis();
    auto item = SyncItem{
        .id = params.id.empty() ? random_hex(16) : params.id,
        .type = params.type,
        .name = params.name,
        .content = params.content,
        .content_hash = compute_content_hash(params.content),
        .version = 1,
        .created_at = now,
        .updated_at = now,
        .modified_by = node_id_,
        .metadata = params.metadata,
    };
    if (params.crdt) item.crdt = make_snapshot(*params.crdt, node_id_, params.content, now);
    return item;
}

auto SyncEngine::update_sync_item(const SyncItem& item, const json& content) const -> SyncItem {
    auto updated = item;
    updated.content = content;
    updated.content_hash = compute_content_hash(content);
    updated.version = item.version + 1;
    updated.updated_at = std::max(now_millis(), item.updated_at + 1);
    updated.modified_by = node_id_;
    if (updated.crdt) apply_content(*updated.crdt, node_id_, content, updated.updated_at);
    return updated;
}

// -- Offline queue ------------------------------------------------------------

auto SyncEngine::queue_operation(const EnqueueRequest& request) -> QueuedOperation {
    return offline_queue()->enqueue(request);
}

void SyncEngine::process_queue() {
    auto queue = offline_queue();
    if (!queue->is_online()) {
        logging::debug("offline; {} operations wait in the queue", queue->get_state().pending.size());
        return;
    }
    auto remote = require_remote();

    auto lock = std::scoped_lock{sync_mutex_};
    queue->process([&](const QueuedOperation& operation) {
        switch (operation.type) {
            case OperationType::create:
            case OperationType::update: {
                auto item = local_store()->get(operation.item_id);
                if (!item) {
                    logging::debug("queued {} of {} skipped: no local item",
                                   to_string_view(operation.type), operation.item_id);
                    return;
                }
                push_item(*item, {});
                return;
            }
            case OperationType::remove:
                remote->remove(operation.item_id);
                return;
            case OperationType::merge: {
                auto local = local_store()->get(operation.item_id);
                auto stored = remote->download_metadata(operation.item_id);
                if (!local || !stored) return;
                auto result = SyncResult{};
                reconcile(result, *local, *stored, SyncOptions{});
                if (!result.conflicts.empty()) {
                    throw SyncError{ErrorKind::invalid_argument, result.conflicts.front().reason};
                }
                return;
            }
        }
    });
}

auto SyncEngine::queue_state() const -> QueueState {
    return offline_queue()->get_state();
}

void SyncEngine::set_network_status(NetworkStatus status) {
    offline_queue()->set_network_status(status);
}

auto SyncEngine::is_online() const -> bool {
    return offline_queue()->is_online();
}

auto SyncEngine::transfer_engine() -> TransferEngine& {
    return *transfer_;
}

}  // namespace peersync
