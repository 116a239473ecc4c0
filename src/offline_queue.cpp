#include <peersync/error.hpp>
#include <peersync/json.hpp>
#include <peersync/offline_queue.hpp>

#include "log.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <thread>
#include <unordered_set>
#include <utility>

namespace peersync {

using json = nlohmann::json;

auto parse_operation_type(std::string_view name) -> std::optional<OperationType> {
    for (auto t : {OperationType::create, OperationType::update,
                   OperationType::remove, OperationType::merge}) {
        if (to_string_view(t) == name) return t;
    }
    return std::nullopt;
}

// -- JSON ---------------------------------------------------------------------

void to_json(json& j, const QueuedOperation& op) {
    j = json{
        {"id", op.id},
        {"type", to_string_view(op.type)},
        {"itemType", op.item_type},
        {"itemId", op.item_id},
        {"payload", op.payload},
        {"createdAt", op.created_at},
        {"retryCount", op.retry_count},
        {"priority", op.priority},
        {"dependencies", op.dependencies},
    };
    if (op.last_attempt_at) j["lastAttemptAt"] = *op.last_attempt_at;
    if (op.last_error) j["lastError"] = *op.last_error;
    if (op.crdt) j["crdtState"] = *op.crdt;
}

void from_json(const json& j, QueuedOperation& op) {
    const auto type = j.at("type").get<std::string>();
    auto parsed = parse_operation_type(type);
    if (!parsed) throw SyncError{ErrorKind::decoding_error, "unknown operation type: " + type};

    op.id = j.at("id").get<std::string>();
    op.type = *parsed;
    op.item_type = j.at("itemType").get<ItemType>();
    op.item_id = j.at("itemId").get<std::string>();
    op.payload = j.value("payload", json{});
    op.created_at = j.value("createdAt", Timestamp{0});
    op.retry_count = j.value("retryCount", std::uint32_t{0});
    op.priority = j.value("priority", default_priority(op.type));
    op.dependencies = j.value("dependencies", std::vector<std::string>{});
    op.last_attempt_at.reset();
    op.last_error.reset();
    op.crdt.reset();
    if (auto it = j.find("lastAttemptAt"); it != j.end() && !it->is_null()) {
        op.last_attempt_at = it->get<Timestamp>();
    }
    if (auto it = j.find("lastError"); it != j.end() && !it->is_null()) {
        op.last_error = it->get<std::string>();
    }
    if (auto it = j.find("crdtState"); it != j.end() && !it->is_null()) {
        op.crdt = it->get<CrdtSnapshot>();
    }
}

// -- MemoryQueue --------------------------------------------------------------

MemoryQueue::MemoryQueue(QueueConfig config)
    : config_{std::move(config)} {
    load();
}

auto MemoryQueue::enqueue(const EnqueueRequest& request) -> QueuedOperation {
    auto operation = QueuedOperation{
        .id = random_hex(16),
        .type = request.type,
        .item_type = request.item_type,
        .item_id = request.item_id,
        .payload = request.payload,
        .created_at = now_millis(),
        .retry_count = 0,
        .last_attempt_at = std::nullopt,
        .last_error = std::nullopt,
        .priority = request.priority.value_or(default_priority(request.type)),
        .dependencies = request.dependencies,
        .crdt = request.crdt,
    };

    auto conflict = std::optional<QueuedOperation>{};
    {
        auto lock = std::scoped_lock{mutex_};
        if (state_.pending.size() >= config_.max_size) {
            throw SyncError{ErrorKind::queue_full,
                            "queue is full (max: " + std::to_string(config_.max_size) + ")"};
        }
        auto existing = std::find_if(state_.pending.begin(), state_.pending.end(),
            [&](const QueuedOperation& op) {
                return op.item_id == request.item_id && op.type == request.type;
            });
        if (existing != state_.pending.end()) conflict = *existing;

        insert_by_priority(operation);
        persist();
    }

    if (conflict) emit(QueueEvent::conflict_detected, &*conflict);
    emit(QueueEvent::operation_added, &operation);
    return operation;
}

// Called with mutex_ held. Stable: after every operation of equal priority.
void MemoryQueue::insert_by_priority(QueuedOperation operation) {
    auto pos = std::upper_bound(state_.pending.begin(), state_.pending.end(), operation.priority,
        [](int priority, const QueuedOperation& op) { return priority < op.priority; });
    state_.pending.insert(pos, std::move(operation));
}

auto MemoryQueue::dequeue(const std::string& operation_id) -> std::optional<QueuedOperation> {
    auto lock = std::scoped_lock{mutex_};
    auto it = std::find_if(state_.pending.begin(), state_.pending.end(),
        [&](const QueuedOperation& op) { return op.id == operation_id; });
    if (it == state_.pending.end()) return std::nullopt;
    auto operation = std::move(*it);
    state_.pending.erase(it);
    persist();
    return operation;
}

auto MemoryQueue::operation(const std::string& operation_id) const
    -> std::optional<QueuedOperation> {
    auto lock = std::scoped_lock{mutex_};
    for (const auto* list : {&state_.pending, &state_.failed}) {
        for (const auto& op : *list) {
            if (op.id == operation_id) return op;
        }
    }
    return std::nullopt;
}

auto MemoryQueue::operations_for_item(const std::string& item_id) const
    -> std::vector<QueuedOperation> {
    auto lock = std::scoped_lock{mutex_};
    auto result = std::vector<QueuedOperation>{};
    for (const auto& op : state_.pending) {
        if (op.item_id == item_id) result.push_back(op);
    }
    return result;
}

auto MemoryQueue::is_completed(const std::string& operation_id) const -> bool {
    auto lock = std::scoped_lock{mutex_};
    return state_.completed.contains(operation_id);
}

auto MemoryQueue::size() const -> std::size_t {
    auto lock = std::scoped_lock{mutex_};
    return state_.pending.size();
}

auto MemoryQueue::empty() const -> bool {
    return size() == 0;
}

void MemoryQueue::clear() {
    {
        auto lock = std::scoped_lock{mutex_};
        state_.pending.clear();
        persist();
    }
    emit(QueueEvent::queue_cleared);
}

void MemoryQueue::clear_failed() {
    auto lock = std::scoped_lock{mutex_};
    state_.failed.clear();
    persist();
}

void MemoryQueue::retry_failed() {
    auto lock = std::scoped_lock{mutex_};
    auto failed = std::move(state_.failed);
    state_.failed.clear();
    for (auto& op : failed) {
        op.retry_count = 0;
        op.last_error.reset();
        insert_by_priority(std::move(op));
    }
    persist();
}

// -- Processing ---------------------------------------------------------------

void MemoryQueue::process(const OperationHandler& handler) {
    {
        auto lock = std::scoped_lock{mutex_};
        if (state_.processing || state_.network_status == NetworkStatus::offline) return;
        state_.processing = true;
    }
    emit(QueueEvent::queue_processing);

    auto processed = std::size_t{0};
    for (;;) {
        auto batch = std::vector<QueuedOperation>{};
        {
            auto lock = std::scoped_lock{mutex_};
            if (state_.pending.empty() || state_.network_status == NetworkStatus::offline) break;
            batch = next_batch();
        }
        // Everything left waits on a dependency that cannot complete.
        if (batch.empty()) break;
        for (const auto& op : batch) {
            if (process_one(op, handler)) ++processed;
        }
    }

    {
        auto lock = std::scoped_lock{mutex_};
        state_.processing = false;
        if (processed > 0) state_.last_sync_at = now_millis();
        persist();
    }
    emit(QueueEvent::queue_idle);
}

// Called with mutex_ held.
auto MemoryQueue::next_batch() const -> std::vector<QueuedOperation> {
    auto batch = std::vector<QueuedOperation>{};
    auto seen = std::unordered_set<std::string>{};
    for (const auto& op : state_.pending) {
        if (batch.size() >= config_.batch_size) break;
        if (!dependencies_met(op)) continue;
        if (!seen.insert(op.item_id).second) continue;
        batch.push_back(op);
    }
    return batch;
}

// Called with mutex_ held. A dependency that is neither completed nor
// pending (failed or dequeued) no longer blocks.
auto MemoryQueue::dependencies_met(const QueuedOperation& operation) const -> bool {
    for (const auto& dep : operation.dependencies) {
        if (state_.completed.contains(dep)) continue;
        auto pending = std::any_of(state_.pending.begin(), state_.pending.end(),
            [&](const QueuedOperation& op) { return op.id == dep; });
        if (pending) return false;
    }
    return true;
}

auto MemoryQueue::process_one(const QueuedOperation& operation,
                              const OperationHandler& handler) -> bool {
    auto error = std::string{};
    try {
        handler(operation);
    } catch (const std::exception& e) {
        error = e.what();
        if (error.empty()) error = "operation failed";
    }

    auto event = QueueEvent::operation_processed;
    auto updated = operation;
    auto delay = std::chrono::milliseconds{0};
    {
        auto lock = std::scoped_lock{mutex_};
        auto it = std::find_if(state_.pending.begin(), state_.pending.end(),
            [&](const QueuedOperation& op) { return op.id == operation.id; });
        if (it == state_.pending.end()) return false;  // dequeued while running

        if (error.empty()) {
            state_.pending.erase(it);
            state_.completed.insert(operation.id);
        } else {
            it->retry_count += 1;
            it->last_attempt_at = now_millis();
            it->last_error = error;
            updated = *it;
            if (it->retry_count >= config_.max_retries) {
                state_.failed.push_back(std::move(*it));
                state_.pending.erase(it);
                event = QueueEvent::operation_failed;
            } else {
                event = QueueEvent::operation_retrying;
                delay = config_.retry_delay * it->retry_count;
            }
        }
        persist();
    }

    if (event == QueueEvent::operation_failed) {
        logging::warn("queued {} of {} failed permanently: {}",
                      to_string_view(operation.type), operation.item_id, error);
    }
    emit(event, &updated);
    if (delay.count() > 0) std::this_thread::sleep_for(delay);
    return error.empty();
}

// -- Network and configuration ------------------------------------------------

auto MemoryQueue::get_state() const -> QueueState {
    auto lock = std::scoped_lock{mutex_};
    return state_;
}

void MemoryQueue::set_network_status(NetworkStatus status) {
    {
        auto lock = std::scoped_lock{mutex_};
        state_.network_status = status;
    }
    if (status == NetworkStatus::online) emit(QueueEvent::network_online);
    if (status == NetworkStatus::offline) emit(QueueEvent::network_offline);
}

auto MemoryQueue::is_online() const -> bool {
    return network_status() == NetworkStatus::online;
}

auto MemoryQueue::network_status() const -> NetworkStatus {
    auto lock = std::scoped_lock{mutex_};
    return state_.network_status;
}

void MemoryQueue::set_listener(QueueListener listener) {
    auto lock = std::scoped_lock{mutex_};
    listener_ = std::move(listener);
}

void MemoryQueue::update_config(const QueueConfig& config) {
    auto lock = std::scoped_lock{mutex_};
    config_ = config;
    persist();
}

void MemoryQueue::destroy() {
    auto lock = std::scoped_lock{mutex_};
    state_ = QueueState{};
    listener_ = nullptr;
}

void MemoryQueue::emit(QueueEvent event, const QueuedOperation* operation) {
    auto listener = QueueListener{};
    {
        auto lock = std::scoped_lock{mutex_};
        listener = listener_;
    }
    if (listener) listener(event, operation);
}

// -- Persistence --------------------------------------------------------------

// Called with mutex_ held.
auto MemoryQueue::export_locked() const -> json {
    auto j = json{
        {"pending", state_.pending},
        {"failed", state_.failed},
        {"completed", state_.completed},
        {"version", 1},
    };
    j["lastSyncAt"] = state_.last_sync_at ? json(*state_.last_sync_at) : json(nullptr);
    return j;
}

auto MemoryQueue::export_state() const -> json {
    auto lock = std::scoped_lock{mutex_};
    return export_locked();
}

void MemoryQueue::import_state(const json& data) {
    auto pending = std::vector<QueuedOperation>{};
    auto failed = std::vector<QueuedOperation>{};
    auto completed = std::set<std::string>{};
    auto last_sync_at = std::optional<Timestamp>{};
    try {
        pending = data.value("pending", std::vector<QueuedOperation>{});
        failed = data.value("failed", std::vector<QueuedOperation>{});
        completed = data.value("completed", std::set<std::string>{});
        if (auto it = data.find("lastSyncAt"); it != data.end() && !it->is_null()) {
            last_sync_at = it->get<Timestamp>();
        }
    } catch (const json::exception& e) {
        throw SyncError{ErrorKind::decoding_error, std::string{"malformed queue state: "} + e.what()};
    }

    auto lock = std::scoped_lock{mutex_};
    state_.pending.clear();
    for (auto& op : pending) insert_by_priority(std::move(op));
    state_.failed = std::move(failed);
    state_.completed = std::move(completed);
    state_.last_sync_at = last_sync_at;
    persist();
}

void MemoryQueue::load() {
    if (!config_.persistence || !config_.storage_path) return;
    if (!std::filesystem::exists(*config_.storage_path)) return;

    auto in = std::ifstream{*config_.storage_path};
    auto j = json::parse(in, nullptr, false);
    if (j.is_discarded()) {
        logging::warn("ignoring unreadable queue file {}", config_.storage_path->string());
        return;
    }
    try {
        import_state(j);
    } catch (const SyncError& e) {
        logging::warn("ignoring malformed queue file {}: {}",
                      config_.storage_path->string(), e.what());
    }
}

// Called with mutex_ held.
void MemoryQueue::persist() const {
    if (!config_.persistence || !config_.storage_path) return;

    const auto& path = *config_.storage_path;
    auto ec = std::error_code{};
    if (path.has_parent_path()) std::filesystem::create_directories(path.parent_path(), ec);

    auto out = std::ofstream{path, std::ios::trunc};
    if (!out) {
        logging::error("cannot write queue file {}", path.string());
        return;
    }
    out << export_locked().dump(2);
}

}  // namespace peersync
