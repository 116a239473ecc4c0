#include <peersync/config.hpp>
#include <peersync/error.hpp>

#include <fstream>
#include <string>

namespace peersync {

using json = nlohmann::json;

namespace {

// Assign j[key] to `out` when present; leave the default otherwise.
template <typename T>
void read_key(const json& j, const char* key, T& out) {
    if (auto it = j.find(key); it != j.end() && !it->is_null()) {
        out = it->template get<T>();
    }
}

void read_millis(const json& j, const char* key, std::chrono::milliseconds& out) {
    if (auto it = j.find(key); it != j.end() && !it->is_null()) {
        out = std::chrono::milliseconds{it->get<std::int64_t>()};
    }
}

void read_path(const json& j, const char* key, std::optional<std::filesystem::path>& out) {
    if (auto it = j.find(key); it != j.end() && !it->is_null()) {
        out = std::filesystem::path{it->get<std::string>()};
    }
}

auto path_or_null(const std::optional<std::filesystem::path>& p) -> json {
    return p ? json(p->string()) : json(nullptr);
}

[[noreturn]] void invalid(const std::string& key, const std::string& why) {
    throw SyncError{ErrorKind::invalid_config, key + ": " + why};
}

}  // namespace

// -- JSON ---------------------------------------------------------------------

void to_json(json& j, const EncryptionConfig& c) {
    j = json{
        {"enabled", c.enabled},
        {"algorithm", c.algorithm},
        {"kdf", c.kdf},
        {"iterations", c.iterations},
    };
}

void from_json(const json& j, EncryptionConfig& c) {
    read_key(j, "enabled", c.enabled);
    read_key(j, "algorithm", c.algorithm);
    read_key(j, "kdf", c.kdf);
    read_key(j, "iterations", c.iterations);
}

void to_json(json& j, const TransferConfig& c) {
    j = json{
        {"chunkSize", c.chunk_size},
        {"maxConcurrent", c.max_concurrent},
        {"bandwidthLimit", c.bandwidth_limit},
        {"compression", c.compression},
        {"compressionLevel", c.compression_level},
        {"retryAttempts", c.retry_attempts},
        {"retryDelay", c.retry_delay.count()},
        {"timeout", c.timeout.count()},
        {"verifyIntegrity", c.verify_integrity},
        {"statePath", path_or_null(c.state_path)},
    };
}

void from_json(const json& j, TransferConfig& c) {
    read_key(j, "chunkSize", c.chunk_size);
    read_key(j, "maxConcurrent", c.max_concurrent);
    read_key(j, "bandwidthLimit", c.bandwidth_limit);
    read_key(j, "compression", c.compression);
    read_key(j, "compressionLevel", c.compression_level);
    read_key(j, "retryAttempts", c.retry_attempts);
    read_millis(j, "retryDelay", c.retry_delay);
    read_millis(j, "timeout", c.timeout);
    read_key(j, "verifyIntegrity", c.verify_integrity);
    read_path(j, "statePath", c.state_path);
}

void to_json(json& j, const QueueConfig& c) {
    j = json{
        {"maxSize", c.max_size},
        {"maxRetries", c.max_retries},
        {"retryDelay", c.retry_delay.count()},
        {"batchSize", c.batch_size},
        {"persistence", c.persistence},
        {"storagePath", path_or_null(c.storage_path)},
    };
}

void from_json(const json& j, QueueConfig& c) {
    read_key(j, "maxSize", c.max_size);
    read_key(j, "maxRetries", c.max_retries);
    read_millis(j, "retryDelay", c.retry_delay);
    read_key(j, "batchSize", c.batch_size);
    read_key(j, "persistence", c.persistence);
    read_path(j, "storagePath", c.storage_path);
}

void to_json(json& j, const SyncConfig& c) {
    j = json{
        {"nodeId", c.node_id},
        {"encryption", c.encryption},
        {"transfer", c.transfer},
        {"queue", c.queue},
        {"autoSyncInterval", c.auto_sync_interval.count()},
        {"verbose", c.verbose},
        {"itemTypes", c.item_types},
    };
}

void from_json(const json& j, SyncConfig& c) {
    read_key(j, "nodeId", c.node_id);
    read_key(j, "encryption", c.encryption);
    read_key(j, "transfer", c.transfer);
    read_key(j, "queue", c.queue);
    read_millis(j, "autoSyncInterval", c.auto_sync_interval);
    read_key(j, "verbose", c.verbose);
    read_key(j, "itemTypes", c.item_types);
}

// -- Validation ---------------------------------------------------------------

void validate(const SyncConfig& config) {
    const auto& t = config.transfer;
    if (t.chunk_size == 0) invalid("transfer.chunkSize", "must be positive");
    if (t.max_concurrent == 0) invalid("transfer.maxConcurrent", "must be positive");
    if (t.compression_level < 0 || t.compression_level > 9) {
        invalid("transfer.compressionLevel", "must be between 0 and 9");
    }
    if (t.retry_attempts == 0) invalid("transfer.retryAttempts", "must be positive");
    if (t.retry_delay.count() < 0) invalid("transfer.retryDelay", "must not be negative");
    if (t.timeout.count() <= 0) invalid("transfer.timeout", "must be positive");

    const auto& q = config.queue;
    if (q.max_size == 0) invalid("queue.maxSize", "must be positive");
    if (q.batch_size == 0) invalid("queue.batchSize", "must be positive");
    if (q.retry_delay.count() < 0) invalid("queue.retryDelay", "must not be negative");
    if (q.persistence && !q.storage_path) {
        invalid("queue.storagePath", "required when queue.persistence is enabled");
    }

    if (config.encryption.enabled && config.encryption.iterations == 0) {
        invalid("encryption.iterations", "must be positive");
    }
    if (config.item_types.empty()) invalid("itemTypes", "must not be empty");
}

auto parse_config(const json& j) -> SyncConfig {
    if (!j.is_object()) invalid("<root>", "configuration must be a JSON object");
    auto config = SyncConfig{};
    try {
        config = j.get<SyncConfig>();
    } catch (const json::exception& e) {
        throw SyncError{ErrorKind::invalid_config, e.what()};
    }
    validate(config);
    return config;
}

auto load_config(const std::filesystem::path& path) -> SyncConfig {
    auto in = std::ifstream{path};
    if (!in) {
        throw SyncError{ErrorKind::invalid_config, "cannot open " + path.string()};
    }
    auto j = json::parse(in, nullptr, false);
    if (j.is_discarded()) {
        throw SyncError{ErrorKind::invalid_config, "malformed JSON in " + path.string()};
    }
    return parse_config(j);
}

}  // namespace peersync
