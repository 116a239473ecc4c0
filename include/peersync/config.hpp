/// @file config.hpp
/// @brief Engine configuration and its JSON form.

#pragma once

#include <peersync/types.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace peersync {

/// Settings handed to the Encryption capability.
struct EncryptionConfig {
    bool enabled = false;
    std::string algorithm = "aes-256-gcm";
    std::string kdf = "pbkdf2";
    std::uint32_t iterations = 100000;

    auto operator==(const EncryptionConfig&) const -> bool = default;
};

/// Settings of the stream transfer engine.
struct TransferConfig {
    std::size_t chunk_size = 1024 * 1024;          ///< Bytes per chunk.
    std::size_t max_concurrent = 3;                ///< Chunks in flight per transfer.
    std::size_t bandwidth_limit = 0;               ///< Bytes per second, 0 = unlimited.
    bool compression = true;                       ///< Deflate each chunk before sending.
    int compression_level = 6;                     ///< zlib level 0-9.
    std::uint32_t retry_attempts = 3;              ///< Attempts per chunk.
    std::chrono::milliseconds retry_delay{1000};   ///< Base of the linear backoff.
    std::chrono::milliseconds timeout{30000};      ///< Deadline of one chunk attempt.
    bool verify_integrity = true;                  ///< Check the payload hash after download.
    std::optional<std::filesystem::path> state_path;  ///< Transfer state file, if persisted.

    auto operator==(const TransferConfig&) const -> bool = default;
};

/// Settings of the reference offline queue.
struct QueueConfig {
    std::size_t max_size = 1000;
    std::uint32_t max_retries = 3;
    std::chrono::milliseconds retry_delay{1000};
    std::size_t batch_size = 10;
    bool persistence = false;
    std::optional<std::filesystem::path> storage_path;

    auto operator==(const QueueConfig&) const -> bool = default;
};

/// Top-level engine configuration.
///
/// JSON keys are camelCase (`nodeId`, `transfer.chunkSize`, ...). Any
/// subset may be given; missing keys keep their defaults.
struct SyncConfig {
    NodeId node_id;  ///< Generated when left empty.
    EncryptionConfig encryption;
    TransferConfig transfer;
    QueueConfig queue;
    std::chrono::milliseconds auto_sync_interval{0};  ///< <= 0 disables auto-sync.
    bool verbose = false;
    std::vector<ItemType> item_types = default_item_types();

    auto operator==(const SyncConfig&) const -> bool = default;
};

/// Check value ranges.
/// @throws SyncError (invalid_config) naming the offending key.
void validate(const SyncConfig& config);

/// Parse and validate a configuration from JSON.
/// @throws SyncError (invalid_config) on a type or range error.
auto parse_config(const nlohmann::json& j) -> SyncConfig;

/// Read, parse and validate a JSON configuration file.
/// @throws SyncError (invalid_config) if the file cannot be read or parsed.
auto load_config(const std::filesystem::path& path) -> SyncConfig;

void to_json(nlohmann::json& j, const EncryptionConfig& c);
void from_json(const nlohmann::json& j, EncryptionConfig& c);
void to_json(nlohmann::json& j, const TransferConfig& c);
void from_json(const nlohmann::json& j, TransferConfig& c);
void to_json(nlohmann::json& j, const QueueConfig& c);
void from_json(const nlohmann::json& j, QueueConfig& c);
void to_json(nlohmann::json& j, const SyncConfig& c);
void from_json(const nlohmann::json& j, SyncConfig& c);

}  // namespace peersync
