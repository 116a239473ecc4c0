/// @file storage.hpp
/// @brief Local and remote item stores, with in-memory implementations.

#pragma once

#include <peersync/sync_item.hpp>
#include <peersync/types.hpp>

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace peersync {

/// The node's own item storage. Saving an existing id overwrites it.
/// Implementations report failure by throwing SyncError (storage_error).
class LocalStore {
public:
    virtual ~LocalStore() = default;

    virtual auto get(const std::string& id) -> std::optional<SyncItem> = 0;
    virtual auto get_all(const ItemType& type) -> std::vector<SyncItem> = 0;
    virtual void save(const SyncItem& item) = 0;
    virtual void remove(const std::string& id) = 0;

    /// Ids of all items, or of the items of one type.
    virtual auto list(const std::optional<ItemType>& type = std::nullopt)
        -> std::vector<std::string> = 0;

    virtual auto has(const std::string& id) -> bool = 0;
};

/// A shared remote holding item metadata records and body chunks.
/// Implementations report failure by throwing SyncError (storage_error).
class RemoteStore {
public:
    virtual ~RemoteStore() = default;

    virtual void connect() = 0;
    virtual void disconnect() = 0;
    virtual auto test_connection() -> bool = 0;

    virtual void upload_chunk(const std::string& item_id, std::uint32_t index, Bytes chunk) = 0;
    virtual auto download_chunk(const std::string& item_id, std::uint32_t index) -> Bytes = 0;

    virtual void upload_metadata(const std::string& item_id, const SyncItem& item) = 0;
    virtual auto download_metadata(const std::string& item_id) -> std::optional<SyncItem> = 0;

    /// Metadata records of all items, or of the items of one type.
    virtual auto list(const std::optional<ItemType>& type = std::nullopt)
        -> std::vector<SyncItem> = 0;

    /// Delete an item's metadata and chunks.
    virtual void remove(const std::string& item_id) = 0;
};

/// Thread-safe in-memory LocalStore.
class MemoryStore : public LocalStore {
public:
    auto get(const std::string& id) -> std::optional<SyncItem> override;
    auto get_all(const ItemType& type) -> std::vector<SyncItem> override;
    void save(const SyncItem& item) override;
    void remove(const std::string& id) override;
    auto list(const std::optional<ItemType>& type = std::nullopt)
        -> std::vector<std::string> override;
    auto has(const std::string& id) -> bool override;

    auto size() const -> std::size_t;

private:
    mutable std::mutex mutex_;
    std::map<std::string, SyncItem> items_;
};

/// Thread-safe in-memory RemoteStore.
///
/// Several engines may share one instance to simulate peers meeting at a
/// common remote. Chunk and metadata calls throw SyncError (storage_error)
/// while disconnected.
class MemoryRemote : public RemoteStore {
public:
    /// Starts connected.
    MemoryRemote() = default;

    void connect() override;
    void disconnect() override;
    auto test_connection() -> bool override;

    void upload_chunk(const std::string& item_id, std::uint32_t index, Bytes chunk) override;
    auto download_chunk(const std::string& item_id, std::uint32_t index) -> Bytes override;

    void upload_metadata(const std::string& item_id, const SyncItem& item) override;
    auto download_metadata(const std::string& item_id) -> std::optional<SyncItem> override;

    auto list(const std::optional<ItemType>& type = std::nullopt)
        -> std::vector<SyncItem> override;

    void remove(const std::string& item_id) override;

    /// Number of chunks stored for an item.
    auto chunk_count(const std::string& item_id) const -> std::size_t;

    /// Total number of chunk uploads received, including overwrites.
    auto chunk_uploads() const -> std::size_t;

private:
    void require_connected() const;

    mutable std::mutex mutex_;
    bool connected_ = true;
    std::map<std::string, SyncItem> metadata_;
    std::map<std::pair<std::string, std::uint32_t>, Bytes> chunks_;
    std::size_t chunk_uploads_ = 0;
};

}  // namespace peersync
