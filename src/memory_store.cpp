#include <peersync/error.hpp>
#include <peersync/storage.hpp>

namespace peersync {

// -- MemoryStore --------------------------------------------------------------

auto MemoryStore::get(const std::string& id) -> std::optional<SyncItem> {
    auto lock = std::scoped_lock{mutex_};
    auto it = items_.find(id);
    if (it == items_.end()) return std::nullopt;
    return it->second;
}

auto MemoryStore::get_all(const ItemType& type) -> std::vector<SyncItem> {
    auto lock = std::scoped_lock{mutex_};
    auto result = std::vector<SyncItem>{};
    for (const auto& [id, item] : items_) {
        if (item.type == type) result.push_back(item);
    }
    return result;
}

void MemoryStore::save(const SyncItem& item) {
    if (item.id.empty()) {
        throw SyncError{ErrorKind::storage_error, "cannot save an item without an id"};
    }
    auto lock = std::scoped_lock{mutex_};
    items_.insert_or_assign(item.id, item);
}

void MemoryStore::remove(const std::string& id) {
    auto lock = std::scoped_lock{mutex_};
    items_.erase(id);
}

auto MemoryStore::list(const std::optional<ItemType>& type) -> std::vector<std::string> {
    auto lock = std::scoped_lock{mutex_};
    auto result = std::vector<std::string>{};
    for (const auto& [id, item] : items_) {
        if (!type || item.type == *type) result.push_back(id);
    }
    return result;
}

auto MemoryStore::has(const std::string& id) -> bool {
    auto lock = std::scoped_lock{mutex_};
    return items_.contains(id);
}

auto MemoryStore::size() const -> std::size_t {
    auto lock = std::scoped_lock{mutex_};
    return items_.size();
}

// -- MemoryRemote -------------------------------------------------------------

void MemoryRemote::connect() {
    auto lock = std::scoped_lock{mutex_};
    connected_ = true;
}

void MemoryRemote::disconnect() {
    auto lock = std::scoped_lock{mutex_};
    connected_ = false;
}

auto MemoryRemote::test_connection() -> bool {
    auto lock = std::scoped_lock{mutex_};
    return connected_;
}

// Called with mutex_ held.
void MemoryRemote::require_connected() const {
    if (!connected_) throw SyncError{ErrorKind::storage_error, "remote store is disconnected"};
}

void MemoryRemote::upload_chunk(const std::string& item_id, std::uint32_t index, Bytes chunk) {
    auto lock = std::scoped_lock{mutex_};
    require_connected();
    chunks_.insert_or_assign(std::pair{item_id, index}, std::move(chunk));
    ++chunk_uploads_;
}

auto MemoryRemote::download_chunk(const std::string& item_id, std::uint32_t index) -> Bytes {
    auto lock = std::scoped_lock{mutex_};
    require_connected();
    auto it = chunks_.find(std::pair{item_id, index});
    if (it == chunks_.end()) {
        throw SyncError{ErrorKind::storage_error,
                        "no chunk " + std::to_string(index) + " for item " + item_id};
    }
    return it->second;
}

void MemoryRemote::upload_metadata(const std::string& item_id, const SyncItem& item) {
    auto lock = std::scoped_lock{mutex_};
    require_connected();
    metadata_.insert_or_assign(item_id, item);
}

auto MemoryRemote::download_metadata(const std::string& item_id) -> std::optional<SyncItem> {
    auto lock = std::scoped_lock{mutex_};
    require_connected();
    auto it = metadata_.find(item_id);
    if (it == metadata_.end()) return std::nullopt;
    return it->second;
}

auto MemoryRemote::list(const std::optional<ItemType>& type) -> std::vector<SyncItem> {
    auto lock = std::scoped_lock{mutex_};
    require_connected();
    auto result = std::vector<SyncItem>{};
    for (const auto& [id, item] : metadata_) {
        if (!type || item.type == *type) result.push_back(item);
    }
    return result;
}

void MemoryRemote::remove(const std::string& item_id) {
    auto lock = std::scoped_lock{mutex_};
    require_connected();
    metadata_.erase(item_id);
    std::erase_if(chunks_, [&](const auto& entry) { return entry.first.first == item_id; });
}

auto MemoryRemote::chunk_count(const std::string& item_id) const -> std::size_t {
    auto lock = std::scoped_lock{mutex_};
    auto count = std::size_t{0};
    for (const auto& [key, bytes] : chunks_) {
        if (key.first == item_id) ++count;
    }
    return count;
}

auto MemoryRemote::chunk_uploads() const -> std::size_t {
    auto lock = std::scoped_lock{mutex_};
    return chunk_uploads_;
}

}  // namespace peersync
