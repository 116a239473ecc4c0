#include <peersync/error.hpp>
#include <peersync/transfer.hpp>

#include "../log.hpp"

#include <fstream>
#include <utility>

namespace peersync {

using json = nlohmann::json;

namespace {

auto parse_direction(const std::string& s) -> TransferDirection {
    if (s == "upload") return TransferDirection::upload;
    if (s == "download") return TransferDirection::download;
    throw SyncError{ErrorKind::decoding_error, "unknown transfer direction: " + s};
}

auto parse_status(const std::string& s) -> TransferStatus {
    for (auto status : {TransferStatus::pending, TransferStatus::active, TransferStatus::paused,
                        TransferStatus::completed, TransferStatus::failed}) {
        if (to_string_view(status) == s) return status;
    }
    throw SyncError{ErrorKind::decoding_error, "unknown transfer status: " + s};
}

}  // namespace

// -- JSON ---------------------------------------------------------------------

void to_json(json& j, const TransferState& s) {
    j = json{
        {"id", s.id},
        {"itemId", s.item_id},
        {"direction", to_string_view(s.direction)},
        {"totalSize", s.total_size},
        {"transferredBytes", s.transferred_bytes},
        {"completedChunks", s.completed_chunks},
        {"totalChunks", s.total_chunks},
        {"chunkSize", s.chunk_size},
        {"compressed", s.compressed},
        {"status", to_string_view(s.status)},
        {"contentHash", s.content_hash},
        {"startedAt", s.started_at},
        {"lastActivityAt", s.last_activity_at},
    };
    if (s.error) j["error"] = *s.error;
}

void from_json(const json& j, TransferState& s) {
    s.id = j.at("id").get<std::string>();
    s.item_id = j.at("itemId").get<std::string>();
    s.direction = parse_direction(j.at("direction").get<std::string>());
    s.total_size = j.at("totalSize").get<std::size_t>();
    s.transferred_bytes = j.value("transferredBytes", std::size_t{0});
    s.completed_chunks = j.value("completedChunks", std::set<std::uint32_t>{});
    s.total_chunks = j.at("totalChunks").get<std::uint32_t>();
    s.chunk_size = j.value("chunkSize", std::size_t{0});
    s.compressed = j.value("compressed", false);
    s.status = parse_status(j.at("status").get<std::string>());
    s.content_hash = j.value("contentHash", std::string{});
    s.started_at = j.value("startedAt", Timestamp{0});
    s.last_activity_at = j.value("lastActivityAt", Timestamp{0});
    if (auto it = j.find("error"); it != j.end() && it->is_string()) {
        s.error = it->get<std::string>();
    } else {
        s.error.reset();
    }
}

// -- TransferStateManager -----------------------------------------------------

TransferStateManager::TransferStateManager(std::filesystem::path persist_path)
    : persist_path_{std::move(persist_path)} {
    load();
}

auto TransferStateManager::create(const std::string& item_id, TransferDirection direction,
                                  std::size_t total_size, std::uint32_t total_chunks,
                                  std::size_t chunk_size, bool compressed,
                                  const std::string& content_hash) -> TransferState {
    const auto now = now_millis();
    auto state = TransferState{
        .id = std::string{to_string_view(direction)} + "-" + item_id + "-" +
              std::to_string(now) + "-" + random_hex(4),
        .item_id = item_id,
        .direction = direction,
        .total_size = total_size,
        .transferred_bytes = 0,
        .completed_chunks = {},
        .total_chunks = total_chunks,
        .chunk_size = chunk_size,
        .compressed = compressed,
        .status = TransferStatus::pending,
        .content_hash = content_hash,
        .error = std::nullopt,
        .started_at = now,
        .last_activity_at = now,
    };

    auto lock = std::scoped_lock{mutex_};
    states_.emplace(state.id, state);
    persist();
    return state;
}

auto TransferStateManager::get(const std::string& id) const -> std::optional<TransferState> {
    auto lock = std::scoped_lock{mutex_};
    auto it = states_.find(id);
    if (it == states_.end()) return std::nullopt;
    return it->second;
}

template <typename Fn>
void TransferStateManager::mutate(const std::string& id, Fn&& fn) {
    auto lock = std::scoped_lock{mutex_};
    auto it = states_.find(id);
    if (it == states_.end()) return;
    fn(it->second);
    it->second.last_activity_at = now_millis();
    persist();
}

void TransferStateManager::start(const std::string& id) {
    mutate(id, [](TransferState& s) { s.status = TransferStatus::active; });
}

void TransferStateManager::record_chunk(const std::string& id, std::uint32_t index,
                                        std::size_t bytes) {
    mutate(id, [&](TransferState& s) {
        if (s.completed_chunks.insert(index).second) {
            s.transferred_bytes += bytes;
        }
        // A pause or abort that raced this chunk keeps its status.
        if (s.status == TransferStatus::pending) s.status = TransferStatus::active;
    });
}

void TransferStateManager::complete(const std::string& id) {
    mutate(id, [](TransferState& s) {
        s.status = TransferStatus::completed;
        s.error.reset();
    });
}

void TransferStateManager::fail(const std::string& id, const std::string& error) {
    mutate(id, [&](TransferState& s) {
        s.status = TransferStatus::failed;
        s.error = error;
    });
}

void TransferStateManager::pause(const std::string& id) {
    mutate(id, [](TransferState& s) { s.status = TransferStatus::paused; });
}

auto TransferStateManager::resume(const std::string& id) -> bool {
    auto resumed = false;
    mutate(id, [&](TransferState& s) {
        if (s.status != TransferStatus::paused && s.status != TransferStatus::failed) return;
        s.status = TransferStatus::active;
        s.error.reset();
        resumed = true;
    });
    return resumed;
}

auto TransferStateManager::missing_chunks(const std::string& id) const
    -> std::vector<std::uint32_t> {
    auto lock = std::scoped_lock{mutex_};
    auto result = std::vector<std::uint32_t>{};
    auto it = states_.find(id);
    if (it == states_.end()) return result;
    for (std::uint32_t i = 0; i < it->second.total_chunks; ++i) {
        if (!it->second.completed_chunks.contains(i)) result.push_back(i);
    }
    return result;
}

auto TransferStateManager::can_resume(const std::string& id) const -> bool {
    auto lock = std::scoped_lock{mutex_};
    auto it = states_.find(id);
    return it != states_.end() &&
           (it->second.status == TransferStatus::paused ||
            it->second.status == TransferStatus::failed);
}

void TransferStateManager::remove(const std::string& id) {
    auto lock = std::scoped_lock{mutex_};
    if (states_.erase(id) > 0) persist();
}

auto TransferStateManager::active() const -> std::vector<TransferState> {
    auto lock = std::scoped_lock{mutex_};
    auto result = std::vector<TransferState>{};
    for (const auto& [id, s] : states_) {
        if (s.status == TransferStatus::active || s.status == TransferStatus::pending) {
            result.push_back(s);
        }
    }
    return result;
}

auto TransferStateManager::for_item(const std::string& item_id) const
    -> std::vector<TransferState> {
    auto lock = std::scoped_lock{mutex_};
    auto result = std::vector<TransferState>{};
    for (const auto& [id, s] : states_) {
        if (s.item_id == item_id) result.push_back(s);
    }
    return result;
}

void TransferStateManager::clear_completed() {
    auto lock = std::scoped_lock{mutex_};
    std::erase_if(states_, [](const auto& entry) {
        return entry.second.status == TransferStatus::completed;
    });
    persist();
}

void TransferStateManager::clear_all() {
    auto lock = std::scoped_lock{mutex_};
    states_.clear();
    persist();
}

// -- Persistence --------------------------------------------------------------

void TransferStateManager::load() {
    if (!persist_path_ || !std::filesystem::exists(*persist_path_)) return;

    auto in = std::ifstream{*persist_path_};
    auto j = json::parse(in, nullptr, false);
    if (j.is_discarded() || !j.contains("transfers")) {
        logging::warn("ignoring unreadable transfer state file {}", persist_path_->string());
        return;
    }

    try {
        for (const auto& entry : j.at("transfers")) {
            auto state = entry.get<TransferState>();
            // Anything in flight when the state was written was interrupted.
            if (state.status == TransferStatus::active || state.status == TransferStatus::pending) {
                state.status = TransferStatus::paused;
            }
            states_.insert_or_assign(state.id, std::move(state));
        }
    } catch (const std::exception& e) {
        logging::warn("ignoring malformed transfer state file {}: {}",
                      persist_path_->string(), e.what());
        states_.clear();
    }
}

// Called with mutex_ held.
void TransferStateManager::persist() const {
    if (!persist_path_) return;

    auto transfers = json::array();
    for (const auto& [id, s] : states_) transfers.push_back(s);

    auto tmp = *persist_path_;
    tmp += ".tmp";
    {
        auto out = std::ofstream{tmp, std::ios::trunc};
        if (!out) {
            logging::error("cannot write transfer state file {}", tmp.string());
            return;
        }
        out << json{{"transfers", std::move(transfers)}}.dump(2);
    }
    auto ec = std::error_code{};
    std::filesystem::rename(tmp, *persist_path_, ec);
    if (ec) {
        logging::error("cannot replace transfer state file {}: {}",
                       persist_path_->string(), ec.message());
    }
}

}  // namespace peersync
