/// @file transfer.hpp
/// @brief Chunked, resumable, verifiable payload transfer.

#pragma once

#include <peersync/config.hpp>
#include <peersync/thread_pool.hpp>
#include <peersync/types.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <span>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace peersync {

namespace transfer {
class BandwidthLimiter;
}  // namespace transfer

// =============================================================================
// Transfer state
// =============================================================================

enum class TransferDirection : std::uint8_t {
    upload,
    download,
};

constexpr auto to_string_view(TransferDirection d) noexcept -> std::string_view {
    switch (d) {
        case TransferDirection::upload:   return "upload";
        case TransferDirection::download: return "download";
    }
    return "unknown";
}

/// Lifecycle of a transfer:
/// pending -> active -> {completed | failed | paused};
/// paused | failed -> active through an explicit resume.
enum class TransferStatus : std::uint8_t {
    pending,
    active,
    paused,
    completed,
    failed,
};

constexpr auto to_string_view(TransferStatus s) noexcept -> std::string_view {
    switch (s) {
        case TransferStatus::pending:   return "pending";
        case TransferStatus::active:    return "active";
        case TransferStatus::paused:    return "paused";
        case TransferStatus::completed: return "completed";
        case TransferStatus::failed:    return "failed";
    }
    return "unknown";
}

/// Bookkeeping of one transfer. Callers always receive copies.
struct TransferState {
    std::string id;
    std::string item_id;
    TransferDirection direction = TransferDirection::upload;
    std::size_t total_size = 0;
    std::size_t transferred_bytes = 0;
    std::set<std::uint32_t> completed_chunks;
    std::uint32_t total_chunks = 0;
    std::size_t chunk_size = 0;
    bool compressed = false;
    TransferStatus status = TransferStatus::pending;
    std::string content_hash;
    std::optional<std::string> error;
    Timestamp started_at = 0;
    Timestamp last_activity_at = 0;

    auto operator==(const TransferState&) const -> bool = default;
};

void to_json(nlohmann::json& j, const TransferState& s);
void from_json(const nlohmann::json& j, TransferState& s);

/// Owns every TransferState of an engine.
///
/// All operations are thread-safe. When constructed with a path, every
/// change is written to that file and the file is reloaded on construction;
/// transfers that were pending or active at load time become paused.
class TransferStateManager {
public:
    TransferStateManager() = default;
    explicit TransferStateManager(std::filesystem::path persist_path);

    TransferStateManager(const TransferStateManager&) = delete;
    auto operator=(const TransferStateManager&) -> TransferStateManager& = delete;

    /// Register a new pending transfer with id `<direction>-<item>-<millis>-<hex>`.
    auto create(const std::string& item_id, TransferDirection direction,
                std::size_t total_size, std::uint32_t total_chunks,
                std::size_t chunk_size, bool compressed,
                const std::string& content_hash) -> TransferState;

    auto get(const std::string& id) const -> std::optional<TransferState>;

    /// Mark the transfer active.
    void start(const std::string& id);

    /// Record a completed chunk of `bytes` bytes and mark the transfer active.
    /// Recording the same chunk twice is a no-op.
    void record_chunk(const std::string& id, std::uint32_t index, std::size_t bytes);

    void complete(const std::string& id);
    void fail(const std::string& id, const std::string& error);
    void pause(const std::string& id);

    /// Move a paused or failed transfer back to active, clearing its error.
    /// @return false if the transfer cannot be resumed.
    auto resume(const std::string& id) -> bool;

    /// `[0, total_chunks) \ completed_chunks` in ascending order.
    auto missing_chunks(const std::string& id) const -> std::vector<std::uint32_t>;

    /// True iff the transfer is paused or failed.
    auto can_resume(const std::string& id) const -> bool;

    void remove(const std::string& id);

    /// Transfers that are pending or active.
    auto active() const -> std::vector<TransferState>;

    auto for_item(const std::string& item_id) const -> std::vector<TransferState>;

    void clear_completed();
    void clear_all();

private:
    template <typename Fn>
    void mutate(const std::string& id, Fn&& fn);

    void load();
    void persist() const;

    mutable std::mutex mutex_;
    std::map<std::string, TransferState> states_;
    std::optional<std::filesystem::path> persist_path_;
};

// =============================================================================
// Chunks and handlers
// =============================================================================

/// Position and checksum of one chunk within a payload.
struct ChunkMetadata {
    std::uint32_t index = 0;
    std::uint32_t total = 0;
    std::size_t size = 0;       ///< Uncompressed size.
    std::string hash;           ///< SHA-256 hex of the uncompressed bytes.
    std::size_t offset = 0;

    auto operator==(const ChunkMetadata&) const -> bool = default;
};

/// Split a payload into chunk descriptors. An empty payload has no chunks.
auto chunk_metadata(std::span<const std::byte> data, std::size_t chunk_size)
    -> std::vector<ChunkMetadata>;

/// True iff the SHA-256 hex of `chunk` equals `expected_hash`.
auto verify_chunk(std::span<const std::byte> chunk, std::string_view expected_hash) -> bool;

/// SHA-256 hex digest of a whole payload.
auto payload_hash(std::span<const std::byte> data) -> std::string;

/// Passed to every chunk handler call.
///
/// Every attempt runs on its own thread. `stop` is requested when the
/// transfer is stopped or when `deadline` passes; an attempt still running
/// at the deadline counts as timed out and is abandoned: it keeps running
/// detached and its result is discarded. Handlers should return promptly
/// once `stop` is requested, and the engine copies a handler for every
/// attempt, so whatever a handler captures must outlive an abandoned call.
struct ChunkContext {
    std::string transfer_id;
    std::stop_token stop;
    std::chrono::steady_clock::time_point deadline;
};

/// Send one chunk. Report failure by throwing.
using UploadHandler = std::function<void(std::span<const std::byte> chunk,
                                         const ChunkMetadata& meta,
                                         const ChunkContext& ctx)>;

/// Fetch one chunk by index. Report failure by throwing.
using DownloadHandler = std::function<Bytes(std::uint32_t index, const ChunkContext& ctx)>;

/// Progress of one transfer, reported after every completed chunk.
struct TransferProgress {
    std::string transfer_id;
    std::string item_id;
    TransferDirection direction = TransferDirection::upload;
    std::size_t bytes_transferred = 0;
    std::size_t total_bytes = 0;
    int percentage = 0;
    double speed = 0.0;                 ///< Bytes per second since this run started.
    std::chrono::milliseconds eta{0};   ///< Remaining time at `speed`; 0 if unknown.
    std::uint32_t current_chunk = 0;
    std::uint32_t total_chunks = 0;
};

using ProgressCallback = std::function<void(const TransferProgress&)>;

/// What a download needs to know about the payload it fetches.
struct DownloadSpec {
    std::string item_id;
    std::size_t total_size = 0;
    std::uint32_t total_chunks = 0;
    std::string content_hash;
    bool compressed = true;     ///< Whether the stored chunks are deflated.
};

// =============================================================================
// TransferEngine
// =============================================================================

/// Moves payloads as independently retried, hashed chunks.
///
/// Chunk work runs on a thread_pool with at most `max_concurrent` chunks in
/// flight per transfer; without a pool, chunks run one after another on the
/// calling thread. Every transfer owns a stop source so it can be aborted
/// or paused from another thread.
///
/// @code
/// auto engine = peersync::TransferEngine{};
/// auto state = engine.upload(bytes, "item-1",
///     [&](auto chunk, const auto& meta, const auto&) {
///         remote.upload_chunk("item-1", meta.index, {chunk.begin(), chunk.end()});
///     });
/// @endcode
class TransferEngine {
public:
    /// Engine with its own pool of `max_concurrent` workers (none if 1).
    explicit TransferEngine(TransferConfig config = {});

    /// Engine using a shared pool. A null pool runs chunks sequentially.
    TransferEngine(TransferConfig config, std::shared_ptr<thread_pool> pool);

    ~TransferEngine();

    TransferEngine(const TransferEngine&) = delete;
    auto operator=(const TransferEngine&) -> TransferEngine& = delete;

    /// Upload a payload in chunks.
    /// @return The completed transfer state.
    /// @throws TransferError if a chunk exhausts its retries or the
    ///         transfer is aborted or paused.
    auto upload(std::span<const std::byte> payload, const std::string& item_id,
                const UploadHandler& upload_chunk,
                const ProgressCallback& on_progress = {}) -> TransferState;

    /// Download and reassemble a payload, verifying its hash when
    /// `verify_integrity` is on.
    /// @throws TransferError on chunk failure, abort or integrity mismatch.
    auto download(const DownloadSpec& spec, const DownloadHandler& download_chunk,
                  const ProgressCallback& on_progress = {}) -> Bytes;

    /// Re-send only the chunks a paused or failed upload is missing.
    /// @throws TransferError if the transfer is unknown or not resumable,
    ///         or if the resumed run fails.
    auto resume_upload(const std::string& transfer_id, std::span<const std::byte> payload,
                       const UploadHandler& upload_chunk,
                       const ProgressCallback& on_progress = {}) -> TransferState;

    /// Cancel a transfer; it ends failed with "aborted by user".
    void abort_transfer(const std::string& transfer_id);

    /// Stop a transfer and leave it paused (resumable).
    void pause_transfer(const std::string& transfer_id);

    auto transfer_state(const std::string& transfer_id) const -> std::optional<TransferState>;
    auto active_transfers() const -> std::vector<TransferState>;
    auto transfers_for_item(const std::string& item_id) const -> std::vector<TransferState>;
    void clear_completed();

    auto config() const -> TransferConfig;
    void update_config(const TransferConfig& config);

    auto state_manager() -> TransferStateManager& { return *states_; }
    auto pool() const -> std::shared_ptr<thread_pool> { return pool_; }

private:
    struct Run;

    auto run_upload(const TransferState& state, std::span<const std::byte> payload,
                    const std::vector<std::uint32_t>& indices,
                    const UploadHandler& upload_chunk,
                    const ProgressCallback& on_progress) -> TransferState;

    void run_chunks(Run& run, const std::vector<std::uint32_t>& indices,
                    const std::function<void(std::uint32_t)>& task);

    using ChunkAttempt = std::function<Bytes(const ChunkContext&)>;

    struct AttemptOutcome {
        Bytes data;
        bool timed_out = false;
        std::exception_ptr error;
    };

    auto run_attempt(Run& run, const ChunkAttempt& attempt,
                     std::chrono::milliseconds timeout) -> AttemptOutcome;
    auto with_retry(Run& run, std::uint32_t index, const ChunkAttempt& attempt) -> Bytes;

    void throttle(Run& run, std::size_t bytes);
    void report(Run& run, std::uint32_t index, const ProgressCallback& on_progress);

    auto begin_run(const TransferState& state) -> std::shared_ptr<Run>;
    void end_run(const std::string& transfer_id);
    void finish_run(Run& run);

    mutable std::mutex config_mutex_;
    TransferConfig config_;
    std::shared_ptr<thread_pool> pool_;
    std::unique_ptr<TransferStateManager> states_;
    std::unique_ptr<transfer::BandwidthLimiter> limiter_;

    std::mutex runs_mutex_;
    std::map<std::string, std::shared_ptr<Run>> runs_;
};

}  // namespace peersync
