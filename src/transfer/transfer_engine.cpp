#include <peersync/error.hpp>
#include <peersync/transfer.hpp>

#include "../crypto/sha256.hpp"
#include "../log.hpp"
#include "bandwidth_limiter.hpp"
#include "compression.hpp"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <exception>
#include <future>
#include <thread>
#include <utility>

namespace peersync {

// -- Chunk helpers ------------------------------------------------------------

auto chunk_metadata(std::span<const std::byte> data, std::size_t chunk_size)
    -> std::vector<ChunkMetadata> {
    if (chunk_size == 0) {
        throw SyncError{ErrorKind::invalid_argument, "chunk size must be positive"};
    }
    const auto total = static_cast<std::uint32_t>((data.size() + chunk_size - 1) / chunk_size);
    auto result = std::vector<ChunkMetadata>{};
    result.reserve(total);
    for (std::uint32_t i = 0; i < total; ++i) {
        const auto offset = static_cast<std::size_t>(i) * chunk_size;
        const auto chunk = data.subspan(offset, std::min(chunk_size, data.size() - offset));
        result.push_back(ChunkMetadata{
            .index = i,
            .total = total,
            .size = chunk.size(),
            .hash = crypto::sha256_hex(chunk),
            .offset = offset,
        });
    }
    return result;
}

auto verify_chunk(std::span<const std::byte> chunk, std::string_view expected_hash) -> bool {
    return crypto::sha256_hex(chunk) == expected_hash;
}

auto payload_hash(std::span<const std::byte> data) -> std::string {
    return crypto::sha256_hex(data);
}

// -- Run ----------------------------------------------------------------------

// One execution of a transfer: the stop source shared by its chunk tasks,
// the first chunk failure, and why the run was stopped.
struct TransferEngine::Run {
    std::string transfer_id;
    std::string item_id;
    TransferDirection direction = TransferDirection::upload;
    std::size_t total_size = 0;
    std::uint32_t total_chunks = 0;
    std::size_t bytes_at_start = 0;     // already transferred by an earlier run
    std::chrono::steady_clock::time_point started = std::chrono::steady_clock::now();

    std::stop_source stop;
    std::atomic<bool> aborted{false};
    std::atomic<bool> paused{false};

    std::mutex mutex;                 // guards error and serializes progress
    std::exception_ptr error;

    std::mutex sleep_mutex;
    std::condition_variable_any sleep_cv;

    void set_error(std::exception_ptr e) {
        {
            auto lock = std::scoped_lock{mutex};
            if (!error) error = std::move(e);
        }
        stop.request_stop();
    }

    // Sleep unless stopped first. Returns false if the run was stopped.
    auto sleep_for(std::chrono::milliseconds delay) -> bool {
        if (delay.count() <= 0) return !stop.stop_requested();
        auto lock = std::unique_lock{sleep_mutex};
        auto token = stop.get_token();
        sleep_cv.wait_for(lock, token, delay, [] { return false; });
        return !token.stop_requested();
    }
};

// -- TransferEngine -----------------------------------------------------------

namespace {

auto make_pool(std::size_t max_concurrent) -> std::shared_ptr<thread_pool> {
    if (max_concurrent <= 1) return nullptr;
    return std::make_shared<thread_pool>(static_cast<unsigned int>(max_concurrent));
}

auto make_state_manager(const TransferConfig& config) -> std::unique_ptr<TransferStateManager> {
    if (config.state_path) return std::make_unique<TransferStateManager>(*config.state_path);
    return std::make_unique<TransferStateManager>();
}

auto percent_of(std::size_t done, std::size_t total) -> int {
    if (total == 0) return 100;
    return static_cast<int>((done * 100 + total / 2) / total);
}

}  // namespace

TransferEngine::TransferEngine(TransferConfig config)
    : TransferEngine{config, make_pool(config.max_concurrent)} {}

TransferEngine::TransferEngine(TransferConfig config, std::shared_ptr<thread_pool> pool)
    : config_{std::move(config)},
      pool_{std::move(pool)},
      states_{make_state_manager(config_)},
      limiter_{std::make_unique<transfer::BandwidthLimiter>(config_.bandwidth_limit)} {}

TransferEngine::~TransferEngine() {
    auto lock = std::scoped_lock{runs_mutex_};
    for (auto& [id, run] : runs_) {
        run->stop.request_stop();
        run->sleep_cv.notify_all();
    }
}

auto TransferEngine::config() const -> TransferConfig {
    auto lock = std::scoped_lock{config_mutex_};
    return config_;
}

void TransferEngine::update_config(const TransferConfig& config) {
    auto lock = std::scoped_lock{config_mutex_};
    config_ = config;
    limiter_->set_limit(config.bandwidth_limit);
}

auto TransferEngine::transfer_state(const std::string& transfer_id) const
    -> std::optional<TransferState> {
    return states_->get(transfer_id);
}

auto TransferEngine::active_transfers() const -> std::vector<TransferState> {
    return states_->active();
}

auto TransferEngine::transfers_for_item(const std::string& item_id) const
    -> std::vector<TransferState> {
    return states_->for_item(item_id);
}

void TransferEngine::clear_completed() {
    states_->clear_completed();
}

// -- Run bookkeeping ----------------------------------------------------------

auto TransferEngine::begin_run(const TransferState& state) -> std::shared_ptr<Run> {
    auto run = std::make_shared<Run>();
    run->transfer_id = state.id;
    run->item_id = state.item_id;
    run->direction = state.direction;
    run->total_size = state.total_size;
    run->total_chunks = state.total_chunks;
    run->bytes_at_start = state.transferred_bytes;

    auto lock = std::scoped_lock{runs_mutex_};
    runs_.insert_or_assign(state.id, run);
    states_->start(state.id);
    return run;
}

void TransferEngine::end_run(const std::string& transfer_id) {
    auto lock = std::scoped_lock{runs_mutex_};
    runs_.erase(transfer_id);
}

// Settle the state of a run whose chunk tasks have all returned, throwing
// if the run did not succeed.
void TransferEngine::finish_run(Run& run) {
    const auto& id = run.transfer_id;

    if (run.aborted) {
        states_->fail(id, "aborted by user");
        logging::info("transfer {} aborted", id);
        throw TransferError{ErrorKind::aborted, "transfer " + id + " aborted by user", id};
    }
    if (run.paused) {
        states_->pause(id);
        logging::info("transfer {} paused", id);
        throw TransferError{ErrorKind::aborted, "transfer " + id + " paused", id};
    }
    if (run.error) {
        try {
            std::rethrow_exception(run.error);
        } catch (const TransferError& e) {
            states_->fail(id, e.what());
            logging::error("transfer {} failed: {}", id, e.what());
            throw;
        } catch (const std::exception& e) {
            states_->fail(id, e.what());
            logging::error("transfer {} failed: {}", id, e.what());
            throw TransferError{ErrorKind::transfer_failed, e.what(), id};
        } catch (...) {
            states_->fail(id, "unknown error");
            logging::error("transfer {} failed with a non-standard exception", id);
            throw TransferError{ErrorKind::transfer_failed, "unknown error", id};
        }
    }
    if (run.stop.stop_requested()) {
        states_->fail(id, "transfer stopped");
        throw TransferError{ErrorKind::aborted, "transfer " + id + " stopped", id};
    }
}

// -- Chunk execution ----------------------------------------------------------

void TransferEngine::run_chunks(Run& run, const std::vector<std::uint32_t>& indices,
                                const std::function<void(std::uint32_t)>& task) {
    auto guarded = [&run, &task](std::uint32_t index) {
        if (run.stop.stop_requested()) return;
        try {
            task(index);
        } catch (...) {
            run.set_error(std::current_exception());
        }
    };

    const auto window = std::max<std::size_t>(config().max_concurrent, 1);
    if (!pool_ || window == 1) {
        for (auto index : indices) {
            if (run.stop.stop_requested()) break;
            guarded(index);
        }
        return;
    }

    // Sliding window: never more than `window` chunks submitted and unfinished.
    auto in_flight = std::deque<std::future<void>>{};
    for (auto index : indices) {
        if (run.stop.stop_requested()) break;
        if (in_flight.size() >= window) {
            in_flight.front().get();
            in_flight.pop_front();
        }
        in_flight.push_back(pool_->submit([&guarded, index] { guarded(index); }));
    }
    for (auto& f : in_flight) f.get();
}

namespace {

auto describe(const std::exception_ptr& error) -> std::string {
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "unknown error";
    }
}

}  // namespace

// Run one attempt on its own thread and wait for it until the deadline. The
// attempt's stop token is requested at the deadline or when the run stops;
// an attempt still running at the deadline is abandoned and its result
// discarded. `attempt` must own everything it touches.
auto TransferEngine::run_attempt(Run& run, const ChunkAttempt& attempt,
                                 std::chrono::milliseconds timeout) -> AttemptOutcome {
    auto attempt_stop = std::stop_source{};
    const auto link = std::stop_callback{run.stop.get_token(),
                                         [&attempt_stop] { attempt_stop.request_stop(); }};
    const auto ctx = ChunkContext{
        .transfer_id = run.transfer_id,
        .stop = attempt_stop.get_token(),
        .deadline = std::chrono::steady_clock::now() + timeout,
    };

    auto promise = std::make_shared<std::promise<Bytes>>();
    auto future = promise->get_future();
    std::thread{[promise, attempt, ctx] {
        try {
            promise->set_value(attempt(ctx));
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
    }}.detach();

    if (future.wait_until(ctx.deadline) == std::future_status::timeout) {
        attempt_stop.request_stop();
        return AttemptOutcome{.timed_out = true};
    }
    try {
        return AttemptOutcome{.data = future.get()};
    } catch (...) {
        return AttemptOutcome{.error = std::current_exception()};
    }
}

auto TransferEngine::with_retry(Run& run, std::uint32_t index, const ChunkAttempt& attempt)
    -> Bytes {
    const auto cfg = config();
    const auto attempts = std::max<std::uint32_t>(cfg.retry_attempts, 1);
    auto last_error = std::string{};
    auto timed_out = false;

    for (std::uint32_t n = 0; n < attempts; ++n) {
        if (run.stop.stop_requested()) {
            throw TransferError{ErrorKind::aborted, "transfer stopped", run.transfer_id};
        }

        auto outcome = run_attempt(run, attempt, cfg.timeout);
        if (!outcome.timed_out && !outcome.error) return std::move(outcome.data);

        timed_out = outcome.timed_out;
        last_error = timed_out ? std::string{"operation timed out"} : describe(outcome.error);

        if (n + 1 < attempts) {
            logging::warn("transfer {} chunk {} attempt {}/{} failed: {}",
                          run.transfer_id, index, n + 1, attempts, last_error);
            if (!run.sleep_for(cfg.retry_delay * (n + 1))) {
                throw TransferError{ErrorKind::aborted, "transfer stopped", run.transfer_id};
            }
        }
    }

    throw TransferError{timed_out ? ErrorKind::timeout : ErrorKind::transfer_failed,
                        "chunk " + std::to_string(index) + " failed after " +
                        std::to_string(attempts) + " attempts: " + last_error,
                        run.transfer_id};
}

void TransferEngine::throttle(Run& run, std::size_t bytes) {
    const auto wait = limiter_->acquire(bytes);
    if (wait.count() > 0) {
        logging::debug("transfer {} throttled for {} ms", run.transfer_id, wait.count());
        run.sleep_for(wait);
    }
}

void TransferEngine::report(Run& run, std::uint32_t index, const ProgressCallback& on_progress) {
    if (!on_progress) return;
    auto state = states_->get(run.transfer_id);
    if (!state) return;

    const auto transferred = std::min(state->transferred_bytes, run.total_size);
    const auto this_run = transferred - std::min(run.bytes_at_start, transferred);
    const auto elapsed = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - run.started).count();
    const auto speed = elapsed > 0.0 ? static_cast<double>(this_run) / elapsed : 0.0;
    const auto eta = speed > 0.0
        ? std::chrono::milliseconds{static_cast<long long>(
              static_cast<double>(run.total_size - transferred) / speed * 1000.0)}
        : std::chrono::milliseconds{0};

    auto lock = std::scoped_lock{run.mutex};
    on_progress(TransferProgress{
        .transfer_id = run.transfer_id,
        .item_id = run.item_id,
        .direction = run.direction,
        .bytes_transferred = transferred,
        .total_bytes = run.total_size,
        .percentage = percent_of(state->completed_chunks.size(), run.total_chunks),
        .speed = speed,
        .eta = eta,
        .current_chunk = index,
        .total_chunks = run.total_chunks,
    });
}

// -- Upload -------------------------------------------------------------------

auto TransferEngine::upload(std::span<const std::byte> payload, const std::string& item_id,
                            const UploadHandler& upload_chunk,
                            const ProgressCallback& on_progress) -> TransferState {
    const auto cfg = config();
    if (cfg.chunk_size == 0) {
        throw SyncError{ErrorKind::invalid_argument, "chunk size must be positive"};
    }
    const auto chunks = static_cast<std::uint32_t>(
        (payload.size() + cfg.chunk_size - 1) / cfg.chunk_size);
    const auto state = states_->create(item_id, TransferDirection::upload, payload.size(),
                                       chunks, cfg.chunk_size, cfg.compression,
                                       payload_hash(payload));

    auto indices = std::vector<std::uint32_t>(chunks);
    for (std::uint32_t i = 0; i < chunks; ++i) indices[i] = i;

    logging::debug("transfer {} uploading {} bytes in {} chunks", state.id, payload.size(), chunks);
    return run_upload(state, payload, indices, upload_chunk, on_progress);
}

auto TransferEngine::resume_upload(const std::string& transfer_id,
                                   std::span<const std::byte> payload,
                                   const UploadHandler& upload_chunk,
                                   const ProgressCallback& on_progress) -> TransferState {
    auto state = states_->get(transfer_id);
    if (!state) {
        throw TransferError{ErrorKind::invalid_argument,
                            "transfer not found: " + transfer_id, transfer_id};
    }
    if (state->direction != TransferDirection::upload) {
        throw TransferError{ErrorKind::invalid_argument,
                            "transfer is not an upload: " + transfer_id, transfer_id};
    }
    if (payload.size() != state->total_size || payload_hash(payload) != state->content_hash) {
        throw TransferError{ErrorKind::integrity_error,
                            "payload does not match transfer " + transfer_id, transfer_id};
    }
    if (!states_->resume(transfer_id)) {
        throw TransferError{ErrorKind::invalid_argument,
                            "transfer cannot be resumed: " +
                            std::string{to_string_view(state->status)}, transfer_id};
    }

    const auto missing = states_->missing_chunks(transfer_id);
    logging::info("transfer {} resuming with {} of {} chunks missing",
                  transfer_id, missing.size(), state->total_chunks);
    return run_upload(*state, payload, missing, upload_chunk, on_progress);
}

auto TransferEngine::run_upload(const TransferState& state, std::span<const std::byte> payload,
                                const std::vector<std::uint32_t>& indices,
                                const UploadHandler& upload_chunk,
                                const ProgressCallback& on_progress) -> TransferState {
    const auto metas = chunk_metadata(payload, state.chunk_size);
    const auto level = config().compression_level;

    auto run = begin_run(state);
    run_chunks(*run, indices, [&](std::uint32_t index) {
        const auto& meta = metas.at(index);
        const auto chunk = payload.subspan(meta.offset, meta.size);

        auto deflated = Bytes{};
        auto wire = chunk;
        if (state.compressed) {
            auto compressed = transfer::deflate_compress(chunk, level);
            if (!compressed) {
                throw TransferError{ErrorKind::transfer_failed,
                                    "failed to compress chunk " + std::to_string(index),
                                    state.id};
            }
            deflated = std::move(*compressed);
            wire = deflated;
        }

        throttle(*run, wire.size());
        with_retry(*run, index,
            [handler = upload_chunk, bytes = Bytes{wire.begin(), wire.end()}, meta](
                const ChunkContext& ctx) {
                handler(bytes, meta, ctx);
                return Bytes{};
            });
        states_->record_chunk(state.id, index, meta.size);
        report(*run, index, on_progress);
    });

    try {
        finish_run(*run);
    } catch (...) {
        end_run(state.id);
        throw;
    }
    end_run(state.id);

    states_->complete(state.id);
    logging::debug("transfer {} completed", state.id);
    return states_->get(state.id).value_or(state);
}

// -- Download -----------------------------------------------------------------

auto TransferEngine::download(const DownloadSpec& spec, const DownloadHandler& download_chunk,
                              const ProgressCallback& on_progress) -> Bytes {
    const auto cfg = config();
    const auto state = states_->create(spec.item_id, TransferDirection::download,
                                       spec.total_size, spec.total_chunks, cfg.chunk_size,
                                       spec.compressed, spec.content_hash);

    auto indices = std::vector<std::uint32_t>(spec.total_chunks);
    for (std::uint32_t i = 0; i < spec.total_chunks; ++i) indices[i] = i;

    auto chunks = std::vector<Bytes>(spec.total_chunks);

    auto run = begin_run(state);
    run_chunks(*run, indices, [&](std::uint32_t index) {
        // A chunk that fails to inflate is fetched again like any other failure.
        auto data = with_retry(*run, index,
            [handler = download_chunk, index, compressed = spec.compressed](
                const ChunkContext& ctx) {
                auto raw = handler(index, ctx);
                if (!compressed) return raw;
                auto inflated = transfer::deflate_decompress(raw);
                if (!inflated) {
                    throw SyncError{ErrorKind::decoding_error,
                                    "chunk " + std::to_string(index) +
                                    " is not valid deflate data"};
                }
                return std::move(*inflated);
            });
        throttle(*run, data.size());
        const auto size = data.size();
        chunks[index] = std::move(data);
        states_->record_chunk(state.id, index, size);
        report(*run, index, on_progress);
    });

    try {
        finish_run(*run);
    } catch (...) {
        end_run(state.id);
        throw;
    }
    end_run(state.id);

    auto result = Bytes{};
    result.reserve(spec.total_size);
    for (const auto& chunk : chunks) result.insert(result.end(), chunk.begin(), chunk.end());

    if (cfg.verify_integrity && payload_hash(result) != spec.content_hash) {
        states_->fail(state.id, "content integrity verification failed");
        logging::error("transfer {} failed integrity verification", state.id);
        throw TransferError{ErrorKind::integrity_error,
                            "content integrity verification failed", state.id};
    }

    states_->complete(state.id);
    return result;
}

// -- Control ------------------------------------------------------------------

void TransferEngine::abort_transfer(const std::string& transfer_id) {
    {
        auto lock = std::scoped_lock{runs_mutex_};
        if (auto it = runs_.find(transfer_id); it != runs_.end()) {
            it->second->aborted = true;
            it->second->stop.request_stop();
            it->second->sleep_cv.notify_all();
        }
    }
    auto state = states_->get(transfer_id);
    if (state && state->status != TransferStatus::completed) {
        states_->fail(transfer_id, "aborted by user");
    }
}

void TransferEngine::pause_transfer(const std::string& transfer_id) {
    {
        auto lock = std::scoped_lock{runs_mutex_};
        if (auto it = runs_.find(transfer_id); it != runs_.end()) {
            it->second->paused = true;
            it->second->stop.request_stop();
            it->second->sleep_cv.notify_all();
        }
    }
    auto state = states_->get(transfer_id);
    if (state && (state->status == TransferStatus::active ||
                  state->status == TransferStatus::pending)) {
        states_->pause(transfer_id);
    }
}

}  // namespace peersync
