#pragma once

// Token bucket pacing chunk sends to a byte rate.
// Internal header, not installed.

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <mutex>

namespace peersync::transfer {

class BandwidthLimiter {
public:
    using clock = std::chrono::steady_clock;

    // 0 bytes per second means unlimited.
    explicit BandwidthLimiter(std::size_t bytes_per_second = 0)
        : limit_{bytes_per_second} {}

    void set_limit(std::size_t bytes_per_second) {
        auto lock = std::scoped_lock{mutex_};
        limit_ = bytes_per_second;
        next_free_ = clock::time_point{};
    }

    auto limit() const -> std::size_t {
        auto lock = std::scoped_lock{mutex_};
        return limit_;
    }

    // Reserve the link for `bytes` and return how long the caller must wait
    // before sending them. Each reservation starts when the previous one
    // ends and occupies bytes / limit seconds, so concurrent callers are
    // serialized onto one timeline.
    auto acquire(std::size_t bytes, clock::time_point now = clock::now())
        -> std::chrono::milliseconds {
        auto lock = std::scoped_lock{mutex_};
        if (limit_ == 0) return std::chrono::milliseconds{0};

        const auto start = std::max(next_free_, now);
        const auto cost = std::chrono::duration<double>{
            static_cast<double>(bytes) / static_cast<double>(limit_)};
        next_free_ = start + std::chrono::duration_cast<clock::duration>(cost);
        return std::chrono::ceil<std::chrono::milliseconds>(start - now);
    }

private:
    mutable std::mutex mutex_;
    std::size_t limit_;
    clock::time_point next_free_{};
};

}  // namespace peersync::transfer
