// peersync benchmarks: measures throughput of CRDT merges, hashing and
// chunked transfers.

#include <peersync/peersync.hpp>
#include <peersync/thread_pool.hpp>

#include <benchmark/benchmark.h>

#include <cstdint>
#include <string>
#include <thread>
#include <vector>

using namespace peersync;

// One pool for every transfer benchmark.
static auto g_pool = std::make_shared<thread_pool>(std::thread::hardware_concurrency());

// =============================================================================
// Vector clocks
// =============================================================================

static void bm_clock_merge(benchmark::State& state) {
    const auto n = static_cast<int>(state.range(0));
    auto a = VectorClock{};
    auto b = VectorClock{};
    for (int i = 0; i < n; ++i) {
        a.set("node-" + std::to_string(i), static_cast<std::uint64_t>(i));
        b.set("node-" + std::to_string(i), static_cast<std::uint64_t>(n - i));
    }
    for (auto _ : state) {
        auto c = a;
        benchmark::DoNotOptimize(c.merge(b));
    }
    state.SetItemsProcessed(state.iterations() * n);
}
BENCHMARK(bm_clock_merge)->Range(4, 256);

static void bm_clock_compare(benchmark::State& state) {
    auto a = VectorClock{};
    auto b = VectorClock{};
    for (int i = 0; i < 32; ++i) {
        a.set("node-" + std::to_string(i), 10);
        b.set("node-" + std::to_string(i), i % 2 == 0 ? 9 : 11);
    }
    for (auto _ : state) {
        benchmark::DoNotOptimize(a.compare(b));
    }
}
BENCHMARK(bm_clock_compare);

// =============================================================================
// CRDTs
// =============================================================================

static void bm_g_counter_merge(benchmark::State& state) {
    auto a = GCounter{"a"};
    auto b = GCounter{"b"};
    a.increment(3);
    b.increment(5);
    for (auto _ : state) {
        auto c = a;
        benchmark::DoNotOptimize(c.merge(b.state()));
    }
}
BENCHMARK(bm_g_counter_merge);

static void bm_or_set_add(benchmark::State& state) {
    auto set = OrSet<std::string>{"a"};
    std::int64_t i = 0;
    for (auto _ : state) {
        set.add("value-" + std::to_string(i++ % 1000));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_or_set_add);

static void bm_or_set_merge(benchmark::State& state) {
    const auto n = static_cast<int>(state.range(0));
    auto a = OrSet<std::string>{"a"};
    auto b = OrSet<std::string>{"b"};
    for (int i = 0; i < n; ++i) {
        a.add("a-" + std::to_string(i));
        b.add("b-" + std::to_string(i));
    }
    for (auto _ : state) {
        auto c = a;
        benchmark::DoNotOptimize(c.merge(b.state()));
    }
    state.SetItemsProcessed(state.iterations() * n);
}
BENCHMARK(bm_or_set_merge)->Range(10, 1000);

static void bm_snapshot_merge(benchmark::State& state) {
    auto a = make_snapshot(CrdtKind::g_counter, "a", 3, 100);
    auto b = make_snapshot(CrdtKind::g_counter, "b", 5, 100);
    for (auto _ : state) {
        benchmark::DoNotOptimize(merge_snapshots(a, b, "a"));
    }
}
BENCHMARK(bm_snapshot_merge);

// =============================================================================
// Items
// =============================================================================

static void bm_content_hash(benchmark::State& state) {
    auto content = nlohmann::json::object();
    for (int i = 0; i < state.range(0); ++i) content["key" + std::to_string(i)] = i;
    for (auto _ : state) {
        benchmark::DoNotOptimize(compute_content_hash(content));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_content_hash)->Range(1, 1000);

static void bm_item_round_trip(benchmark::State& state) {
    auto engine = SyncEngine{{.node_id = "bench"}};
    auto item = engine.create_sync_item({.type = "skill", .content = {{"text", "hello"}},
                                         .crdt = CrdtKind::lww_register});
    for (auto _ : state) {
        auto text = nlohmann::json(item).dump();
        benchmark::DoNotOptimize(parse_sync_item(text));
    }
}
BENCHMARK(bm_item_round_trip);

// =============================================================================
// Transfers
// =============================================================================

static void bm_upload(benchmark::State& state) {
    auto config = TransferConfig{};
    config.chunk_size = 64 * 1024;
    config.compression = state.range(1) != 0;
    auto engine = TransferEngine{config, g_pool};

    const auto size = static_cast<std::size_t>(state.range(0));
    auto payload = Bytes(size);
    for (std::size_t i = 0; i < size; ++i) payload[i] = static_cast<std::byte>(i % 251);

    for (auto _ : state) {
        auto s = engine.upload(payload, "bench", [](auto, const auto&, const auto&) {});
        engine.state_manager().remove(s.id);
    }
    state.SetBytesProcessed(static_cast<std::int64_t>(state.iterations() * size));
}
BENCHMARK(bm_upload)->Args({1 << 20, 0})->Args({1 << 20, 1})->Args({8 << 20, 1});
