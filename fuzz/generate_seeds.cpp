// Helper to generate valid seed corpus files for fuzz testing.
// Build and run once: ./generate_seeds
// Not a fuzz target itself: just a corpus generator.

#include <peersync/peersync.hpp>

#include "transfer/compression.hpp"

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

static void write_seed(const std::string& path, const std::vector<std::byte>& data) {
    auto ofs = std::ofstream{path, std::ios::binary};
    ofs.write(reinterpret_cast<const char*>(data.data()),
              static_cast<std::streamsize>(data.size()));
}

int main() {
    namespace fs = std::filesystem;
    namespace ps = peersync;
    const auto items_dir = std::string{"fuzz/corpus/sync_item"};
    const auto inflate_dir = std::string{"fuzz/corpus/inflate"};
    fs::create_directories(items_dir);
    fs::create_directories(inflate_dir);

    auto engine = ps::SyncEngine{{.node_id = "seed"}};

    // Seed 1: plain item without CRDT state
    {
        auto item = engine.create_sync_item({.id = "plain", .type = "skill", .content = "hi"});
        write_seed(items_dir + "/seed_plain.json", ps::to_bytes(nlohmann::json(item).dump()));
    }

    // Seed 2-4: one item per CRDT kind
    {
        auto reg = engine.create_sync_item({.id = "reg", .type = "skill",
                                            .content = {{"k", 1}},
                                            .crdt = ps::CrdtKind::lww_register});
        auto counter = engine.create_sync_item({.id = "count", .type = "config",
                                                .content = 7, .crdt = ps::CrdtKind::g_counter});
        auto set = engine.create_sync_item({.id = "set", .type = "template",
                                            .content = nlohmann::json::array({"a", "b"}),
                                            .crdt = ps::CrdtKind::or_set});
        write_seed(items_dir + "/seed_register.json", ps::to_bytes(nlohmann::json(reg).dump()));
        write_seed(items_dir + "/seed_counter.json", ps::to_bytes(nlohmann::json(counter).dump()));
        write_seed(items_dir + "/seed_set.json", ps::to_bytes(nlohmann::json(set).dump()));
    }

    // Seed 5: sealed record with envelope and chunked payload
    {
        auto item = engine.create_sync_item({.id = "sealed", .type = "skill", .content = 1});
        item.content = nullptr;
        item.encrypted = true;
        item.envelope = ps::EncryptedEnvelope{.algorithm = "aes-256-gcm", .iv = "aXY=",
                                              .auth_tag = "dGFn", .ciphertext = "Yw=="};
        item.payload = ps::ChunkedPayload{.size = 10, .total_chunks = 1, .chunk_size = 10,
                                          .content_hash = std::string(64, '0')};
        write_seed(items_dir + "/seed_sealed.json", ps::to_bytes(nlohmann::json(item).dump()));
    }

    // Seeds for the inflate target: compressed text and random-looking bytes
    {
        auto text = ps::to_bytes(std::string(4096, 'a') + "peersync");
        if (auto packed = ps::transfer::deflate_compress(text)) {
            write_seed(inflate_dir + "/seed_text.bin", *packed);
        }
        auto mixed = std::vector<std::byte>{};
        for (int i = 0; i < 2048; ++i) mixed.push_back(static_cast<std::byte>((i * 131) & 0xFF));
        if (auto packed = ps::transfer::deflate_compress(mixed, 1)) {
            write_seed(inflate_dir + "/seed_mixed.bin", *packed);
        }
    }

    return 0;
}
