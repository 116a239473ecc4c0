#include <peersync/peersync.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <stdexcept>
#include <set>
#include <string>
#include <thread>
#include <vector>

using namespace peersync;
using json = nlohmann::json;
using namespace std::chrono_literals;

namespace {

// Reversible stand-in cipher: XOR with a password-derived byte, hex encoded.
class XorEncryption : public Encryption {
public:
    void initialize(const std::string& password) override {
        if (password.empty()) throw SyncError{ErrorKind::encryption_error, "empty password"};
        key_ = 0x5A;
        for (auto c : password) key_ = static_cast<unsigned char>(key_ ^ c);
        ready_ = true;
    }

    auto is_ready() const -> bool override { return ready_; }

    auto encrypt(const std::string& plaintext) -> EncryptedEnvelope override {
        auto hex = std::string{};
        static constexpr char digits[] = "0123456789abcdef";
        for (auto c : plaintext) {
            const auto b = static_cast<unsigned char>(static_cast<unsigned char>(c) ^ key_);
            hex += digits[b >> 4];
            hex += digits[b & 0x0F];
        }
        return EncryptedEnvelope{.algorithm = "xor-test", .iv = "00", .ciphertext = hex,
                                 .key_id = "test"};
    }

    auto decrypt(const EncryptedEnvelope& envelope) -> std::string override {
        auto out = std::string{};
        const auto& hex = envelope.ciphertext;
        for (std::size_t i = 0; i + 1 < hex.size(); i += 2) {
            const auto b = static_cast<unsigned char>(std::stoi(hex.substr(i, 2), nullptr, 16));
            out += static_cast<char>(b ^ key_);
        }
        return out;
    }

    void update_config(const EncryptionConfig&) override {}

    void destroy() override { ready_ = false; }

private:
    unsigned char key_ = 0;
    bool ready_ = false;
};

// Rejects one chunk index while `failing` is set.
class FlakyRemote : public MemoryRemote {
public:
    explicit FlakyRemote(std::uint32_t bad_index) : bad_index_{bad_index} {}

    void upload_chunk(const std::string& item_id, std::uint32_t index, Bytes chunk) override {
        if (failing && index == bad_index_) {
            throw SyncError{ErrorKind::storage_error, "connection reset"};
        }
        MemoryRemote::upload_chunk(item_id, index, std::move(chunk));
    }

    std::atomic<bool> failing{true};

private:
    std::uint32_t bad_index_;
};

auto test_config(const NodeId& node) -> SyncConfig {
    auto config = SyncConfig{};
    config.node_id = node;
    config.transfer.retry_attempts = 1;
    config.transfer.retry_delay = 1ms;
    config.transfer.max_concurrent = 1;
    return config;
}

auto make_engine(const NodeId& node, std::shared_ptr<MemoryRemote> remote,
                 SyncConfig config = {}) -> std::unique_ptr<SyncEngine> {
    if (config.node_id.empty()) config = test_config(node);
    auto engine = std::make_unique<SyncEngine>(config);
    engine->set_remote_store(std::move(remote));
    return engine;
}

auto contains(const std::vector<std::string>& ids, const std::string& id) -> bool {
    return std::ranges::find(ids, id) != ids.end();
}

}  // namespace

// =============================================================================
// Lifecycle
// =============================================================================

TEST(SyncEngine, generates_a_node_id) {
    auto engine = SyncEngine{};
    EXPECT_FALSE(engine.node_id().empty());
    EXPECT_EQ(engine.config().node_id, engine.node_id());
}

TEST(SyncEngine, rejects_invalid_config) {
    auto config = SyncConfig{};
    config.transfer.chunk_size = 0;
    EXPECT_THROW(SyncEngine{config}, SyncError);
}

TEST(SyncEngine, sync_before_initialize_throws) {
    auto engine = make_engine("a", std::make_shared<MemoryRemote>());
    try {
        engine->sync();
        FAIL() << "expected SyncError";
    } catch (const SyncError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::not_initialized);
    }
}

TEST(SyncEngine, sync_without_remote_throws) {
    auto engine = SyncEngine{test_config("a")};
    engine.initialize();
    try {
        engine.sync();
        FAIL() << "expected SyncError";
    } catch (const SyncError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::no_remote_store);
    }
}

TEST(SyncEngine, encryption_requires_capability_and_password) {
    auto config = test_config("a");
    config.encryption.enabled = true;

    auto no_capability = SyncEngine{config};
    try {
        no_capability.initialize("secret");
        FAIL() << "expected SyncError";
    } catch (const SyncError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::invalid_config);
    }

    auto no_password = SyncEngine{config};
    no_password.set_encryption(std::make_shared<XorEncryption>());
    try {
        no_password.initialize();
        FAIL() << "expected SyncError";
    } catch (const SyncError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::invalid_argument);
    }
    EXPECT_FALSE(no_password.is_initialized());
}

TEST(SyncEngine, stop_allows_reinitialize) {
    auto remote = std::make_shared<MemoryRemote>();
    auto engine = make_engine("a", remote);
    engine->initialize();
    EXPECT_TRUE(engine->is_initialized());
    engine->stop();
    EXPECT_FALSE(engine->is_initialized());
    EXPECT_FALSE(remote->test_connection());
    engine->initialize();
    EXPECT_TRUE(engine->is_initialized());
}

TEST(SyncEngine, update_config_keeps_node_id) {
    auto engine = SyncEngine{test_config("fixed")};
    auto config = engine.config();
    config.node_id = "other";
    config.transfer.chunk_size = 2048;
    engine.update_config(config);
    EXPECT_EQ(engine.node_id(), "fixed");
    EXPECT_EQ(engine.config().transfer.chunk_size, 2048u);
    EXPECT_EQ(engine.transfer_engine().config().chunk_size, 2048u);
}

TEST(SyncEngine, transfer_pool_is_shared_or_owned) {
    auto config = test_config("a");
    config.transfer.max_concurrent = 3;

    auto pool = std::make_shared<thread_pool>(2u);
    auto shared = SyncEngine{config, pool};
    EXPECT_EQ(shared.transfer_engine().pool(), pool);

    auto owned = SyncEngine{config};
    ASSERT_NE(owned.transfer_engine().pool(), nullptr);
    EXPECT_EQ(owned.transfer_engine().pool()->get_thread_count(), 3u);

    config.transfer.max_concurrent = 1;
    EXPECT_EQ(SyncEngine{config}.transfer_engine().pool(), nullptr);
}

// =============================================================================
// Items
// =============================================================================

TEST(SyncEngine, create_and_update_items) {
    auto engine = SyncEngine{test_config("a")};
    const auto item = engine.create_sync_item({
        .type = "skill", .name = "greet", .content = {{"text", "hi"}},
        .crdt = CrdtKind::lww_register,
    });
    EXPECT_EQ(item.id.size(), 32u);
    EXPECT_EQ(item.version, 1u);
    EXPECT_EQ(item.modified_by, "a");
    EXPECT_EQ(item.content_hash, compute_content_hash(item.content));
    EXPECT_FALSE(item.encrypted);
    ASSERT_TRUE(item.crdt.has_value());

    const auto updated = engine.update_sync_item(item, json{{"text", "hello"}});
    EXPECT_EQ(updated.version, 2u);
    EXPECT_GT(updated.updated_at, item.updated_at);
    EXPECT_EQ(updated.crdt->value(), (json{{"text", "hello"}}));
    EXPECT_NE(updated.content_hash, item.content_hash);
}

// =============================================================================
// Push and pull
// =============================================================================

TEST(SyncEngine, push_then_pull_on_another_node) {
    auto remote = std::make_shared<MemoryRemote>();
    auto a = make_engine("a", remote);
    auto b = make_engine("b", remote);
    a->initialize();
    b->initialize();

    const auto item = a->create_sync_item({.type = "skill", .content = {{"n", 1}}});
    a->local_store()->save(item);

    const auto pushed = a->sync();
    EXPECT_TRUE(pushed.success);
    EXPECT_EQ(pushed.pushed, (std::vector<std::string>{item.id}));

    const auto pulled = b->sync();
    EXPECT_TRUE(pulled.success);
    EXPECT_EQ(pulled.pulled, (std::vector<std::string>{item.id}));
    EXPECT_EQ(b->local_store()->get(item.id)->content, item.content);
}

TEST(SyncEngine, push_only_and_pull_only) {
    auto remote = std::make_shared<MemoryRemote>();
    auto a = make_engine("a", remote);
    a->initialize();

    const auto mine = a->create_sync_item({.type = "skill", .content = 1});
    a->local_store()->save(mine);
    auto theirs = a->create_sync_item({.type = "workflow", .content = 2});
    remote->upload_metadata(theirs.id, theirs);

    const auto push = a->sync(std::nullopt, {.direction = SyncDirection::push});
    EXPECT_EQ(push.pushed, (std::vector<std::string>{mine.id}));
    EXPECT_TRUE(push.pulled.empty());
    EXPECT_FALSE(a->local_store()->has(theirs.id));

    const auto pull = a->sync(std::nullopt, {.direction = SyncDirection::pull});
    EXPECT_TRUE(contains(pull.pulled, theirs.id));
    EXPECT_TRUE(a->local_store()->has(theirs.id));
}

TEST(SyncEngine, newer_remote_wins) {
    auto remote = std::make_shared<MemoryRemote>();
    auto engine = make_engine("a", remote);
    engine->initialize();

    auto local = engine->create_sync_item({.id = "x", .type = "skill", .content = "old"});
    local.updated_at = 100;
    engine->local_store()->save(local);

    auto newer = local;
    newer.content = "new";
    newer.content_hash = compute_content_hash(newer.content);
    newer.updated_at = 200;
    remote->upload_metadata("x", newer);

    const auto result = engine->sync("skill");
    EXPECT_EQ(result.pulled, (std::vector<std::string>{"x"}));
    EXPECT_EQ(engine->local_store()->get("x")->content, "new");
}

TEST(SyncEngine, newer_local_wins) {
    auto remote = std::make_shared<MemoryRemote>();
    auto engine = make_engine("a", remote);
    engine->initialize();

    auto local = engine->create_sync_item({.id = "x", .type = "skill", .content = "mine"});
    local.updated_at = 300;
    engine->local_store()->save(local);
    auto older = local;
    older.content = "theirs";
    older.content_hash = compute_content_hash(older.content);
    older.updated_at = 200;
    remote->upload_metadata("x", older);

    const auto result = engine->sync("skill");
    EXPECT_EQ(result.pushed, (std::vector<std::string>{"x"}));
    EXPECT_EQ(remote->download_metadata("x")->content, "mine");
}

TEST(SyncEngine, dominating_local_clock_pushes_without_merge) {
    auto remote = std::make_shared<MemoryRemote>();
    auto engine = make_engine("a", remote);
    engine->initialize();

    auto base = engine->create_sync_item({.id = "x", .type = "skill", .content = "old",
                                          .crdt = CrdtKind::lww_register});
    base.updated_at = 100;
    auto newer = engine->update_sync_item(base, "new");
    newer.updated_at = 100;
    ASSERT_EQ(newer.crdt->clock.compare(base.crdt->clock), ClockOrder::after);
    ASSERT_NE(newer.content_hash, base.content_hash);

    engine->local_store()->save(newer);
    remote->upload_metadata("x", base);

    const auto result = engine->sync("skill");
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.pushed, (std::vector<std::string>{"x"}));
    EXPECT_TRUE(result.pulled.empty());
    EXPECT_TRUE(result.merged.empty());
    EXPECT_TRUE(result.conflicts.empty());
    EXPECT_EQ(remote->download_metadata("x")->content, "new");
    EXPECT_EQ(remote->download_metadata("x")->version, newer.version);
}

TEST(SyncEngine, dominating_remote_clock_pulls_without_merge) {
    auto remote = std::make_shared<MemoryRemote>();
    auto engine = make_engine("a", remote);
    engine->initialize();

    auto base = engine->create_sync_item({.id = "x", .type = "skill", .content = "old",
                                          .crdt = CrdtKind::lww_register});
    base.updated_at = 100;
    auto newer = engine->update_sync_item(base, "new");
    newer.updated_at = 100;

    engine->local_store()->save(base);
    remote->upload_metadata("x", newer);

    const auto result = engine->sync("skill");
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.pulled, (std::vector<std::string>{"x"}));
    EXPECT_TRUE(result.pushed.empty());
    EXPECT_TRUE(result.merged.empty());
    EXPECT_TRUE(result.conflicts.empty());
    const auto local = engine->local_store()->get("x");
    ASSERT_TRUE(local.has_value());
    EXPECT_EQ(local->content, "new");
    EXPECT_EQ(local->crdt, newer.crdt);
}

TEST(SyncEngine, equal_items_are_unchanged_unless_forced) {
    auto remote = std::make_shared<MemoryRemote>();
    auto engine = make_engine("a", remote);
    engine->initialize();
    const auto item = engine->create_sync_item({.type = "skill", .content = 5});
    engine->local_store()->save(item);
    remote->upload_metadata(item.id, item);

    const auto result = engine->sync();
    EXPECT_EQ(result.unchanged, (std::vector<std::string>{item.id}));
    EXPECT_TRUE(result.pushed.empty());

    const auto forced = engine->sync(std::nullopt, {.force = true});
    EXPECT_EQ(forced.pushed, (std::vector<std::string>{item.id}));
}

TEST(SyncEngine, same_timestamp_without_crdt_is_a_conflict) {
    auto remote = std::make_shared<MemoryRemote>();
    auto engine = make_engine("a", remote);
    engine->initialize();

    auto conflicts = std::vector<std::string>{};
    engine->set_event_listener([&](const SyncEvent& e) {
        if (e.kind == EngineEvent::conflict) conflicts.push_back(e.item_id);
    });

    const auto local = engine->create_sync_item({.id = "x", .type = "skill", .content = "left"});
    engine->local_store()->save(local);
    auto other = local;
    other.content = "right";
    other.content_hash = compute_content_hash(other.content);
    remote->upload_metadata("x", other);

    const auto result = engine->sync();
    ASSERT_EQ(result.conflicts.size(), 1u);
    EXPECT_EQ(result.conflicts[0].item_id, "x");
    EXPECT_EQ(result.conflicts[0].reason, "concurrent modifications with same timestamp");
    EXPECT_EQ(result.conflicts[0].remote.content, "right");
    EXPECT_EQ(conflicts, (std::vector<std::string>{"x"}));
    // Neither side was overwritten.
    EXPECT_EQ(engine->local_store()->get("x")->content, "left");
    EXPECT_EQ(remote->download_metadata("x")->content, "right");
}

TEST(SyncEngine, concurrent_counter_increments_converge) {
    auto remote = std::make_shared<MemoryRemote>();
    auto a = make_engine("a", remote);
    auto b = make_engine("b", remote);
    a->initialize();
    b->initialize();

    const auto counter = a->create_sync_item({
        .id = "clicks", .type = "config", .content = 0, .crdt = CrdtKind::g_counter,
    });
    a->local_store()->save(counter);
    a->sync();
    b->sync();
    ASSERT_TRUE(b->local_store()->has("clicks"));

    // Both nodes edit the same base and happen to stamp the same time.
    const auto stamp = now_millis() + 1000;
    auto on_a = a->update_sync_item(*a->local_store()->get("clicks"), 3);
    auto on_b = b->update_sync_item(*b->local_store()->get("clicks"), 5);
    on_a.updated_at = stamp;
    on_b.updated_at = stamp;
    a->local_store()->save(on_a);
    b->local_store()->save(on_b);

    EXPECT_EQ(a->sync().pushed, (std::vector<std::string>{"clicks"}));

    auto merged_events = 0;
    b->set_event_listener([&](const SyncEvent& e) {
        if (e.kind == EngineEvent::item_merged) ++merged_events;
    });
    const auto merge = b->sync();
    EXPECT_EQ(merge.merged, (std::vector<std::string>{"clicks"}));
    EXPECT_EQ(merged_events, 1);

    const auto on_b_after = b->local_store()->get("clicks");
    EXPECT_EQ(on_b_after->content, 8);
    EXPECT_EQ(on_b_after->modified_by, "b");
    EXPECT_GT(on_b_after->updated_at, stamp);
    EXPECT_EQ(on_b_after->version, 3u);

    EXPECT_EQ(a->sync().pulled, (std::vector<std::string>{"clicks"}));
    EXPECT_EQ(a->local_store()->get("clicks")->content, 8);
}

TEST(SyncEngine, sets_merge_by_union) {
    auto remote = std::make_shared<MemoryRemote>();
    auto a = make_engine("a", remote);
    auto b = make_engine("b", remote);
    a->initialize();
    b->initialize();

    a->local_store()->save(a->create_sync_item({
        .id = "tags", .type = "skill", .content = json::array({"x"}), .crdt = CrdtKind::or_set,
    }));
    a->sync();
    b->sync();

    const auto stamp = now_millis() + 1000;
    auto on_a = a->update_sync_item(*a->local_store()->get("tags"), json::array({"x", "y"}));
    auto on_b = b->update_sync_item(*b->local_store()->get("tags"), json::array({"x", "z"}));
    on_a.updated_at = stamp;
    on_b.updated_at = stamp;
    a->local_store()->save(on_a);
    b->local_store()->save(on_b);

    a->sync();
    b->sync();
    EXPECT_EQ(b->local_store()->get("tags")->content, json::array({"x", "y", "z"}));
}

TEST(SyncEngine, untyped_sync_skips_unconfigured_types) {
    auto remote = std::make_shared<MemoryRemote>();
    auto engine = make_engine("a", remote);
    engine->initialize();
    auto stray = engine->create_sync_item({.type = "scratch", .content = 1});
    remote->upload_metadata(stray.id, stray);

    EXPECT_TRUE(engine->sync().pulled.empty());
    EXPECT_EQ(engine->sync("scratch").pulled, (std::vector<std::string>{stray.id}));
}

TEST(SyncEngine, failing_item_does_not_abort_the_batch) {
    auto remote = std::make_shared<MemoryRemote>();
    auto engine = make_engine("a", remote);
    engine->initialize();

    auto good = engine->create_sync_item({.id = "good", .type = "skill", .content = 1});
    remote->upload_metadata("good", good);

    // A body that points at chunks which were never uploaded.
    auto broken = engine->create_sync_item({.id = "broken", .type = "skill", .content = 2});
    broken.content = nullptr;
    broken.payload = ChunkedPayload{.size = 10, .total_chunks = 1, .chunk_size = 10,
                                    .content_hash = std::string(64, '0')};
    remote->upload_metadata("broken", broken);

    const auto result = engine->sync();
    EXPECT_FALSE(result.success);
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].item_id, "broken");
    EXPECT_EQ(result.pulled, (std::vector<std::string>{"good"}));
}

TEST(SyncEngine, tampered_body_fails_integrity) {
    auto remote = std::make_shared<MemoryRemote>();
    auto engine = make_engine("a", remote);
    engine->initialize();

    auto config = engine->config();
    config.transfer.chunk_size = 16;
    config.transfer.compression = false;
    engine->update_config(config);

    auto item = engine->create_sync_item({.id = "t", .type = "skill",
                                          .content = std::string(100, 'k')});
    engine->local_store()->save(item);
    engine->sync(std::nullopt, {.direction = SyncDirection::push});

    // Replace the stored record's hash so the fetched body no longer matches it.
    auto record = *remote->download_metadata("t");
    record.content_hash = compute_content_hash("something else");
    record.updated_at += 10;
    remote->upload_metadata("t", record);

    const auto result = engine->sync();
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].kind, ErrorKind::integrity_error);
}

// =============================================================================
// Chunked and encrypted bodies
// =============================================================================

TEST(SyncEngine, large_bodies_travel_in_chunks) {
    auto remote = std::make_shared<MemoryRemote>();
    auto config = test_config("a");
    config.transfer.chunk_size = 256;
    auto a = make_engine("a", remote, config);
    config.node_id = "b";
    auto b = make_engine("b", remote, config);
    a->initialize();
    b->initialize();

    auto text = std::string{};
    for (int i = 0; i < 200; ++i) text += "line " + std::to_string(i) + "\n";
    const auto item = a->create_sync_item({.id = "doc", .type = "template",
                                           .content = {{"body", text}},
                                           .crdt = CrdtKind::lww_register});
    a->local_store()->save(item);

    auto progress = std::vector<int>{};
    a->sync(std::nullopt, {.on_progress = [&](const TransferProgress& p) {
        progress.push_back(p.percentage);
    }});
    ASSERT_FALSE(progress.empty());
    EXPECT_EQ(progress.back(), 100);

    const auto record = remote->download_metadata("doc");
    ASSERT_TRUE(record.has_value());
    ASSERT_TRUE(record->payload.has_value());
    EXPECT_GT(record->payload->total_chunks, 1u);
    EXPECT_EQ(remote->chunk_count("doc"), record->payload->total_chunks);
    EXPECT_TRUE(record->content.is_null());
    EXPECT_FALSE(record->crdt->state.has_value());
    EXPECT_EQ(record->content_hash, item.content_hash);
    EXPECT_TRUE(a->transfer_engine().transfers_for_item("doc").empty());

    b->sync();
    const auto pulled = b->local_store()->get("doc");
    ASSERT_TRUE(pulled.has_value());
    EXPECT_EQ(pulled->content, item.content);
    EXPECT_EQ(pulled->crdt, item.crdt);
    EXPECT_FALSE(pulled->sealed());
}

TEST(SyncEngine, failed_chunked_push_resumes_on_next_sync) {
    auto remote = std::make_shared<FlakyRemote>(2);
    auto config = test_config("a");
    config.transfer.chunk_size = 256;
    config.transfer.compression = false;
    auto a = make_engine("a", remote, config);
    a->initialize();

    auto text = std::string{};
    for (int i = 0; i < 200; ++i) text += "line " + std::to_string(i) + "\n";
    const auto item = a->create_sync_item({.id = "doc", .type = "template",
                                           .content = {{"body", text}}});
    a->local_store()->save(item);

    const auto first = a->sync("template", {.direction = SyncDirection::push});
    EXPECT_FALSE(first.success);
    ASSERT_EQ(first.errors.size(), 1u);
    EXPECT_FALSE(remote->download_metadata("doc").has_value());
    const auto leftover = a->transfer_engine().transfers_for_item("doc");
    ASSERT_EQ(leftover.size(), 1u);
    EXPECT_EQ(leftover.front().status, TransferStatus::failed);
    EXPECT_EQ(leftover.front().completed_chunks, (std::set<std::uint32_t>{0, 1}));
    const auto total = leftover.front().total_chunks;
    ASSERT_GT(total, 3u);

    remote->failing = false;
    const auto second = a->sync("template", {.direction = SyncDirection::push});
    EXPECT_TRUE(second.success);
    EXPECT_EQ(second.pushed, (std::vector<std::string>{"doc"}));
    // Chunks 0 and 1 were not sent again.
    EXPECT_EQ(remote->chunk_uploads(), total);
    EXPECT_TRUE(a->transfer_engine().transfers_for_item("doc").empty());

    config.node_id = "b";
    auto b = make_engine("b", remote, config);
    b->initialize();
    b->sync("template", {.direction = SyncDirection::pull});
    ASSERT_TRUE(b->local_store()->get("doc").has_value());
    EXPECT_EQ(b->local_store()->get("doc")->content, item.content);
}

TEST(SyncEngine, stale_upload_of_other_content_is_discarded) {
    auto remote = std::make_shared<FlakyRemote>(1);
    auto config = test_config("a");
    config.transfer.chunk_size = 256;
    auto a = make_engine("a", remote, config);
    a->initialize();

    auto text = std::string{};
    for (int i = 0; i < 200; ++i) text += "entry " + std::to_string(i) + "\n";
    const auto item = a->create_sync_item({.id = "doc", .type = "template",
                                           .content = {{"body", text}}});
    a->local_store()->save(item);
    EXPECT_FALSE(a->sync("template", {.direction = SyncDirection::push}).success);
    ASSERT_EQ(a->transfer_engine().transfers_for_item("doc").size(), 1u);

    a->local_store()->save(a->update_sync_item(item, {{"body", text + "more\n"}}));
    remote->failing = false;
    EXPECT_TRUE(a->sync("template", {.direction = SyncDirection::push}).success);
    EXPECT_TRUE(a->transfer_engine().transfers_for_item("doc").empty());
    EXPECT_EQ(remote->download_metadata("doc")->content_hash,
              a->local_store()->get("doc")->content_hash);
}

TEST(SyncEngine, encrypted_push_never_exposes_plaintext) {
    auto remote = std::make_shared<MemoryRemote>();
    auto config = test_config("a");
    config.encryption.enabled = true;
    auto a = make_engine("a", remote, config);
    config.node_id = "b";
    auto b = make_engine("b", remote, config);
    a->set_encryption(std::make_shared<XorEncryption>());
    b->set_encryption(std::make_shared<XorEncryption>());
    a->initialize("correct horse");
    b->initialize("correct horse");

    const auto item = a->create_sync_item({.id = "s", .type = "config",
                                           .content = {{"apiKey", "plaintext-marker"}},
                                           .crdt = CrdtKind::lww_register});
    a->local_store()->save(item);
    EXPECT_TRUE(a->sync().success);

    const auto record = remote->download_metadata("s");
    ASSERT_TRUE(record.has_value());
    EXPECT_TRUE(record->encrypted);
    ASSERT_TRUE(record->envelope.has_value());
    EXPECT_EQ(record->envelope->algorithm, "xor-test");
    EXPECT_TRUE(record->content.is_null());
    EXPECT_EQ(json(*record).dump().find("plaintext-marker"), std::string::npos);
    EXPECT_FALSE(a->local_store()->get("s")->encrypted);

    EXPECT_TRUE(b->sync().success);
    EXPECT_EQ(b->local_store()->get("s")->content, item.content);
}

TEST(SyncEngine, encrypted_chunked_body_round_trips) {
    auto remote = std::make_shared<MemoryRemote>();
    auto config = test_config("a");
    config.encryption.enabled = true;
    config.transfer.chunk_size = 128;
    auto a = make_engine("a", remote, config);
    config.node_id = "b";
    auto b = make_engine("b", remote, config);
    a->set_encryption(std::make_shared<XorEncryption>());
    b->set_encryption(std::make_shared<XorEncryption>());
    a->initialize("pw");
    b->initialize("pw");

    const auto item = a->create_sync_item({.id = "big", .type = "skill",
                                           .content = {{"secret", std::string(2000, 's')}}});
    a->local_store()->save(item);
    a->sync();

    const auto record = remote->download_metadata("big");
    ASSERT_TRUE(record->payload.has_value());
    EXPECT_TRUE(record->encrypted);
    EXPECT_FALSE(record->envelope.has_value());

    b->sync();
    EXPECT_EQ(b->local_store()->get("big")->content, item.content);
}

TEST(SyncEngine, push_refuses_plaintext_when_encryption_not_ready) {
    auto remote = std::make_shared<MemoryRemote>();
    auto config = test_config("a");
    config.encryption.enabled = true;
    auto engine = make_engine("a", remote, config);
    auto encryption = std::make_shared<XorEncryption>();
    engine->set_encryption(encryption);
    engine->initialize("pw");
    encryption->destroy();

    engine->local_store()->save(engine->create_sync_item({.id = "p", .type = "skill",
                                                          .content = "secret"}));
    const auto result = engine->sync();
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].kind, ErrorKind::encryption_error);
    EXPECT_FALSE(remote->download_metadata("p").has_value());
}

// =============================================================================
// Events and the offline queue
// =============================================================================

TEST(SyncEngine, emits_lifecycle_events) {
    auto remote = std::make_shared<MemoryRemote>();
    auto engine = make_engine("a", remote);
    auto kinds = std::vector<EngineEvent>{};
    auto completed_with_result = false;
    engine->set_event_listener([&](const SyncEvent& e) {
        kinds.push_back(e.kind);
        if (e.kind == EngineEvent::sync_complete) completed_with_result = e.result != nullptr;
    });
    engine->initialize();
    engine->sync();
    EXPECT_EQ(kinds, (std::vector<EngineEvent>{
        EngineEvent::initialized, EngineEvent::sync_start, EngineEvent::sync_complete}));
    EXPECT_TRUE(completed_with_result);
}

TEST(SyncEngine, queued_operations_replay_when_online) {
    auto remote = std::make_shared<MemoryRemote>();
    auto engine = make_engine("a", remote);
    engine->initialize();

    auto queue_events = std::vector<QueueEvent>{};
    engine->set_event_listener([&](const SyncEvent& e) {
        if (e.queue_event) queue_events.push_back(*e.queue_event);
    });

    const auto item = engine->create_sync_item({.id = "q", .type = "skill", .content = 1});
    engine->local_store()->save(item);
    engine->set_network_status(NetworkStatus::offline);
    engine->queue_operation({.type = OperationType::create, .item_type = "skill", .item_id = "q"});

    engine->process_queue();
    EXPECT_FALSE(remote->download_metadata("q").has_value());
    EXPECT_EQ(engine->queue_state().pending.size(), 1u);

    engine->set_network_status(NetworkStatus::online);
    EXPECT_TRUE(engine->is_online());
    engine->process_queue();
    EXPECT_TRUE(remote->download_metadata("q").has_value());
    EXPECT_TRUE(engine->queue_state().pending.empty());

    engine->queue_operation({.type = OperationType::remove, .item_type = "skill", .item_id = "q"});
    engine->process_queue();
    EXPECT_FALSE(remote->download_metadata("q").has_value());

    EXPECT_NE(std::ranges::find(queue_events, QueueEvent::operation_added), queue_events.end());
    EXPECT_NE(std::ranges::find(queue_events, QueueEvent::operation_processed), queue_events.end());
    EXPECT_NE(std::ranges::find(queue_events, QueueEvent::network_online), queue_events.end());
}

TEST(SyncEngine, queued_merge_reconciles_one_item) {
    auto remote = std::make_shared<MemoryRemote>();
    auto engine = make_engine("a", remote);
    engine->initialize();
    engine->set_network_status(NetworkStatus::online);

    auto local = engine->create_sync_item({.id = "m", .type = "skill", .content = "new"});
    local.updated_at = 500;
    engine->local_store()->save(local);
    auto stale = local;
    stale.content = "old";
    stale.content_hash = compute_content_hash(stale.content);
    stale.updated_at = 100;
    remote->upload_metadata("m", stale);

    engine->queue_operation({.type = OperationType::merge, .item_type = "skill", .item_id = "m"});
    engine->process_queue();
    EXPECT_EQ(remote->download_metadata("m")->content, "new");
}

TEST(SyncEngine, custom_queue_replaces_default) {
    auto engine = SyncEngine{test_config("a")};
    auto queue = std::make_shared<MemoryQueue>();
    engine.set_offline_queue(queue);
    EXPECT_EQ(engine.offline_queue(), queue);
    EXPECT_THROW(engine.set_offline_queue(nullptr), SyncError);
    EXPECT_THROW(engine.set_local_store(nullptr), SyncError);
}

TEST(SyncEngine, auto_sync_runs_while_online) {
    auto remote = std::make_shared<MemoryRemote>();
    auto config = test_config("a");
    config.auto_sync_interval = 20ms;
    auto engine = make_engine("a", remote, config);
    engine->set_network_status(NetworkStatus::online);
    engine->local_store()->save(engine->create_sync_item({.id = "auto", .type = "skill",
                                                          .content = 1}));
    engine->initialize();

    for (int i = 0; i < 200 && !remote->download_metadata("auto"); ++i) {
        std::this_thread::sleep_for(10ms);
    }
    EXPECT_TRUE(remote->download_metadata("auto").has_value());
    engine->stop();
}
