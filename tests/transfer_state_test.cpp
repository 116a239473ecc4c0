#include <peersync/transfer.hpp>

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

using namespace peersync;

namespace {

auto make_upload(TransferStateManager& m, std::uint32_t chunks = 4) -> TransferState {
    return m.create("item-1", TransferDirection::upload, chunks * 100, chunks, 100, true,
                    std::string(64, 'f'));
}

class TempFile {
public:
    explicit TempFile(const char* name)
        : path_{std::filesystem::temp_directory_path() / name} {
        std::filesystem::remove(path_);
    }
    ~TempFile() {
        std::filesystem::remove(path_);
        std::filesystem::remove(std::filesystem::path{path_} += ".tmp");
    }
    auto path() const -> const std::filesystem::path& { return path_; }

private:
    std::filesystem::path path_;
};

}  // namespace

TEST(TransferState, create_starts_pending) {
    auto m = TransferStateManager{};
    const auto s = make_upload(m);
    EXPECT_EQ(s.status, TransferStatus::pending);
    EXPECT_EQ(s.id.rfind("upload-item-1-", 0), 0u);
    EXPECT_EQ(s.transferred_bytes, 0u);
    EXPECT_TRUE(s.completed_chunks.empty());
    EXPECT_EQ(m.get(s.id), s);
}

TEST(TransferState, ids_are_unique) {
    auto m = TransferStateManager{};
    EXPECT_NE(make_upload(m).id, make_upload(m).id);
}

TEST(TransferState, record_chunk_is_idempotent) {
    auto m = TransferStateManager{};
    const auto s = make_upload(m);
    m.record_chunk(s.id, 1, 100);
    m.record_chunk(s.id, 1, 100);
    const auto after = m.get(s.id);
    ASSERT_TRUE(after.has_value());
    EXPECT_EQ(after->transferred_bytes, 100u);
    EXPECT_EQ(after->completed_chunks, (std::set<std::uint32_t>{1}));
    EXPECT_EQ(after->status, TransferStatus::active);
}

TEST(TransferState, missing_chunks_ascending) {
    auto m = TransferStateManager{};
    const auto s = make_upload(m, 6);
    m.record_chunk(s.id, 0, 100);
    m.record_chunk(s.id, 2, 100);
    m.record_chunk(s.id, 4, 100);
    EXPECT_EQ(m.missing_chunks(s.id), (std::vector<std::uint32_t>{1, 3, 5}));
    EXPECT_TRUE(m.missing_chunks("unknown").empty());
}

TEST(TransferState, lifecycle_transitions) {
    auto m = TransferStateManager{};
    const auto s = make_upload(m);
    m.start(s.id);
    EXPECT_FALSE(m.can_resume(s.id));
    EXPECT_FALSE(m.resume(s.id));

    m.fail(s.id, "network down");
    EXPECT_EQ(m.get(s.id)->error, "network down");
    EXPECT_TRUE(m.can_resume(s.id));
    EXPECT_TRUE(m.resume(s.id));
    EXPECT_EQ(m.get(s.id)->status, TransferStatus::active);
    EXPECT_FALSE(m.get(s.id)->error.has_value());

    m.pause(s.id);
    EXPECT_TRUE(m.can_resume(s.id));

    m.complete(s.id);
    EXPECT_EQ(m.get(s.id)->status, TransferStatus::completed);
    EXPECT_FALSE(m.resume(s.id));
}

TEST(TransferState, pause_survives_a_racing_chunk) {
    auto m = TransferStateManager{};
    const auto s = make_upload(m);
    m.start(s.id);
    m.pause(s.id);
    m.record_chunk(s.id, 0, 100);
    EXPECT_EQ(m.get(s.id)->status, TransferStatus::paused);
}

TEST(TransferState, queries_and_cleanup) {
    auto m = TransferStateManager{};
    const auto a = make_upload(m);
    const auto b = m.create("item-2", TransferDirection::download, 10, 1, 10, false, "");
    m.start(b.id);
    m.complete(a.id);

    EXPECT_EQ(m.active().size(), 1u);
    EXPECT_EQ(m.for_item("item-1").size(), 1u);

    m.clear_completed();
    EXPECT_FALSE(m.get(a.id).has_value());
    EXPECT_TRUE(m.get(b.id).has_value());

    m.remove(b.id);
    EXPECT_FALSE(m.get(b.id).has_value());

    make_upload(m);
    m.clear_all();
    EXPECT_TRUE(m.active().empty());
}

TEST(TransferState, reload_turns_in_flight_transfers_into_paused) {
    auto file = TempFile{"peersync_transfer_state_test.json"};
    auto id = std::string{};
    auto done = std::string{};
    {
        auto m = TransferStateManager{file.path()};
        const auto s = make_upload(m);
        id = s.id;
        m.start(id);
        m.record_chunk(id, 0, 100);
        m.record_chunk(id, 3, 100);

        const auto c = make_upload(m);
        done = c.id;
        m.complete(done);
    }

    auto reloaded = TransferStateManager{file.path()};
    const auto s = reloaded.get(id);
    ASSERT_TRUE(s.has_value());
    EXPECT_EQ(s->status, TransferStatus::paused);
    EXPECT_EQ(s->completed_chunks, (std::set<std::uint32_t>{0, 3}));
    EXPECT_EQ(s->transferred_bytes, 200u);
    EXPECT_EQ(reloaded.missing_chunks(id), (std::vector<std::uint32_t>{1, 2}));
    EXPECT_TRUE(reloaded.can_resume(id));
    EXPECT_EQ(reloaded.get(done)->status, TransferStatus::completed);
}

TEST(TransferState, corrupt_state_file_is_ignored) {
    auto file = TempFile{"peersync_transfer_state_corrupt.json"};
    {
        auto out = std::ofstream{file.path()};
        out << "{\"transfers\": [{\"id\": 3}]}";
    }
    auto m = TransferStateManager{file.path()};
    EXPECT_TRUE(m.active().empty());
    EXPECT_TRUE(m.for_item("item-1").empty());
}

TEST(TransferState, json_keys_are_camel_case) {
    auto m = TransferStateManager{};
    auto s = make_upload(m);
    s.error = "boom";
    const auto j = nlohmann::json(s);
    EXPECT_EQ(j.at("itemId"), "item-1");
    EXPECT_EQ(j.at("direction"), "upload");
    EXPECT_EQ(j.at("status"), "pending");
    EXPECT_EQ(j.at("totalChunks"), 4);
    EXPECT_EQ(j.at("error"), "boom");
    EXPECT_EQ(j.get<TransferState>(), s);
}
