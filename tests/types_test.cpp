#include <peersync/types.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <set>
#include <string>
#include <variant>

using namespace peersync;

// -- Identity -----------------------------------------------------------------

TEST(NodeId, generated_ids_are_32_hex_chars) {
    const auto id = generate_node_id();
    EXPECT_EQ(id.size(), 32u);
    EXPECT_TRUE(std::ranges::all_of(id, [](char c) {
        return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
    }));
}

TEST(NodeId, generated_ids_are_unique) {
    auto ids = std::set<NodeId>{};
    for (int i = 0; i < 100; ++i) ids.insert(generate_node_id());
    EXPECT_EQ(ids.size(), 100u);
}

TEST(RandomHex, length_is_twice_the_byte_count) {
    EXPECT_EQ(random_hex(0), "");
    EXPECT_EQ(random_hex(4).size(), 8u);
}

// -- Time ---------------------------------------------------------------------

TEST(Timestamp, now_millis_is_monotonic_enough) {
    const auto a = now_millis();
    const auto b = now_millis();
    EXPECT_GT(a, 1'600'000'000'000);  // after 2020
    EXPECT_LE(a, b);
}

// -- Bytes --------------------------------------------------------------------

TEST(Bytes, string_round_trip) {
    const auto text = std::string{"h\0llo", 5};
    const auto bytes = to_bytes(text);
    ASSERT_EQ(bytes.size(), 5u);
    EXPECT_EQ(bytes[1], std::byte{0});
    EXPECT_EQ(to_string(bytes), text);
}

TEST(Bytes, empty) {
    EXPECT_TRUE(to_bytes("").empty());
    EXPECT_EQ(to_string(Bytes{}), "");
}

// -- Item types and overload --------------------------------------------------

TEST(ItemType, defaults) {
    const auto types = default_item_types();
    EXPECT_EQ(types, (std::vector<ItemType>{"skill", "workflow", "config", "plugin", "template"}));
}

TEST(Overload, visits_variant_alternatives) {
    auto v = std::variant<int, std::string>{std::string{"x"}};
    auto name = std::visit(overload{
        [](int) { return std::string{"int"}; },
        [](const std::string&) { return std::string{"string"}; },
    }, v);
    EXPECT_EQ(name, "string");
}
