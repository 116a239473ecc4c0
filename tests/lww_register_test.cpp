#include <peersync/crdt/lww_register.hpp>

#include <gtest/gtest.h>

#include <string>

using namespace peersync;

TEST(LwwRegister, later_timestamp_wins) {
    auto reg = LwwRegister<std::string>{"a"};
    EXPECT_TRUE(reg.set("first", 100));
    EXPECT_TRUE(reg.set("second", 200));
    EXPECT_FALSE(reg.set("stale", 150));

    EXPECT_EQ(reg.value(), "second");
    EXPECT_EQ(reg.timestamp(), 200);
    EXPECT_EQ(reg.writer(), "a");
}

TEST(LwwRegister, default_timestamp_always_applies) {
    auto reg = LwwRegister<int>{"a"};
    reg.set(1, 9'999'999'999'999);
    EXPECT_TRUE(reg.set(2));
    EXPECT_EQ(reg.value(), 2);
    EXPECT_EQ(reg.timestamp(), 10'000'000'000'000);
}

TEST(LwwRegister, merge_adopts_newer_state) {
    auto a = LwwRegister<std::string>{"a"};
    auto b = LwwRegister<std::string>{"b"};
    a.set("from a", 100);
    b.set("from b", 200);

    EXPECT_TRUE(a.merge(b.state()));
    EXPECT_EQ(a.value(), "from b");
    EXPECT_FALSE(b.merge(a.state()));
}

TEST(LwwRegister, tie_goes_to_greater_node_by_default) {
    auto a = LwwRegister<std::string>{"node-a"};
    auto b = LwwRegister<std::string>{"node-b"};
    a.set("A", 500);
    b.set("B", 500);

    a.merge(b.state());
    b.merge(a.state());

    EXPECT_EQ(a.value(), "B");
    EXPECT_EQ(b.value(), "B");
    EXPECT_EQ(a.state(), b.state());
}

TEST(LwwRegister, tie_goes_to_smaller_node_with_first_bias) {
    auto a = LwwRegister<std::string>{"node-a", TieBias::first};
    auto b = LwwRegister<std::string>{"node-b", TieBias::first};
    a.set("A", 500);
    b.set("B", 500);

    b.merge(a.state());
    a.merge(b.state());

    EXPECT_EQ(a.value(), "A");
    EXPECT_EQ(b.value(), "A");
}

TEST(LwwRegister, tie_break_is_independent_of_merge_order) {
    const auto sa = LwwRegisterState<int>{.value = 1, .timestamp = 7, .node_id = "x"};
    const auto sb = LwwRegisterState<int>{.value = 2, .timestamp = 7, .node_id = "y"};
    const auto sc = LwwRegisterState<int>{.value = 3, .timestamp = 7, .node_id = "w"};

    auto r1 = LwwRegister<int>{"r1"};
    r1.merge(sa);
    r1.merge(sb);
    r1.merge(sc);

    auto r2 = LwwRegister<int>{"r2"};
    r2.merge(sc);
    r2.merge(sb);
    r2.merge(sa);

    EXPECT_EQ(r1.state(), r2.state());
    EXPECT_EQ(r1.value(), 2);
}

TEST(LwwRegister, same_node_same_timestamp_is_a_no_op) {
    auto reg = LwwRegister<int>{"a"};
    reg.set(1, 100);
    EXPECT_FALSE(reg.merge({.value = 99, .timestamp = 100, .node_id = "a"}));
    EXPECT_EQ(reg.value(), 1);
}

TEST(LwwRegister, merge_is_idempotent) {
    auto a = LwwRegister<int>{"a"};
    a.set(5, 10);
    const auto remote = LwwRegisterState<int>{.value = 6, .timestamp = 20, .node_id = "b"};
    EXPECT_TRUE(a.merge(remote));
    EXPECT_FALSE(a.merge(remote));
    EXPECT_EQ(a.state(), remote);
}

TEST(TieBias, to_string_view) {
    EXPECT_EQ(to_string_view(TieBias::last), "last");
    EXPECT_EQ(to_string_view(TieBias::first), "first");
}
