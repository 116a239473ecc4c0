#include <peersync/crdt/g_counter.hpp>
#include <peersync/error.hpp>

#include <gtest/gtest.h>

#include <limits>

using namespace peersync;

// -- GCounter -----------------------------------------------------------------

TEST(GCounter, starts_at_zero) {
    const auto c = GCounter{"a"};
    EXPECT_EQ(c.value(), 0u);
    EXPECT_TRUE(c.state().counts.empty());
}

TEST(GCounter, increment_adds_to_own_entry) {
    auto c = GCounter{"a"};
    c.increment();
    c.increment(4);
    EXPECT_EQ(c.value(), 5u);
    EXPECT_EQ(c.count_for("a"), 5u);
    EXPECT_EQ(c.count_for("b"), 0u);
}

TEST(GCounter, negative_increment_throws) {
    auto c = GCounter{"a"};
    try {
        c.increment(-1);
        FAIL() << "expected SyncError";
    } catch (const SyncError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::invalid_argument);
    }
    EXPECT_EQ(c.value(), 0u);
}

TEST(GCounter, concurrent_increments_converge) {
    auto a = GCounter{"a"};
    auto b = GCounter{"b"};
    a.increment(3);
    b.increment(5);

    a.merge(b.state());
    b.merge(a.state());

    EXPECT_EQ(a.value(), 8u);
    EXPECT_EQ(b.value(), 8u);
    EXPECT_EQ(a.state(), b.state());
}

TEST(GCounter, merge_is_commutative) {
    auto a = GCounter{"a", {.counts = {{"a", 2}, {"b", 1}}}};
    auto b = GCounter{"b", {.counts = {{"b", 4}, {"c", 7}}}};
    auto ab = GCounter{"x", a.state()};
    ab.merge(b.state());
    auto ba = GCounter{"x", b.state()};
    ba.merge(a.state());

    EXPECT_EQ(ab.state(), ba.state());
    EXPECT_EQ(ab.value(), 2u + 4u + 7u);
}

TEST(GCounter, merge_is_idempotent) {
    auto a = GCounter{"a"};
    a.increment(3);
    auto b = GCounter{"b"};
    b.increment(2);

    EXPECT_TRUE(a.merge(b.state()));
    const auto once = a.state();
    EXPECT_FALSE(a.merge(b.state()));
    EXPECT_FALSE(a.merge(a.state()));
    EXPECT_EQ(a.state(), once);
}

TEST(GCounter, merge_never_lowers_an_entry) {
    auto a = GCounter{"a"};
    a.increment(10);
    a.merge({.counts = {{"a", 3}}});
    EXPECT_EQ(a.value(), 10u);
}

// -- PNCounter ----------------------------------------------------------------

TEST(PNCounter, increment_and_decrement) {
    auto c = PNCounter{"a"};
    c.increment(10);
    c.decrement(3);
    EXPECT_EQ(c.value(), 7);
    c.decrement(10);
    EXPECT_EQ(c.value(), -3);
}

TEST(PNCounter, negative_amounts_switch_sides) {
    auto c = PNCounter{"a"};
    c.increment(-2);
    c.decrement(-5);
    EXPECT_EQ(c.value(), 3);
    EXPECT_EQ(c.state().negative.counts.at("a"), 2u);
    EXPECT_EQ(c.state().positive.counts.at("a"), 5u);
}

TEST(PNCounter, unnegatable_amount_is_rejected) {
    auto c = PNCounter{"a"};
    c.increment(4);
    constexpr auto lowest = std::numeric_limits<std::int64_t>::min();
    EXPECT_THROW(c.increment(lowest), SyncError);
    EXPECT_THROW(c.decrement(lowest), SyncError);
    EXPECT_EQ(c.value(), 4);
    c.decrement(std::numeric_limits<std::int64_t>::max());
    EXPECT_EQ(c.value(), 4 - std::numeric_limits<std::int64_t>::max());
}

TEST(PNCounter, concurrent_updates_converge) {
    auto a = PNCounter{"a"};
    auto b = PNCounter{"b"};
    a.increment(5);
    b.decrement(2);
    b.increment(1);

    a.merge(b.state());
    b.merge(a.state());

    EXPECT_EQ(a.value(), 4);
    EXPECT_EQ(b.value(), 4);
}

TEST(PNCounter, merge_reports_change_in_either_half) {
    auto a = PNCounter{"a"};
    auto b = PNCounter{"b"};
    b.decrement(1);
    EXPECT_TRUE(a.merge(b.state()));
    EXPECT_FALSE(a.merge(b.state()));
}
