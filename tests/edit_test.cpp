#include <coedit-cpp/edit.hpp>

#include <gtest/gtest.h>

using namespace coedit_cpp;

TEST(EditKind, to_string_view_covers_all_variants) {
    EXPECT_EQ(to_string_view(EditKind::insert),  "insert");
    EXPECT_EQ(to_string_view(EditKind::del),     "delete");
    EXPECT_EQ(to_string_view(EditKind::replace), "replace");
}

TEST(Edit, make_insert_fills_insert_fields) {
    const auto e = make_insert(4, "abc", "alice", 2);

    EXPECT_EQ(e.kind, EditKind::insert);
    EXPECT_EQ(e.position, 4u);
    EXPECT_EQ(e.content, "abc");
    EXPECT_EQ(e.length, 0u);
    EXPECT_EQ(e.author_id, "alice");
    EXPECT_EQ(e.base_version, 2u);
    EXPECT_EQ(e.version, 0u);
    EXPECT_TRUE(e.id.empty());
}

TEST(Edit, make_delete_fills_delete_fields) {
    const auto e = make_delete(5, 10, "bob");

    EXPECT_EQ(e.kind, EditKind::del);
    EXPECT_EQ(e.position, 5u);
    EXPECT_EQ(e.length, 10u);
    EXPECT_TRUE(e.content.empty());
    EXPECT_EQ(e.base_version, 0u);
}

TEST(Edit, inserted_and_removed_lengths_follow_kind) {
    EXPECT_EQ(make_insert(0, "xyz", "a").inserted_length(), 3u);
    EXPECT_EQ(make_insert(0, "xyz", "a").removed_length(), 0u);

    EXPECT_EQ(make_delete(0, 7, "a").inserted_length(), 0u);
    EXPECT_EQ(make_delete(0, 7, "a").removed_length(), 7u);

    const auto r = make_replace(1, 2, "hello", "a");
    EXPECT_EQ(r.inserted_length(), 5u);
    EXPECT_EQ(r.removed_length(), 2u);
}

TEST(Edit, equality_detects_different_positions) {
    const auto base = make_insert(1, "x", "a");
    auto moved = base;
    moved.position = 2;

    EXPECT_EQ(base, make_insert(1, "x", "a"));
    EXPECT_NE(base, moved);
}
