#include <coedit-cpp/transform.hpp>

#include "../src/text_buffer.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace coedit_cpp;

namespace {

// Apply `first`, then `second` transformed against it, to `text`.
auto apply_pair(std::string text, const Edit& first, const Edit& second) -> std::string {
    auto buffer = detail::TextBuffer{std::move(text)};
    buffer.apply(detail::clamp_to_document(first, buffer.size()));
    buffer.apply(detail::clamp_to_document(transform(second, first), buffer.size()));
    return buffer.content;
}

}  // namespace

// -- insert vs insert ---------------------------------------------------------

TEST(TransformInsertInsert, earlier_position_is_unchanged) {
    const auto t = transform(make_insert(2, "x", "a"), make_insert(5, "abc", "b"));
    EXPECT_EQ(t.position, 2u);
}

TEST(TransformInsertInsert, later_position_shifts_by_applied_content) {
    const auto t = transform(make_insert(7, "x", "a"), make_insert(5, "abc", "b"));
    EXPECT_EQ(t.position, 10u);
}

TEST(TransformInsertInsert, tie_smaller_author_keeps_position) {
    const auto t = transform(make_insert(3, "x", "a"), make_insert(3, "yy", "b"));
    EXPECT_EQ(t.position, 3u);
}

TEST(TransformInsertInsert, tie_larger_author_shifts_right) {
    const auto t = transform(make_insert(3, "x", "b"), make_insert(3, "yy", "a"));
    EXPECT_EQ(t.position, 5u);
}

TEST(TransformInsertInsert, tie_same_author_shifts_right) {
    const auto t = transform(make_insert(3, "x", "a"), make_insert(3, "yy", "a"));
    EXPECT_EQ(t.position, 5u);
}

TEST(TransformInsertInsert, tie_break_is_independent_of_arrival_order) {
    const auto from_a = make_insert(0, "A", "a");
    const auto from_b = make_insert(0, "B", "b");

    EXPECT_EQ(apply_pair("", from_a, from_b), "AB");
    EXPECT_EQ(apply_pair("", from_b, from_a), "AB");
    EXPECT_EQ(apply_pair("--", from_a, from_b), "AB--");
    EXPECT_EQ(apply_pair("--", from_b, from_a), "AB--");
}

TEST(TransformInsertInsert, content_and_author_are_preserved) {
    const auto in = make_insert(7, "hello", "a", 3);
    const auto t = transform(in, make_insert(1, "zz", "b"));
    EXPECT_EQ(t.content, "hello");
    EXPECT_EQ(t.author_id, "a");
    EXPECT_EQ(t.base_version, 3u);
}

// -- insert vs delete ---------------------------------------------------------

TEST(TransformInsertDelete, before_or_at_delete_start_is_unchanged) {
    EXPECT_EQ(transform(make_insert(3, "x", "a"), make_delete(5, 4, "b")).position, 3u);
    EXPECT_EQ(transform(make_insert(5, "x", "a"), make_delete(5, 4, "b")).position, 5u);
}

TEST(TransformInsertDelete, past_deleted_range_shifts_left) {
    EXPECT_EQ(transform(make_insert(10, "x", "a"), make_delete(5, 4, "b")).position, 6u);
}

TEST(TransformInsertDelete, inside_deleted_range_clamps_to_start) {
    EXPECT_EQ(transform(make_insert(7, "x", "a"), make_delete(5, 4, "b")).position, 5u);
    EXPECT_EQ(transform(make_insert(9, "x", "a"), make_delete(5, 4, "b")).position, 5u);
}

TEST(TransformInsertDelete, insert_after_deleted_text_lands_in_place) {
    //                 0123456789
    const auto text = std::string{"abcdefghij"};
    EXPECT_EQ(apply_pair(text, make_delete(2, 3, "b"), make_insert(8, "_", "a")),
              "abfgh_ij");
}

// -- delete vs insert ---------------------------------------------------------

TEST(TransformDeleteInsert, before_insert_is_unchanged) {
    const auto t = transform(make_delete(2, 2, "a"), make_insert(5, "ab", "b"));
    EXPECT_EQ(t.position, 2u);
    EXPECT_EQ(t.length, 2u);
}

TEST(TransformDeleteInsert, at_or_after_insert_shifts_right) {
    EXPECT_EQ(transform(make_delete(5, 3, "a"), make_insert(5, "ab", "b")).position, 7u);
    EXPECT_EQ(transform(make_delete(8, 1, "a"), make_insert(5, "ab", "b")).position, 10u);
}

TEST(TransformDeleteInsert, shifted_delete_removes_the_intended_text) {
    const auto text = std::string{"abcdefghij"};
    EXPECT_EQ(apply_pair(text, make_insert(1, "XY", "b"), make_delete(4, 2, "a")),
              "aXYbcdghij");
}

// -- delete vs delete ---------------------------------------------------------

TEST(TransformDeleteDelete, disjoint_earlier_delete_is_unchanged) {
    const auto t = transform(make_delete(0, 2, "a"), make_delete(5, 3, "b"));
    EXPECT_EQ(t.position, 0u);
    EXPECT_EQ(t.length, 2u);
}

TEST(TransformDeleteDelete, disjoint_later_delete_shifts_left) {
    const auto t = transform(make_delete(20, 2, "a"), make_delete(5, 3, "b"));
    EXPECT_EQ(t.position, 17u);
    EXPECT_EQ(t.length, 2u);
}

TEST(TransformDeleteDelete, identical_ranges_become_noop) {
    const auto t = transform(make_delete(5, 3, "a"), make_delete(5, 3, "b"));
    EXPECT_EQ(t.position, 5u);
    EXPECT_EQ(t.length, 0u);
}

TEST(TransformDeleteDelete, range_covered_by_applied_delete_becomes_noop) {
    EXPECT_EQ(transform(make_delete(5, 2, "a"), make_delete(5, 10, "b")).length, 0u);

    const auto inside = transform(make_delete(6, 2, "a"), make_delete(5, 10, "b"));
    EXPECT_EQ(inside.position, 5u);
    EXPECT_EQ(inside.length, 0u);
}

TEST(TransformDeleteDelete, same_start_longer_delete_keeps_its_tail) {
    const auto t = transform(make_delete(5, 6, "a"), make_delete(5, 2, "b"));
    EXPECT_EQ(t.position, 5u);
    EXPECT_EQ(t.length, 4u);
}

TEST(TransformDeleteDelete, earlier_overlapping_delete_drops_shared_tail) {
    const auto t = transform(make_delete(3, 4, "a"), make_delete(5, 3, "b"));
    EXPECT_EQ(t.position, 3u);
    EXPECT_EQ(t.length, 2u);
}

TEST(TransformDeleteDelete, later_overlapping_delete_never_removes_text_twice) {
    // Delete(5, 10) applied; Delete(8, 10) was made against the same base.
    const auto applied = make_delete(5, 10, "a");
    const auto t = transform(make_delete(8, 10, "b"), applied);

    EXPECT_EQ(t.position, 5u);
    EXPECT_EQ(t.length, 3u);
    EXPECT_LE(t.length, 10u);

    //                 0         1         2
    //                 012345678901234567890123456
    const auto text = std::string{"0123456789abcdefghijklmnopq"};
    // Union of [5, 15) and [8, 18) is removed, nothing else.
    EXPECT_EQ(apply_pair(text, applied, make_delete(8, 10, "b")), "01234ijklmnopq");
}

// -- replace ------------------------------------------------------------------

TEST(TransformReplace, applied_replace_counts_as_delete_then_insert) {
    const auto applied = make_replace(5, 2, "XYZ", "b");
    const auto t = transform(make_insert(10, "q", "a"), applied);
    EXPECT_EQ(t.position, 11u);

    EXPECT_EQ(apply_pair("0123456789ABC", applied, make_insert(10, "q", "a")),
              "01234XYZ789qABC");
}

TEST(TransformReplace, incoming_replace_moves_like_a_delete) {
    const auto t = transform(make_replace(8, 2, "Q", "a"), make_insert(2, "ab", "b"));
    EXPECT_EQ(t.kind, EditKind::replace);
    EXPECT_EQ(t.position, 10u);
    EXPECT_EQ(t.length, 2u);
    EXPECT_EQ(t.content, "Q");
}

TEST(TransformReplace, incoming_replace_inside_applied_delete_keeps_content) {
    const auto t = transform(make_replace(6, 2, "Q", "a"), make_delete(5, 10, "b"));
    EXPECT_EQ(t.position, 5u);
    EXPECT_EQ(t.length, 0u);
    EXPECT_EQ(t.content, "Q");
}

// -- sequences ----------------------------------------------------------------

TEST(TransformAgainst, empty_sequence_returns_input) {
    const auto in = make_insert(4, "x", "a");
    EXPECT_EQ(transform_against(in, {}), in);
}

TEST(TransformAgainst, applies_each_edit_oldest_first) {
    const auto applied = std::vector<Edit>{
        make_insert(0, "abc", "b"),  // shifts by 3
        make_delete(0, 2, "c"),      // then shifts left by 2
    };
    const auto t = transform_against(make_insert(5, "x", "a"), applied);
    EXPECT_EQ(t.position, 6u);
}
