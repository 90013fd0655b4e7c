#include <jsondelta-cpp/hash.hpp>
#include <jsondelta-cpp/json.hpp>

#include <gtest/gtest.h>

#include <functional>
#include <string>
#include <unordered_set>

using namespace jsondelta_cpp;

// -- structural_hash ----------------------------------------------------------

TEST(StructuralHash, equal_values_hash_equal) {
    const auto a = parse_value(R"({"x": [1, 2, {"y": "z"}], "w": null})");
    const auto b = parse_value(R"({"w": null, "x": [1, 2, {"y": "z"}]})");
    ASSERT_EQ(a, b);
    EXPECT_EQ(structural_hash(a), structural_hash(b));
}

TEST(StructuralHash, kinds_are_distinguished) {
    EXPECT_NE(structural_hash(Value{"1"}), structural_hash(Value{1}));
    EXPECT_NE(structural_hash(Value{1}), structural_hash(Value{1.0}));
    EXPECT_NE(structural_hash(Value{}), structural_hash(Value{false}));
}

TEST(StructuralHash, array_order_matters) {
    EXPECT_NE(structural_hash(make_array({1, 2})), structural_hash(make_array({2, 1})));
}

TEST(StructuralHash, signed_zero_hashes_alike) {
    EXPECT_EQ(structural_hash(Value{0.0}), structural_hash(Value{-0.0}));
}

TEST(StructuralHash, cache_does_not_change_result) {
    const auto long_text = Value{std::string(200, 'q')};
    auto cache = HashCache{};
    const auto uncached = structural_hash(long_text);
    EXPECT_EQ(structural_hash(long_text, &cache), uncached);
    EXPECT_EQ(structural_hash(long_text, &cache), uncached);
    EXPECT_EQ(cache.size(), 1u);
    EXPECT_EQ(cache.hits(), 1u);
}

TEST(StructuralHash, short_strings_bypass_cache) {
    auto cache = HashCache{};
    (void)structural_hash(Value{"short"}, &cache);
    EXPECT_EQ(cache.size(), 0u);
}

TEST(StdHash, usable_in_unordered_containers) {
    auto set = std::unordered_set<Value>{};
    set.insert(make_array({1, 2}));
    set.insert(make_array({1, 2}));
    set.insert(Value{"x"});
    EXPECT_EQ(set.size(), 2u);
}

// -- match_moved_elements -----------------------------------------------------

TEST(MatchMovedElements, rotation) {
    const auto old_items = Array{"a", "b", "c"};
    const auto new_items = Array{"c", "a", "b"};
    const auto m = match_moved_elements(old_items, new_items);
    ASSERT_EQ(m.size(), 3u);
    EXPECT_EQ(m[0], 2u);
    EXPECT_EQ(m[1], 0u);
    EXPECT_EQ(m[2], 1u);
}

TEST(MatchMovedElements, same_index_is_preferred) {
    const auto old_items = Array{"x", "a", "x"};
    const auto new_items = Array{"a", "x", "x"};
    const auto m = match_moved_elements(old_items, new_items);
    EXPECT_EQ(m[2], 2u);
    EXPECT_EQ(m[0], 1u);
    EXPECT_EQ(m[1], 0u);
}

TEST(MatchMovedElements, each_old_element_matches_once) {
    const auto old_items = Array{"a"};
    const auto new_items = Array{"a", "a"};
    const auto m = match_moved_elements(old_items, new_items);
    EXPECT_EQ(m[0], 0u);
    EXPECT_FALSE(m[1].has_value());
}

TEST(MatchMovedElements, unmatched_new_elements) {
    const auto m = match_moved_elements(Array{1}, Array{2});
    EXPECT_FALSE(m[0].has_value());
}
