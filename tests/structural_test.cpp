#include <jsondelta-cpp/structural.hpp>
#include <jsondelta-cpp/json.hpp>
#include <jsondelta-cpp/text_diff.hpp>

#include <gtest/gtest.h>

#include <string>
#include <utility>
#include <vector>

using namespace jsondelta_cpp;

namespace {

auto v(const char* text) -> Value { return parse_value(text); }

auto no_moves() -> StructuralOptions {
    auto opts = StructuralOptions{};
    opts.include_moves = false;
    return opts;
}

auto with_strategy(ArrayStrategy strategy, bool moves) -> StructuralOptions {
    auto opts = StructuralOptions{};
    opts.array_diff = strategy;
    opts.include_moves = moves;
    return opts;
}

// Document pairs that exercise objects, arrays, moves, nesting and text.
auto round_trip_pairs() -> std::vector<std::pair<Value, Value>> {
    const auto long_a = std::string(80, 'x') + " tail";
    const auto long_b = std::string(40, 'x') + "INSERTED" + std::string(40, 'x') + " tale";
    return {
        {v(R"({"a":1})"), v(R"({"a":2})")},
        {v(R"({"a":1,"b":{"c":[1,2,3]}})"), v(R"({"b":{"c":[3,1,2],"d":true}})")},
        {v(R"(["a","b","c"])"), v(R"(["c","a","b"])")},
        {v(R"(["a","b","c","d"])"), v(R"(["b","c","d","e"])")},
        {v(R"(["a","b","c"])"), v(R"(["x","a","b","c"])")},
        {v(R"(["a","b","c"])"), v(R"(["b","a"])")},
        {v(R"(["a","b"])"), v(R"(["b","a","c"])")},
        {v(R"([1,2,3,4,5])"), v(R"([5,4,3,2,1])")},
        {v(R"([1,1,2,2])"), v(R"([2,1,2,1,1])")},
        {v(R"([{"x":1},"k"])"), v(R"(["k",{"x":2}])")},
        {v(R"([[1,2],[3]])"), v(R"([[3],[1,2,9]])")},
        {v(R"([])"), v(R"([1,2])")},
        {v(R"([1,2])"), v(R"([])")},
        {v(R"({"list":[1,2,3]})"), v(R"({"list":"flat"})")},
        {v(R"(null)"), v(R"({"a":1})")},
        {v(R"(1)"), v(R"(1.0)")},
        {Value{Object{{"s", long_a}}}, Value{Object{{"s", long_b}}}},
        {Value{Array{long_a, "z"}}, Value{Array{"z", long_b}}},
    };
}

}  // namespace

// =============================================================================
// Concrete scenarios
// =============================================================================

TEST(DiffStructural, replaced_scalar) {
    EXPECT_EQ(diff_structural(v(R"({"a":1})"), v(R"({"a":2})")), v(R"({"a":[1,2]})"));
}

TEST(PatchStructural, replaced_scalar) {
    EXPECT_EQ(patch_structural(v(R"({"a":1})"), v(R"({"a":[1,2]})")), v(R"({"a":2})"));
}

TEST(DiffStructural, removed_key) {
    const auto delta = diff_structural(v(R"({"a":1})"), v(R"({})"));
    EXPECT_EQ(delta, v(R"({"a":[1,0,0]})"));
    EXPECT_EQ(patch_structural(v(R"({"a":1})"), delta), v(R"({})"));
}

TEST(DiffStructural, added_key) {
    EXPECT_EQ(diff_structural(v(R"({})"), v(R"({"a":[1]})")), v(R"({"a":[[1]]})"));
}

TEST(DiffStructural, nested_object) {
    const auto delta = diff_structural(v(R"({"p":{"q":1,"r":2}})"), v(R"({"p":{"q":1,"r":3}})"));
    EXPECT_EQ(delta, v(R"({"p":{"r":[2,3]}})"));
}

TEST(DiffStructural, integer_and_double_are_different) {
    EXPECT_EQ(diff_structural(v("1"), v("1.0")), make_array({1, 1.0}));
}

// =============================================================================
// Idempotence
// =============================================================================

TEST(DiffStructural, equal_documents_give_empty_delta) {
    const auto doc = v(R"({"a":[1,{"b":null}],"c":"text"})");
    const auto delta = diff_structural(doc, doc);
    EXPECT_TRUE(is_empty_delta(delta));
    EXPECT_EQ(patch_structural(doc, delta), doc);
}

TEST(DiffStructural, key_order_does_not_matter) {
    EXPECT_TRUE(is_empty_delta(diff_structural(v(R"({"a":1,"b":2})"), v(R"({"b":2,"a":1})"))));
}

// =============================================================================
// Arrays
// =============================================================================

TEST(DiffStructural, rotation_is_three_moves) {
    const auto delta = diff_structural(v(R"(["a","b","c"])"), v(R"(["c","a","b"])"));
    EXPECT_EQ(delta, v(R"({"_0":["",2,3],"_1":["",0,3],"_2":["",1,3]})"));
}

TEST(DiffStructural, rotation_without_moves_is_positional) {
    const auto delta = diff_structural(v(R"(["a","b","c"])"), v(R"(["c","a","b"])"), no_moves());
    EXPECT_EQ(delta, v(R"({"_0":["a","c"],"_1":["b","a"],"_2":["c","b"]})"));
}

TEST(DiffStructural, simple_strategy_ignores_moves) {
    const auto delta = diff_structural(v(R"(["a","b","c"])"), v(R"(["c","a","b"])"),
                                       with_strategy(ArrayStrategy::simple, true));
    EXPECT_EQ(delta, v(R"({"_0":["a","c"],"_1":["b","a"],"_2":["c","b"]})"));
}

TEST(DiffStructural, appended_and_truncated_elements) {
    EXPECT_EQ(diff_structural(v("[1]"), v("[1,2,3]"), no_moves()), v(R"({"1":[2],"2":[3]})"));
    EXPECT_EQ(diff_structural(v("[1,2,3]"), v("[1]"), no_moves()),
              v(R"({"_1":[2,0,0],"_2":[3,0,0]})"));
}

TEST(DiffStructural, myers_emits_deletes_and_inserts) {
    const auto opts = with_strategy(ArrayStrategy::myers, false);
    EXPECT_EQ(diff_structural(v("[1,2,3,4]"), v("[1,3,4,5]"), opts),
              v(R"({"_1":[2,0,0],"3":[5]})"));
    EXPECT_EQ(diff_structural(v("[1,2,3]"), v("[1,9,2,3]"), opts), v(R"({"1":[9]})"));
}

TEST(PatchStructural, myers_interleaved_edits) {
    const auto old_doc = v(R"(["a","b","c","d"])");
    const auto new_doc = v(R"(["x","b","y","d"])");
    const auto delta = diff_structural(old_doc, new_doc, with_strategy(ArrayStrategy::myers, false));
    EXPECT_EQ(delta, v(R"({"_0":["a",0,0],"0":["x"],"_2":["c",0,0],"2":["y"]})"));
    EXPECT_EQ(patch_structural(old_doc, delta), new_doc);
}

TEST(PatchStructural, moves_with_insert_and_delete) {
    EXPECT_EQ(patch_structural(v(R"(["a","b","c"])"),
                               v(R"({"_0":["",1,3],"_1":["",0,3],"_2":["c",0,0]})")),
              v(R"(["b","a"])"));
    EXPECT_EQ(patch_structural(v(R"(["a","b"])"),
                               v(R"({"_0":["",1,3],"_1":["",0,3],"2":["c"]})")),
              v(R"(["b","a","c"])"));
}

// =============================================================================
// Text diffs
// =============================================================================

TEST(DiffStructural, long_string_change_is_a_text_diff) {
    auto old_text = std::string(100, 'a');
    auto new_text = old_text;
    new_text[50] = 'b';

    const auto delta = diff_structural(Value{Object{{"s", old_text}}}, Value{Object{{"s", new_text}}});
    const auto* entry = delta.find("s");
    ASSERT_NE(entry, nullptr);
    const auto* slots = entry->get_if<Array>();
    ASSERT_NE(slots, nullptr);
    ASSERT_EQ(slots->size(), 3u);
    EXPECT_EQ((*slots)[1], Value{0});
    EXPECT_EQ((*slots)[2], Value{delta_text_diff});

    const auto ops = read_text_ops((*slots)[0]);
    ASSERT_EQ(ops.size(), 1u);
    EXPECT_EQ(ops[0].kind, TextOpKind::replace);
    EXPECT_EQ(ops[0].old_range, (TextRange{50, 51}));
    EXPECT_EQ(ops[0].new_range, (TextRange{50, 51}));

    EXPECT_EQ(patch_structural(Value{Object{{"s", old_text}}}, delta), (Value{Object{{"s", new_text}}}));
}

TEST(DiffStructural, short_string_change_is_a_replacement) {
    const auto delta = diff_structural(v(R"({"s":"aaaaaaaaaa"})"), v(R"({"s":"aaaaabaaaa"})"));
    EXPECT_EQ(delta, v(R"({"s":["aaaaaaaaaa","aaaaabaaaa"]})"));
}

TEST(DiffStructural, threshold_applies_to_both_sides) {
    const auto long_text = std::string(100, 'a');
    const auto delta = diff_structural(Value{long_text}, Value{"short"});
    EXPECT_EQ(delta, (Value{Array{long_text, "short"}}));
}

TEST(DiffStructural, text_diff_can_be_disabled) {
    auto opts = StructuralOptions{};
    opts.text_diff = false;
    const auto a = std::string(100, 'a');
    const auto b = std::string(99, 'a') + "b";
    EXPECT_EQ(diff_structural(Value{a}, Value{b}, opts), (Value{Array{a, b}}));
}

TEST(DiffStructural, custom_threshold) {
    auto opts = StructuralOptions{};
    opts.text_diff_threshold = 5;
    const auto delta = diff_structural(Value{"abcdefgh"}, Value{"abcdXfgh"}, opts);
    EXPECT_EQ(delta.get_if<Array>()->size(), 3u);
}

// =============================================================================
// Round trip
// =============================================================================

TEST(PatchStructural, round_trip_with_every_array_strategy) {
    const auto option_sets = std::vector<StructuralOptions>{
        StructuralOptions{},
        no_moves(),
        with_strategy(ArrayStrategy::simple, true),
        with_strategy(ArrayStrategy::myers, true),
        with_strategy(ArrayStrategy::myers, false),
    };
    for (const auto& opts : option_sets) {
        for (const auto& [old_doc, new_doc] : round_trip_pairs()) {
            const auto delta = diff_structural(old_doc, new_doc, opts);
            EXPECT_EQ(patch_structural(old_doc, delta), new_doc)
                << to_json_text(old_doc) << " -> " << to_json_text(new_doc)
                << " via " << to_json_text(delta)
                << " (" << to_string_view(opts.array_diff) << ")";
        }
    }
}

TEST(DiffStructural, caches_do_not_change_results) {
    auto caches = Caches{};
    auto disabled = Caches::disabled();
    for (const auto& [old_doc, new_doc] : round_trip_pairs()) {
        const auto plain = diff_structural(old_doc, new_doc);
        EXPECT_EQ(diff_structural(old_doc, new_doc, {}, &caches), plain);
        EXPECT_EQ(diff_structural(old_doc, new_doc, {}, &caches), plain);
        EXPECT_EQ(diff_structural(old_doc, new_doc, {}, disabled.get()), plain);
    }
}

// =============================================================================
// Permissive patching
// =============================================================================

TEST(PatchStructural, scalar_delta_replaces_document) {
    EXPECT_EQ(patch_structural(v(R"({"a":1})"), Value{7}), Value{7});
}

TEST(PatchStructural, object_delta_on_scalar_patches_empty_object) {
    EXPECT_EQ(patch_structural(Value{5}, v(R"({"a":[1]})")), v(R"({"a":1})"));
    EXPECT_EQ(patch_structural(Value{5}, v("{}")), Value{5});
}

TEST(PatchStructural, nested_delta_for_missing_key_is_inserted_verbatim) {
    EXPECT_EQ(patch_structural(v("{}"), v(R"({"a":{"b":[1]}})")), v(R"({"a":{"b":[1]}})"));
}

TEST(PatchStructural, out_of_range_indices_are_skipped) {
    EXPECT_EQ(patch_structural(v("[1]"), v(R"({"_5":[9,0,0],"_3":[1,2]})")), v("[1]"));
}

TEST(PatchStructural, text_diff_on_non_string_is_skipped) {
    const auto delta = Value{Object{{"n", make_text_diff_delta(diff_text("abc", "abd"))}}};
    EXPECT_EQ(patch_structural(v(R"({"n":3})"), delta), v(R"({"n":3})"));
}

TEST(PatchStructural, insert_beyond_end_appends) {
    EXPECT_EQ(patch_structural(v("[1]"), v(R"({"7":[2]})")), v("[1,2]"));
}

// =============================================================================
// Validate
// =============================================================================

TEST(ValidateStructural, own_base_is_valid) {
    for (const auto& [old_doc, new_doc] : round_trip_pairs()) {
        EXPECT_TRUE(validate_structural(old_doc, diff_structural(old_doc, new_doc)))
            << to_json_text(old_doc);
    }
}

TEST(ValidateStructural, mismatched_old_value) {
    EXPECT_FALSE(validate_structural(v(R"({"a":5})"), v(R"({"a":[1,2]})")));
    EXPECT_FALSE(validate_structural(v(R"({"a":5})"), v(R"({"a":[1,0,0]})")));
}

TEST(ValidateStructural, add_over_existing_key) {
    EXPECT_FALSE(validate_structural(v(R"({"a":5})"), v(R"({"a":[1]})")));
}

TEST(ValidateStructural, missing_move_source) {
    EXPECT_FALSE(validate_structural(v(R"(["a"])"), v(R"({"_0":["",4,3]})")));
}

TEST(ValidateStructural, duplicate_move_source) {
    EXPECT_FALSE(validate_structural(v(R"(["a","b"])"), v(R"({"_0":["",1,3],"_1":["",1,3]})")));
}

TEST(ValidateStructural, text_diff_against_other_text) {
    const auto delta = diff_structural(Value{std::string(70, 'a')}, Value{std::string(70, 'b')});
    EXPECT_TRUE(validate_structural(Value{std::string(70, 'a')}, delta));
    EXPECT_FALSE(validate_structural(Value{std::string(70, 'c')}, delta));
}

// =============================================================================
// Inverse
// =============================================================================

TEST(InverseStructural, scalar_entries) {
    EXPECT_EQ(inverse_structural(v(R"({"a":[1,2]})")), v(R"({"a":[2,1]})"));
    EXPECT_EQ(inverse_structural(v(R"({"a":[1,0,0]})")), v(R"({"a":[1]})"));
    EXPECT_EQ(inverse_structural(v(R"({"a":[1]})")), v(R"({"a":[1,0,0]})"));
}

TEST(InverseStructural, moves_swap_source_and_target) {
    EXPECT_EQ(inverse_structural(v(R"({"_0":["",2,3],"_1":["",0,3],"_2":["",1,3]})")),
              v(R"({"_2":["",0,3],"_0":["",1,3],"_1":["",2,3]})"));
}

TEST(InverseStructural, undoes_every_round_trip_pair) {
    for (const auto& [old_doc, new_doc] : round_trip_pairs()) {
        const auto delta = diff_structural(old_doc, new_doc);
        const auto undo = inverse_structural(delta, &old_doc);
        EXPECT_EQ(patch_structural(new_doc, undo), old_doc)
            << to_json_text(old_doc) << " <- " << to_json_text(new_doc);
    }
}

TEST(InverseStructural, base_disambiguates_numeric_object_keys) {
    const auto old_doc = v(R"({"0":"zero"})");
    const auto new_doc = v(R"({})");
    const auto delta = diff_structural(old_doc, new_doc);
    EXPECT_EQ(patch_structural(new_doc, inverse_structural(delta, &old_doc)), old_doc);
}

TEST(InverseStructural, inverting_twice_restores_delta) {
    const auto delta = v(R"({"a":[1,2],"b":[3,0,0],"c":{"d":[4]}})");
    EXPECT_EQ(inverse_structural(inverse_structural(delta)), delta);
}

// =============================================================================
// Merge
// =============================================================================

TEST(MergeStructural, later_entries_win) {
    const auto deltas = std::vector<Value>{v(R"({"a":[1,2],"b":[1]})"), v(R"({"a":[2,3]})")};
    EXPECT_EQ(merge_structural(deltas), v(R"({"a":[2,3],"b":[1]})"));
}

TEST(MergeStructural, nested_objects_merge_recursively) {
    const auto deltas = std::vector<Value>{v(R"({"p":{"x":[1,2]}})"), v(R"({"p":{"y":[3]}})")};
    EXPECT_EQ(merge_structural(deltas), v(R"({"p":{"x":[1,2],"y":[3]}})"));
}

TEST(MergeStructural, no_deltas_is_empty) {
    EXPECT_TRUE(is_empty_delta(merge_structural({})));
}
