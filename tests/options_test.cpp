#include <jsondelta-cpp/options.hpp>

#include <gtest/gtest.h>

#include <string>

using namespace jsondelta_cpp;

TEST(ArrayStrategy, to_string_view_covers_all_variants) {
    EXPECT_EQ(to_string_view(ArrayStrategy::lcs),    "lcs");
    EXPECT_EQ(to_string_view(ArrayStrategy::simple), "simple");
    EXPECT_EQ(to_string_view(ArrayStrategy::myers),  "myers");
}

TEST(ConflictResolution, parse_round_trips) {
    for (auto c : {ConflictResolution::last_write_wins, ConflictResolution::merge}) {
        EXPECT_EQ(parse_conflict_resolution(to_string_view(c)), c);
    }
    EXPECT_FALSE(parse_conflict_resolution("first_write_wins").has_value());
}

TEST(BlankNodeStrategy, parse_round_trips) {
    for (auto s : {BlankNodeStrategy::hash, BlankNodeStrategy::uuid, BlankNodeStrategy::preserve}) {
        EXPECT_EQ(parse_blank_node_strategy(to_string_view(s)), s);
    }
}

TEST(ParseBool, accepted_spellings) {
    EXPECT_EQ(parse_bool("true"), true);
    EXPECT_EQ(parse_bool("1"), true);
    EXPECT_EQ(parse_bool("yes"), true);
    EXPECT_EQ(parse_bool("false"), false);
    EXPECT_EQ(parse_bool("0"), false);
    EXPECT_EQ(parse_bool("no"), false);
    EXPECT_FALSE(parse_bool("TRUE").has_value());
}

TEST(StructuralOptions, defaults) {
    const auto opts = StructuralOptions::from_map({});
    EXPECT_TRUE(opts.include_moves);
    EXPECT_EQ(opts.array_diff, ArrayStrategy::lcs);
    EXPECT_TRUE(opts.text_diff);
    EXPECT_EQ(opts.text_diff_threshold, 60u);
}

TEST(StructuralOptions, from_map_reads_every_key) {
    const auto opts = StructuralOptions::from_map({
        {"include_moves", "false"},
        {"array_diff", "myers"},
        {"text_diff", "no"},
        {"text_diff_threshold", "12"},
    });
    EXPECT_FALSE(opts.include_moves);
    EXPECT_EQ(opts.array_diff, ArrayStrategy::myers);
    EXPECT_FALSE(opts.text_diff);
    EXPECT_EQ(opts.text_diff_threshold, 12u);
}

TEST(StructuralOptions, unknown_keys_and_bad_values_keep_defaults) {
    const auto opts = StructuralOptions::from_map({
        {"array_diff", "quantum"},
        {"text_diff_threshold", "-5"},
        {"color", "blue"},
    });
    EXPECT_EQ(opts.array_diff, ArrayStrategy::lcs);
    EXPECT_EQ(opts.text_diff_threshold, 60u);
}

TEST(OperationalOptions, from_map) {
    const auto opts = OperationalOptions::from_map({
        {"actor_id", "alice"},
        {"timestamp", "1000"},
        {"conflict_resolution", "merge"},
    });
    EXPECT_EQ(opts.actor_id, "alice");
    EXPECT_EQ(opts.timestamp, 1000u);
    EXPECT_EQ(opts.conflict_resolution, ConflictResolution::merge);
}

TEST(OperationalOptions, malformed_timestamp_is_ignored) {
    const auto opts = OperationalOptions::from_map({{"timestamp", "soon"}});
    EXPECT_FALSE(opts.timestamp.has_value());
    EXPECT_TRUE(opts.actor_id.empty());
}

TEST(SemanticOptions, from_map) {
    const auto opts = SemanticOptions::from_map({
        {"normalize", "false"},
        {"context_aware", "0"},
        {"expand_contexts", "true"},
        {"blank_node_strategy", "preserve"},
    });
    EXPECT_FALSE(opts.normalize);
    EXPECT_FALSE(opts.context_aware);
    EXPECT_TRUE(opts.expand_contexts);
    EXPECT_EQ(opts.blank_node_strategy, BlankNodeStrategy::preserve);
}

TEST(GenerateActorId, shape_and_uniqueness) {
    const auto a = generate_actor_id();
    const auto b = generate_actor_id();
    EXPECT_EQ(a.size(), 22u);
    EXPECT_EQ(a.rfind("actor_", 0), 0u);
    EXPECT_NE(a, b);
}

TEST(NowNanoseconds, is_after_2020) {
    EXPECT_GT(now_nanoseconds(), 1'577'836'800'000'000'000ULL);
}
