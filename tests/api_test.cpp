#include <jsondelta-cpp/api.hpp>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <string>
#include <vector>

using namespace jsondelta_cpp;
using json = nlohmann::json;

// =============================================================================
// Strategy names
// =============================================================================

TEST(Strategy, names_round_trip) {
    for (auto s : {Strategy::structural, Strategy::operational, Strategy::semantic}) {
        EXPECT_EQ(parse_strategy(to_string_view(s)), s);
    }
    EXPECT_FALSE(parse_strategy("Structural").has_value());
    EXPECT_FALSE(parse_strategy("").has_value());
}

// =============================================================================
// Errors
// =============================================================================

TEST(TextApi, malformed_document_is_parse_error) {
    for (auto s : {Strategy::structural, Strategy::operational, Strategy::semantic}) {
        const auto r = diff(s, "{\"a\":", "{}");
        ASSERT_FALSE(r.ok());
        EXPECT_EQ(r.error().kind, ErrorKind::parse_error);
        EXPECT_EQ(r.error().message.rfind("JSON parse error: ", 0), 0u);
    }
    EXPECT_EQ(patch(Strategy::structural, "{}", "nope").error().kind, ErrorKind::parse_error);
    EXPECT_EQ(expand_text("[1,").error().kind, ErrorKind::parse_error);
}

TEST(TextApi, unreadable_operation_log_is_invalid_delta) {
    const auto r = patch(Strategy::operational, "{}", R"({"operations": 3})");
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error().kind, ErrorKind::invalid_delta);

    EXPECT_EQ(inverse(Strategy::operational, "[]").error().kind, ErrorKind::invalid_delta);
    EXPECT_EQ(validate(Strategy::operational, "{}", R"({"operations":[{"path":[]}]})").error().kind,
              ErrorKind::invalid_delta);
}

TEST(TextApi, unreadable_semantic_delta_is_invalid_delta) {
    EXPECT_EQ(patch(Strategy::semantic, "{}", "[]").error().kind, ErrorKind::invalid_delta);
    EXPECT_EQ(inverse(Strategy::semantic, "\"x\"").error().kind, ErrorKind::invalid_delta);

    const auto texts = std::vector<std::string>{"{}", "17"};
    EXPECT_EQ(merge(Strategy::semantic, texts).error().kind, ErrorKind::invalid_delta);
}

TEST(TextApi, bad_delta_text_in_merge_is_parse_error) {
    const auto texts = std::vector<std::string>{"{}", "{"};
    EXPECT_EQ(merge(Strategy::structural, texts).error().kind, ErrorKind::parse_error);
}

TEST(TextApi, unknown_options_are_ignored) {
    const auto options = OptionMap{{"no_such_option", "1"}, {"include_moves", "maybe"}};
    const auto r = diff(Strategy::structural, R"({"a":1})", R"({"a":2})", options);
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(json::parse(r.value()), json::parse(R"({"a":[1,2]})"));
}

TEST(TextApi, ill_fitting_delta_leaves_value_unchanged) {
    const auto r = patch(Strategy::structural, R"({"s":3,"t":"x"})", R"({"s":[{"text_diff":[]},0,2]})");
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(json::parse(r.value()), json::parse(R"({"s":3,"t":"x"})"));
}

// =============================================================================
// End to end
// =============================================================================

TEST(TextApi, structural_cycle) {
    const auto old_text = std::string{R"({"a":1,"list":[1,2,3]})"};
    const auto new_text = std::string{R"({"a":2,"list":[3,1,2],"b":true})"};

    const auto delta = diff(Strategy::structural, old_text, new_text);
    ASSERT_TRUE(delta.ok());
    EXPECT_EQ(json::parse(delta.value()).at("a"), json::parse("[1,2]"));

    const auto patched = patch(Strategy::structural, old_text, delta.value());
    ASSERT_TRUE(patched.ok());
    EXPECT_EQ(json::parse(patched.value()), json::parse(new_text));

    EXPECT_TRUE(validate(Strategy::structural, old_text, delta.value()).value());

    const auto inv = inverse(Strategy::structural, delta.value());
    ASSERT_TRUE(inv.ok());
    EXPECT_EQ(json::parse(patch(Strategy::structural, new_text, inv.value()).value()),
              json::parse(old_text));
}

TEST(TextApi, structural_options_are_forwarded) {
    const auto r = diff(Strategy::structural, "[1,2,3]", "[3,1,2]", {{"include_moves", "false"}});
    ASSERT_TRUE(r.ok());
    const auto j = json::parse(r.value());
    ASSERT_TRUE(j.is_object());
    for (const auto& [key, entry] : j.items()) {
        EXPECT_FALSE(entry.is_array() && entry.size() == 3 && entry[2] == 3) << key;
    }
}

TEST(TextApi, equal_documents_give_empty_structural_delta) {
    EXPECT_EQ(diff(Strategy::structural, R"({"a":[1]})", R"({"a":[1]})").value(), "{}");
}

TEST(TextApi, operational_cycle) {
    const auto old_text = std::string{R"({"name":"Ada","tags":["x"]})"};
    const auto new_text = std::string{R"({"name":"Grace","tags":["x","y"]})"};
    const auto options = OptionMap{{"actor_id", "alice"}, {"timestamp", "100"}};

    const auto log = diff(Strategy::operational, old_text, new_text, options);
    ASSERT_TRUE(log.ok());
    const auto j = json::parse(log.value());
    ASSERT_FALSE(j.at("operations").empty());
    EXPECT_EQ(j.at("operations").at(0).at("actor_id"), "alice");
    EXPECT_EQ(j.at("operations").at(0).at("timestamp"), 100);
    EXPECT_EQ(j.at("metadata").at("actors"), json::parse(R"(["alice"])"));

    const auto patched = patch(Strategy::operational, old_text, log.value());
    ASSERT_TRUE(patched.ok());
    EXPECT_EQ(json::parse(patched.value()), json::parse(new_text));
    EXPECT_TRUE(validate(Strategy::operational, old_text, log.value()).value());
    EXPECT_TRUE(inverse(Strategy::operational, log.value()).ok());
}

TEST(TextApi, operational_merge_resolution_option) {
    const auto a = diff(Strategy::operational, "{}", R"({"x":1})",
                        {{"actor_id", "a"}, {"timestamp", "5"}}).value();
    const auto b = diff(Strategy::operational, "{}", R"({"x":2})",
                        {{"actor_id", "b"}, {"timestamp", "3"}}).value();
    const auto texts = std::vector<std::string>{a, b};

    const auto merged = merge(Strategy::operational, texts, {{"conflict_resolution", "merge"}});
    ASSERT_TRUE(merged.ok());
    const auto j = json::parse(merged.value());
    EXPECT_EQ(j.at("metadata").at("conflict_resolution"), "merge");
    EXPECT_EQ(j.at("metadata").at("actors"), json::parse(R"(["a","b"])"));
    EXPECT_EQ(j.at("operations").at(0).at("actor_id"), "b");

    EXPECT_EQ(json::parse(patch(Strategy::operational, "{}", merged.value()).value()),
              json::parse(R"({"x":1})"));

    const auto defaulted = json::parse(merge(Strategy::operational, texts).value());
    EXPECT_EQ(defaulted.at("metadata").at("conflict_resolution"), "last_write_wins");
}

TEST(TextApi, semantic_cycle) {
    const auto old_text = std::string{R"({"@id":"http://ex.org/p","name":"Ada"})"};
    const auto new_text = std::string{R"({"@id":"http://ex.org/p","name":"Grace","age":36})"};

    const auto delta = diff(Strategy::semantic, old_text, new_text);
    ASSERT_TRUE(delta.ok());
    const auto j = json::parse(delta.value());
    EXPECT_EQ(j.at("added_triples").size(), 2u);
    EXPECT_EQ(j.at("removed_triples").size(), 1u);

    EXPECT_EQ(json::parse(patch(Strategy::semantic, old_text, delta.value()).value()),
              json::parse(new_text));
    EXPECT_TRUE(validate(Strategy::semantic, old_text, delta.value()).value());
    EXPECT_FALSE(validate(Strategy::semantic, new_text, delta.value()).value());

    const auto inv = inverse(Strategy::semantic, delta.value());
    ASSERT_TRUE(inv.ok());
    EXPECT_EQ(json::parse(patch(Strategy::semantic, new_text, inv.value()).value()),
              json::parse(old_text));
}

TEST(TextApi, semantic_equivalence_flag) {
    const auto r = diff(Strategy::semantic,
                        R"({"@id":"http://ex.org/p","t":["a","b"]})",
                        R"({"t":{"@set":["b","a"]},"@id":"http://ex.org/p"})");
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(json::parse(r.value()).at("metadata").at("semantic_equivalence"), true);
}

TEST(TextApi, expand_text_output) {
    const auto r = expand_text(R"({"name":"Ada"})");
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(json::parse(r.value()), json::parse(R"([{"http://example.org/name":[{"@value":"Ada"}]}])"));
}

TEST(TextApi, caches_do_not_change_results) {
    auto caches = Caches{};
    const auto old_text = std::string{R"({"doc":{"body":"the quick brown fox jumps over the lazy dog again and again and again"}})"};
    const auto new_text = std::string{R"({"doc":{"body":"the quick brown cat jumps over the lazy dog again and again and again"}})"};
    const auto plain = diff(Strategy::structural, old_text, new_text);
    EXPECT_EQ(diff(Strategy::structural, old_text, new_text, {}, &caches), plain);
    EXPECT_EQ(diff(Strategy::structural, old_text, new_text, {}, &caches), plain);
}
