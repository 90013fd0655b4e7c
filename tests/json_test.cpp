#include <jsondelta-cpp/json.hpp>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <string>

using namespace jsondelta_cpp;
using json = nlohmann::json;

// =============================================================================
// Conversion
// =============================================================================

TEST(ToValue, scalars) {
    EXPECT_EQ(to_value(json(nullptr)), Value{});
    EXPECT_EQ(to_value(json(true)), Value{true});
    EXPECT_EQ(to_value(json(-3)), Value{-3});
    EXPECT_EQ(to_value(json(2.5)), Value{2.5});
    EXPECT_EQ(to_value(json("s")), Value{"s"});
}

TEST(ToValue, small_unsigned_becomes_signed) {
    EXPECT_EQ(to_value(json(std::uint64_t{5})).kind(), ValueKind::integer);
    EXPECT_EQ(to_value(json(std::uint64_t{18446744073709551615ULL})).kind(),
              ValueKind::unsigned_integer);
}

TEST(ToValue, nested_containers) {
    const auto v = to_value(json::parse(R"({"a": [1, {"b": null}]})"));
    const auto expected = Value{Object{{"a", Array{1, Value{Object{{"b", Value{}}}}}}}};
    EXPECT_EQ(v, expected);
}

TEST(ToJsonValue, round_trips_through_nlohmann) {
    const auto text = std::string{R"({"a":[1,2.5,"x",true,null],"b":{"c":{}}})"};
    EXPECT_EQ(to_json_value(parse_value(text)), json::parse(text));
}

TEST(Adl, get_and_assign) {
    const auto j = json::parse(R"([1, "two"])");
    const auto v = j.get<Value>();
    EXPECT_EQ(v, make_array({1, "two"}));
    const json back = v;
    EXPECT_EQ(back, j);
}

// =============================================================================
// Text helpers
// =============================================================================

TEST(ParseValue, malformed_text_throws_parse_error) {
    EXPECT_THROW(parse_value("{"), json::parse_error);
    EXPECT_THROW(parse_value(""), json::parse_error);
}

TEST(ToJsonText, compact_by_default) {
    EXPECT_EQ(to_json_text(make_object("a", 1)), R"({"a":1})");
}

TEST(CanonicalText, sorts_keys) {
    const auto v = parse_value(R"({"b": 1, "a": 2})");
    EXPECT_EQ(canonical_text(v), R"({"a":2,"b":1})");
}

TEST(CanonicalText, invalid_utf8_throws_type_error) {
    const auto v = Value{std::string{"\xff\xfe"}};
    EXPECT_THROW((void)canonical_text(v), json::type_error);
}
