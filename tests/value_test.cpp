#include <jsondelta-cpp/value.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <string>

using namespace jsondelta_cpp;

// -- ValueKind ----------------------------------------------------------------

TEST(ValueKind, to_string_view_covers_all_variants) {
    EXPECT_EQ(to_string_view(ValueKind::null),             "null");
    EXPECT_EQ(to_string_view(ValueKind::boolean),          "boolean");
    EXPECT_EQ(to_string_view(ValueKind::integer),          "integer");
    EXPECT_EQ(to_string_view(ValueKind::unsigned_integer), "unsigned_integer");
    EXPECT_EQ(to_string_view(ValueKind::real),             "real");
    EXPECT_EQ(to_string_view(ValueKind::string),           "string");
    EXPECT_EQ(to_string_view(ValueKind::array),            "array");
    EXPECT_EQ(to_string_view(ValueKind::object),           "object");
}

// -- Construction -------------------------------------------------------------

TEST(Value, default_is_null) {
    EXPECT_TRUE(Value{}.is_null());
    EXPECT_EQ(Value{}, Value{Null{}});
}

TEST(Value, integers_are_stored_signed_when_they_fit) {
    EXPECT_EQ(Value{42}.kind(), ValueKind::integer);
    EXPECT_EQ(Value{std::uint64_t{7}}.kind(), ValueKind::integer);
    EXPECT_EQ(Value{std::uint64_t{18446744073709551615ULL}}.kind(), ValueKind::unsigned_integer);
}

TEST(Value, bool_is_not_an_integer) {
    EXPECT_EQ(Value{true}.kind(), ValueKind::boolean);
}

TEST(Value, strings_from_every_spelling) {
    EXPECT_EQ(Value{"a"}, Value{std::string{"a"}});
    EXPECT_EQ(Value{std::string_view{"a"}}, Value{"a"});
}

// -- Equality -----------------------------------------------------------------

TEST(Value, integer_and_double_differ) {
    EXPECT_NE(Value{1}, Value{1.0});
}

TEST(Value, objects_compare_as_key_sets) {
    const auto a = Value{Object{{"x", 1}, {"y", 2}}};
    const auto b = Value{Object{{"y", 2}, {"x", 1}}};
    EXPECT_EQ(a, b);
}

TEST(Value, arrays_compare_in_order) {
    EXPECT_NE(make_array({1, 2}), make_array({2, 1}));
    EXPECT_EQ(make_array({1, 2}), make_array({1, 2}));
}

// -- Access -------------------------------------------------------------------

TEST(Value, find_member) {
    auto v = Value{Object{{"name", "Ada"}}};
    ASSERT_NE(v.find("name"), nullptr);
    EXPECT_EQ(*v.find("name"), Value{"Ada"});
    EXPECT_EQ(v.find("missing"), nullptr);
    EXPECT_EQ(Value{3}.find("name"), nullptr);
}

TEST(Value, size_of_containers_and_scalars) {
    EXPECT_EQ(make_array({1, 2, 3}).size(), 3u);
    EXPECT_EQ(make_object("k", 1).size(), 1u);
    EXPECT_EQ(Value{"text"}.size(), 0u);
}

TEST(Value, as_string_view_of_non_string_is_empty) {
    EXPECT_EQ(as_string_view(Value{"abc"}), "abc");
    EXPECT_TRUE(as_string_view(Value{1}).empty());
}

TEST(Value, overload_visitor) {
    const auto v = Value{"text"};
    auto name = std::visit(overload{
        [](const std::string&) { return std::string{"string"}; },
        [](const auto&) { return std::string{"other"}; },
    }, v.storage());
    EXPECT_EQ(name, "string");
}
