#include <jsondelta-cpp/expand.hpp>
#include <jsondelta-cpp/json.hpp>

#include <gtest/gtest.h>

using namespace jsondelta_cpp;

namespace {

auto v(const char* text) -> Value { return parse_value(text); }

}  // namespace

TEST(Expand, object_becomes_single_node_array) {
    EXPECT_EQ(expand(v(R"({"name": "Ada"})")),
              v(R"([{"http://example.org/name": [{"@value": "Ada"}]}])"));
}

TEST(Expand, scalars_get_datatypes) {
    EXPECT_EQ(expand(v(R"({"n": 3, "x": 1.5, "b": false})")), v(R"([{
        "http://example.org/n": [{"@value": 3, "@type": "http://www.w3.org/2001/XMLSchema#integer"}],
        "http://example.org/x": [{"@value": 1.5, "@type": "http://www.w3.org/2001/XMLSchema#double"}],
        "http://example.org/b": [{"@value": false, "@type": "http://www.w3.org/2001/XMLSchema#boolean"}]
    }])"));
}

TEST(Expand, ids_types_and_prefixes) {
    EXPECT_EQ(expand(v(R"({"@id": "http://ex.org/a", "@type": "schema:Person", "schema:name": "A"})")),
              v(R"([{
                  "@id": "http://ex.org/a",
                  "@type": ["http://schema.org/Person"],
                  "http://schema.org/name": [{"@value": "A"}]
              }])"));
}

TEST(Expand, set_is_unwrapped_and_list_kept) {
    EXPECT_EQ(expand(v(R"({"s": {"@set": ["a", "b"]}, "l": {"@list": ["a"]}})")), v(R"([{
        "http://example.org/s": [{"@value": "a"}, {"@value": "b"}],
        "http://example.org/l": [{"@list": [{"@value": "a"}]}]
    }])"));
}

TEST(Expand, nested_nodes_and_value_objects) {
    EXPECT_EQ(expand(v(R"({"knows": {"name": "B"}, "g": {"@value": "hi", "@language": "en"}})")), v(R"([{
        "http://example.org/knows": [{"http://example.org/name": [{"@value": "B"}]}],
        "http://example.org/g": [{"@value": "hi", "@language": "en"}]
    }])"));
}

TEST(Expand, nulls_are_dropped) {
    EXPECT_EQ(expand(v(R"({"a": null, "b": [null, 1]})")), v(R"([{
        "http://example.org/a": [],
        "http://example.org/b": [{"@value": 1, "@type": "http://www.w3.org/2001/XMLSchema#integer"}]
    }])"));
}

TEST(Expand, context_is_dropped) {
    EXPECT_EQ(expand(v(R"({"@context": {"name": "http://schema.org/name"}, "@id": "http://ex.org/a"})")),
              v(R"([{"@id": "http://ex.org/a"}])"));
}

TEST(Expand, graph_wrapper_expands_to_members) {
    EXPECT_EQ(expand(v(R"({"@context": {}, "@graph": [{"@id": "http://ex.org/a"}, {"@id": "http://ex.org/b"}]})")),
              v(R"([{"@id": "http://ex.org/a"}, {"@id": "http://ex.org/b"}])"));
}

TEST(Expand, named_graph_keeps_graph_key) {
    EXPECT_EQ(expand(v(R"({"@id": "http://ex.org/g", "@graph": [{"@id": "http://ex.org/a"}]})")),
              v(R"([{"@id": "http://ex.org/g", "@graph": [{"@id": "http://ex.org/a"}]}])"));
}

TEST(Expand, top_level_array_and_scalars) {
    EXPECT_EQ(expand(v(R"([{"@id": "http://ex.org/a"}, {"@id": "http://ex.org/b"}])")),
              v(R"([{"@id": "http://ex.org/a"}, {"@id": "http://ex.org/b"}])"));
    EXPECT_EQ(expand(v("42")), v("[]"));
    EXPECT_EQ(expand(v("null")), v("[]"));
}

TEST(Expand, cached_result_matches) {
    const auto doc = v(R"({"name": "Ada", "tags": ["x", "y"]})");
    auto caches = Caches{};
    const auto first = expand(doc, &caches);
    const auto second = expand(doc, &caches);
    EXPECT_EQ(first, expand(doc));
    EXPECT_EQ(second, first);
    EXPECT_EQ(caches.patterns.hits(), 1u);
}
