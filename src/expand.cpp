#include <jsondelta-cpp/expand.hpp>
#include <jsondelta-cpp/semantic.hpp>

#include <easylogging++.h>

#include <algorithm>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace jsondelta_cpp {

namespace {

auto expand_node(const Object& obj) -> Value;

auto typed_value(Value v, std::string_view datatype) -> Value {
    auto out = Object{};
    out.emplace("@value", std::move(v));
    if (!datatype.empty()) out.emplace("@type", Value{datatype});
    return Value{std::move(out)};
}

void expand_values(const Value& v, Array& out) {
    std::visit(overload{
        [](Null) {},
        [&](const Array& arr) {
            for (const auto& item : arr) expand_values(item, out);
        },
        [&](const Object& obj) {
            if (auto set = obj.find("@set"); set != obj.end()) {
                expand_values(set->second, out);
            } else if (auto list = obj.find("@list"); list != obj.end()) {
                auto items = Array{};
                expand_values(list->second, items);
                out.push_back(make_object("@list", Value{std::move(items)}));
            } else if (obj.contains("@value")) {
                out.push_back(v);
            } else {
                out.push_back(expand_node(obj));
            }
        },
        [&](const std::string& s) { out.push_back(typed_value(Value{s}, {})); },
        [&](bool) { out.push_back(typed_value(v, xsd::boolean_iri)); },
        [&](double) { out.push_back(typed_value(v, xsd::double_iri)); },
        [&](const auto&) { out.push_back(typed_value(v, xsd::integer_iri)); },
    }, v.storage());
}

auto expand_types(const Value& types) -> Value {
    auto out = Array{};
    auto add = [&](const Value& t) {
        if (const auto* s = t.get_if<std::string>()) out.push_back(Value{expand_iri(*s)});
    };
    if (const auto* arr = types.get_if<Array>()) {
        for (const auto& t : *arr) add(t);
    } else {
        add(types);
    }
    return Value{std::move(out)};
}

auto expand_node(const Object& obj) -> Value {
    auto out = Object{};
    for (const auto& [key, value] : obj) {
        if (key == "@context") continue;
        if (key == "@id") {
            out.emplace(key, value);
        } else if (key == "@type") {
            out.emplace(key, expand_types(value));
        } else if (key == "@graph") {
            auto items = Array{};
            expand_values(value, items);
            out.emplace(key, Value{std::move(items)});
        } else if (key.starts_with('@')) {
            out.emplace(key, value);
        } else {
            auto items = Array{};
            expand_values(value, items);
            out.emplace(expand_iri(key), Value{std::move(items)});
        }
    }
    return Value{std::move(out)};
}

auto expand_document(const Value& document) -> Value {
    const auto* obj = document.get_if<Object>();
    if (obj) {
        // A bare graph container expands to its members.
        auto graph = obj->find("@graph");
        const auto wrapper_only = graph != obj->end() &&
            std::all_of(obj->begin(), obj->end(), [](const auto& entry) {
                return entry.first == "@graph" || entry.first == "@context";
            });
        if (wrapper_only) {
            auto items = Array{};
            expand_values(graph->second, items);
            return Value{std::move(items)};
        }
    }
    auto items = Array{};
    if (document.is_container()) {
        expand_values(document, items);
    } else if (!document.is_null()) {
        LOG(DEBUG) << "expanding a top-level " << std::string{to_string_view(document.kind())}
                   << " yields no nodes";
    }
    return Value{std::move(items)};
}

}  // namespace

auto expand(const Value& document, Caches* caches) -> Value {
    auto key = caches ? pattern_key("expand", document) : std::nullopt;
    if (key) {
        if (auto hit = caches->patterns.find(*key)) return std::move(*hit);
    }
    auto expanded = expand_document(document);
    if (key) caches->patterns.insert(*key, expanded);
    return expanded;
}

}  // namespace jsondelta_cpp
