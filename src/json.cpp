#include <jsondelta-cpp/json.hpp>

#include <cstdint>
#include <limits>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace jsondelta_cpp {

// =============================================================================
// ADL serialization
// =============================================================================

void to_json(nlohmann::json& j, Null) {
    j = nullptr;
}

void to_json(nlohmann::json& j, const Value& v) {
    std::visit(overload{
        [&](Null) { j = nullptr; },
        [&](bool b) { j = b; },
        [&](std::int64_t i) { j = i; },
        [&](std::uint64_t u) { j = u; },
        [&](double d) { j = d; },
        [&](const std::string& s) { j = s; },
        [&](const Array& arr) {
            j = nlohmann::json::array();
            for (const auto& item : arr) {
                auto element = nlohmann::json{};
                to_json(element, item);
                j.push_back(std::move(element));
            }
        },
        [&](const Object& obj) {
            j = nlohmann::json::object();
            for (const auto& [key, item] : obj) {
                to_json(j[key], item);
            }
        },
    }, v.storage());
}

void from_json(const nlohmann::json& j, Value& v) {
    switch (j.type()) {
        case nlohmann::json::value_t::null:
            v = Value{};
            return;
        case nlohmann::json::value_t::boolean:
            v = Value{j.get<bool>()};
            return;
        case nlohmann::json::value_t::number_unsigned: {
            auto val = j.get<std::uint64_t>();
            // If it fits in int64, prefer int64 for consistency
            if (val <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
                v = Value{static_cast<std::int64_t>(val)};
            } else {
                v = Value{val};
            }
            return;
        }
        case nlohmann::json::value_t::number_integer:
            v = Value{j.get<std::int64_t>()};
            return;
        case nlohmann::json::value_t::number_float:
            v = Value{j.get<double>()};
            return;
        case nlohmann::json::value_t::string:
            v = Value{j.get<std::string>()};
            return;
        case nlohmann::json::value_t::array: {
            auto arr = Array{};
            arr.reserve(j.size());
            for (const auto& item : j) {
                auto element = Value{};
                from_json(item, element);
                arr.push_back(std::move(element));
            }
            v = Value{std::move(arr)};
            return;
        }
        case nlohmann::json::value_t::object: {
            auto obj = Object{};
            for (auto it = j.begin(); it != j.end(); ++it) {
                auto element = Value{};
                from_json(it.value(), element);
                obj.emplace(it.key(), std::move(element));
            }
            v = Value{std::move(obj)};
            return;
        }
        case nlohmann::json::value_t::binary:
        case nlohmann::json::value_t::discarded:
            v = Value{};
            return;
    }
}

// =============================================================================
// Conversion and text helpers
// =============================================================================

auto to_value(const nlohmann::json& j) -> Value {
    auto v = Value{};
    from_json(j, v);
    return v;
}

auto to_json_value(const Value& v) -> nlohmann::json {
    auto j = nlohmann::json{};
    to_json(j, v);
    return j;
}

auto parse_value(std::string_view text) -> Value {
    return to_value(nlohmann::json::parse(text));
}

auto to_json_text(const Value& v, int indent) -> std::string {
    return to_json_value(v).dump(indent);
}

auto canonical_text(const Value& v) -> std::string {
    // nlohmann::json objects are key-ordered maps, so dump() is already sorted.
    return to_json_value(v).dump();
}

}  // namespace jsondelta_cpp
