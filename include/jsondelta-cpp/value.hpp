/// @file value.hpp
/// @brief The document value tree: Null, Array, Object and Value.

#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <limits>
#include <map>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace jsondelta_cpp {

/// Represents a JSON null value.
struct Null {
    auto operator<=>(const Null&) const = default;
    auto operator==(const Null&) const -> bool = default;
};

class Value;

/// An ordered sequence of values. Order is significant.
using Array = std::vector<Value>;

/// A mapping of unique string keys to values. Key order is not significant.
using Object = std::map<std::string, Value>;

/// The kinds of value a document node can hold.
enum class ValueKind : std::uint8_t {
    null,
    boolean,
    integer,   ///< Signed 64-bit integer.
    unsigned_integer,  ///< Unsigned integer beyond the signed range.
    real,      ///< IEEE double.
    string,
    array,
    object,
};

/// Convert a ValueKind to its string representation.
constexpr auto to_string_view(ValueKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ValueKind::null:             return "null";
        case ValueKind::boolean:          return "boolean";
        case ValueKind::integer:          return "integer";
        case ValueKind::unsigned_integer: return "unsigned_integer";
        case ValueKind::real:             return "real";
        case ValueKind::string:           return "string";
        case ValueKind::array:            return "array";
        case ValueKind::object:           return "object";
    }
    return "unknown";
}

/// A node of a parsed document.
///
/// Equality is structural: arrays compare element by element, objects
/// compare as key sets, and numbers compare as stored, so the integer 1
/// and the double 1.0 are different values.
///
/// @code
/// auto v = Value{Object{{"name", "Ada"}, {"tags", Array{"a", "b"}}}};
/// if (const auto* name = v.find("name")) { ... }
/// @endcode
class Value {
public:
    using Storage = std::variant<
        Null,
        bool,
        std::int64_t,
        std::uint64_t,
        double,
        std::string,
        Array,
        Object
    >;

    Value() = default;
    Value(Null) {}
    Value(bool b) : data_{b} {}
    Value(double d) : data_{d} {}
    Value(std::string s) : data_{std::move(s)} {}
    Value(std::string_view s) : data_{std::string{s}} {}
    Value(const char* s) : data_{std::string{s}} {}
    Value(Array a) : data_{std::move(a)} {}
    Value(Object o) : data_{std::move(o)} {}

    /// Integers are stored signed whenever they fit.
    template <std::integral T>
        requires (!std::same_as<T, bool>)
    Value(T i) {
        if constexpr (std::is_signed_v<T>) {
            data_ = static_cast<std::int64_t>(i);
        } else if (static_cast<std::uint64_t>(i) <=
                   static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            data_ = static_cast<std::int64_t>(i);
        } else {
            data_ = static_cast<std::uint64_t>(i);
        }
    }

    auto kind() const noexcept -> ValueKind { return static_cast<ValueKind>(data_.index()); }

    auto is_null() const noexcept -> bool { return kind() == ValueKind::null; }
    auto is_bool() const noexcept -> bool { return kind() == ValueKind::boolean; }
    auto is_number() const noexcept -> bool {
        return kind() == ValueKind::integer || kind() == ValueKind::unsigned_integer ||
               kind() == ValueKind::real;
    }
    auto is_string() const noexcept -> bool { return kind() == ValueKind::string; }
    auto is_array() const noexcept -> bool { return kind() == ValueKind::array; }
    auto is_object() const noexcept -> bool { return kind() == ValueKind::object; }
    auto is_container() const noexcept -> bool { return is_array() || is_object(); }

    /// Pointer to the held alternative, or nullptr on a kind mismatch.
    template <typename T>
    auto get_if() const noexcept -> const T* { return std::get_if<T>(&data_); }

    template <typename T>
    auto get_if() noexcept -> T* { return std::get_if<T>(&data_); }

    /// Member lookup on an object. Returns nullptr for missing keys and non-objects.
    auto find(std::string_view key) const -> const Value*;
    auto find(std::string_view key) -> Value*;

    /// Element count of an array or object, 0 for scalars.
    auto size() const noexcept -> std::size_t;

    auto storage() const noexcept -> const Storage& { return data_; }
    auto storage() noexcept -> Storage& { return data_; }

    friend auto operator==(const Value& a, const Value& b) -> bool;

private:
    Storage data_;
};

// -- Variant visitor helper ---------------------------------------------------

/// Helper for constructing ad-hoc visitors from lambdas.
///
/// @code
/// std::visit(overload{
///     [](const std::string& s) { ... },
///     [](const Array& a) { ... },
///     [](const auto&) { ... },
/// }, value.storage());
/// @endcode
template <typename... Ts>
struct overload : Ts... { using Ts::operator()...; };

template <typename... Ts>
overload(Ts...) -> overload<Ts...>;

// -- Small conveniences --------------------------------------------------------

/// The string held by @p v, or an empty view for non-strings.
auto as_string_view(const Value& v) noexcept -> std::string_view;

/// A single-key object, used to build delta entries.
auto make_object(std::string key, Value value) -> Value;

/// An array literal from an initializer list.
auto make_array(std::initializer_list<Value> items) -> Value;

}  // namespace jsondelta_cpp
