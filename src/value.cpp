#include <jsondelta-cpp/value.hpp>

namespace jsondelta_cpp {

auto Value::find(std::string_view key) const -> const Value* {
    const auto* obj = get_if<Object>();
    if (!obj) return nullptr;
    auto it = obj->find(std::string{key});
    return it == obj->end() ? nullptr : &it->second;
}

auto Value::find(std::string_view key) -> Value* {
    auto* obj = get_if<Object>();
    if (!obj) return nullptr;
    auto it = obj->find(std::string{key});
    return it == obj->end() ? nullptr : &it->second;
}

auto Value::size() const noexcept -> std::size_t {
    if (const auto* arr = get_if<Array>()) return arr->size();
    if (const auto* obj = get_if<Object>()) return obj->size();
    return 0;
}

// Alternatives compare only against the same alternative, so an integer
// never equals a double holding the same number.
auto operator==(const Value& a, const Value& b) -> bool {
    return a.data_ == b.data_;
}

auto as_string_view(const Value& v) noexcept -> std::string_view {
    if (const auto* s = v.get_if<std::string>()) return *s;
    return {};
}

auto make_object(std::string key, Value value) -> Value {
    auto obj = Object{};
    obj.emplace(std::move(key), std::move(value));
    return Value{std::move(obj)};
}

auto make_array(std::initializer_list<Value> items) -> Value {
    return Value{Array(items)};
}

}  // namespace jsondelta_cpp
