#include <jsondelta-cpp/structural.hpp>
#include <jsondelta-cpp/hash.hpp>
#include <jsondelta-cpp/text_diff.hpp>

#include "myers.hpp"

#include <easylogging++.h>

#include <algorithm>
#include <charconv>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace jsondelta_cpp {

// =============================================================================
// Delta entry shapes
// =============================================================================

namespace {

enum class EntryKind : std::uint8_t {
    add,        // [new]
    remove,     // [old, 0, 0]
    replace,    // [old, new]
    move,       // ["", from, 3]
    text_diff,  // [{"text_diff": [...]}, 0, 2]
    nested,     // object
    unknown,
};

/// Non-negative integral numbers, including doubles with no fraction.
auto integral_index(const Value& v) -> std::optional<std::size_t> {
    if (const auto* i = v.get_if<std::int64_t>()) {
        if (*i < 0) return std::nullopt;
        return static_cast<std::size_t>(*i);
    }
    if (const auto* u = v.get_if<std::uint64_t>()) {
        return static_cast<std::size_t>(*u);
    }
    if (const auto* d = v.get_if<double>()) {
        if (*d < 0.0 || std::floor(*d) != *d) return std::nullopt;
        return static_cast<std::size_t>(*d);
    }
    return std::nullopt;
}

auto has_code(const Value& v, std::int64_t code) -> bool {
    auto index = integral_index(v);
    return index && static_cast<std::int64_t>(*index) == code;
}

auto classify(const Value& entry) -> EntryKind {
    if (entry.is_object()) return EntryKind::nested;
    const auto* arr = entry.get_if<Array>();
    if (!arr) return EntryKind::unknown;
    switch (arr->size()) {
        case 1: return EntryKind::add;
        case 2: return EntryKind::replace;
        case 3: {
            const auto& slots = *arr;
            if (has_code(slots[2], delta_moved) && integral_index(slots[1])) {
                return EntryKind::move;
            }
            if (!has_code(slots[1], 0)) return EntryKind::unknown;
            if (has_code(slots[2], delta_text_diff) && slots[0].find("text_diff")) {
                return EntryKind::text_diff;
            }
            if (has_code(slots[2], delta_deleted)) return EntryKind::remove;
            return EntryKind::unknown;
        }
        default: return EntryKind::unknown;
    }
}

auto slot(const Value& entry, std::size_t i) -> const Value& {
    return (*entry.get_if<Array>())[i];
}

auto make_add(Value v) -> Value { return Value{Array{std::move(v)}}; }

auto make_remove(Value v) -> Value {
    return Value{Array{std::move(v), Value{0}, Value{delta_deleted}}};
}

auto make_replace(Value old_value, Value new_value) -> Value {
    return Value{Array{std::move(old_value), std::move(new_value)}};
}

auto make_move(std::size_t from) -> Value {
    return Value{Array{Value{""}, Value{from}, Value{delta_moved}}};
}

// -- Array delta keys ---------------------------------------------------------

struct ArrayKey {
    bool old_side;  ///< `_<i>` rather than `<j>`
    std::size_t index;
};

auto parse_index(std::string_view digits) -> std::optional<std::size_t> {
    if (digits.empty()) return std::nullopt;
    auto value = std::size_t{0};
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
    if (ec != std::errc{} || ptr != digits.data() + digits.size()) return std::nullopt;
    return value;
}

auto parse_array_key(std::string_view key) -> std::optional<ArrayKey> {
    if (!key.empty() && key.front() == '_') {
        if (auto i = parse_index(key.substr(1))) return ArrayKey{true, *i};
        return std::nullopt;
    }
    if (auto j = parse_index(key)) return ArrayKey{false, *j};
    return std::nullopt;
}

auto old_key(std::size_t i) -> std::string { return "_" + std::to_string(i); }
auto new_key(std::size_t j) -> std::string { return std::to_string(j); }

/// Used when no base document says whether a nested delta is for an array.
auto looks_like_array_delta(const Object& delta) -> bool {
    if (delta.empty()) return false;
    for (const auto& [key, entry] : delta) {
        if (key == "_t") continue;
        if (!parse_array_key(key)) return false;
    }
    return true;
}

}  // namespace

auto is_empty_delta(const Value& delta) -> bool {
    const auto* obj = delta.get_if<Object>();
    return obj && obj->empty();
}

// =============================================================================
// Diff
// =============================================================================

namespace {

class StructuralDiffer {
public:
    StructuralDiffer(const StructuralOptions& options, Caches* caches)
        : options_{options}, hashes_{caches ? &caches->hashes : nullptr} {}

    /// Delta of two values; the empty object when they are equal.
    auto diff(const Value& a, const Value& b) -> Value {
        if (a == b) return Value{Object{}};
        if (a.is_object() && b.is_object()) {
            return diff_objects(*a.get_if<Object>(), *b.get_if<Object>());
        }
        if (a.is_array() && b.is_array()) {
            return diff_arrays(*a.get_if<Array>(), *b.get_if<Array>());
        }
        if (a.is_string() && b.is_string()) {
            if (auto text = diff_strings(*a.get_if<std::string>(), *b.get_if<std::string>())) {
                return std::move(*text);
            }
        }
        return make_replace(a, b);
    }

private:
    auto diff_objects(const Object& a, const Object& b) -> Value {
        auto delta = Object{};
        for (const auto& [key, old_value] : a) {
            auto it = b.find(key);
            if (it == b.end()) {
                delta.emplace(key, make_remove(old_value));
                continue;
            }
            auto sub = diff(old_value, it->second);
            if (!is_empty_delta(sub)) {
                delta.emplace(key, std::move(sub));
            }
        }
        for (const auto& [key, new_value] : b) {
            if (!a.contains(key)) {
                delta.emplace(key, make_add(new_value));
            }
        }
        return Value{std::move(delta)};
    }

    auto diff_strings(const std::string& a, const std::string& b) -> std::optional<Value> {
        if (!options_.text_diff) return std::nullopt;
        const auto threshold = options_.text_diff_threshold;
        if (char_count(a) <= threshold || char_count(b) <= threshold) return std::nullopt;
        return make_text_diff_delta(diff_text(a, b));
    }

    auto diff_arrays(const Array& a, const Array& b) -> Value {
        if (options_.include_moves && options_.array_diff != ArrayStrategy::simple) {
            return diff_arrays_with_moves(a, b);
        }
        if (options_.array_diff == ArrayStrategy::myers) {
            return diff_arrays_aligned(a, b);
        }
        return diff_arrays_positional(a, b);
    }

    // Index by index: changes where both sides exist, then the tail.
    auto diff_arrays_positional(const Array& a, const Array& b) -> Value {
        auto delta = Object{};
        const auto common = std::min(a.size(), b.size());
        for (std::size_t k = 0; k < common; ++k) {
            auto sub = diff(a[k], b[k]);
            if (!is_empty_delta(sub)) delta.emplace(old_key(k), std::move(sub));
        }
        for (auto i = common; i < a.size(); ++i) {
            delta.emplace(old_key(i), make_remove(a[i]));
        }
        for (auto j = common; j < b.size(); ++j) {
            delta.emplace(new_key(j), make_add(b[j]));
        }
        return Value{std::move(delta)};
    }

    // Elements outside the longest common subsequence are deleted and
    // inserted; the subsequence keeps its relative order.
    auto diff_arrays_aligned(const Array& a, const Array& b) -> Value {
        auto hash_all = [&](const Array& items) {
            auto out = std::vector<std::uint64_t>{};
            out.reserve(items.size());
            for (const auto& item : items) out.push_back(structural_hash(item, hashes_));
            return out;
        };
        const auto ha = hash_all(a);
        const auto hb = hash_all(b);
        const auto edits = detail::myers_diff(a.size(), b.size(), [&](std::size_t i, std::size_t j) {
            return ha[i] == hb[j] && a[i] == b[j];
        });

        auto delta = Object{};
        for (const auto& edit : edits) {
            if (edit.kind == detail::EditKind::remove) {
                for (auto i = edit.old_begin; i < edit.old_end; ++i) {
                    delta.emplace(old_key(i), make_remove(a[i]));
                }
            } else if (edit.kind == detail::EditKind::insert) {
                for (auto j = edit.new_begin; j < edit.new_end; ++j) {
                    delta.emplace(new_key(j), make_add(b[j]));
                }
            }
        }
        return Value{std::move(delta)};
    }

    auto diff_arrays_with_moves(const Array& a, const Array& b) -> Value {
        auto new_to_old = match_moved_elements(a, b, hashes_);
        auto old_to_new = std::vector<std::optional<std::size_t>>(a.size());
        for (std::size_t j = 0; j < b.size(); ++j) {
            if (new_to_old[j]) old_to_new[*new_to_old[j]] = j;
        }

        // A move from i to j is keyed `_j` and leaves slot i of the new array
        // to whatever lands there. Drop moves whose key would also name a
        // deleted old element, or whose source slot receives an insertion.
        auto changed = true;
        while (changed) {
            changed = false;
            for (std::size_t j = 0; j < b.size(); ++j) {
                if (!new_to_old[j] || *new_to_old[j] == j) continue;
                const auto i = *new_to_old[j];
                const auto key_taken = j < a.size() && !old_to_new[j];
                const auto source_taken = i < b.size() && !new_to_old[i];
                if (key_taken || source_taken) {
                    new_to_old[j].reset();
                    old_to_new[i].reset();
                    changed = true;
                }
            }
        }

        auto delta = Object{};
        for (std::size_t j = 0; j < b.size(); ++j) {
            if (new_to_old[j] && *new_to_old[j] != j) {
                delta.emplace(old_key(j), make_move(*new_to_old[j]));
            }
        }
        const auto longest = std::max(a.size(), b.size());
        for (std::size_t k = 0; k < longest; ++k) {
            const auto old_free = k < a.size() && !old_to_new[k];
            const auto new_free = k < b.size() && !new_to_old[k];
            if (old_free && new_free) {
                auto sub = diff(a[k], b[k]);
                if (!is_empty_delta(sub)) delta.emplace(old_key(k), std::move(sub));
            } else if (old_free) {
                delta.emplace(old_key(k), make_remove(a[k]));
            } else if (new_free) {
                delta.emplace(new_key(k), make_add(b[k]));
            }
        }
        return Value{std::move(delta)};
    }

    const StructuralOptions& options_;
    HashCache* hashes_;
};

}  // namespace

auto diff_structural(const Value& old_doc, const Value& new_doc,
                     const StructuralOptions& options, Caches* caches) -> Value {
    return StructuralDiffer{options, caches}.diff(old_doc, new_doc);
}

// =============================================================================
// Patch
// =============================================================================

namespace {

auto patch_value(const Value& document, const Value& delta) -> Value;

/// Result of one delta entry against the value it addresses; nullopt
/// removes the value.
auto apply_entry(const Value* existing, const Value& entry) -> std::optional<Value> {
    switch (classify(entry)) {
        case EntryKind::add:
            return slot(entry, 0);
        case EntryKind::remove:
            return std::nullopt;
        case EntryKind::replace:
            return slot(entry, 1);
        case EntryKind::text_diff:
            if (existing && existing->is_string()) {
                return Value{apply_text_ops(*existing->get_if<std::string>(),
                                            read_text_ops(slot(entry, 0)))};
            }
            LOG(DEBUG) << "text diff against a non-string value, skipped";
            break;
        case EntryKind::nested:
            if (existing) return patch_value(*existing, entry);
            return entry;
        case EntryKind::move:
        case EntryKind::unknown:
            LOG(DEBUG) << "delta entry does not fit its target, skipped";
            break;
    }
    if (existing) return *existing;
    return std::nullopt;
}

auto patch_object(Object obj, const Object& delta) -> Value {
    for (const auto& [key, entry] : delta) {
        auto it = obj.find(key);
        const auto* existing = it == obj.end() ? nullptr : &it->second;
        auto result = apply_entry(existing, entry);
        if (!result) {
            if (it != obj.end()) obj.erase(it);
        } else if (it != obj.end()) {
            it->second = std::move(*result);
        } else {
            obj.emplace(key, std::move(*result));
        }
    }
    return Value{std::move(obj)};
}

struct Placement {
    std::size_t position;
    Value value;
};

auto patch_array(Array arr, const Object& delta) -> Value {
    auto removed = std::vector<bool>(arr.size(), false);
    auto moves = std::vector<std::pair<std::size_t, std::size_t>>{};  // (to, from)
    auto inserts = std::vector<Placement>{};

    // Changes rewrite old elements in place; nothing moves yet.
    for (const auto& [key, entry] : delta) {
        if (key == "_t") continue;
        auto parsed = parse_array_key(key);
        if (!parsed) {
            LOG(DEBUG) << "non-index key in array delta skipped: " << key;
            continue;
        }
        const auto kind = classify(entry);
        if (kind == EntryKind::add) {
            inserts.push_back(Placement{parsed->index, slot(entry, 0)});
            continue;
        }
        if (kind == EntryKind::move) {
            if (parsed->old_side) moves.emplace_back(parsed->index, *integral_index(slot(entry, 1)));
            continue;
        }
        const auto i = parsed->index;
        if (i >= arr.size()) {
            LOG(DEBUG) << "array delta index " << i << " out of range";
            continue;
        }
        if (kind == EntryKind::remove) {
            removed[i] = true;
        } else if (auto result = apply_entry(&arr[i], entry)) {
            arr[i] = std::move(*result);
        }
    }

    auto placed = std::vector<Placement>{};
    std::sort(moves.begin(), moves.end());
    for (const auto& [to, from] : moves) {
        if (from >= arr.size() || removed[from]) {
            LOG(DEBUG) << "array move from " << from << " has no source, skipped";
            continue;
        }
        removed[from] = true;
        placed.push_back(Placement{to, std::move(arr[from])});
    }
    for (auto& insert : inserts) {
        placed.push_back(std::move(insert));
    }
    std::stable_sort(placed.begin(), placed.end(),
        [](const Placement& x, const Placement& y) { return x.position < y.position; });

    auto out = Array{};
    out.reserve(arr.size() + inserts.size());
    for (std::size_t i = 0; i < arr.size(); ++i) {
        if (!removed[i]) out.push_back(std::move(arr[i]));
    }
    // Ascending positions: every earlier placement sits before the next one.
    for (auto& p : placed) {
        const auto at = std::min(p.position, out.size());
        out.insert(out.begin() + static_cast<std::ptrdiff_t>(at), std::move(p.value));
    }
    return Value{std::move(out)};
}

auto patch_value(const Value& document, const Value& delta) -> Value {
    if (const auto* obj_delta = delta.get_if<Object>()) {
        if (const auto* obj = document.get_if<Object>()) return patch_object(*obj, *obj_delta);
        if (const auto* arr = document.get_if<Array>()) return patch_array(*arr, *obj_delta);
        if (obj_delta->empty()) return document;
        LOG(DEBUG) << "object delta against a " << std::string{to_string_view(document.kind())}
                   << ", patching an empty object";
        return patch_object(Object{}, *obj_delta);
    }
    if (delta.is_array()) {
        if (auto result = apply_entry(&document, delta)) return std::move(*result);
        return Value{};
    }
    return delta;
}

}  // namespace

auto patch_structural(const Value& document, const Value& delta) -> Value {
    return patch_value(document, delta);
}

// =============================================================================
// Validate
// =============================================================================

namespace {

auto validate_value(const Value& document, const Value& delta) -> bool;

auto validate_text(const Value* existing, const Value& entry) -> bool {
    if (!existing || !existing->is_string()) return false;
    return text_ops_match(*existing->get_if<std::string>(), read_text_ops(slot(entry, 0)));
}

auto validate_object(const Object& obj, const Object& delta) -> bool {
    for (const auto& [key, entry] : delta) {
        auto it = obj.find(key);
        const auto* existing = it == obj.end() ? nullptr : &it->second;
        switch (classify(entry)) {
            case EntryKind::add:
                if (existing) return false;
                break;
            case EntryKind::remove:
            case EntryKind::replace:
                if (!existing || *existing != slot(entry, 0)) return false;
                break;
            case EntryKind::text_diff:
                if (!validate_text(existing, entry)) return false;
                break;
            case EntryKind::nested:
                if (!existing || !validate_value(*existing, entry)) return false;
                break;
            case EntryKind::move:
            case EntryKind::unknown:
                return false;
        }
    }
    return true;
}

auto validate_array(const Array& arr, const Object& delta) -> bool {
    auto sources = std::vector<bool>(arr.size(), false);
    for (const auto& [key, entry] : delta) {
        if (key == "_t") continue;
        auto parsed = parse_array_key(key);
        if (!parsed) return false;
        const auto kind = classify(entry);
        if (kind == EntryKind::add) continue;
        if (!parsed->old_side) return false;

        auto i = parsed->index;
        if (kind == EntryKind::move) i = *integral_index(slot(entry, 1));
        if (i >= arr.size() || sources[i]) return false;
        sources[i] = true;

        switch (kind) {
            case EntryKind::remove:
            case EntryKind::replace:
                if (arr[i] != slot(entry, 0)) return false;
                break;
            case EntryKind::text_diff:
                if (!validate_text(&arr[i], entry)) return false;
                break;
            case EntryKind::nested:
                if (!validate_value(arr[i], entry)) return false;
                break;
            case EntryKind::move:
                break;
            case EntryKind::add:
            case EntryKind::unknown:
                return false;
        }
    }
    return true;
}

auto validate_value(const Value& document, const Value& delta) -> bool {
    if (const auto* obj_delta = delta.get_if<Object>()) {
        if (const auto* obj = document.get_if<Object>()) return validate_object(*obj, *obj_delta);
        if (const auto* arr = document.get_if<Array>()) return validate_array(*arr, *obj_delta);
        return obj_delta->empty();
    }
    if (delta.is_array()) {
        switch (classify(delta)) {
            case EntryKind::add:
                return true;
            case EntryKind::remove:
            case EntryKind::replace:
                return document == slot(delta, 0);
            case EntryKind::text_diff:
                return validate_text(&document, delta);
            default:
                return false;
        }
    }
    return true;
}

}  // namespace

auto validate_structural(const Value& document, const Value& delta) -> bool {
    return validate_value(document, delta);
}

// =============================================================================
// Inverse
// =============================================================================

namespace {

auto invert_value(const Value& delta, const Value* base) -> Value;

auto invert_entry(const Value& entry, const Value* base) -> Value {
    switch (classify(entry)) {
        case EntryKind::add:
            return make_remove(slot(entry, 0));
        case EntryKind::remove:
            return make_add(slot(entry, 0));
        case EntryKind::replace:
            return make_replace(slot(entry, 1), slot(entry, 0));
        case EntryKind::text_diff:
            return make_text_diff_delta(invert_text_ops(read_text_ops(slot(entry, 0))));
        case EntryKind::nested:
            return invert_value(entry, base);
        case EntryKind::move:
        case EntryKind::unknown:
            break;
    }
    return entry;
}

auto invert_object(const Object& delta, const Object* base) -> Value {
    auto out = Object{};
    for (const auto& [key, entry] : delta) {
        const Value* child = nullptr;
        if (base) {
            auto it = base->find(key);
            if (it != base->end()) child = &it->second;
        }
        out.emplace(key, invert_entry(entry, child));
    }
    return Value{std::move(out)};
}

// Old-side keys of the inverse are positions in the new array, and the
// other way round.
auto invert_array(const Object& delta, const Array* base) -> Value {
    auto out = Object{};
    for (const auto& [key, entry] : delta) {
        auto parsed = parse_array_key(key);
        if (!parsed) {
            out.emplace(key, entry);
            continue;
        }
        const auto index = parsed->index;
        switch (classify(entry)) {
            case EntryKind::add:
                out.emplace(old_key(index), make_remove(slot(entry, 0)));
                break;
            case EntryKind::remove:
                out.emplace(new_key(index), make_add(slot(entry, 0)));
                break;
            case EntryKind::move:
                out.emplace(old_key(*integral_index(slot(entry, 1))), make_move(index));
                break;
            default: {
                const Value* child = base && index < base->size() ? &(*base)[index] : nullptr;
                out.emplace(key, invert_entry(entry, child));
                break;
            }
        }
    }
    return Value{std::move(out)};
}

auto invert_value(const Value& delta, const Value* base) -> Value {
    if (const auto* obj_delta = delta.get_if<Object>()) {
        if (base) {
            if (const auto* arr = base->get_if<Array>()) return invert_array(*obj_delta, arr);
            return invert_object(*obj_delta, base->get_if<Object>());
        }
        if (looks_like_array_delta(*obj_delta)) return invert_array(*obj_delta, nullptr);
        return invert_object(*obj_delta, nullptr);
    }
    if (delta.is_array()) return invert_entry(delta, base);
    return delta;
}

}  // namespace

auto inverse_structural(const Value& delta, const Value* base) -> Value {
    return invert_value(delta, base);
}

// =============================================================================
// Merge
// =============================================================================

namespace {

void merge_into(Value& target, const Value& delta) {
    auto* target_obj = target.get_if<Object>();
    const auto* delta_obj = delta.get_if<Object>();
    if (!target_obj || !delta_obj) {
        target = delta;
        return;
    }
    for (const auto& [key, entry] : *delta_obj) {
        auto it = target_obj->find(key);
        if (it != target_obj->end() && it->second.is_object() && entry.is_object()) {
            merge_into(it->second, entry);
        } else {
            (*target_obj)[key] = entry;
        }
    }
}

}  // namespace

auto merge_structural(std::span<const Value> deltas) -> Value {
    auto merged = Value{Object{}};
    for (const auto& delta : deltas) {
        merge_into(merged, delta);
    }
    return merged;
}

}  // namespace jsondelta_cpp
