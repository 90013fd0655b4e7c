/// @file structural.hpp
/// @brief Tree diffs in the jsondiffpatch delta format.
///
/// A delta mirrors the shape of the documents it relates:
///
/// | Entry                         | Meaning                                   |
/// |-------------------------------|-------------------------------------------|
/// | `[new]`                       | add                                       |
/// | `[old, 0, 0]`                 | delete                                    |
/// | `[old, new]`                  | replace                                   |
/// | `["", from, 3]` under `_<to>` | move an array element                     |
/// | `[{"text_diff": [...]}, 0, 2]`| character-level string edit               |
/// | object                        | nested delta of an object or array        |
///
/// Inside an array delta, `_<i>` keys address the old array and bare `<j>`
/// keys address the new one. Deltas of arrays carry no marker key.

#pragma once

#include <jsondelta-cpp/cache.hpp>
#include <jsondelta-cpp/options.hpp>
#include <jsondelta-cpp/value.hpp>

#include <cstdint>
#include <span>

namespace jsondelta_cpp {

/// Marker codes in the third slot of a 3-element delta entry.
inline constexpr std::int64_t delta_deleted = 0;
inline constexpr std::int64_t delta_text_diff = 2;
inline constexpr std::int64_t delta_moved = 3;

/// Compute the delta turning @p old_doc into @p new_doc.
/// Equal documents produce an empty object.
auto diff_structural(const Value& old_doc, const Value& new_doc,
                     const StructuralOptions& options = {},
                     Caches* caches = nullptr) -> Value;

/// Apply @p delta to @p document.
///
/// Application is permissive: entries that do not fit the document are
/// skipped, and entries for missing values insert the delta verbatim.
/// A delta that is neither an object nor an array replaces the document.
auto patch_structural(const Value& document, const Value& delta) -> Value;

/// Strict check that @p delta was computed against @p document: every
/// recorded old value, move source and text range must match.
auto validate_structural(const Value& document, const Value& delta) -> bool;

/// The delta that undoes @p delta.
///
/// With @p base (the document @p delta was computed against), nested deltas
/// are read as array deltas exactly where the base holds an array. Without
/// it, an object delta whose keys are all `_<i>` or `<i>` is taken to be an
/// array delta.
auto inverse_structural(const Value& delta, const Value* base = nullptr) -> Value;

/// Merge deltas in order; for object deltas a later entry replaces an
/// earlier one key by key, recursively.
auto merge_structural(std::span<const Value> deltas) -> Value;

/// True if @p delta is the empty delta.
auto is_empty_delta(const Value& delta) -> bool;

}  // namespace jsondelta_cpp
