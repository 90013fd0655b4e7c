/// @file hash.hpp
/// @brief Structural hashing of values and array-element move matching.

#pragma once

#include <jsondelta-cpp/cache.hpp>
#include <jsondelta-cpp/value.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <vector>

namespace jsondelta_cpp {

/// Deterministic 64-bit hash consistent with Value equality.
///
/// Arrays hash their children in order. Objects combine (key, child) pair
/// hashes commutatively, so key order never matters. The hash is advisory:
/// it short-circuits equality checks and is never persisted.
auto structural_hash(const Value& v, HashCache* cache = nullptr) -> std::uint64_t;

/// For each element of @p new_items, the index of an equal element of
/// @p old_items, or nullopt. Each old element is matched at most once.
///
/// An equal element at the same index is preferred; otherwise the first
/// unmatched equal element in old order is taken. Candidates are found by
/// hash and confirmed by deep equality.
auto match_moved_elements(const Array& old_items, const Array& new_items,
                          HashCache* cache = nullptr)
    -> std::vector<std::optional<std::size_t>>;

}  // namespace jsondelta_cpp

// =============================================================================
// std::hash specialization
// =============================================================================

template <>
struct std::hash<jsondelta_cpp::Value> {
    auto operator()(const jsondelta_cpp::Value& v) const -> std::size_t {
        return static_cast<std::size_t>(jsondelta_cpp::structural_hash(v));
    }
};
