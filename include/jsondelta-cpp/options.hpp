/// @file options.hpp
/// @brief Per-call options for the diff engines, parsed from string maps.
///
/// Option maps are forward compatible: unknown keys are ignored and values
/// that fail to parse leave the documented default in place.

#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace jsondelta_cpp {

/// Options as they arrive at the boundary: string keys to string values.
using OptionMap = std::map<std::string, std::string>;

// =============================================================================
// Enumerations
// =============================================================================

/// How arrays are aligned by the structural engine.
enum class ArrayStrategy : std::uint8_t {
    lcs,     ///< Move detection when enabled, positional otherwise.
    simple,  ///< Always positional, even with moves enabled.
    myers,   ///< Move detection when enabled, Myers alignment otherwise.
};

constexpr auto to_string_view(ArrayStrategy s) noexcept -> std::string_view {
    switch (s) {
        case ArrayStrategy::lcs:    return "lcs";
        case ArrayStrategy::simple: return "simple";
        case ArrayStrategy::myers:  return "myers";
    }
    return "unknown";
}

/// How concurrent writes are resolved on replay. Only last-write-wins replay
/// is implemented; `merge` is recorded as metadata.
enum class ConflictResolution : std::uint8_t {
    last_write_wins,
    merge,
};

constexpr auto to_string_view(ConflictResolution c) noexcept -> std::string_view {
    switch (c) {
        case ConflictResolution::last_write_wins: return "last_write_wins";
        case ConflictResolution::merge:           return "merge";
    }
    return "unknown";
}

/// How explicitly labeled blank nodes (`"@id": "_:x"`) are treated.
enum class BlankNodeStrategy : std::uint8_t {
    hash,      ///< Relabel from the content of the labeled node.
    uuid,      ///< Accepted spelling of `hash`; labels stay deterministic.
    preserve,  ///< Keep document labels verbatim.
};

constexpr auto to_string_view(BlankNodeStrategy s) noexcept -> std::string_view {
    switch (s) {
        case BlankNodeStrategy::hash:     return "hash";
        case BlankNodeStrategy::uuid:     return "uuid";
        case BlankNodeStrategy::preserve: return "preserve";
    }
    return "unknown";
}

auto parse_array_strategy(std::string_view s) -> std::optional<ArrayStrategy>;
auto parse_conflict_resolution(std::string_view s) -> std::optional<ConflictResolution>;
auto parse_blank_node_strategy(std::string_view s) -> std::optional<BlankNodeStrategy>;

/// Parse `true/false/1/0/yes/no` (case-sensitive), nullopt otherwise.
auto parse_bool(std::string_view s) -> std::optional<bool>;

// =============================================================================
// Option structs
// =============================================================================

/// Options for diff_structural().
struct StructuralOptions {
    bool include_moves{true};
    ArrayStrategy array_diff{ArrayStrategy::lcs};
    bool text_diff{true};
    /// Strings longer than this many characters on both sides get a text diff.
    std::size_t text_diff_threshold{60};

    static auto from_map(const OptionMap& map) -> StructuralOptions;
};

/// Options for diff_operational().
struct OperationalOptions {
    std::string actor_id;            ///< Empty means a fresh random actor.
    std::optional<std::uint64_t> timestamp;  ///< Base timestamp; default is now.
    ConflictResolution conflict_resolution{ConflictResolution::last_write_wins};

    static auto from_map(const OptionMap& map) -> OperationalOptions;
};

/// Options for diff_semantic().
struct SemanticOptions {
    bool normalize{true};       ///< Renumber blank nodes canonically.
    bool context_aware{true};   ///< Report @context mapping changes.
    bool expand_contexts{false};  ///< Accepted for compatibility; no effect.
    BlankNodeStrategy blank_node_strategy{BlankNodeStrategy::hash};

    static auto from_map(const OptionMap& map) -> SemanticOptions;
};

/// A fresh actor id of the form `actor_<16 hex digits>`.
auto generate_actor_id() -> std::string;

/// Wall-clock time in nanoseconds since the Unix epoch.
auto now_nanoseconds() -> std::uint64_t;

}  // namespace jsondelta_cpp
