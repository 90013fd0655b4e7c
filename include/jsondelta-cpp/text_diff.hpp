/// @file text_diff.hpp
/// @brief Character-level text diffs embedded in structural deltas.
///
/// Positions count Unicode scalar values, not bytes. A byte that is not part
/// of a well-formed UTF-8 sequence counts as one position and round-trips
/// unchanged.

#pragma once

#include <jsondelta-cpp/value.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace jsondelta_cpp {

/// The edit a TextOp performs.
enum class TextOpKind : std::uint8_t {
    insert,   ///< Wire name "insert".
    remove,   ///< Wire name "delete".
    replace,  ///< Wire name "replace".
};

constexpr auto to_string_view(TextOpKind kind) noexcept -> std::string_view {
    switch (kind) {
        case TextOpKind::insert:  return "insert";
        case TextOpKind::remove:  return "delete";
        case TextOpKind::replace: return "replace";
    }
    return "unknown";
}

/// A half-open range of character positions.
struct TextRange {
    std::size_t begin{0};
    std::size_t end{0};

    auto size() const noexcept -> std::size_t { return end - begin; }
    auto operator==(const TextRange&) const -> bool = default;
};

/// One edit of a text diff.
///
/// `remove` uses old_range/old_text, `insert` uses new_range/new_text and
/// `replace` uses all four. Unused fields are left empty.
struct TextOp {
    TextOpKind kind{TextOpKind::insert};
    TextRange old_range;
    TextRange new_range;
    std::string old_text;
    std::string new_text;

    auto operator==(const TextOp&) const -> bool = default;
};

/// Number of character positions in @p text.
auto char_count(std::string_view text) -> std::size_t;

/// Myers character diff of @p old_text against @p new_text. Equal runs are
/// omitted; adjacent deletions and insertions coalesce into one `replace`.
auto diff_text(std::string_view old_text, std::string_view new_text) -> std::vector<TextOp>;

/// Replay @p ops against @p old_text. Out-of-range positions are clamped.
auto apply_text_ops(std::string_view old_text, const std::vector<TextOp>& ops) -> std::string;

/// True if every op addresses an in-range, ordered position and every
/// recorded old text matches @p old_text.
auto text_ops_match(std::string_view old_text, const std::vector<TextOp>& ops) -> bool;

/// Ops that turn the diff's new text back into its old text.
auto invert_text_ops(const std::vector<TextOp>& ops) -> std::vector<TextOp>;

// -- Wire format --------------------------------------------------------------

void to_json(nlohmann::json& j, const TextOp& op);
void from_json(const nlohmann::json& j, TextOp& op);

/// Encode ops as the delta value `[{"text_diff": [...]}, 0, 2]`.
auto make_text_diff_delta(const std::vector<TextOp>& ops) -> Value;

/// Decode ops from the `{"text_diff": [...]}` payload of a text-diff delta.
/// Malformed entries are skipped.
auto read_text_ops(const Value& payload) -> std::vector<TextOp>;

}  // namespace jsondelta_cpp
