/// @file operational.hpp
/// @brief Actor-tagged operation logs with last-write-wins replay.

#pragma once

#include <jsondelta-cpp/options.hpp>
#include <jsondelta-cpp/value.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace jsondelta_cpp {

/// A path element: either an object key or an array index.
using PathElement = std::variant<std::string, std::size_t>;

/// A path from the document root (e.g. "config" / "items" / 0).
using Path = std::vector<PathElement>;

/// The edit an Operation performs.
enum class OpType : std::uint8_t {
    set,     ///< Put a value at an object key or existing array index.
    remove,  ///< Delete the value at the path. Wire name "delete".
    insert,  ///< Insert into an array (or put into an object).
};

constexpr auto to_string_view(OpType t) noexcept -> std::string_view {
    switch (t) {
        case OpType::set:    return "set";
        case OpType::remove: return "delete";
        case OpType::insert: return "insert";
    }
    return "unknown";
}

/// Parse a wire name into an OpType.
auto parse_op_type(std::string_view s) -> std::optional<OpType>;

/// One timestamped, actor-tagged edit.
struct Operation {
    OpType type{OpType::set};
    Path path;
    Value value;  ///< Null for deletions.
    std::uint64_t timestamp{0};
    std::string actor_id;

    auto operator==(const Operation&) const -> bool = default;
};

/// Inclusive range of the timestamps in a log.
struct TimestampRange {
    std::uint64_t first{0};
    std::uint64_t last{0};

    auto operator==(const TimestampRange&) const -> bool = default;
};

struct OperationLogMetadata {
    std::vector<std::string> actors;
    TimestampRange timestamp_range;
    ConflictResolution conflict_resolution{ConflictResolution::last_write_wins};

    auto operator==(const OperationLogMetadata&) const -> bool = default;
};

/// The operational delta: operations in emission order plus metadata.
struct OperationLog {
    std::vector<Operation> operations;
    OperationLogMetadata metadata;

    auto operator==(const OperationLog&) const -> bool = default;
};

/// Emit the operations turning @p old_doc into @p new_doc.
///
/// Object keys are compared one by one; arrays that differ are rewritten
/// wholesale (every old index deleted from the highest down, then every
/// new element inserted in order). Timestamps start at the configured base
/// and increase by one per operation.
auto diff_operational(const Value& old_doc, const Value& new_doc,
                      const OperationalOptions& options = {}) -> OperationLog;

/// Replay @p log onto @p document in timestamp order. Operations ordered by
/// equal timestamps keep their log order. Operations addressing missing
/// locations are no-ops.
auto patch_operational(const Value& document, const OperationLog& log) -> Value;

/// True if every operation, replayed in timestamp order, addresses an
/// existing location.
auto validate_operational(const Value& document, const OperationLog& log) -> bool;

/// Lossy inverse: operations reversed, `set` and `insert` undone by
/// `delete`, `delete` undone by setting null.
auto inverse_operational(const OperationLog& log) -> OperationLog;

/// Exact inverse of @p log as replayed on @p base, built from the values
/// each operation overwrote.
auto inverse_operational(const OperationLog& log, const Value& base) -> OperationLog;

/// Concatenate logs, dedupe actors in first-seen order and sort the
/// operations by timestamp (stable). The conflict resolution comes from
/// @p resolution, else from the first log.
auto merge_operational(std::span<const OperationLog> logs,
                       std::optional<ConflictResolution> resolution = std::nullopt)
    -> OperationLog;

// -- Wire format --------------------------------------------------------------

void to_json(nlohmann::json& j, const Operation& op);
void from_json(const nlohmann::json& j, Operation& op);
void to_json(nlohmann::json& j, const OperationLog& log);
void from_json(const nlohmann::json& j, OperationLog& log);

}  // namespace jsondelta_cpp
