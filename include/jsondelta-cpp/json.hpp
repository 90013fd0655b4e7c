/// @file json.hpp
/// @brief nlohmann/json interoperability for jsondelta-cpp.
///
/// Provides ADL serialization (to_json/from_json) for Value and the text
/// helpers used at the library boundary. The delta types declare their
/// own to_json/from_json next to their definitions.

#pragma once

#include <jsondelta-cpp/value.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace jsondelta_cpp {

// =============================================================================
// ADL serialization: to_json / from_json
// =============================================================================

void to_json(nlohmann::json& j, Null);
void to_json(nlohmann::json& j, const Value& v);
void from_json(const nlohmann::json& j, Value& v);

// =============================================================================
// Conversion and text helpers
// =============================================================================

/// Convert a parsed nlohmann::json tree into a Value.
///
/// Unsigned numbers that fit into int64 become signed integers; binary
/// and discarded values become null.
auto to_value(const nlohmann::json& j) -> Value;

/// Convert a Value into an nlohmann::json tree.
auto to_json_value(const Value& v) -> nlohmann::json;

/// Parse UTF-8 JSON text into a Value.
/// @throws nlohmann::json::parse_error on malformed input.
auto parse_value(std::string_view text) -> Value;

/// Serialize a Value as JSON text. An indent of -1 produces compact output.
/// @throws nlohmann::json::type_error if a string holds invalid UTF-8.
auto to_json_text(const Value& v, int indent = -1) -> std::string;

/// Serialize a Value with sorted keys and no whitespace.
/// @throws nlohmann::json::type_error if a string holds invalid UTF-8.
auto canonical_text(const Value& v) -> std::string;

}  // namespace jsondelta_cpp
