/// @file expand.hpp
/// @brief Simplified JSON-LD expansion.

#pragma once

#include <jsondelta-cpp/cache.hpp>
#include <jsondelta-cpp/value.hpp>

namespace jsondelta_cpp {

/// Expand @p document to the JSON-LD expanded form, without remote
/// contexts or term definitions.
///
/// The result is always an array of node objects. Property names expand
/// with expand_iri(), every value becomes an array, scalars become
/// `{"@value": v}` objects (numbers and booleans get an `@type`), `@set`
/// wrappers are removed and `@list` wrappers kept. `@context` is dropped.
///
/// @code
/// auto expanded = expand(parse_value(R"({"name": "Ada"})"));
/// // [{"http://example.org/name": [{"@value": "Ada"}]}]
/// @endcode
auto expand(const Value& document, Caches* caches = nullptr) -> Value;

}  // namespace jsondelta_cpp
