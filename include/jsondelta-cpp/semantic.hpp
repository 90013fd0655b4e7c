/// @file semantic.hpp
/// @brief RDF triple extraction from JSON-LD documents and triple-set deltas.
///
/// Two documents are semantically equal when they denote the same set of
/// triples after blank-node canonicalization, whatever their JSON shape.

#pragma once

#include <jsondelta-cpp/cache.hpp>
#include <jsondelta-cpp/options.hpp>
#include <jsondelta-cpp/value.hpp>

#include <nlohmann/json.hpp>

#include <compare>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace jsondelta_cpp {

// =============================================================================
// IRIs
// =============================================================================

inline constexpr std::string_view rdf_type_iri = "http://www.w3.org/1999/02/22-rdf-syntax-ns#type";
inline constexpr std::string_view default_vocabulary = "http://example.org/";

namespace xsd {
inline constexpr std::string_view string_iri = "http://www.w3.org/2001/XMLSchema#string";
inline constexpr std::string_view integer_iri = "http://www.w3.org/2001/XMLSchema#integer";
inline constexpr std::string_view double_iri = "http://www.w3.org/2001/XMLSchema#double";
inline constexpr std::string_view boolean_iri = "http://www.w3.org/2001/XMLSchema#boolean";
}  // namespace xsd

/// Expand a property name or type to an IRI.
///
/// Absolute `http(s)` IRIs pass through, `schema:`, `rdf:` and `rdfs:`
/// prefixes expand, other prefixed names stay as they are, and bare terms
/// land in the default vocabulary.
auto expand_iri(std::string_view term) -> std::string;

/// The segment after the last `/` or `#` of @p iri.
auto iri_local_name(std::string_view iri) -> std::string;

// =============================================================================
// Triples
// =============================================================================

/// A literal object: lexical form plus an optional datatype or language.
struct Literal {
    std::string value;
    std::optional<std::string> datatype;
    std::optional<std::string> language;

    auto operator<=>(const Literal&) const = default;
};

/// A triple object: an IRI or `_:` blank node id, or a literal.
using Term = std::variant<std::string, Literal>;

struct Triple {
    std::string subject;
    std::string predicate;
    Term object;

    auto operator<=>(const Triple&) const = default;
};

/// The triples denoted by @p document, sorted and without duplicates.
///
/// Objects without `@id` become blank nodes named after their structural
/// hash, so identical anonymous subtrees share one node. With
/// `options.normalize` the blank node ids are canonicalized.
auto extract_triples(const Value& document, const SemanticOptions& options = {},
                     Caches* caches = nullptr) -> std::vector<Triple>;

/// Rename every blank node to `_:hNNNNNNNN`, numbered in the sorted order of
/// the ids in use. Result is sorted.
auto canonicalize_blank_nodes(std::vector<Triple> triples) -> std::vector<Triple>;

// =============================================================================
// Contexts
// =============================================================================

/// Flattened `@context`: term to IRI, or to the compact JSON text of a
/// non-string definition.
using ContextMap = std::map<std::string, std::string>;

/// The flattened `@context` of @p document. An array context merges its
/// object members in order; string members contribute nothing.
auto flatten_context(const Value& document, Caches* caches = nullptr) -> ContextMap;

struct ContextChange {
    std::string old_value;
    std::string new_value;

    auto operator==(const ContextChange&) const -> bool = default;
};

struct ContextChanges {
    ContextMap added;
    ContextMap removed;
    std::map<std::string, ContextChange> changed;
    std::optional<std::string> old_base;  ///< `@base` before, if any.
    std::optional<std::string> new_base;  ///< `@base` after, if any.

    auto empty() const -> bool { return added.empty() && removed.empty() && changed.empty(); }
    auto operator==(const ContextChanges&) const -> bool = default;
};

// =============================================================================
// Delta
// =============================================================================

/// One property change of a node. Additions carry only new_value,
/// removals only old_value, modifications both.
struct PropertyChange {
    std::string property;
    std::optional<Term> old_value;
    std::optional<Term> new_value;

    auto operator==(const PropertyChange&) const -> bool = default;
};

/// Triple changes of one subject, paired by predicate.
struct NodeChange {
    std::string node_id;
    std::vector<PropertyChange> added_properties;
    std::vector<PropertyChange> removed_properties;
    std::vector<PropertyChange> modified_properties;

    auto operator==(const NodeChange&) const -> bool = default;
};

struct SemanticMetadata {
    std::string normalization_algorithm{"lexicographic"};
    BlankNodeStrategy blank_node_handling{BlankNodeStrategy::hash};
    bool semantic_equivalence{true};

    auto operator==(const SemanticMetadata&) const -> bool = default;
};

struct SemanticDelta {
    std::vector<Triple> added_triples;
    std::vector<Triple> removed_triples;
    std::vector<NodeChange> modified_nodes;
    ContextChanges context_changes;
    SemanticMetadata metadata;

    auto operator==(const SemanticDelta&) const -> bool = default;
};

/// Triple-set difference of two documents plus the change of their
/// `@context` tables (left empty when `options.context_aware` is off).
auto diff_semantic(const Value& old_doc, const Value& new_doc,
                   const SemanticOptions& options = {}, Caches* caches = nullptr) -> SemanticDelta;

/// Apply the triple changes whose subject is the root `@id` of @p document,
/// then the context changes. Other subjects are not reconstructed.
auto patch_semantic(const Value& document, const SemanticDelta& delta) -> Value;

/// True if every removed triple of @p delta is denoted by @p document.
auto validate_semantic(const Value& document, const SemanticDelta& delta,
                       Caches* caches = nullptr) -> bool;

/// The delta with additions and removals swapped.
auto inverse_semantic(const SemanticDelta& delta) -> SemanticDelta;

/// Concatenate deltas without duplicate triples; context tables merge with
/// later deltas winning.
auto merge_semantic(std::span<const SemanticDelta> deltas) -> SemanticDelta;

// -- Wire format --------------------------------------------------------------

void to_json(nlohmann::json& j, const Literal& literal);
void from_json(const nlohmann::json& j, Literal& literal);
void to_json(nlohmann::json& j, const Triple& triple);
void from_json(const nlohmann::json& j, Triple& triple);
void to_json(nlohmann::json& j, const NodeChange& node);
void from_json(const nlohmann::json& j, NodeChange& node);
void to_json(nlohmann::json& j, const ContextChanges& changes);
void from_json(const nlohmann::json& j, ContextChanges& changes);
void to_json(nlohmann::json& j, const SemanticDelta& delta);
void from_json(const nlohmann::json& j, SemanticDelta& delta);

}  // namespace jsondelta_cpp
