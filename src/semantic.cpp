#include <jsondelta-cpp/semantic.hpp>
#include <jsondelta-cpp/hash.hpp>
#include <jsondelta-cpp/json.hpp>

#include <easylogging++.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <map>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace jsondelta_cpp {

// =============================================================================
// IRIs
// =============================================================================

namespace {

struct Prefix {
    std::string_view name;
    std::string_view iri;
};

constexpr Prefix known_prefixes[] = {
    {"schema", "http://schema.org/"},
    {"rdf", "http://www.w3.org/1999/02/22-rdf-syntax-ns#"},
    {"rdfs", "http://www.w3.org/2000/01/rdf-schema#"},
};

// `scheme://...`, where the scheme is a letter followed by letters, digits,
// '+', '-' or '.'.
auto is_absolute_iri(std::string_view s) -> bool {
    const auto sep = s.find("://");
    if (sep == std::string_view::npos || sep == 0) return false;
    if (!std::isalpha(static_cast<unsigned char>(s.front()))) return false;
    return std::all_of(s.begin(), s.begin() + static_cast<std::ptrdiff_t>(sep), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '-' || c == '.';
    });
}

auto is_blank(std::string_view s) -> bool { return s.starts_with("_:"); }

auto hex16(std::uint64_t bits) -> std::string {
    static constexpr char hex_chars[] = "0123456789abcdef";
    auto out = std::string(16, '0');
    for (int i = 15; i >= 0; --i) {
        out[static_cast<std::size_t>(i)] = hex_chars[bits & 0x0F];
        bits >>= 4;
    }
    return out;
}

}  // namespace

auto expand_iri(std::string_view term) -> std::string {
    if (is_absolute_iri(term)) return std::string{term};
    if (auto colon = term.find(':'); colon != std::string_view::npos) {
        const auto prefix = term.substr(0, colon);
        for (const auto& known : known_prefixes) {
            if (known.name == prefix) {
                return std::string{known.iri} + std::string{term.substr(colon + 1)};
            }
        }
        return std::string{term};
    }
    return std::string{default_vocabulary} + std::string{term};
}

auto iri_local_name(std::string_view iri) -> std::string {
    auto pos = iri.find_last_of("/#");
    if (pos == std::string_view::npos) return std::string{iri};
    return std::string{iri.substr(pos + 1)};
}

// =============================================================================
// Extraction
// =============================================================================

namespace {

auto lexical_form(const Value& v) -> std::string {
    if (const auto* s = v.get_if<std::string>()) return *s;
    if (const auto* b = v.get_if<bool>()) return *b ? "true" : "false";
    return canonical_text(v);
}

auto inferred_datatype(const Value& v) -> std::optional<std::string> {
    switch (v.kind()) {
        case ValueKind::string:           return std::string{xsd::string_iri};
        case ValueKind::boolean:          return std::string{xsd::boolean_iri};
        case ValueKind::integer:
        case ValueKind::unsigned_integer: return std::string{xsd::integer_iri};
        case ValueKind::real:             return std::string{xsd::double_iri};
        default:                          return std::nullopt;
    }
}

auto without_id(const Object& obj) -> Value {
    auto copy = obj;
    copy.erase("@id");
    return Value{std::move(copy)};
}

class TripleExtractor {
public:
    TripleExtractor(const SemanticOptions& options, HashCache* hashes)
        : options_{options}, hashes_{hashes} {}

    auto run(const Value& document) -> std::vector<Triple> {
        if (options_.blank_node_strategy != BlankNodeStrategy::preserve) {
            collect_labels(document);
        }
        walk(document);
        std::sort(triples_.begin(), triples_.end());
        triples_.erase(std::unique(triples_.begin(), triples_.end()), triples_.end());
        return std::move(triples_);
    }

private:
    // Explicit blank node labels are renamed after the content of the nodes
    // that define them, so the choice of label never matters.
    void collect_labels(const Value& v) {
        if (const auto* arr = v.get_if<Array>()) {
            for (const auto& item : *arr) collect_labels(item);
            return;
        }
        const auto* obj = v.get_if<Object>();
        if (!obj) return;
        if (const auto* id = v.find("@id"); id && id->is_string() && is_blank(as_string_view(*id))) {
            has_labels_ = true;
            if (obj->size() > 1) {
                const auto content = relabel(without_id(*obj), [](const std::string&) { return std::string{"_:"}; });
                label_hashes_[*id->get_if<std::string>()] += structural_hash(content, hashes_);
            }
        }
        for (const auto& [key, child] : *obj) collect_labels(child);
    }

    auto node_id(const std::string& id) -> std::string {
        if (!is_blank(id) || options_.blank_node_strategy == BlankNodeStrategy::preserve) return id;
        auto it = label_hashes_.find(id);
        const auto bits = it != label_hashes_.end() ? it->second : structural_hash(Value{id}, hashes_);
        return "_:b" + hex16(bits);
    }

    /// Copy of @p v with every blank `@id` string replaced by rename(id), so
    /// that hashing it does not see the document's own labels.
    template <typename Rename>
    static auto relabel(const Value& v, const Rename& rename) -> Value {
        if (const auto* arr = v.get_if<Array>()) {
            auto out = Array{};
            out.reserve(arr->size());
            for (const auto& item : *arr) out.push_back(relabel(item, rename));
            return Value{std::move(out)};
        }
        const auto* obj = v.get_if<Object>();
        if (!obj) return v;
        auto out = Object{};
        for (const auto& [key, child] : *obj) {
            if (key == "@id" && child.is_string() && is_blank(as_string_view(child))) {
                out.emplace(key, Value{rename(*child.get_if<std::string>())});
            } else {
                out.emplace(key, relabel(child, rename));
            }
        }
        return Value{std::move(out)};
    }

    void walk(const Value& v) {
        if (const auto* arr = v.get_if<Array>()) {
            for (const auto& item : *arr) walk(item);
        } else if (const auto* obj = v.get_if<Object>()) {
            if (obj->contains("@value")) return;
            if (const auto* inner = set_or_list(*obj)) {
                walk(*inner);
                return;
            }
            node(*obj);
        }
    }

    static auto set_or_list(const Object& obj) -> const Value* {
        for (const auto* key : {"@set", "@list"}) {
            if (auto it = obj.find(key); it != obj.end()) return &it->second;
        }
        return nullptr;
    }

    /// Emit the triples of one node object and return its subject.
    auto node(const Object& obj) -> std::string {
        auto id_it = obj.find("@id");
        auto subject = std::string{};
        if (id_it != obj.end() && id_it->second.is_string()) {
            subject = node_id(*id_it->second.get_if<std::string>());
        } else if (has_labels_) {
            const auto content = relabel(Value{obj}, [this](const std::string& id) { return node_id(id); });
            subject = "_:b" + hex16(structural_hash(content, hashes_));
        } else {
            subject = "_:b" + hex16(structural_hash(Value{obj}, hashes_));
        }

        if (auto graph = obj.find("@graph"); graph != obj.end()) {
            walk(graph->second);
        }
        if (auto types = obj.find("@type"); types != obj.end()) {
            emit_types(subject, types->second);
        }
        for (const auto& [key, value] : obj) {
            if (key.starts_with('@')) continue;
            emit_values(subject, expand_iri(key), value);
        }
        return subject;
    }

    void emit_types(const std::string& subject, const Value& types) {
        if (const auto* arr = types.get_if<Array>()) {
            for (const auto& t : *arr) emit_types(subject, t);
        } else if (const auto* t = types.get_if<std::string>()) {
            triples_.push_back(Triple{subject, std::string{rdf_type_iri}, Term{expand_iri(*t)}});
        }
    }

    void emit_values(const std::string& subject, const std::string& predicate, const Value& value) {
        std::visit(overload{
            [](Null) {},
            [&](const Array& arr) {
                for (const auto& item : arr) emit_values(subject, predicate, item);
            },
            [&](const Object& obj) {
                if (const auto* inner = set_or_list(obj)) {
                    emit_values(subject, predicate, *inner);
                } else if (obj.contains("@value")) {
                    if (auto literal = value_object(obj)) emit(subject, predicate, Term{std::move(*literal)});
                } else if (auto id = obj.find("@id"); id != obj.end() && id->second.is_string() && obj.size() == 1) {
                    emit(subject, predicate, Term{node_id(*id->second.get_if<std::string>())});
                } else {
                    emit(subject, predicate, Term{node(obj)});
                }
            },
            [&](const std::string& s) {
                if (is_absolute_iri(s)) {
                    emit(subject, predicate, Term{s});
                } else {
                    emit(subject, predicate, Term{Literal{s, std::string{xsd::string_iri}, std::nullopt}});
                }
            },
            [&](const auto&) {
                emit(subject, predicate, Term{Literal{lexical_form(value), inferred_datatype(value), std::nullopt}});
            },
        }, value.storage());
    }

    static auto value_object(const Object& obj) -> std::optional<Literal> {
        const auto& raw = obj.at("@value");
        if (raw.is_null()) return std::nullopt;
        if (raw.is_container()) {
            LOG(DEBUG) << "skipping @value holding a " << std::string{to_string_view(raw.kind())};
            return std::nullopt;
        }
        auto literal = Literal{lexical_form(raw), std::nullopt, std::nullopt};
        if (auto lang = obj.find("@language"); lang != obj.end() && lang->second.is_string()) {
            literal.language = *lang->second.get_if<std::string>();
        } else if (auto type = obj.find("@type"); type != obj.end() && type->second.is_string()) {
            literal.datatype = *type->second.get_if<std::string>();
        } else {
            literal.datatype = inferred_datatype(raw);
        }
        return literal;
    }

    void emit(const std::string& subject, const std::string& predicate, Term object) {
        triples_.push_back(Triple{subject, predicate, std::move(object)});
    }

    const SemanticOptions& options_;
    HashCache* hashes_;
    std::map<std::string, std::uint64_t> label_hashes_;
    bool has_labels_{false};
    std::vector<Triple> triples_;
};

}  // namespace

auto extract_triples(const Value& document, const SemanticOptions& options, Caches* caches)
    -> std::vector<Triple> {
    auto triples = TripleExtractor{options, caches ? &caches->hashes : nullptr}.run(document);
    if (options.normalize) return canonicalize_blank_nodes(std::move(triples));
    return triples;
}

auto canonicalize_blank_nodes(std::vector<Triple> triples) -> std::vector<Triple> {
    auto ids = std::set<std::string>{};
    for (const auto& t : triples) {
        if (is_blank(t.subject)) ids.insert(t.subject);
        if (const auto* iri = std::get_if<std::string>(&t.object); iri && is_blank(*iri)) ids.insert(*iri);
    }

    auto renamed = std::map<std::string, std::string>{};
    auto counter = std::size_t{0};
    for (const auto& id : ids) {
        auto digits = std::to_string(counter++);
        if (digits.size() < 8) digits.insert(0, 8 - digits.size(), '0');
        renamed.emplace(id, "_:h" + digits);
    }

    for (auto& t : triples) {
        if (auto it = renamed.find(t.subject); it != renamed.end()) t.subject = it->second;
        if (auto* iri = std::get_if<std::string>(&t.object)) {
            if (auto it = renamed.find(*iri); it != renamed.end()) *iri = it->second;
        }
    }
    std::sort(triples.begin(), triples.end());
    triples.erase(std::unique(triples.begin(), triples.end()), triples.end());
    return triples;
}

// =============================================================================
// Contexts
// =============================================================================

namespace {

void flatten_into(ContextMap& out, const Value& context) {
    if (const auto* arr = context.get_if<Array>()) {
        for (const auto& member : *arr) flatten_into(out, member);
        return;
    }
    const auto* obj = context.get_if<Object>();
    if (!obj) return;
    for (const auto& [term, definition] : *obj) {
        out[term] = definition.is_string() ? *definition.get_if<std::string>() : canonical_text(definition);
    }
}

auto context_to_value(const ContextMap& map) -> Value {
    auto obj = Object{};
    for (const auto& [term, text] : map) obj.emplace(term, Value{text});
    return Value{std::move(obj)};
}

auto context_from_value(const Value& v) -> ContextMap {
    auto map = ContextMap{};
    if (const auto* obj = v.get_if<Object>()) {
        for (const auto& [term, text] : *obj) map.emplace(term, std::string{as_string_view(text)});
    }
    return map;
}

/// A stored definition as it goes back into `@context`: JSON text of a
/// container is parsed, anything else stays a string.
auto restore_definition(const std::string& text) -> Value {
    if (!text.empty() && (text.front() == '{' || text.front() == '[')) {
        auto parsed = nlohmann::json::parse(text, nullptr, false);
        if (!parsed.is_discarded()) return to_value(parsed);
    }
    return Value{text};
}

auto base_of(const ContextMap& map) -> std::optional<std::string> {
    if (auto it = map.find("@base"); it != map.end()) return it->second;
    return std::nullopt;
}

auto diff_contexts(const ContextMap& a, const ContextMap& b) -> ContextChanges {
    auto changes = ContextChanges{};
    for (const auto& [term, old_value] : a) {
        auto it = b.find(term);
        if (it == b.end()) {
            changes.removed.emplace(term, old_value);
        } else if (it->second != old_value) {
            changes.changed.emplace(term, ContextChange{old_value, it->second});
        }
    }
    for (const auto& [term, new_value] : b) {
        if (!a.contains(term)) changes.added.emplace(term, new_value);
    }
    changes.old_base = base_of(a);
    changes.new_base = base_of(b);
    return changes;
}

}  // namespace

auto flatten_context(const Value& document, Caches* caches) -> ContextMap {
    const auto* context = document.find("@context");
    if (!context) return {};

    auto key = caches ? pattern_key("context", *context) : std::nullopt;
    if (key) {
        if (auto hit = caches->patterns.find(*key)) return context_from_value(*hit);
    }
    auto map = ContextMap{};
    flatten_into(map, *context);
    if (key) caches->patterns.insert(*key, context_to_value(map));
    return map;
}

// =============================================================================
// Diff
// =============================================================================

namespace {

auto group_by_node(const std::vector<Triple>& added, const std::vector<Triple>& removed)
    -> std::vector<NodeChange> {
    using Bucket = std::pair<std::vector<const Triple*>, std::vector<const Triple*>>;
    auto buckets = std::map<std::pair<std::string, std::string>, Bucket>{};
    for (const auto& t : added) buckets[{t.subject, t.predicate}].first.push_back(&t);
    for (const auto& t : removed) buckets[{t.subject, t.predicate}].second.push_back(&t);

    auto nodes = std::vector<NodeChange>{};
    for (const auto& [key, bucket] : buckets) {
        const auto& [subject, predicate] = key;
        if (nodes.empty() || nodes.back().node_id != subject) {
            nodes.push_back(NodeChange{subject, {}, {}, {}});
        }
        auto& node = nodes.back();
        const auto& [adds, removes] = bucket;
        // The first addition and removal of a predicate pair up as a modification.
        const auto paired = !adds.empty() && !removes.empty() ? std::size_t{1} : std::size_t{0};

        for (std::size_t k = 0; k < paired; ++k) {
            node.modified_properties.push_back(
                PropertyChange{predicate, removes[k]->object, adds[k]->object});
        }
        for (auto k = paired; k < adds.size(); ++k) {
            node.added_properties.push_back(PropertyChange{predicate, std::nullopt, adds[k]->object});
        }
        for (auto k = paired; k < removes.size(); ++k) {
            node.removed_properties.push_back(PropertyChange{predicate, removes[k]->object, std::nullopt});
        }
    }
    return nodes;
}

}  // namespace

auto diff_semantic(const Value& old_doc, const Value& new_doc,
                   const SemanticOptions& options, Caches* caches) -> SemanticDelta {
    const auto old_triples = extract_triples(old_doc, options, caches);
    const auto new_triples = extract_triples(new_doc, options, caches);

    auto delta = SemanticDelta{};
    std::set_difference(new_triples.begin(), new_triples.end(),
                        old_triples.begin(), old_triples.end(),
                        std::back_inserter(delta.added_triples));
    std::set_difference(old_triples.begin(), old_triples.end(),
                        new_triples.begin(), new_triples.end(),
                        std::back_inserter(delta.removed_triples));
    delta.modified_nodes = group_by_node(delta.added_triples, delta.removed_triples);

    if (options.context_aware) {
        delta.context_changes = diff_contexts(flatten_context(old_doc, caches),
                                              flatten_context(new_doc, caches));
    }
    delta.metadata.blank_node_handling = options.blank_node_strategy;
    delta.metadata.semantic_equivalence = delta.added_triples.empty() && delta.removed_triples.empty();
    return delta;
}

// =============================================================================
// Patch
// =============================================================================

namespace {

auto parse_integer(const std::string& text) -> std::optional<Value> {
    auto i = std::int64_t{0};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), i);
    if (ec == std::errc{} && ptr == text.data() + text.size()) return Value{i};
    auto u = std::uint64_t{0};
    auto [uptr, uec] = std::from_chars(text.data(), text.data() + text.size(), u);
    if (uec == std::errc{} && uptr == text.data() + text.size()) return Value{u};
    return std::nullopt;
}

auto parse_double(const std::string& text) -> std::optional<Value> {
    auto parsed = nlohmann::json::parse(text, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_number()) return std::nullopt;
    return Value{parsed.get<double>()};
}

/// The JSON value a triple object stands for in a compact document.
auto decode_term(const Term& term) -> Value {
    if (const auto* iri = std::get_if<std::string>(&term)) return Value{*iri};
    const auto& literal = std::get<Literal>(term);
    if (!literal.language && literal.datatype) {
        const auto& type = *literal.datatype;
        if (type == xsd::integer_iri) {
            if (auto v = parse_integer(literal.value)) return *v;
        } else if (type == xsd::double_iri) {
            if (auto v = parse_double(literal.value)) return *v;
        } else if (type == xsd::boolean_iri) {
            if (literal.value == "true") return Value{true};
            if (literal.value == "false") return Value{false};
        }
    }
    return Value{literal.value};
}

auto type_name(const Term& term) -> std::optional<std::string> {
    if (const auto* iri = std::get_if<std::string>(&term)) return iri_local_name(*iri);
    return std::nullopt;
}

void add_value(Object& obj, const std::string& key, Value value) {
    auto it = obj.find(key);
    if (it == obj.end()) {
        obj.emplace(key, std::move(value));
        return;
    }
    if (auto* arr = it->second.get_if<Array>()) {
        if (std::find(arr->begin(), arr->end(), value) == arr->end()) arr->push_back(std::move(value));
    } else if (it->second != value) {
        it->second = Value{Array{std::move(it->second), std::move(value)}};
    }
}

void remove_value(Object& obj, const std::string& key, const Value& value) {
    auto it = obj.find(key);
    if (it == obj.end()) return;
    if (auto* arr = it->second.get_if<Array>()) {
        arr->erase(std::remove(arr->begin(), arr->end(), value), arr->end());
        if (arr->empty()) {
            obj.erase(it);
        } else if (arr->size() == 1) {
            auto only = std::move(arr->front());
            it->second = std::move(only);
        }
    } else if (it->second == value) {
        obj.erase(it);
    }
}

void apply_triples(Object& doc, const std::vector<Triple>& triples, bool adding) {
    const auto* root = doc.contains("@id") ? doc.at("@id").get_if<std::string>() : nullptr;
    if (!root) return;
    const auto root_id = *root;

    for (const auto& t : triples) {
        if (t.subject != root_id) continue;
        // Nested nodes are not rebuilt, and their labels are not property values.
        if (const auto* iri = std::get_if<std::string>(&t.object); iri && is_blank(*iri)) continue;
        if (t.predicate == rdf_type_iri) {
            auto name = type_name(t.object);
            if (!name) continue;
            if (adding) {
                add_value(doc, "@type", Value{*name});
            } else {
                remove_value(doc, "@type", Value{*name});
            }
            continue;
        }
        const auto key = iri_local_name(t.predicate);
        if (adding) {
            add_value(doc, key, decode_term(t.object));
        } else {
            remove_value(doc, key, decode_term(t.object));
        }
    }
}

void apply_context(Object& doc, const ContextChanges& changes) {
    if (changes.empty()) return;
    auto map = flatten_context(Value{doc});
    for (const auto& [term, value] : changes.added) map[term] = value;
    for (const auto& [term, value] : changes.removed) map.erase(term);
    for (const auto& [term, change] : changes.changed) map[term] = change.new_value;

    auto context = Object{};
    for (const auto& [term, text] : map) context.emplace(term, restore_definition(text));
    doc["@context"] = Value{std::move(context)};
}

}  // namespace

auto patch_semantic(const Value& document, const SemanticDelta& delta) -> Value {
    const auto* obj = document.get_if<Object>();
    if (!obj) {
        LOG(DEBUG) << "semantic patch against a " << std::string{to_string_view(document.kind())}
                   << ", left unchanged";
        return document;
    }
    auto result = *obj;
    apply_triples(result, delta.added_triples, true);
    apply_triples(result, delta.removed_triples, false);
    apply_context(result, delta.context_changes);
    return Value{std::move(result)};
}

// =============================================================================
// Validate / inverse / merge
// =============================================================================

namespace {

auto is_plain_string(const Literal& literal) -> bool {
    return !literal.language && (!literal.datatype || *literal.datatype == xsd::string_iri);
}

auto objects_match(const Term& expected, const Term& actual) -> bool {
    if (expected == actual) return true;
    const auto* want_text = std::get_if<std::string>(&expected);
    const auto* want_literal = std::get_if<Literal>(&expected);
    const auto* have = std::get_if<Literal>(&actual);
    if (!have || !is_plain_string(*have)) return false;
    if (want_text) return *want_text == have->value;
    return is_plain_string(*want_literal) && want_literal->value == have->value;
}

auto contains_triple(const std::vector<Triple>& triples, const Triple& wanted) -> bool {
    return std::any_of(triples.begin(), triples.end(), [&](const Triple& t) {
        return t.subject == wanted.subject && t.predicate == wanted.predicate &&
               objects_match(wanted.object, t.object);
    });
}

auto invert_properties(std::vector<PropertyChange> props) -> std::vector<PropertyChange> {
    for (auto& p : props) std::swap(p.old_value, p.new_value);
    return props;
}

template <typename T>
void append_unique(std::vector<T>& out, const std::vector<T>& items) {
    for (const auto& item : items) {
        if (std::find(out.begin(), out.end(), item) == out.end()) out.push_back(item);
    }
}

}  // namespace

auto validate_semantic(const Value& document, const SemanticDelta& delta, Caches* caches) -> bool {
    auto options = SemanticOptions{};
    options.blank_node_strategy = delta.metadata.blank_node_handling;
    const auto triples = extract_triples(document, options, caches);
    return std::all_of(delta.removed_triples.begin(), delta.removed_triples.end(),
                       [&](const Triple& t) { return contains_triple(triples, t); });
}

auto inverse_semantic(const SemanticDelta& delta) -> SemanticDelta {
    auto inv = SemanticDelta{};
    inv.added_triples = delta.removed_triples;
    inv.removed_triples = delta.added_triples;
    for (const auto& node : delta.modified_nodes) {
        inv.modified_nodes.push_back(NodeChange{
            node.node_id,
            invert_properties(node.removed_properties),
            invert_properties(node.added_properties),
            invert_properties(node.modified_properties),
        });
    }

    const auto& ctx = delta.context_changes;
    inv.context_changes.added = ctx.removed;
    inv.context_changes.removed = ctx.added;
    for (const auto& [term, change] : ctx.changed) {
        inv.context_changes.changed.emplace(term, ContextChange{change.new_value, change.old_value});
    }
    inv.context_changes.old_base = ctx.new_base;
    inv.context_changes.new_base = ctx.old_base;
    inv.metadata = delta.metadata;
    return inv;
}

auto merge_semantic(std::span<const SemanticDelta> deltas) -> SemanticDelta {
    auto merged = SemanticDelta{};
    for (const auto& delta : deltas) {
        append_unique(merged.added_triples, delta.added_triples);
        append_unique(merged.removed_triples, delta.removed_triples);

        for (const auto& node : delta.modified_nodes) {
            auto it = std::find_if(merged.modified_nodes.begin(), merged.modified_nodes.end(),
                [&](const NodeChange& n) { return n.node_id == node.node_id; });
            if (it == merged.modified_nodes.end()) {
                merged.modified_nodes.push_back(node);
                continue;
            }
            append_unique(it->added_properties, node.added_properties);
            append_unique(it->removed_properties, node.removed_properties);
            append_unique(it->modified_properties, node.modified_properties);
        }

        auto& ctx = merged.context_changes;
        for (const auto& [term, value] : delta.context_changes.added) ctx.added[term] = value;
        for (const auto& [term, value] : delta.context_changes.removed) ctx.removed[term] = value;
        for (const auto& [term, change] : delta.context_changes.changed) ctx.changed[term] = change;
        if (delta.context_changes.old_base) ctx.old_base = delta.context_changes.old_base;
        if (delta.context_changes.new_base) ctx.new_base = delta.context_changes.new_base;
        merged.metadata = delta.metadata;
    }
    merged.metadata.semantic_equivalence = merged.added_triples.empty() && merged.removed_triples.empty();
    return merged;
}

// =============================================================================
// Wire format
// =============================================================================

namespace {

auto term_to_json(const Term& term) -> nlohmann::json {
    if (const auto* iri = std::get_if<std::string>(&term)) return *iri;
    return std::get<Literal>(term);
}

auto term_from_json(const nlohmann::json& j) -> Term {
    if (j.is_string()) return Term{j.get<std::string>()};
    if (j.is_object() && j.contains("@id")) return Term{j.at("@id").get<std::string>()};
    return Term{j.get<Literal>()};
}

auto optional_text(const std::optional<std::string>& s) -> nlohmann::json {
    if (s) return *s;
    return nullptr;
}

auto read_optional_text(const nlohmann::json& j) -> std::optional<std::string> {
    if (j.is_string()) return j.get<std::string>();
    return std::nullopt;
}

auto property_to_json(const PropertyChange& p) -> nlohmann::json {
    auto j = nlohmann::json{{"property", p.property}, {"change_type", "value"}};
    if (p.old_value) j["old_value"] = term_to_json(*p.old_value);
    if (p.new_value) j["new_value"] = term_to_json(*p.new_value);
    return j;
}

auto property_from_json(const nlohmann::json& j) -> PropertyChange {
    auto p = PropertyChange{};
    p.property = j.at("property").get<std::string>();
    if (auto it = j.find("old_value"); it != j.end() && !it->is_null()) p.old_value = term_from_json(*it);
    if (auto it = j.find("new_value"); it != j.end() && !it->is_null()) p.new_value = term_from_json(*it);
    return p;
}

auto properties_to_json(const std::vector<PropertyChange>& props) -> nlohmann::json {
    auto out = nlohmann::json::array();
    for (const auto& p : props) out.push_back(property_to_json(p));
    return out;
}

auto properties_from_json(const nlohmann::json& j, const std::string& key) -> std::vector<PropertyChange> {
    auto props = std::vector<PropertyChange>{};
    if (auto it = j.find(key); it != j.end()) {
        for (const auto& entry : *it) props.push_back(property_from_json(entry));
    }
    return props;
}

auto triples_from_json(const nlohmann::json& j, const std::string& key) -> std::vector<Triple> {
    auto triples = std::vector<Triple>{};
    if (auto it = j.find(key); it != j.end()) {
        for (const auto& entry : *it) triples.push_back(entry.get<Triple>());
    }
    return triples;
}

}  // namespace

void to_json(nlohmann::json& j, const Literal& literal) {
    j = nlohmann::json{{"value", literal.value}};
    if (literal.datatype) j["type"] = *literal.datatype;
    if (literal.language) j["language"] = *literal.language;
}

void from_json(const nlohmann::json& j, Literal& literal) {
    literal = Literal{};
    const auto& value = j.at("value");
    literal.value = value.is_string() ? value.get<std::string>() : value.dump();
    if (auto it = j.find("type"); it != j.end() && it->is_string()) literal.datatype = it->get<std::string>();
    if (auto it = j.find("language"); it != j.end() && it->is_string()) literal.language = it->get<std::string>();
}

void to_json(nlohmann::json& j, const Triple& triple) {
    j = nlohmann::json{
        {"subject", triple.subject},
        {"predicate", triple.predicate},
        {"object", term_to_json(triple.object)},
    };
}

void from_json(const nlohmann::json& j, Triple& triple) {
    triple.subject = j.at("subject").get<std::string>();
    triple.predicate = j.at("predicate").get<std::string>();
    triple.object = term_from_json(j.at("object"));
}

void to_json(nlohmann::json& j, const NodeChange& node) {
    j = nlohmann::json{
        {"node_id", node.node_id},
        {"added_properties", properties_to_json(node.added_properties)},
        {"removed_properties", properties_to_json(node.removed_properties)},
        {"modified_properties", properties_to_json(node.modified_properties)},
    };
}

void from_json(const nlohmann::json& j, NodeChange& node) {
    node.node_id = j.at("node_id").get<std::string>();
    node.added_properties = properties_from_json(j, "added_properties");
    node.removed_properties = properties_from_json(j, "removed_properties");
    node.modified_properties = properties_from_json(j, "modified_properties");
}

void to_json(nlohmann::json& j, const ContextChanges& changes) {
    auto changed = nlohmann::json::object();
    for (const auto& [term, change] : changes.changed) {
        changed[term] = nlohmann::json::array({change.old_value, change.new_value});
    }
    j = nlohmann::json{
        {"added_mappings", changes.added},
        {"removed_mappings", changes.removed},
        {"changed_mappings", std::move(changed)},
        {"base_changes", nlohmann::json::array({optional_text(changes.old_base),
                                                optional_text(changes.new_base)})},
    };
}

void from_json(const nlohmann::json& j, ContextChanges& changes) {
    changes = ContextChanges{};
    auto read_map = [&](const std::string& key, ContextMap& out) {
        auto it = j.find(key);
        if (it == j.end() || !it->is_object()) return;
        for (const auto& [term, value] : it->items()) {
            out[term] = value.is_string() ? value.get<std::string>() : value.dump();
        }
    };
    read_map("added_mappings", changes.added);
    read_map("removed_mappings", changes.removed);
    if (auto it = j.find("changed_mappings"); it != j.end() && it->is_object()) {
        for (const auto& [term, pair] : it->items()) {
            if (!pair.is_array() || pair.size() != 2) continue;
            auto text = [](const nlohmann::json& v) { return v.is_string() ? v.get<std::string>() : v.dump(); };
            changes.changed.emplace(term, ContextChange{text(pair[0]), text(pair[1])});
        }
    }
    if (auto it = j.find("base_changes"); it != j.end() && it->is_array() && it->size() == 2) {
        changes.old_base = read_optional_text((*it)[0]);
        changes.new_base = read_optional_text((*it)[1]);
    }
}

void to_json(nlohmann::json& j, const SemanticDelta& delta) {
    j = nlohmann::json{
        {"added_triples", delta.added_triples},
        {"removed_triples", delta.removed_triples},
        {"modified_nodes", delta.modified_nodes},
        {"context_changes", delta.context_changes},
        {"metadata", {
            {"normalization_algorithm", delta.metadata.normalization_algorithm},
            {"blank_node_handling", std::string{to_string_view(delta.metadata.blank_node_handling)}},
            {"semantic_equivalence", delta.metadata.semantic_equivalence},
        }},
    };
}

void from_json(const nlohmann::json& j, SemanticDelta& delta) {
    delta = SemanticDelta{};
    if (!j.is_object()) throw std::invalid_argument{"semantic delta must be an object"};
    delta.added_triples = triples_from_json(j, "added_triples");
    delta.removed_triples = triples_from_json(j, "removed_triples");
    if (auto it = j.find("modified_nodes"); it != j.end()) {
        delta.modified_nodes = it->get<std::vector<NodeChange>>();
    }
    if (auto it = j.find("context_changes"); it != j.end() && it->is_object()) {
        delta.context_changes = it->get<ContextChanges>();
    }
    const auto meta = j.value("metadata", nlohmann::json::object());
    delta.metadata.normalization_algorithm =
        meta.value("normalization_algorithm", delta.metadata.normalization_algorithm);
    if (auto it = meta.find("blank_node_handling"); it != meta.end() && it->is_string()) {
        if (auto parsed = parse_blank_node_strategy(it->get<std::string>())) {
            delta.metadata.blank_node_handling = *parsed;
        }
    }
    delta.metadata.semantic_equivalence = meta.value(
        "semantic_equivalence", delta.added_triples.empty() && delta.removed_triples.empty());
}

}  // namespace jsondelta_cpp
