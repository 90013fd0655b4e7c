#include <jsondelta-cpp/api.hpp>
#include <jsondelta-cpp/expand.hpp>
#include <jsondelta-cpp/json.hpp>
#include <jsondelta-cpp/operational.hpp>
#include <jsondelta-cpp/semantic.hpp>
#include <jsondelta-cpp/structural.hpp>

#include <nlohmann/json.hpp>

#include <easylogging++.h>

#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace jsondelta_cpp {

auto parse_strategy(std::string_view s) -> std::optional<Strategy> {
    if (s == "structural") return Strategy::structural;
    if (s == "operational") return Strategy::operational;
    if (s == "semantic") return Strategy::semantic;
    return std::nullopt;
}

namespace {

// Raised when a result holds text that JSON cannot encode (invalid UTF-8).
struct SerializationFailure : std::runtime_error {
    using std::runtime_error::runtime_error;
};

auto parse_json(std::string_view text) -> nlohmann::json {
    return nlohmann::json::parse(text.begin(), text.end());
}

auto serialize(const nlohmann::json& j) -> std::string {
    try {
        return j.dump();
    } catch (const nlohmann::json::type_error& e) {
        throw SerializationFailure{e.what()};
    }
}

auto serialize(const Value& v) -> std::string { return serialize(to_json_value(v)); }

/// Read a typed delta; any shape problem becomes std::invalid_argument.
template <typename T>
auto decode(std::string_view text, std::string_view what) -> T {
    const auto j = parse_json(text);
    try {
        return j.get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw std::invalid_argument{std::string{what} + ": " + e.what()};
    }
}

template <typename F>
auto guarded(std::string_view operation, F&& body) -> Result<std::invoke_result_t<F&>> {
    try {
        return body();
    } catch (const nlohmann::json::parse_error& e) {
        LOG(WARNING) << std::string{operation} << ": " << e.what();
        return Error{ErrorKind::parse_error, std::string{"JSON parse error: "} + e.what()};
    } catch (const SerializationFailure& e) {
        LOG(WARNING) << std::string{operation} << ": " << e.what();
        return Error{ErrorKind::serialization_error, e.what()};
    } catch (const std::invalid_argument& e) {
        LOG(WARNING) << std::string{operation} << ": " << e.what();
        return Error{ErrorKind::invalid_delta, e.what()};
    } catch (const nlohmann::json::exception& e) {
        LOG(WARNING) << std::string{operation} << ": " << e.what();
        return Error{ErrorKind::invalid_delta, e.what()};
    }
}

}  // namespace

auto diff(Strategy strategy, std::string_view old_text, std::string_view new_text,
          const OptionMap& options, Caches* caches) -> Result<std::string> {
    return guarded("diff", [&]() -> std::string {
        const auto old_doc = parse_value(old_text);
        const auto new_doc = parse_value(new_text);
        switch (strategy) {
            case Strategy::structural:
                return serialize(diff_structural(old_doc, new_doc,
                                                 StructuralOptions::from_map(options), caches));
            case Strategy::operational:
                return serialize(nlohmann::json(
                    diff_operational(old_doc, new_doc, OperationalOptions::from_map(options))));
            case Strategy::semantic:
                return serialize(nlohmann::json(
                    diff_semantic(old_doc, new_doc, SemanticOptions::from_map(options), caches)));
        }
        throw std::invalid_argument{"unknown strategy"};
    });
}

auto patch(Strategy strategy, std::string_view document_text, std::string_view delta_text)
    -> Result<std::string> {
    return guarded("patch", [&]() -> std::string {
        const auto document = parse_value(document_text);
        switch (strategy) {
            case Strategy::structural:
                return serialize(patch_structural(document, parse_value(delta_text)));
            case Strategy::operational:
                return serialize(patch_operational(document, decode<OperationLog>(delta_text, "operation log")));
            case Strategy::semantic:
                return serialize(patch_semantic(document, decode<SemanticDelta>(delta_text, "semantic delta")));
        }
        throw std::invalid_argument{"unknown strategy"};
    });
}

auto validate(Strategy strategy, std::string_view document_text, std::string_view delta_text,
              Caches* caches) -> Result<bool> {
    return guarded("validate", [&]() -> bool {
        const auto document = parse_value(document_text);
        switch (strategy) {
            case Strategy::structural:
                return validate_structural(document, parse_value(delta_text));
            case Strategy::operational:
                return validate_operational(document, decode<OperationLog>(delta_text, "operation log"));
            case Strategy::semantic:
                return validate_semantic(document, decode<SemanticDelta>(delta_text, "semantic delta"), caches);
        }
        throw std::invalid_argument{"unknown strategy"};
    });
}

auto inverse(Strategy strategy, std::string_view delta_text) -> Result<std::string> {
    return guarded("inverse", [&]() -> std::string {
        switch (strategy) {
            case Strategy::structural:
                return serialize(inverse_structural(parse_value(delta_text)));
            case Strategy::operational:
                return serialize(nlohmann::json(
                    inverse_operational(decode<OperationLog>(delta_text, "operation log"))));
            case Strategy::semantic:
                return serialize(nlohmann::json(
                    inverse_semantic(decode<SemanticDelta>(delta_text, "semantic delta"))));
        }
        throw std::invalid_argument{"unknown strategy"};
    });
}

auto merge(Strategy strategy, std::span<const std::string> delta_texts, const OptionMap& options)
    -> Result<std::string> {
    return guarded("merge", [&]() -> std::string {
        switch (strategy) {
            case Strategy::structural: {
                auto deltas = std::vector<Value>{};
                for (const auto& text : delta_texts) deltas.push_back(parse_value(text));
                return serialize(merge_structural(deltas));
            }
            case Strategy::operational: {
                auto logs = std::vector<OperationLog>{};
                for (const auto& text : delta_texts) {
                    logs.push_back(decode<OperationLog>(text, "operation log"));
                }
                auto resolution = std::optional<ConflictResolution>{};
                if (auto it = options.find("conflict_resolution"); it != options.end()) {
                    resolution = parse_conflict_resolution(it->second);
                }
                return serialize(nlohmann::json(merge_operational(logs, resolution)));
            }
            case Strategy::semantic: {
                auto deltas = std::vector<SemanticDelta>{};
                for (const auto& text : delta_texts) {
                    deltas.push_back(decode<SemanticDelta>(text, "semantic delta"));
                }
                return serialize(nlohmann::json(merge_semantic(deltas)));
            }
        }
        throw std::invalid_argument{"unknown strategy"};
    });
}

auto expand_text(std::string_view document_text, Caches* caches) -> Result<std::string> {
    return guarded("expand", [&]() -> std::string {
        return serialize(expand(parse_value(document_text), caches));
    });
}

}  // namespace jsondelta_cpp
