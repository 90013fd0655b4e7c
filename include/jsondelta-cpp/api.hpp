/// @file api.hpp
/// @brief Text-in, text-out entry points for all three delta strategies.
///
/// These functions never throw for bad input. Malformed document text
/// yields ErrorKind::parse_error, a delta whose shape cannot be read yields
/// ErrorKind::invalid_delta and output that cannot be encoded as JSON yields
/// ErrorKind::serialization_error.

#pragma once

#include <jsondelta-cpp/cache.hpp>
#include <jsondelta-cpp/error.hpp>
#include <jsondelta-cpp/options.hpp>

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace jsondelta_cpp {

/// Which notion of difference a call computes.
enum class Strategy : std::uint8_t {
    structural,   ///< jsondiffpatch-style tree delta.
    operational,  ///< Timestamped operation log.
    semantic,     ///< RDF triple-set delta.
};

constexpr auto to_string_view(Strategy s) noexcept -> std::string_view {
    switch (s) {
        case Strategy::structural:  return "structural";
        case Strategy::operational: return "operational";
        case Strategy::semantic:    return "semantic";
    }
    return "unknown";
}

auto parse_strategy(std::string_view s) -> std::optional<Strategy>;

/// Delta from @p old_text to @p new_text, as JSON text.
auto diff(Strategy strategy, std::string_view old_text, std::string_view new_text,
          const OptionMap& options = {}, Caches* caches = nullptr) -> Result<std::string>;

/// @p document_text with @p delta_text applied.
auto patch(Strategy strategy, std::string_view document_text, std::string_view delta_text)
    -> Result<std::string>;

/// Whether @p delta_text can be applied to @p document_text exactly.
auto validate(Strategy strategy, std::string_view document_text, std::string_view delta_text,
              Caches* caches = nullptr) -> Result<bool>;

/// The delta undoing @p delta_text.
auto inverse(Strategy strategy, std::string_view delta_text) -> Result<std::string>;

/// One delta combining @p delta_texts in order. Operational merges honor
/// the `conflict_resolution` option.
auto merge(Strategy strategy, std::span<const std::string> delta_texts,
           const OptionMap& options = {}) -> Result<std::string>;

/// Simplified JSON-LD expansion of @p document_text.
auto expand_text(std::string_view document_text, Caches* caches = nullptr) -> Result<std::string>;

}  // namespace jsondelta_cpp
