/// @file error.hpp
/// @brief Error types and the tagged Result returned at the text boundary.

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace jsondelta_cpp {

/// Categories of errors that can occur in the library.
///
/// `shape_mismatch` and `unknown_option` are reserved and currently never
/// produced: patches that do not fit the document fall back to leaving the
/// affected value unchanged, and unknown or malformed options are ignored.
enum class ErrorKind : std::uint8_t {
    parse_error,          ///< Input text is not well-formed JSON.
    shape_mismatch,       ///< Reserved. A delta does not fit the value it is applied to.
    unknown_option,       ///< Reserved. An option key or value was not recognized.
    serialization_error,  ///< A result could not be encoded as JSON text.
    invalid_delta,        ///< A delta document cannot be interpreted at all.
};

/// Convert an ErrorKind to its string representation.
constexpr auto to_string_view(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::parse_error:         return "parse_error";
        case ErrorKind::shape_mismatch:      return "shape_mismatch";
        case ErrorKind::unknown_option:      return "unknown_option";
        case ErrorKind::serialization_error: return "serialization_error";
        case ErrorKind::invalid_delta:       return "invalid_delta";
    }
    return "unknown";
}

/// A structured error with a category and a human-readable message.
struct Error {
    ErrorKind kind;      ///< The category of this error.
    std::string message; ///< A human-readable description.

    /// Construct an Error with the given kind and message.
    Error(ErrorKind k, std::string msg)
        : kind{k}, message{std::move(msg)} {}

    auto operator==(const Error& other) const -> bool = default;
};

/// Either a payload or an Error. There is no partial-success state.
///
/// @code
/// auto r = jsondelta_cpp::diff(Strategy::structural, old_text, new_text);
/// if (r.ok()) std::puts(r.value().c_str());
/// else        std::puts(r.error().message.c_str());
/// @endcode
template <typename T>
class Result {
public:
    Result(T value) : state_{std::in_place_index<0>, std::move(value)} {}
    Result(Error error) : state_{std::in_place_index<1>, std::move(error)} {}

    auto ok() const noexcept -> bool { return state_.index() == 0; }
    explicit operator bool() const noexcept { return ok(); }

    /// The payload. Throws std::logic_error on a failed result.
    auto value() const -> const T& {
        if (!ok()) throw std::logic_error{"Result holds an error: " + std::get<1>(state_).message};
        return std::get<0>(state_);
    }

    auto value() -> T& {
        if (!ok()) throw std::logic_error{"Result holds an error: " + std::get<1>(state_).message};
        return std::get<0>(state_);
    }

    /// The error. Throws std::logic_error on a successful result.
    auto error() const -> const Error& {
        if (ok()) throw std::logic_error{"Result holds a value"};
        return std::get<1>(state_);
    }

    auto operator==(const Result&) const -> bool = default;

private:
    std::variant<T, Error> state_;
};

}  // namespace jsondelta_cpp
