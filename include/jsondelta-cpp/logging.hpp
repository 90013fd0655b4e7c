/// @file logging.hpp
/// @brief Logging configuration for jsondelta-cpp.
///
/// The library logs through easylogging++. Executables that link it must
/// place INITIALIZE_EASYLOGGINGPP in exactly one translation unit.

#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace jsondelta_cpp {

/// Minimum severity that reaches the log sinks.
enum class LogLevel : std::uint8_t {
    trace,
    debug,
    info,
    warning,
    error,
    off,
};

/// Convert a LogLevel to its string representation.
constexpr auto to_string_view(LogLevel level) noexcept -> std::string_view {
    switch (level) {
        case LogLevel::trace:   return "trace";
        case LogLevel::debug:   return "debug";
        case LogLevel::info:    return "info";
        case LogLevel::warning: return "warning";
        case LogLevel::error:   return "error";
        case LogLevel::off:     return "off";
    }
    return "unknown";
}

/// Sink and level settings applied to every registered logger.
struct LogSettings {
    LogLevel level{LogLevel::info};  ///< Messages below this level are dropped.
    bool to_stdout{true};            ///< Write to standard output.
    std::string file;                ///< Log file path; empty disables file output.
};

/// Reconfigure all easylogging++ loggers from @p settings.
void configure_logging(const LogSettings& settings);

/// Reconfigure all easylogging++ loggers from an easylogging++ config file.
/// Returns false if the file could not be parsed.
auto configure_logging_from_file(const std::string& path) -> bool;

}  // namespace jsondelta_cpp
