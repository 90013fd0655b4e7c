// Fuzz target for the structural engine. The input is split at the first
// NUL byte into two documents; any pair that parses is diffed, and the
// delta must patch the old document into the new one and invert back.

#include <jsondelta-cpp/json.hpp>
#include <jsondelta-cpp/logging.hpp>
#include <jsondelta-cpp/structural.hpp>

#include <easylogging++.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string_view>

INITIALIZE_EASYLOGGINGPP

extern "C" int LLVMFuzzerInitialize(int*, char***) {
    jsondelta_cpp::configure_logging(
        jsondelta_cpp::LogSettings{.level = jsondelta_cpp::LogLevel::off, .to_stdout = false, .file = {}});
    return 0;
}

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto input = std::string_view{reinterpret_cast<const char*>(data), size};
    const auto split = std::min(input.find('\0'), input.size());
    const auto old_text = input.substr(0, split);
    const auto new_text = split < input.size() ? input.substr(split + 1) : std::string_view{};

    auto old_doc = jsondelta_cpp::Value{};
    auto new_doc = jsondelta_cpp::Value{};
    try {
        old_doc = jsondelta_cpp::parse_value(old_text);
        new_doc = jsondelta_cpp::parse_value(new_text);
    } catch (const nlohmann::json::exception&) {
        return 0;
    }

    const auto delta = jsondelta_cpp::diff_structural(old_doc, new_doc);
    if (jsondelta_cpp::patch_structural(old_doc, delta) != new_doc) std::abort();
    if (!jsondelta_cpp::validate_structural(old_doc, delta)) std::abort();

    const auto inverse = jsondelta_cpp::inverse_structural(delta, &old_doc);
    if (jsondelta_cpp::patch_structural(new_doc, inverse) != old_doc) std::abort();
    return 0;
}
