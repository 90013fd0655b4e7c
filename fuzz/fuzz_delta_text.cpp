// Fuzz target for the text API. The input is used as a delta for every
// strategy against a fixed document; malformed deltas must come back as
// errors, never as crashes or escaping exceptions.

#include <jsondelta-cpp/api.hpp>
#include <jsondelta-cpp/logging.hpp>

#include <easylogging++.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

INITIALIZE_EASYLOGGINGPP

namespace {

constexpr auto document = std::string_view{
    R"({"@id":"http://example.org/a","name":"Ada","tags":["x","y",{"k":[1,2]}],"n":3})"};

}  // namespace

extern "C" int LLVMFuzzerInitialize(int*, char***) {
    jsondelta_cpp::configure_logging(
        jsondelta_cpp::LogSettings{.level = jsondelta_cpp::LogLevel::off, .to_stdout = false, .file = {}});
    return 0;
}

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto delta = std::string{reinterpret_cast<const char*>(data), size};
    const auto deltas = std::vector<std::string>{delta, delta};

    for (auto strategy : {jsondelta_cpp::Strategy::structural, jsondelta_cpp::Strategy::operational,
                          jsondelta_cpp::Strategy::semantic}) {
        auto patched = jsondelta_cpp::patch(strategy, document, delta);
        auto valid = jsondelta_cpp::validate(strategy, document, delta);
        auto inverted = jsondelta_cpp::inverse(strategy, delta);
        auto merged = jsondelta_cpp::merge(strategy, deltas);
        (void)patched;
        (void)valid;
        (void)inverted;
        (void)merged;
    }
    return 0;
}
