#include <jsondelta-cpp/logging.hpp>

#include <easylogging++.h>
#include <gtest/gtest.h>

INITIALIZE_EASYLOGGINGPP

auto main(int argc, char** argv) -> int {
    ::testing::InitGoogleTest(&argc, argv);
    START_EASYLOGGINGPP(argc, argv);
    jsondelta_cpp::configure_logging(jsondelta_cpp::LogSettings{
        .level = jsondelta_cpp::LogLevel::off, .to_stdout = false, .file = {}});
    return RUN_ALL_TESTS();
}
