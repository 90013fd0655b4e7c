#include <jsondelta-cpp/logging.hpp>

#include <easylogging++.h>
#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>

using namespace jsondelta_cpp;

namespace {

auto quiet() -> LogSettings {
    return LogSettings{.level = LogLevel::off, .to_stdout = false, .file = {}};
}

auto read_file(const std::string& path) -> std::string {
    auto in = std::ifstream{path};
    auto text = std::stringstream{};
    text << in.rdbuf();
    return text.str();
}

}  // namespace

TEST(LogLevel, to_string_view) {
    EXPECT_EQ(to_string_view(LogLevel::trace), "trace");
    EXPECT_EQ(to_string_view(LogLevel::warning), "warning");
    EXPECT_EQ(to_string_view(LogLevel::off), "off");
}

TEST(ConfigureLogging, file_sink_respects_level) {
    const auto path = ::testing::TempDir() + "jsondelta_logging_test.log";
    std::remove(path.c_str());

    configure_logging(LogSettings{.level = LogLevel::warning, .to_stdout = false, .file = path});
    LOG(INFO) << "informational line";
    LOG(WARNING) << "warning line";
    configure_logging(quiet());

    const auto text = read_file(path);
    EXPECT_EQ(text.find("informational line"), std::string::npos);
    EXPECT_NE(text.find("warning line"), std::string::npos);
    std::remove(path.c_str());
}

TEST(ConfigureLogging, from_file) {
    const auto path = ::testing::TempDir() + "jsondelta_logging_test.conf";
    {
        auto out = std::ofstream{path};
        out << "* GLOBAL:\n"
            << "    ENABLED = false\n"
            << "    TO_STANDARD_OUTPUT = false\n"
            << "    TO_FILE = false\n";
    }
    EXPECT_TRUE(configure_logging_from_file(path));
    configure_logging(quiet());
    std::remove(path.c_str());
}
