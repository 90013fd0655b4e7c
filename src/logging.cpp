#include <jsondelta-cpp/logging.hpp>

#include <easylogging++.h>

#include <string>

namespace jsondelta_cpp {

namespace {

auto enabled(LogLevel threshold, LogLevel level) -> const char* {
    return static_cast<int>(level) >= static_cast<int>(threshold) ? "true" : "false";
}

}  // namespace

void configure_logging(const LogSettings& settings) {
    auto conf = el::Configurations{};
    conf.setToDefault();
    conf.set(el::Level::Global, el::ConfigurationType::Format,
             "%datetime %level [%logger] %msg");
    conf.set(el::Level::Global, el::ConfigurationType::ToStandardOutput,
             settings.level != LogLevel::off && settings.to_stdout ? "true" : "false");
    conf.set(el::Level::Global, el::ConfigurationType::ToFile,
             settings.level != LogLevel::off && !settings.file.empty() ? "true" : "false");
    if (!settings.file.empty()) {
        conf.set(el::Level::Global, el::ConfigurationType::Filename, settings.file);
    }

    conf.set(el::Level::Trace, el::ConfigurationType::Enabled,
             enabled(settings.level, LogLevel::trace));
    conf.set(el::Level::Debug, el::ConfigurationType::Enabled,
             enabled(settings.level, LogLevel::debug));
    conf.set(el::Level::Verbose, el::ConfigurationType::Enabled,
             enabled(settings.level, LogLevel::debug));
    conf.set(el::Level::Info, el::ConfigurationType::Enabled,
             enabled(settings.level, LogLevel::info));
    conf.set(el::Level::Warning, el::ConfigurationType::Enabled,
             enabled(settings.level, LogLevel::warning));
    conf.set(el::Level::Error, el::ConfigurationType::Enabled,
             enabled(settings.level, LogLevel::error));
    conf.set(el::Level::Fatal, el::ConfigurationType::Enabled,
             enabled(settings.level, LogLevel::error));

    el::Loggers::reconfigureAllLoggers(conf);
    el::Loggers::addFlag(el::LoggingFlag::ImmediateFlush);
}

auto configure_logging_from_file(const std::string& path) -> bool {
    auto conf = el::Configurations{};
    if (!conf.parseFromFile(path)) {
        LOG(WARNING) << "cannot parse logging configuration " << path;
        return false;
    }
    el::Loggers::reconfigureAllLoggers(conf);
    el::Loggers::addFlag(el::LoggingFlag::ImmediateFlush);
    return true;
}

}  // namespace jsondelta_cpp
