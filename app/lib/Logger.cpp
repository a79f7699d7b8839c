#include "Logger.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <filesystem>

namespace {
constexpr std::size_t kMaxLogFileBytes = 5 * 1024 * 1024;
constexpr std::size_t kMaxLogFiles = 3;
}


void Logger::setup_loggers(const LoggerOptions& options)
{
    std::vector<spdlog::sink_ptr> sinks;

    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_pattern("[%^%l%$] %v");
    sinks.push_back(console_sink);

    if (!options.log_directory.empty()) {
        std::filesystem::create_directories(options.log_directory);
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            log_file_path(options.log_directory), kMaxLogFileBytes, kMaxLogFiles);
        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");
        sinks.push_back(file_sink);
    }

    for (const auto& name : logger_names()) {
        spdlog::drop(name);
        auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        logger->set_level(options.level);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    }
}


std::shared_ptr<spdlog::logger> Logger::get_logger(const std::string& name)
{
    return spdlog::get(name);
}


const std::vector<std::string>& Logger::logger_names()
{
    static const std::vector<std::string> names = {"core_logger", "cli_logger"};
    return names;
}


std::string Logger::log_file_path(const std::string& directory)
{
    return (std::filesystem::path(directory) / "filename-sanitizer.log").string();
}
