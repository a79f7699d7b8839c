#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <memory>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

struct LoggerOptions {
    spdlog::level::level_enum level{spdlog::level::info};
    std::string log_directory; ///< Empty disables the rotating file sink.
};

class Logger {
public:
    static void setup_loggers(const LoggerOptions& options = {});

    // nullptr until setup_loggers() has registered the name
    static std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

    static const std::vector<std::string>& logger_names();

private:
    static std::string log_file_path(const std::string& directory);
};

#endif
