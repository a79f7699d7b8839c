#include "Settings.hpp"
#include "AppException.hpp"
#include "Logger.hpp"
#include "Utils.hpp"
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <stdexcept>
#include <utility>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>


namespace {
constexpr const char* kAppName = "FilenameSanitizer";
constexpr const char* kNamingSection = "Naming";
constexpr const char* kLoggingSection = "Logging";

template <typename... Args>
void settings_log(spdlog::level::level_enum level, const char* fmt, Args&&... args) {
    auto message = fmt::format(fmt::runtime(fmt), std::forward<Args>(args)...);
    if (auto logger = Logger::get_logger("core_logger")) {
        logger->log(level, "{}", message);
    } else if (level >= spdlog::level::err) {
        std::fprintf(stderr, "%s\n", message.c_str());
    }
}

[[noreturn]] void reject_value(const std::string& key, const std::string& value, const char* expected)
{
    THROW_APP_ERROR_MSG(ErrorCodes::Code::CONFIG_INVALID_VALUE,
                        fmt::format("Invalid value '{}' for {}: expected {}", value, key, expected),
                        key);
}

int parse_length(const std::string& key, const std::string& value)
{
    std::size_t consumed = 0;
    int parsed = 0;
    try {
        parsed = std::stoi(value, &consumed);
    } catch (const std::exception&) {
        reject_value(key, value, "a non-negative integer");
    }
    if (consumed != value.size() || parsed < 0) {
        reject_value(key, value, "a non-negative integer");
    }
    return parsed;
}

bool is_valid_extension(const std::string& extension)
{
    return extension.empty() || extension.front() == '.';
}

bool is_valid_log_level(const std::string& level)
{
    return spdlog::level::from_str(level) != spdlog::level::off || level == "off";
}
}


Settings::Settings()
    : Settings(define_config_path())
{
}


Settings::Settings(std::string config_path)
    : config_path(std::move(config_path))
{
}


std::string Settings::define_config_path()
{
    if (const char* override_root = std::getenv("FILENAME_SANITIZER_CONFIG_DIR")) {
        return (std::filesystem::path(override_root) / kAppName / "config.ini").string();
    }
#ifdef _WIN32
    if (const char* app_data = std::getenv("APPDATA")) {
        return (std::filesystem::path(app_data) / kAppName / "config.ini").string();
    }
#else
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && xdg[0] != '\0') {
        return (std::filesystem::path(xdg) / kAppName / "config.ini").string();
    }
    if (const char* home = std::getenv("HOME")) {
        return (std::filesystem::path(home) / ".config" / kAppName / "config.ini").string();
    }
#endif
    return "config.ini";
}


const std::string& Settings::get_config_path() const
{
    return config_path;
}


bool Settings::load()
{
    std::error_code ec;
    if (!std::filesystem::exists(config_path, ec)) {
        settings_log(spdlog::level::debug, "No configuration at '{}'; using defaults", config_path);
        return false;
    }
    if (!config.load(config_path)) {
        return false;
    }

    if (const auto raw = config.findValue(kNamingSection, "MaxBaseLength")) {
        max_base_length = parse_length("Naming.MaxBaseLength", *raw);
    }
    if (const auto raw = config.findValue(kNamingSection, "UseSpaces")) {
        const auto parsed = Utils::parse_bool(*raw);
        if (!parsed) {
            reject_value("Naming.UseSpaces", *raw, "true or false");
        }
        use_spaces = *parsed;
    }
    if (const auto extension = config.findValue(kNamingSection, "DefaultExtension")) {
        if (!is_valid_extension(*extension)) {
            reject_value("Naming.DefaultExtension", *extension, "an empty value or text starting with '.'");
        }
        default_extension = *extension;
    }

    const std::string level = Utils::to_lower_copy(config.getValue(kLoggingSection, "Level", log_level));
    if (!is_valid_log_level(level)) {
        reject_value("Logging.Level", level, "trace, debug, info, warning, error, critical or off");
    }
    log_level = level;
    log_directory = config.getValue(kLoggingSection, "Directory", log_directory);

    settings_log(spdlog::level::info,
                 "Loaded settings from '{}' (max base length: {}, use spaces: {}, extension: '{}')",
                 config_path, max_base_length, use_spaces, default_extension);
    return true;
}


bool Settings::save()
{
    config.setValue(kNamingSection, "MaxBaseLength", std::to_string(max_base_length));
    config.setValue(kNamingSection, "UseSpaces", use_spaces ? "true" : "false");
    config.setValue(kNamingSection, "DefaultExtension", default_extension);
    config.setValue(kLoggingSection, "Level", log_level);
    config.setValue(kLoggingSection, "Directory", log_directory);

    const auto config_dir = std::filesystem::path(config_path).parent_path();
    if (!config_dir.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(config_dir, ec);
        if (ec) {
            settings_log(spdlog::level::err, "Error creating configuration directory '{}': {}",
                         config_dir.string(), ec.message());
            return false;
        }
    }
    return config.save(config_path);
}


int Settings::get_max_base_length() const
{
    return max_base_length;
}


void Settings::set_max_base_length(int value)
{
    if (value < 0) {
        THROW_APP_ERROR(ErrorCodes::Code::VALIDATION_VALUE_OUT_OF_RANGE,
                        fmt::format("max_base_length={}", value));
    }
    max_base_length = value;
}


bool Settings::get_use_spaces() const
{
    return use_spaces;
}


void Settings::set_use_spaces(bool value)
{
    use_spaces = value;
}


std::string Settings::get_default_extension() const
{
    return default_extension;
}


void Settings::set_default_extension(const std::string& extension)
{
    if (!is_valid_extension(extension)) {
        THROW_APP_ERROR(ErrorCodes::Code::VALIDATION_INVALID_FORMAT,
                        fmt::format("extension='{}'", extension));
    }
    default_extension = extension;
}


std::string Settings::get_log_level() const
{
    return log_level;
}


void Settings::set_log_level(const std::string& level)
{
    const std::string lowered = Utils::to_lower_copy(level);
    if (!is_valid_log_level(lowered)) {
        reject_value("Logging.Level", level, "trace, debug, info, warning, error, critical or off");
    }
    log_level = lowered;
}


std::string Settings::get_log_directory() const
{
    return log_directory;
}


void Settings::set_log_directory(const std::string& directory)
{
    log_directory = directory;
}


NamingOptions Settings::naming_options() const
{
    return NamingOptions{max_base_length, use_spaces};
}


LoggerOptions Settings::logger_options() const
{
    return LoggerOptions{spdlog::level::from_str(log_level), log_directory};
}
