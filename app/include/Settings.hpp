#ifndef SETTINGS_HPP
#define SETTINGS_HPP

#include <IniConfig.hpp>
#include <Logger.hpp>
#include <Types.hpp>
#include <string>


class Settings
{
public:
    Settings();
    explicit Settings(std::string config_path);

    // False when the file is absent or unreadable (defaults stay in effect).
    // Throws ErrorCodes::AppException (CONFIG_INVALID_VALUE) for bad values.
    bool load();
    bool save();

    static std::string define_config_path();
    const std::string& get_config_path() const;

    int get_max_base_length() const;
    void set_max_base_length(int value);

    bool get_use_spaces() const;
    void set_use_spaces(bool value);

    std::string get_default_extension() const;
    void set_default_extension(const std::string& extension);

    std::string get_log_level() const;
    void set_log_level(const std::string& level);

    std::string get_log_directory() const;
    void set_log_directory(const std::string& directory);

    NamingOptions naming_options() const;
    LoggerOptions logger_options() const;

private:
    std::string config_path;
    IniConfig config;

    int max_base_length{kDefaultMaxBaseLength};
    bool use_spaces{true};
    std::string default_extension{".md"};
    std::string log_level{"info"};
    std::string log_directory;
};

#endif
