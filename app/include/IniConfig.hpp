#ifndef INICONFIG_HPP
#define INICONFIG_HPP

#include <map>
#include <optional>
#include <string>

// Minimal INI store: [section] headers, key = value pairs, ';' or '#' comments.
// Keys before the first header belong to the unnamed section "".
class IniConfig {
public:
    bool load(const std::string &filename);
    bool save(const std::string &filename) const;

    std::optional<std::string> findValue(const std::string &section, const std::string &key) const;
    std::string getValue(const std::string &section, const std::string &key,
                         const std::string &default_value = "") const;
    void setValue(const std::string &section, const std::string &key, const std::string &value);

private:
    using Section = std::map<std::string, std::string>;
    std::map<std::string, Section> sections;
};

#endif
