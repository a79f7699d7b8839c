#include "IniConfig.hpp"
#include "Logger.hpp"
#include "Utils.hpp"
#include <cstdio>
#include <fstream>
#include <utility>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

namespace {
template <typename... Args>
void ini_log(spdlog::level::level_enum level, const char* fmt, Args&&... args) {
    auto message = fmt::format(fmt::runtime(fmt), std::forward<Args>(args)...);
    if (auto logger = Logger::get_logger("core_logger")) {
        logger->log(level, "{}", message);
    } else if (level >= spdlog::level::err) {
        std::fprintf(stderr, "%s\n", message.c_str());
    }
}

enum class LineKind {Blank, Header, Entry, Malformed};

struct ParsedLine {
    LineKind kind{LineKind::Blank};
    std::string name;
    std::string value;
};

ParsedLine parse_line(const std::string& raw_line)
{
    const std::string line = Utils::trim_copy(raw_line);
    if (line.empty() || line.front() == ';' || line.front() == '#') {
        return {};
    }
    if (line.front() == '[' && line.back() == ']' && line.size() >= 2) {
        return {LineKind::Header, Utils::trim_copy(line.substr(1, line.size() - 2)), {}};
    }
    const auto delimiter = line.find('=');
    if (delimiter == std::string::npos) {
        return {LineKind::Malformed, {}, {}};
    }
    std::string key = Utils::trim_copy(line.substr(0, delimiter));
    if (key.empty()) {
        return {LineKind::Malformed, {}, {}};
    }
    return {LineKind::Entry, std::move(key), Utils::trim_copy(line.substr(delimiter + 1))};
}

void write_entries(std::ofstream& file, const std::map<std::string, std::string>& entries)
{
    for (const auto& [key, value] : entries) {
        file << key << " = " << value << "\n";
    }
}
}


bool IniConfig::load(const std::string &filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        ini_log(spdlog::level::err, "Failed to open config file: {}", filename);
        return false;
    }

    std::string raw_line;
    std::string current_section;
    std::size_t line_number = 0;
    std::size_t entries = 0;
    while (std::getline(file, raw_line)) {
        ++line_number;
        ParsedLine parsed = parse_line(raw_line);
        switch (parsed.kind) {
            case LineKind::Blank:
                break;
            case LineKind::Header:
                current_section = std::move(parsed.name);
                break;
            case LineKind::Entry:
                sections[current_section][parsed.name] = std::move(parsed.value);
                ++entries;
                break;
            case LineKind::Malformed:
                ini_log(spdlog::level::warn, "Ignoring malformed line {} in {}", line_number, filename);
                break;
        }
    }
    ini_log(spdlog::level::debug, "Read {} setting(s) from {}", entries, filename);
    return true;
}


std::optional<std::string> IniConfig::findValue(const std::string &section, const std::string &key) const
{
    const auto section_it = sections.find(section);
    if (section_it == sections.end()) {
        return std::nullopt;
    }
    const auto key_it = section_it->second.find(key);
    if (key_it == section_it->second.end()) {
        return std::nullopt;
    }
    return key_it->second;
}


std::string IniConfig::getValue(const std::string &section, const std::string &key, const std::string &default_value) const {
    return findValue(section, key).value_or(default_value);
}


void IniConfig::setValue(const std::string &section, const std::string &key, const std::string &value) {
    sections[section][key] = value;
}


bool IniConfig::save(const std::string &filename) const
{
    std::ofstream file(filename);
    if (!file.is_open()) {
        ini_log(spdlog::level::err, "Failed to open config file for writing: {}", filename);
        return false;
    }

    // Sectionless keys must precede the first header to load back into "".
    if (const auto unnamed = sections.find(""); unnamed != sections.end()) {
        write_entries(file, unnamed->second);
        file << "\n";
    }
    for (const auto &[name, entries] : sections) {
        if (name.empty()) {
            continue;
        }
        file << "[" << name << "]\n";
        write_entries(file, entries);
        file << "\n";
    }

    return static_cast<bool>(file);
}
