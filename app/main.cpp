#include "AppException.hpp"
#include "FilenameManager.hpp"
#include "Logger.hpp"
#include "Settings.hpp"

#ifdef _WIN32
#include <json/json.h>
#elif __APPLE__
#include <json/json.h>
#else
#include <jsoncpp/json/json.h>
#endif

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace {

constexpr int kExitUsage = 2;

class UsageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct ParsedArguments {
    std::optional<std::string> config_path;
    std::optional<std::string> extension;
    std::optional<int> max_base_len;
    bool no_spaces{false};
    bool json_output{false};
    bool verbose{false};
    bool show_help{false};
    std::vector<std::string> titles;
};

struct IssuedFile {
    std::string title;
    std::string filename;
};

void print_usage(std::FILE* stream)
{
    std::fprintf(stream,
                 "Usage: sanitize-titles [--config PATH] [--ext EXT] [--max-base N]\n"
                 "                       [--no-spaces] [--json] [--verbose] [TITLE...]\n"
                 "\n"
                 "Prints a unique, filesystem-safe filename for every title. Titles are read\n"
                 "one per line from stdin when none are given on the command line.\n");
}

const char* require_value(int argc, char** argv, int& index)
{
    if (index + 1 >= argc) {
        throw UsageError(std::string("Missing value for ") + argv[index]);
    }
    return argv[++index];
}

int parse_max_base(const std::string& value)
{
    std::size_t consumed = 0;
    int parsed = 0;
    try {
        parsed = std::stoi(value, &consumed);
    } catch (const std::exception&) {
        throw UsageError("--max-base expects an integer, got '" + value + "'");
    }
    if (consumed != value.size()) {
        throw UsageError("--max-base expects an integer, got '" + value + "'");
    }
    return parsed;
}

ParsedArguments parse_command_line(int argc, char** argv)
{
    ParsedArguments parsed;
    bool positional_only = false;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        if (positional_only || arg[0] != '-' || std::strcmp(arg, "-") == 0) {
            parsed.titles.emplace_back(arg);
        } else if (std::strcmp(arg, "--") == 0) {
            positional_only = true;
        } else if (std::strcmp(arg, "--config") == 0) {
            parsed.config_path = require_value(argc, argv, i);
        } else if (std::strcmp(arg, "--ext") == 0) {
            parsed.extension = require_value(argc, argv, i);
        } else if (std::strcmp(arg, "--max-base") == 0) {
            parsed.max_base_len = parse_max_base(require_value(argc, argv, i));
        } else if (std::strcmp(arg, "--no-spaces") == 0) {
            parsed.no_spaces = true;
        } else if (std::strcmp(arg, "--json") == 0) {
            parsed.json_output = true;
        } else if (std::strcmp(arg, "--verbose") == 0 || std::strcmp(arg, "-v") == 0) {
            parsed.verbose = true;
        } else if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
            parsed.show_help = true;
        } else {
            throw UsageError(std::string("Unknown option ") + arg);
        }
    }
    return parsed;
}

Settings load_settings(const ParsedArguments& args)
{
    Settings settings = args.config_path ? Settings(*args.config_path) : Settings();
    const bool loaded = settings.load();
    if (!loaded && args.config_path) {
        THROW_APP_ERROR(ErrorCodes::Code::CONFIG_LOAD_FAILED, *args.config_path);
    }

    if (args.max_base_len) {
        settings.set_max_base_length(*args.max_base_len);
    }
    if (args.no_spaces) {
        settings.set_use_spaces(false);
    }
    if (args.extension) {
        settings.set_default_extension(*args.extension);
    }
    if (args.verbose) {
        settings.set_log_level("debug");
    }
    return settings;
}

bool initialize_loggers(const LoggerOptions& options)
{
    try {
        Logger::setup_loggers(options);
        return true;
    } catch (const std::exception& e) {
        std::fprintf(stderr, "Failed to initialize loggers: %s\n", e.what());
        return false;
    }
}

std::vector<std::string> read_titles(std::istream& input)
{
    std::vector<std::string> titles;
    std::string line;
    while (std::getline(input, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        titles.push_back(std::move(line));
    }
    return titles;
}

void write_plain(const std::vector<IssuedFile>& files)
{
    for (const auto& file : files) {
        std::cout << file.title << '\t' << file.filename << '\n';
    }
}

void write_json(const std::vector<IssuedFile>& files, const Settings& settings)
{
    Json::Value root;
    root["options"]["max_base_length"] = settings.get_max_base_length();
    root["options"]["use_spaces"] = settings.get_use_spaces();
    root["options"]["extension"] = settings.get_default_extension();

    Json::Value entries(Json::arrayValue);
    for (const auto& file : files) {
        Json::Value entry;
        entry["title"] = file.title;
        entry["filename"] = file.filename;
        entries.append(entry);
    }
    root["files"] = entries;

    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    builder["emitUTF8"] = true;
    std::cout << Json::writeString(builder, root) << '\n';
}

int run_application(const ParsedArguments& args)
{
    const Settings settings = load_settings(args);
    if (!initialize_loggers(settings.logger_options())) {
        return EXIT_FAILURE;
    }
    auto logger = Logger::get_logger("cli_logger");

    const std::vector<std::string> titles = args.titles.empty() ? read_titles(std::cin) : args.titles;
    FilenameManager manager(settings.naming_options());

    std::vector<IssuedFile> issued;
    issued.reserve(titles.size());
    for (const auto& title : titles) {
        issued.push_back({title, manager.get_sanitized_filename(title, settings.get_default_extension())});
    }

    if (args.json_output) {
        write_json(issued, settings);
    } else {
        write_plain(issued);
    }

    if (logger) {
        logger->info("Issued {} filename(s) for {} title(s)", manager.issued_count(), titles.size());
    }
    return EXIT_SUCCESS;
}

} // namespace

int main(int argc, char **argv) {
    ParsedArguments args;
    try {
        args = parse_command_line(argc, argv);
    } catch (const UsageError& ex) {
        std::fprintf(stderr, "%s\n\n", ex.what());
        print_usage(stderr);
        return kExitUsage;
    }
    if (args.show_help) {
        print_usage(stdout);
        return EXIT_SUCCESS;
    }

    try {
        return run_application(args);
    } catch (const ErrorCodes::AppException& ex) {
        if (auto logger = Logger::get_logger("cli_logger")) {
            logger->critical("{}", ex.get_full_details());
        } else {
            std::fprintf(stderr, "%s\n", ex.get_full_details().c_str());
        }
        return EXIT_FAILURE;
    } catch (const std::exception& ex) {
        if (auto logger = Logger::get_logger("cli_logger")) {
            logger->critical("Error: {}", ex.what());
        } else {
            std::fprintf(stderr, "Error: %s\n", ex.what());
        }
        return EXIT_FAILURE;
    }
}
