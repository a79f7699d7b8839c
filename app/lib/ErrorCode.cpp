#include "ErrorCode.hpp"

#include <fmt/format.h>

#include <utility>

namespace ErrorCodes {

ErrorInfo::ErrorInfo(Code code,
                     std::string message,
                     std::string resolution,
                     std::string technical_details)
    : code(code),
      message(std::move(message)),
      resolution(std::move(resolution)),
      technical_details(std::move(technical_details))
{
}

std::string ErrorInfo::get_user_message() const
{
    if (resolution.empty()) {
        return message;
    }
    return fmt::format("{}\n{}", message, resolution);
}

std::string ErrorInfo::get_full_details() const
{
    std::string details = fmt::format("Error {} ({}): {}",
                                      static_cast<int>(code),
                                      ErrorCatalog::code_name(code),
                                      message);
    if (!resolution.empty()) {
        details += fmt::format("\nResolution: {}", resolution);
    }
    if (!technical_details.empty()) {
        details += fmt::format("\nDetails: {}", technical_details);
    }
    return details;
}

ErrorInfo ErrorCatalog::get_error_info(Code code, const std::string& context)
{
    switch (code) {
        case Code::SUCCESS:
            return ErrorInfo(code, "Operation completed successfully.", "", context);
        case Code::CONFIG_LOAD_FAILED:
            return ErrorInfo(code,
                             "The configuration file could not be read.",
                             "Check that the file exists and is readable, or omit --config to use defaults.",
                             context);
        case Code::CONFIG_SAVE_FAILED:
            return ErrorInfo(code,
                             "The configuration file could not be written.",
                             "Check that the configuration directory is writable.",
                             context);
        case Code::CONFIG_INVALID_VALUE:
            return ErrorInfo(code,
                             "A configuration value is invalid.",
                             "Correct the value in the configuration file or remove it to restore the default.",
                             context);
        case Code::VALIDATION_INVALID_FORMAT:
            return ErrorInfo(code,
                             "An argument has an invalid format.",
                             "Extensions must be empty or start with a dot, for example \".md\".",
                             context);
        case Code::VALIDATION_VALUE_OUT_OF_RANGE:
            return ErrorInfo(code,
                             "A length limit is out of range.",
                             "Length limits must be zero or greater.",
                             context);
        case Code::NAMING_DIGEST_FAILED:
            return ErrorInfo(code,
                             "The content digest for a fallback filename could not be computed.",
                             "Verify that the OpenSSL runtime is installed correctly.",
                             context);
        case Code::UNKNOWN_ERROR:
            break;
    }
    return ErrorInfo(Code::UNKNOWN_ERROR, "An unknown error occurred.", "", context);
}

const char* ErrorCatalog::code_name(Code code)
{
    switch (code) {
        case Code::SUCCESS: return "SUCCESS";
        case Code::CONFIG_LOAD_FAILED: return "CONFIG_LOAD_FAILED";
        case Code::CONFIG_SAVE_FAILED: return "CONFIG_SAVE_FAILED";
        case Code::CONFIG_INVALID_VALUE: return "CONFIG_INVALID_VALUE";
        case Code::VALIDATION_INVALID_FORMAT: return "VALIDATION_INVALID_FORMAT";
        case Code::VALIDATION_VALUE_OUT_OF_RANGE: return "VALIDATION_VALUE_OUT_OF_RANGE";
        case Code::NAMING_DIGEST_FAILED: return "NAMING_DIGEST_FAILED";
        case Code::UNKNOWN_ERROR: return "UNKNOWN_ERROR";
    }
    return "UNKNOWN_ERROR";
}

} // namespace ErrorCodes
