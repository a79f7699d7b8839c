#ifndef ERRORCODE_HPP
#define ERRORCODE_HPP

#include <string>

namespace ErrorCodes {

// Codes are grouped by range so the number alone tells the subsystem.
enum class Code {
    SUCCESS = 0,

    // Configuration (1500-1599)
    CONFIG_SAVE_FAILED = 1503,
    CONFIG_LOAD_FAILED = 1504,
    CONFIG_INVALID_VALUE = 1505,

    // Validation (1600-1699)
    VALIDATION_INVALID_FORMAT = 1601,
    VALIDATION_VALUE_OUT_OF_RANGE = 1605,

    // Naming (2000-2099)
    NAMING_DIGEST_FAILED = 2001,

    UNKNOWN_ERROR = 9999
};

struct ErrorInfo {
    Code code;
    std::string message;
    std::string resolution;
    std::string technical_details;

    ErrorInfo(Code code,
              std::string message,
              std::string resolution,
              std::string technical_details = "");

    // Message followed by the resolution hint
    std::string get_user_message() const;

    // Everything, including the numeric code and technical details
    std::string get_full_details() const;
};

class ErrorCatalog {
public:
    static ErrorInfo get_error_info(Code code, const std::string& context = "");
    static const char* code_name(Code code);
};

} // namespace ErrorCodes

#endif // ERRORCODE_HPP
