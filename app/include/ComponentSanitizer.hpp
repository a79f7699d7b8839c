#ifndef COMPONENT_SANITIZER_HPP
#define COMPONENT_SANITIZER_HPP

#include "Types.hpp"

#include <string>

namespace ComponentSanitizer {

/**
 * @brief Turns arbitrary text into a single filesystem-legal path component.
 *
 * Forbidden characters (< > : " / \ | ? * [ ] ^ # % and 0x00-0x1F) become the
 * placeholder, placeholder runs collapse, trailing spaces and dots go, and a
 * reserved device stem (CON, PRN, AUX, NUL, COM1-9, LPT1-9) gets a leading
 * separator: a space when @p allow_spaces (" con.md"), otherwise the
 * placeholder ("_con.md"). Callers that trim names must not strip that
 * leading space, or the device name comes back.
 *
 * Overlong names lose characters from the stem so the text after
 * the last dot survives. With @p allow_spaces the placeholder reads as a
 * single space. Empty results become "unnamed".
 *
 * The operation is idempotent for a fixed max_length and allow_spaces.
 *
 * @throws ErrorCodes::AppException (VALIDATION_VALUE_OUT_OF_RANGE) when max_length < 0.
 */
std::string sanitize_component(const std::string& text,
                               int max_length = kMaxComponentLength,
                               bool allow_spaces = true);

bool is_forbidden_char(unsigned char ch);

// Case-insensitive match of the text before the first dot against the device names.
bool is_reserved_name(const std::string& name);

// Advisory check against the 260 character total path ceiling.
bool fits_total_path(const std::string& directory, const std::string& filename);

} // namespace ComponentSanitizer

#endif
