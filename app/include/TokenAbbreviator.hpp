#ifndef TOKEN_ABBREVIATOR_HPP
#define TOKEN_ABBREVIATOR_HPP

#include "Types.hpp"

#include <string>

namespace TokenAbbreviator {

/**
 * @brief Shortens a single token to at most @p max_len characters.
 *
 * Tokens that already fit and pure numbers come back unchanged. Otherwise
 * the first applicable rule wins: uppercase initials of a camel-case word,
 * initials of underscore/hyphen separated parts, then the word with its
 * inner vowels removed.
 *
 * @throws ErrorCodes::AppException (VALIDATION_VALUE_OUT_OF_RANGE) when max_len < 0.
 */
std::string abbreviate(const std::string& token, int max_len = kDefaultAbbreviationLength);

} // namespace TokenAbbreviator

#endif
