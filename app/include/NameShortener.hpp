#ifndef NAME_SHORTENER_HPP
#define NAME_SHORTENER_HPP

#include <string>
#include <vector>

namespace NameShortener {

/**
 * @brief Joins @p tokens with @p separator, shortening only when the join
 *        is longer than @p max_length.
 *
 * Lossy steps run in a fixed order, and the fit is re-tested after every
 * single edit:
 *  1. drop stopword/boilerplate tokens, right to left;
 *  2. abbreviate tokens longer than 10 characters, right to left;
 *  3. drop tokens from the right while more than one remains;
 *  4. cut the join to max_length and strip trailing separators.
 *
 * At least one token always survives the drops. The result is at most
 * max_length bytes.
 *
 * @throws ErrorCodes::AppException (VALIDATION_VALUE_OUT_OF_RANGE) when max_length < 0.
 */
std::string shorten(std::vector<std::string> tokens, int max_length, const std::string& separator);

} // namespace NameShortener

#endif
