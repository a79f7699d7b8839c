#ifndef TITLE_TOKENIZER_HPP
#define TITLE_TOKENIZER_HPP

#include "Types.hpp"

#include <string>
#include <vector>

namespace TitleTokenizer {

/**
 * @brief Splits a title into word tokens, left to right.
 *
 * A token is a maximal run of ASCII letters, digits and apostrophes. Every
 * other byte separates tokens and is dropped. An empty result means the
 * caller should fall back to the literal base name "unnamed".
 */
std::vector<std::string> tokenize(const std::string& title);

TokenClass classify(const std::string& token);

// False for stopwords and web/document boilerplate.
bool is_informative(const std::string& token);

} // namespace TitleTokenizer

#endif
