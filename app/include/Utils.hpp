#ifndef UTILS_HPP
#define UTILS_HPP

#include <string>
#include <optional>
#include <string_view>
#include <vector>

namespace Utils {

std::string to_lower_copy(std::string value);
std::string to_upper_copy(std::string value);
std::string trim_copy(const std::string& value);

/**
 * @brief Removes every trailing character contained in @p chars.
 */
void strip_trailing(std::string& value, std::string_view chars);

/**
 * @brief Collapses consecutive occurrences of @p ch into a single one.
 */
void collapse_runs(std::string& value, char ch);

std::string join(const std::vector<std::string>& parts, const std::string& separator);

/**
 * @brief Cuts @p value to at most @p max_bytes without splitting a UTF-8 sequence.
 * @param value UTF-8 (or plain ASCII) text.
 * @param max_bytes Upper bound for the result size in bytes.
 * @return The longest prefix that fits and ends on a code point boundary.
 */
std::string utf8_truncate(const std::string& value, std::size_t max_bytes);

/**
 * @brief Lowercase hex SHA-256 digest of @p data.
 * @throws ErrorCodes::AppException (NAMING_DIGEST_FAILED) if OpenSSL fails.
 */
std::string sha256_hex(const std::string& data);

std::optional<bool> parse_bool(const std::string& value);

} // namespace Utils

#endif
