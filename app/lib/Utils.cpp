#include "Utils.hpp"
#include "AppException.hpp"

#include <openssl/evp.h>
#include <fmt/format.h>

#include <algorithm>
#include <cctype>

namespace Utils {

std::string to_lower_copy(std::string value)
{
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return value;
}

std::string to_upper_copy(std::string value)
{
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
        return static_cast<char>(std::toupper(ch));
    });
    return value;
}

std::string trim_copy(const std::string& value)
{
    const char* whitespace = " \t\n\r\f\v";
    const auto start = value.find_first_not_of(whitespace);
    if (start == std::string::npos) {
        return std::string();
    }
    const auto end = value.find_last_not_of(whitespace);
    return value.substr(start, end - start + 1);
}

void strip_trailing(std::string& value, std::string_view chars)
{
    while (!value.empty() && chars.find(value.back()) != std::string_view::npos) {
        value.pop_back();
    }
}

void collapse_runs(std::string& value, char ch)
{
    auto last = std::unique(value.begin(), value.end(), [ch](char left, char right) {
        return left == ch && right == ch;
    });
    value.erase(last, value.end());
}

std::string join(const std::vector<std::string>& parts, const std::string& separator)
{
    std::string joined;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            joined += separator;
        }
        joined += parts[i];
    }
    return joined;
}

std::string utf8_truncate(const std::string& value, std::size_t max_bytes)
{
    if (value.size() <= max_bytes) {
        return value;
    }
    std::size_t cut = max_bytes;
    // Back off while the first dropped byte is a continuation byte (10xxxxxx).
    while (cut > 0 && (static_cast<unsigned char>(value[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return value.substr(0, cut);
}

std::string sha256_hex(const std::string& data)
{
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_length = 0;
    if (EVP_Digest(data.data(), data.size(), digest, &digest_length, EVP_sha256(), nullptr) != 1) {
        THROW_APP_ERROR(ErrorCodes::Code::NAMING_DIGEST_FAILED, "EVP_Digest(sha256)");
    }

    std::string hex;
    hex.reserve(static_cast<std::size_t>(digest_length) * 2);
    for (unsigned int i = 0; i < digest_length; ++i) {
        hex += fmt::format("{:02x}", digest[i]);
    }
    return hex;
}

std::optional<bool> parse_bool(const std::string& value)
{
    const std::string lowered = to_lower_copy(trim_copy(value));
    if (lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on") {
        return true;
    }
    if (lowered == "0" || lowered == "false" || lowered == "no" || lowered == "off") {
        return false;
    }
    return std::nullopt;
}

} // namespace Utils
