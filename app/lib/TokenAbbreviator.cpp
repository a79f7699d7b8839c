#include "TokenAbbreviator.hpp"
#include "AppException.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <iterator>
#include <optional>
#include <string_view>

namespace {

bool is_ascii_upper(char ch)
{
    return ch >= 'A' && ch <= 'Z';
}

bool is_vowel(char ch)
{
    return std::string_view("aeiouAEIOU").find(ch) != std::string_view::npos;
}

bool is_part_separator(char ch)
{
    return ch == '_' || ch == '-';
}

bool is_all_digits(const std::string& token)
{
    return !token.empty() && std::all_of(token.begin(), token.end(), [](char ch) {
        return ch >= '0' && ch <= '9';
    });
}

bool acceptable_length(const std::string& candidate, std::size_t max_len)
{
    return candidate.size() >= 2 && candidate.size() <= max_len;
}

std::optional<std::string> camel_case_initials(const std::string& token, std::size_t max_len)
{
    std::string caps;
    std::copy_if(token.begin(), token.end(), std::back_inserter(caps), is_ascii_upper);
    if (!acceptable_length(caps, max_len)) {
        return std::nullopt;
    }
    return caps;
}

std::optional<std::string> part_initials(const std::string& token, std::size_t max_len)
{
    if (std::none_of(token.begin(), token.end(), is_part_separator)) {
        return std::nullopt;
    }
    std::string initials;
    bool at_part_start = true;
    for (char ch : token) {
        if (is_part_separator(ch)) {
            at_part_start = true;
        } else if (at_part_start) {
            initials.push_back(ch);
            at_part_start = false;
        }
    }
    if (!acceptable_length(initials, max_len)) {
        return std::nullopt;
    }
    return initials;
}

std::string drop_inner_vowels(const std::string& token, std::size_t max_len)
{
    std::string candidate(1, token.front());
    if (token.size() > 2) {
        std::copy_if(token.begin() + 1, token.end() - 1, std::back_inserter(candidate),
                     [](char ch) { return !is_vowel(ch); });
    }
    candidate.push_back(token.back());
    if (candidate.size() > max_len) {
        candidate.resize(max_len);
    }
    if (candidate.size() < 3 && token.size() >= 3) {
        return token.substr(0, max_len);
    }
    return candidate;
}

}

namespace TokenAbbreviator {

std::string abbreviate(const std::string& token, int max_len)
{
    if (max_len < 0) {
        THROW_APP_ERROR(ErrorCodes::Code::VALIDATION_VALUE_OUT_OF_RANGE,
                        fmt::format("abbreviation max_len={}", max_len));
    }
    const auto limit = static_cast<std::size_t>(max_len);

    if (is_all_digits(token) || token.size() <= limit) {
        return token;
    }
    if (auto caps = camel_case_initials(token, limit)) {
        return *caps;
    }
    if (auto initials = part_initials(token, limit)) {
        return *initials;
    }
    return drop_inner_vowels(token, limit);
}

} // namespace TokenAbbreviator
