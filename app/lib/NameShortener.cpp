#include "NameShortener.hpp"
#include "AppException.hpp"
#include "Logger.hpp"
#include "TitleTokenizer.hpp"
#include "TokenAbbreviator.hpp"
#include "Types.hpp"
#include "Utils.hpp"

#include <fmt/format.h>

#include <utility>

namespace {

using Tokens = std::vector<std::string>;

constexpr std::size_t kLongTokenLength = static_cast<std::size_t>(kDefaultAbbreviationLength);

std::size_t joined_length(const Tokens& tokens, const std::string& separator)
{
    if (tokens.empty()) {
        return 0;
    }
    std::size_t length = separator.size() * (tokens.size() - 1);
    for (const auto& token : tokens) {
        length += token.size();
    }
    return length;
}

void log_step(const char* step, const Tokens& tokens, const std::string& separator)
{
    if (auto logger = Logger::get_logger("core_logger")) {
        logger->debug("Shortener {} -> '{}'", step, Utils::join(tokens, separator));
    }
}

bool drop_uninformative(Tokens& tokens, const std::string& separator, std::size_t limit)
{
    for (std::size_t i = tokens.size(); i-- > 0;) {
        if (tokens.size() == 1) {
            break;
        }
        if (TitleTokenizer::is_informative(tokens[i])) {
            continue;
        }
        tokens.erase(tokens.begin() + static_cast<Tokens::difference_type>(i));
        log_step("dropped uninformative token", tokens, separator);
        if (joined_length(tokens, separator) <= limit) {
            return true;
        }
    }
    return false;
}

bool abbreviate_long_tokens(Tokens& tokens, const std::string& separator, std::size_t limit)
{
    for (std::size_t i = tokens.size(); i-- > 0;) {
        if (tokens[i].size() <= kLongTokenLength) {
            continue;
        }
        std::string abbreviated = TokenAbbreviator::abbreviate(tokens[i]);
        if (abbreviated.size() >= tokens[i].size()) {
            continue;
        }
        tokens[i] = std::move(abbreviated);
        log_step("abbreviated token", tokens, separator);
        if (joined_length(tokens, separator) <= limit) {
            return true;
        }
    }
    return false;
}

bool drop_trailing_tokens(Tokens& tokens, const std::string& separator, std::size_t limit)
{
    while (tokens.size() > 1) {
        tokens.pop_back();
        log_step("dropped trailing token", tokens, separator);
        if (joined_length(tokens, separator) <= limit) {
            return true;
        }
    }
    return false;
}

std::string hard_truncate(const Tokens& tokens, const std::string& separator, std::size_t limit)
{
    std::string joined = Utils::join(tokens, separator);
    if (joined.size() <= limit) {
        return joined;
    }
    joined = Utils::utf8_truncate(joined, limit);
    Utils::strip_trailing(joined, " -_." + separator);
    if (auto logger = Logger::get_logger("core_logger")) {
        logger->debug("Shortener truncated to '{}'", joined);
    }
    return joined;
}

}

namespace NameShortener {

std::string shorten(std::vector<std::string> tokens, int max_length, const std::string& separator)
{
    if (max_length < 0) {
        THROW_APP_ERROR(ErrorCodes::Code::VALIDATION_VALUE_OUT_OF_RANGE,
                        fmt::format("shorten max_length={}", max_length));
    }
    const auto limit = static_cast<std::size_t>(max_length);

    if (joined_length(tokens, separator) <= limit) {
        return Utils::join(tokens, separator);
    }

    if (drop_uninformative(tokens, separator, limit)
        || abbreviate_long_tokens(tokens, separator, limit)
        || drop_trailing_tokens(tokens, separator, limit)) {
        return Utils::join(tokens, separator);
    }
    return hard_truncate(tokens, separator, limit);
}

} // namespace NameShortener
