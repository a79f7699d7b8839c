#include "UniqueNameResolver.hpp"
#include "AppException.hpp"
#include "ComponentSanitizer.hpp"
#include "Logger.hpp"
#include "NameShortener.hpp"
#include "TitleTokenizer.hpp"
#include "Utils.hpp"

#include <fmt/format.h>

#include <limits>
#include <utility>

namespace {

constexpr std::size_t kComponentLimit = static_cast<std::size_t>(kMaxComponentLength);
constexpr int kMaxHashAttempts = 16;
// Widest counter appended after the hash: the digits of a std::size_t.
constexpr std::size_t kMaxCounterDigits = std::numeric_limits<std::size_t>::digits10 + 1;
// Longest suffix any phase appends: "-x", the hash digits, '-' and a counter.
constexpr std::size_t kLongestSuffix = 2 + kHashSuffixDigits + 1 + kMaxCounterDigits;

struct SplitName {
    std::string name_part;
    std::string ext_part;
};

SplitName split_at_last_dot(const std::string& filename)
{
    const auto dot = filename.rfind('.');
    if (dot == std::string::npos || filename.size() - dot + kLongestSuffix > kComponentLimit) {
        return {filename, ""};
    }
    return {filename.substr(0, dot), filename.substr(dot)};
}

std::string with_suffix(const SplitName& split, const std::string& suffix)
{
    const std::size_t budget = kComponentLimit - split.ext_part.size();
    if (split.name_part.size() + suffix.size() <= budget) {
        return split.name_part + suffix + split.ext_part;
    }
    std::string truncated = Utils::utf8_truncate(split.name_part, budget - suffix.size());
    Utils::strip_trailing(truncated, "-_ .");
    return truncated + suffix + split.ext_part;
}

bool is_taken(const IssuedNameSet& issued, const std::string& candidate)
{
    return issued.contains(Utils::to_lower_copy(candidate));
}

std::string hash_fallback(const std::string& title,
                          const SplitName& split,
                          const IssuedNameSet& issued)
{
    const std::string hashed = "-x" + Utils::sha256_hex(title).substr(0, kHashSuffixDigits);
    std::string candidate = with_suffix(split, hashed);
    for (int attempt = 1; attempt < kMaxHashAttempts && is_taken(issued, candidate); ++attempt) {
        const std::string digest = Utils::sha256_hex(fmt::format("{}#{}", title, attempt));
        candidate = with_suffix(split, "-x" + digest.substr(0, kHashSuffixDigits));
    }
    // Every counter yields a distinct name and the issued set is finite.
    for (std::size_t counter = 2; is_taken(issued, candidate); ++counter) {
        candidate = with_suffix(split, fmt::format("{}-{}", hashed, counter));
    }

    if (auto logger = Logger::get_logger("core_logger")) {
        logger->warn("Version suffixes exhausted for '{}'; using hashed name '{}'",
                     split.name_part + split.ext_part, candidate);
    }
    return candidate;
}

}

namespace UniqueNameResolver {

std::string initial_candidate(const std::string& title,
                              const std::string& extension,
                              int max_base_len,
                              bool use_spaces)
{
    if (max_base_len < 0) {
        THROW_APP_ERROR(ErrorCodes::Code::VALIDATION_VALUE_OUT_OF_RANGE,
                        fmt::format("max_base_len={}", max_base_len));
    }
    if (!extension.empty() && extension.front() != '.') {
        THROW_APP_ERROR(ErrorCodes::Code::VALIDATION_INVALID_FORMAT,
                        fmt::format("extension='{}'", extension));
    }

    auto tokens = TitleTokenizer::tokenize(title);
    std::string base = tokens.empty()
        ? std::string(kFallbackName)
        : NameShortener::shorten(std::move(tokens), max_base_len, word_separator(use_spaces));
    base = ComponentSanitizer::sanitize_component(base, max_base_len, use_spaces);
    return ComponentSanitizer::sanitize_component(base + extension, kMaxComponentLength, use_spaces);
}

std::string resolve_unique(const std::string& title,
                           const std::string& extension,
                           const IssuedNameSet& issued,
                           int max_base_len,
                           bool use_spaces)
{
    const std::string filename = initial_candidate(title, extension, max_base_len, use_spaces);
    if (!is_taken(issued, filename)) {
        return filename;
    }

    const SplitName split = split_at_last_dot(filename);
    for (int counter = 2; counter <= kMaxVersionAttempts; ++counter) {
        std::string candidate = with_suffix(split, fmt::format("-v{}", counter));
        if (!is_taken(issued, candidate)) {
            if (auto logger = Logger::get_logger("core_logger")) {
                logger->debug("'{}' already issued; using '{}'", filename, candidate);
            }
            return candidate;
        }
    }
    return hash_fallback(title, split, issued);
}

} // namespace UniqueNameResolver
