#include "ComponentSanitizer.hpp"
#include "AppException.hpp"
#include "Utils.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <string_view>
#include <unordered_set>

namespace {

constexpr std::string_view kForbiddenChars = "<>:\"/\\|?*[]^#%";
constexpr std::string_view kTrailingIllegal = " .";

const std::unordered_set<std::string>& reserved_names()
{
    static const std::unordered_set<std::string> names = [] {
        std::unordered_set<std::string> result = {"CON", "PRN", "AUX", "NUL"};
        for (int i = 1; i <= 9; ++i) {
            result.insert("COM" + std::to_string(i));
            result.insert("LPT" + std::to_string(i));
        }
        return result;
    }();
    return names;
}

std::string fallback_name(std::size_t limit)
{
    const std::string fallback = kFallbackName;
    // A zero budget admits no name at all; keep the full fallback then.
    if (limit == 0) {
        return fallback;
    }
    return fallback.substr(0, limit);
}

std::string trim_leading_spaces(const std::string& value)
{
    const auto start = value.find_first_not_of(' ');
    return start == std::string::npos ? std::string() : value.substr(start);
}

// Cuts the stem so stem + suffix fits, then repairs what the cut may expose:
// trailing spaces/dots, a guard space that no longer guards anything, or a
// stem that became a device name.
std::string enforce_length(const std::string& name, std::size_t limit, bool allow_spaces)
{
    std::string stem = name;
    std::string suffix;
    if (const auto dot = name.rfind('.'); dot != std::string::npos && name.size() - dot < limit) {
        stem = name.substr(0, dot);
        suffix = name.substr(dot);
    }
    stem = Utils::utf8_truncate(stem, limit - suffix.size());

    for (;;) {
        if (suffix.empty()) {
            Utils::strip_trailing(stem, kTrailingIllegal);
        }
        if (allow_spaces && !stem.empty() && stem.front() == ' ') {
            std::string trimmed = trim_leading_spaces(stem);
            if (!ComponentSanitizer::is_reserved_name(trimmed + suffix)) {
                stem = std::move(trimmed);
                continue;
            }
        }
        if (!stem.empty() && ComponentSanitizer::is_reserved_name(stem + suffix)) {
            stem.pop_back();
            continue;
        }
        break;
    }
    return stem + suffix;
}

}

namespace ComponentSanitizer {

bool is_forbidden_char(unsigned char ch)
{
    return ch < 0x20 || kForbiddenChars.find(static_cast<char>(ch)) != std::string_view::npos;
}

bool is_reserved_name(const std::string& name)
{
    const std::string stem = name.substr(0, name.find('.'));
    return reserved_names().contains(Utils::to_upper_copy(stem));
}

bool fits_total_path(const std::string& directory, const std::string& filename)
{
    std::size_t total = directory.size() + filename.size();
    if (!directory.empty() && directory.back() != '/' && directory.back() != '\\') {
        ++total;
    }
    return total <= static_cast<std::size_t>(kMaxTotalPathLength);
}

std::string sanitize_component(const std::string& text, int max_length, bool allow_spaces)
{
    if (max_length < 0) {
        THROW_APP_ERROR(ErrorCodes::Code::VALIDATION_VALUE_OUT_OF_RANGE,
                        fmt::format("sanitize_component max_length={}", max_length));
    }
    const auto limit = static_cast<std::size_t>(max_length);
    if (text.empty()) {
        return fallback_name(limit);
    }

    const char separator = allow_spaces ? ' ' : kPlaceholderChar;
    std::string name = text;
    std::replace_if(name.begin(), name.end(),
                    [](char ch) { return is_forbidden_char(static_cast<unsigned char>(ch)); },
                    kPlaceholderChar);
    std::replace(name.begin(), name.end(), ':', kPlaceholderChar);
    Utils::strip_trailing(name, kTrailingIllegal);
    Utils::collapse_runs(name, kPlaceholderChar);

    if (allow_spaces) {
        std::replace(name.begin(), name.end(), kPlaceholderChar, ' ');
        Utils::collapse_runs(name, ' ');
        name = Utils::trim_copy(name);
        Utils::strip_trailing(name, kTrailingIllegal);
    }

    // Runs before trimming: "CON.md" is as reserved as "CON".
    if (is_reserved_name(name)) {
        name.insert(name.begin(), separator);
    }

    if (name.size() > limit) {
        name = enforce_length(name, limit, allow_spaces);
    }

    return name.empty() ? fallback_name(limit) : name;
}

} // namespace ComponentSanitizer
