#ifndef TYPES_HPP
#define TYPES_HPP

#include <cstddef>
#include <string>
#include <unordered_set>

// Filesystem ceilings and naming defaults shared by every naming stage.
constexpr int kMaxComponentLength = 255;
constexpr int kMaxTotalPathLength = 260;
constexpr int kDefaultMaxBaseLength = 150;
constexpr int kDefaultAbbreviationLength = 10;
constexpr int kMaxVersionAttempts = 50;
constexpr std::size_t kHashSuffixDigits = 6;
constexpr char kPlaceholderChar = '_';
constexpr const char* kFallbackName = "unnamed";

enum class TokenClass {Informative, Stopword, Noise};

inline std::string to_string(TokenClass value) {
    switch (value) {
        case TokenClass::Informative: return "Informative";
        case TokenClass::Stopword: return "Stopword";
        case TokenClass::Noise: return "Noise";
        default: return "Unknown";
    }
}

/**
 * @brief Per-session naming options.
 */
struct NamingOptions {
    int max_base_len{kDefaultMaxBaseLength};
    bool use_spaces{true};
};

inline std::string word_separator(bool use_spaces) {
    return use_spaces ? " " : "-";
}

// Case-folded filenames already handed out in one session.
using IssuedNameSet = std::unordered_set<std::string>;

#endif
