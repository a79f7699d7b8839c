#include "TitleTokenizer.hpp"
#include "Utils.hpp"

#include <unordered_set>
#include <utility>

namespace {

const std::unordered_set<std::string> kStopwords = {
    "a", "about", "above", "after", "again", "an", "and", "are", "as", "at",
    "be", "been", "before", "being", "below", "but", "by", "can", "did", "do",
    "does", "doing", "during", "else", "for", "from", "further", "had", "has",
    "have", "having", "if", "in", "into", "is", "it", "it's", "its", "just",
    "no", "not", "of", "on", "or", "our", "ours", "over", "than", "that", "the",
    "then", "these", "this", "those", "through", "to", "too", "under", "very",
    "was", "we", "were", "when", "while", "will", "with", "you", "your", "yours"
};

const std::unordered_set<std::string> kNoiseTokens = {
    "default", "home", "htm", "html", "http", "https", "index", "page", "www"
};

bool is_token_char(unsigned char ch)
{
    return (ch >= 'A' && ch <= 'Z')
        || (ch >= 'a' && ch <= 'z')
        || (ch >= '0' && ch <= '9')
        || ch == '\'';
}

}

namespace TitleTokenizer {

std::vector<std::string> tokenize(const std::string& title)
{
    std::vector<std::string> tokens;
    std::string current;
    for (unsigned char ch : title) {
        if (is_token_char(ch)) {
            current.push_back(static_cast<char>(ch));
        } else if (!current.empty()) {
            tokens.emplace_back(std::move(current));
            current.clear();
        }
    }
    if (!current.empty()) {
        tokens.emplace_back(std::move(current));
    }
    return tokens;
}

TokenClass classify(const std::string& token)
{
    const std::string folded = Utils::to_lower_copy(token);
    if (kStopwords.contains(folded)) {
        return TokenClass::Stopword;
    }
    if (kNoiseTokens.contains(folded)) {
        return TokenClass::Noise;
    }
    return TokenClass::Informative;
}

bool is_informative(const std::string& token)
{
    return classify(token) == TokenClass::Informative;
}

} // namespace TitleTokenizer
