#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>
#include "AppException.hpp"
#include "ComponentSanitizer.hpp"
#include "Utils.hpp"
#include "TestHelpers.hpp"

#include <string>
#include <vector>

using ComponentSanitizer::sanitize_component;

TEST_CASE("forbidden characters are replaced") {
    const std::string spaced = sanitize_component("a/b:c*d");
    CHECK(spaced == "a b c d");
    CHECK(has_no_forbidden_chars(spaced));

    const std::string compact = sanitize_component("a/b:c*d", kMaxComponentLength, false);
    CHECK(compact == "a_b_c_d");
    CHECK(has_no_forbidden_chars(compact));
}

TEST_CASE("control characters and bracket punctuation are replaced") {
    const std::string result = sanitize_component("a\tb\nc[1]^2#3%4", kMaxComponentLength, false);
    CHECK(has_no_forbidden_chars(result));
    CHECK(result == "a_b_c_1_2_3_4");
}

TEST_CASE("placeholder runs collapse to one") {
    CHECK(sanitize_component("a???b", kMaxComponentLength, false) == "a_b");
    CHECK(sanitize_component("a???b") == "a b");
    CHECK(sanitize_component("x_  _y") == "x y");
}

TEST_CASE("empty input becomes unnamed") {
    CHECK(sanitize_component("") == "unnamed");
    CHECK(sanitize_component(" . . ") == "unnamed");
    CHECK(sanitize_component("", 3) == "unn");
}

TEST_CASE("trailing spaces and dots are removed") {
    CHECK(sanitize_component("report. . .") == "report");
    CHECK(sanitize_component("a._") == "a");
}

TEST_CASE("reserved device names get a leading separator") {
    CHECK(sanitize_component("con") == " con");
    CHECK(sanitize_component("con", kMaxComponentLength, false) == "_con");
    CHECK(sanitize_component("CON.md") == " CON.md");
    CHECK(sanitize_component("Com1.txt", kMaxComponentLength, false) == "_Com1.txt");
    CHECK(sanitize_component("console.md") == "console.md");
    CHECK_FALSE(ComponentSanitizer::is_reserved_name(sanitize_component("lpt9.tar.gz")));
}

TEST_CASE("the leading guard space is what keeps a device name legal") {
    const std::string guarded = sanitize_component("con.md");
    REQUIRE(guarded == " con.md");
    CHECK_FALSE(ComponentSanitizer::is_reserved_name(guarded));
    CHECK(ComponentSanitizer::is_reserved_name(Utils::trim_copy(guarded)));
    CHECK(sanitize_component(guarded) == guarded);
}

TEST_CASE("length limit keeps the extension") {
    CHECK(sanitize_component("abcdefghij.md", 8) == "abcde.md");
    CHECK(sanitize_component("abcdefghij", 4) == "abcd");
}

TEST_CASE("truncation never exposes a device name or trailing space") {
    CHECK(sanitize_component("CONSOLE", 3) == "CO");
    CHECK(sanitize_component("abc defg", 4) == "abc");
}

TEST_CASE("truncation does not split UTF-8 sequences") {
    CHECK(sanitize_component("h\xC3\xA9llo", 2) == "h");
    CHECK(sanitize_component("h\xC3\xA9llo", 3) == "h\xC3\xA9");
}

TEST_CASE("sanitize_component is idempotent") {
    const std::vector<std::string> inputs = {
        "", "a/b:c*d", "report. . .", "con", "CON.md", " con", "a._", "x_ y",
        "CONSOLE", "abc defg", "lpt1 .", "..md", "Meeting notes: Q3 / Q4?",
        "aux.tar.gz", "  spaced   out  ", "h\xC3\xA9llo w\xC3\xB6rld", "trailing_"
    };
    const int limit = GENERATE(0, 3, 4, 6, 8, 12, kMaxComponentLength);
    const bool allow_spaces = GENERATE(true, false);

    for (const auto& input : inputs) {
        INFO("input='" << input << "' limit=" << limit << " spaces=" << allow_spaces);
        const std::string once = sanitize_component(input, limit, allow_spaces);
        CHECK(sanitize_component(once, limit, allow_spaces) == once);
        CHECK(has_no_forbidden_chars(once));
        CHECK_FALSE(ComponentSanitizer::is_reserved_name(once));
        if (limit > 0) {
            CHECK(once.size() <= static_cast<std::size_t>(limit));
        }
    }
}

TEST_CASE("fits_total_path counts the joining separator") {
    const std::string directory(200, 'd');
    CHECK(ComponentSanitizer::fits_total_path(directory, std::string(59, 'f')));
    CHECK_FALSE(ComponentSanitizer::fits_total_path(directory, std::string(60, 'f')));
    CHECK(ComponentSanitizer::fits_total_path(directory + "/", std::string(59, 'f')));
}

TEST_CASE("negative component limits are rejected") {
    CHECK_THROWS_AS(sanitize_component("name", -1), ErrorCodes::AppException);
}
