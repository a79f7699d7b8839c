#include <catch2/catch_test_macros.hpp>
#include "Utils.hpp"

#include <string>
#include <vector>

TEST_CASE("utf8_truncate never splits a code point") {
    const std::string text = "ab\xC3\xA9";
    CHECK(Utils::utf8_truncate(text, 4) == text);
    CHECK(Utils::utf8_truncate(text, 3) == "ab");
    CHECK(Utils::utf8_truncate("\xE2\x82\xAC" "x", 2).empty());
    CHECK(Utils::utf8_truncate("plain", 0).empty());
}

TEST_CASE("sha256_hex matches the reference digest") {
    CHECK(Utils::sha256_hex("abc") ==
          "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    CHECK(Utils::sha256_hex("").size() == 64);
}

TEST_CASE("string helpers") {
    std::string runs = "a__b___c_";
    Utils::collapse_runs(runs, '_');
    CHECK(runs == "a_b_c_");

    std::string tail = "name. . ";
    Utils::strip_trailing(tail, " .");
    CHECK(tail == "name");

    CHECK(Utils::join({"a", "b", "c"}, "-") == "a-b-c");
    CHECK(Utils::join({}, "-").empty());
    CHECK(Utils::trim_copy("  x y \t") == "x y");
    CHECK(Utils::to_upper_copy("con.txt") == "CON.TXT");
}

TEST_CASE("parse_bool accepts common spellings") {
    CHECK(Utils::parse_bool("Yes") == true);
    CHECK(Utils::parse_bool(" on ") == true);
    CHECK(Utils::parse_bool("0") == false);
    CHECK(Utils::parse_bool("OFF") == false);
    CHECK_FALSE(Utils::parse_bool("maybe").has_value());
}
