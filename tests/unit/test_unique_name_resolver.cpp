#include <catch2/catch_test_macros.hpp>
#include "AppException.hpp"
#include "UniqueNameResolver.hpp"
#include "Utils.hpp"

#include <fmt/format.h>

#include <string>

using UniqueNameResolver::resolve_unique;

namespace {

IssuedNameSet versioned_names(const std::string& stem, const std::string& extension, int last_version)
{
    IssuedNameSet issued{Utils::to_lower_copy(stem + extension)};
    for (int version = 2; version <= last_version; ++version) {
        issued.insert(Utils::to_lower_copy(fmt::format("{}-v{}{}", stem, version, extension)));
    }
    return issued;
}

}

TEST_CASE("free names are returned unchanged") {
    CHECK(resolve_unique("Meeting Notes", ".md", {}) == "Meeting Notes.md");
    CHECK(resolve_unique("", ".md", {}) == "unnamed.md");
    CHECK(resolve_unique("Meeting Notes", "", {}) == "Meeting Notes");
}

TEST_CASE("hyphens join words when spaces are disabled") {
    CHECK(resolve_unique("Hello World", ".md", {}, kDefaultMaxBaseLength, false) == "Hello-World.md");
}

TEST_CASE("collisions are detected case-insensitively") {
    CHECK(resolve_unique("REPORT", ".md", {"report.md"}) == "REPORT-v2.md");
    CHECK(resolve_unique("", ".md", {"unnamed.md", "unnamed-v2.md"}) == "unnamed-v3.md");
}

TEST_CASE("the last version suffix is still used before hashing") {
    CHECK(resolve_unique("Duplicate", ".md", versioned_names("Duplicate", ".md", 49)) ==
          "Duplicate-v50.md");
}

TEST_CASE("exhausted version suffixes switch to a content hash") {
    const auto issued = versioned_names("Duplicate", ".md", 50);
    const std::string expected = "Duplicate-x" + Utils::sha256_hex("Duplicate").substr(0, 6) + ".md";
    CHECK(resolve_unique("Duplicate", ".md", issued) == expected);
}

TEST_CASE("a taken hash name is re-salted") {
    auto issued = versioned_names("Duplicate", ".md", 50);
    const std::string first_hash = resolve_unique("Duplicate", ".md", issued);
    issued.insert(Utils::to_lower_copy(first_hash));

    const std::string second_hash = resolve_unique("Duplicate", ".md", issued);
    CHECK(second_hash != first_hash);
    CHECK(second_hash == "Duplicate-x" + Utils::sha256_hex("Duplicate#1").substr(0, 6) + ".md");
}

TEST_CASE("exhausted salted hashes fall back to a numbered hash name") {
    auto issued = versioned_names("Duplicate", ".md", 50);
    const std::string hashed = "Duplicate-x" + Utils::sha256_hex("Duplicate").substr(0, 6);
    issued.insert(Utils::to_lower_copy(hashed + ".md"));
    for (int salt = 1; salt < 16; ++salt) {
        const std::string digest = Utils::sha256_hex(fmt::format("Duplicate#{}", salt)).substr(0, 6);
        issued.insert(Utils::to_lower_copy("Duplicate-x" + digest + ".md"));
    }

    CHECK(resolve_unique("Duplicate", ".md", issued) == hashed + "-2.md");
    issued.insert(Utils::to_lower_copy(hashed + "-2.md"));
    CHECK(resolve_unique("Duplicate", ".md", issued) == hashed + "-3.md");
}

TEST_CASE("numbered hash names still fit the component ceiling") {
    const std::string title(260, 'a');
    IssuedNameSet issued;
    for (int i = 0; i < 80; ++i) {
        const std::string name = resolve_unique(title, ".md", issued, 300);
        CHECK(name.size() <= 255);
        CHECK(name.substr(name.size() - 3) == ".md");
        CHECK(issued.insert(Utils::to_lower_copy(name)).second);
    }
}

TEST_CASE("results never exceed the component ceiling") {
    const std::string title(260, 'a');
    const std::string first = resolve_unique(title, ".md", {}, 300);
    CHECK(first.size() == 255);
    CHECK(first.substr(first.size() - 3) == ".md");

    const std::string second = resolve_unique(title, ".md", {Utils::to_lower_copy(first)}, 300);
    CHECK(second.size() == 255);
    CHECK(second.substr(second.size() - 6) == "-v2.md");
}

TEST_CASE("base length budget applies before the extension") {
    const std::string title =
        "The Quick Brown Fox Jumps Over The Lazy Dog and a Very Long Supplementary "
        "Explanatory Subtitle About Nothing In Particular";
    const std::string name = resolve_unique(title, ".md", {}, 40);
    CHECK(name == "Quick Brown Fox Jumps Lazy Dog Long.md");
    CHECK(name.size() - 3 <= 40);
}

TEST_CASE("reserved titles never produce a bare device stem") {
    const std::string name = resolve_unique("con", ".md", {});
    CHECK(Utils::to_upper_copy(name.substr(0, name.find('.'))) != "CON");
}

TEST_CASE("invalid arguments are rejected at the boundary") {
    try {
        (void)resolve_unique("Title", "md", {});
        FAIL("expected AppException");
    } catch (const ErrorCodes::AppException& ex) {
        CHECK(ex.get_error_code() == ErrorCodes::Code::VALIDATION_INVALID_FORMAT);
    }
    try {
        (void)resolve_unique("Title", ".md", {}, -1);
        FAIL("expected AppException");
    } catch (const ErrorCodes::AppException& ex) {
        CHECK(ex.get_error_code() == ErrorCodes::Code::VALIDATION_VALUE_OUT_OF_RANGE);
    }
}
