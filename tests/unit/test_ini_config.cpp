#include <catch2/catch_test_macros.hpp>
#include "IniConfig.hpp"
#include "TestHelpers.hpp"

#include <optional>
#include <string>

TEST_CASE("IniConfig parses sections and skips comments") {
    TempDir temp_dir;
    const auto path = temp_dir.path() / "sample.ini";
    write_text_file(path,
                    "; leading comment\n"
                    "top = level\n"
                    "[ Naming ]\n"
                    "# another comment\n"
                    "  MaxBaseLength   =  80  \n"
                    "this line is malformed\n"
                    "= missing key\n"
                    "Empty =\n");

    IniConfig config;
    REQUIRE(config.load(path.string()));
    CHECK(config.getValue("", "top") == "level");
    CHECK(config.getValue("Naming", "MaxBaseLength") == "80");
    CHECK(config.findValue("Naming", "Empty") == std::optional<std::string>(""));
    CHECK(config.getValue("Naming", "Empty", "fallback").empty());
    CHECK_FALSE(config.findValue("Naming", "this line is malformed").has_value());
    CHECK_FALSE(config.findValue("Logging", "Level").has_value());
    CHECK(config.getValue("Logging", "Level", "info") == "info");
}

TEST_CASE("IniConfig round-trips through save") {
    TempDir temp_dir;
    const auto path = temp_dir.path() / "saved.ini";

    IniConfig config;
    config.setValue("Naming", "UseSpaces", "false");
    config.setValue("Logging", "Level", "debug");
    config.setValue("", "Version", "1");
    REQUIRE(config.save(path.string()));

    IniConfig reloaded;
    REQUIRE(reloaded.load(path.string()));
    CHECK(reloaded.getValue("Naming", "UseSpaces") == "false");
    CHECK(reloaded.getValue("Logging", "Level") == "debug");
    CHECK(reloaded.getValue("", "Version") == "1");
    CHECK_FALSE(reloaded.findValue("Naming", "Version").has_value());
}

TEST_CASE("IniConfig reports unreadable files") {
    TempDir temp_dir;
    IniConfig config;
    CHECK_FALSE(config.load((temp_dir.path() / "missing.ini").string()));
}
