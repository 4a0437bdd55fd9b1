#include <catch2/catch.hpp>

#include "utils/text.hpp"

TEST_CASE("trim strips surrounding whitespace only", "[text]") {
    CHECK(Text::trim("  diligent \t\n") == "diligent");
    CHECK(Text::trim("two words") == "two words");
    CHECK(Text::trim(" \t ").empty());
    CHECK(Text::trim("").empty());
}

TEST_CASE("lowerTrim normalises commands and rating tokens", "[text]") {
    CHECK(Text::lowerTrim("  REVIEW ") == "review");
    CHECK(Text::lowerTrim("Easy\r") == "easy");
    CHECK(Text::lowerTrim("q") == "q");
}
