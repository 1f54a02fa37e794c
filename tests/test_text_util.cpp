#include <catch2/catch_test_macros.hpp>

#include "text_util.hpp"

TEST_CASE("Text utilities", "[text]") {

    SECTION("CharCountIsCodePoints") {
        REQUIRE(text::char_count("") == 0);
        REQUIRE(text::char_count("abc") == 3);
        REQUIRE(text::char_count("h\xC3\xA9llo") == 5);       // é is two bytes
        REQUIRE(text::char_count("\xF0\x9F\x98\x80!") == 2);  // emoji is four bytes
    }

    SECTION("TruncateKeepsShortStrings") {
        REQUIRE(text::truncate_chars("hello", 10) == "hello");
        REQUIRE(text::truncate_chars("hello", 5) == "hello");
    }

    SECTION("TruncateCutsAtCharBoundary") {
        REQUIRE(text::truncate_chars("hello", 3) == "hel");
        REQUIRE(text::truncate_chars("h\xC3\xA9llo", 2) == "h\xC3\xA9");
        REQUIRE(text::truncate_chars("\xF0\x9F\x98\x80\xF0\x9F\x98\x80", 1) == "\xF0\x9F\x98\x80");
        REQUIRE(text::truncate_chars("abc", 0).empty());
    }

    SECTION("Trim") {
        REQUIRE(text::trim("  hi \n\t") == "hi");
        REQUIRE(text::trim("hi") == "hi");
        REQUIRE(text::trim(" \r\n ").empty());
        REQUIRE(text::trim("").empty());
    }

    SECTION("TrimUnicodeWhitespace") {
        REQUIRE(text::trim("\xC2\xA0hi\xE3\x80\x80") == "hi");
        REQUIRE(text::trim("ok?\xE2\x80\xAF \xE2\x80\x89") == "ok?");
        REQUIRE(text::trim("\x1c\x1f").empty());
        REQUIRE(text::trim("\xE3\x80\x80").empty());
        // Interior spaces and other multi-byte characters are kept.
        REQUIRE(text::trim(" caf\xC3\xA9\xC2\xA0" "au lait ") == "caf\xC3\xA9\xC2\xA0" "au lait");
        REQUIRE(text::trim("\xE2\x80\x8B") == "\xE2\x80\x8B");
    }

    SECTION("ToLower") {
        REQUIRE(text::to_lower("MyProject-2") == "myproject-2");
    }
}
