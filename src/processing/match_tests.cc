#include "match.hpp"

#include <doctest.h>

using namespace patchy;

TEST_CASE("match_alphabet") {
    SUBCASE("unique") {
        auto s = match_alphabet("abc");
        REQUIRE(s['a'] == 4);
        REQUIRE(s['b'] == 2);
        REQUIRE(s['c'] == 1);
        REQUIRE(s['d'] == 0);
    }

    SUBCASE("duplicates") {
        auto s = match_alphabet("abcaba");
        REQUIRE(s['a'] == 37);
        REQUIRE(s['b'] == 18);
        REQUIRE(s['c'] == 8);
    }
}

TEST_CASE("match_bitap") {
    PatchSettings settings;
    settings.match_distance = 100;
    settings.match_threshold = 0.5;

    SUBCASE("exact_matches") {
        REQUIRE(match_bitap("abcdefghijk", "fgh", 5, settings) == 5);
        REQUIRE(match_bitap("abcdefghijk", "fgh", 0, settings) == 5);
    }

    SUBCASE("fuzzy_matches") {
        REQUIRE(match_bitap("abcdefghijk", "efxhi", 0, settings) == 4);
        REQUIRE(match_bitap("abcdefghijk", "cdefxyhijk", 5, settings) == 2);
        REQUIRE(match_bitap("abcdefghijk", "bxy", 1, settings) == kNotFound);
    }

    SUBCASE("overflow") {
        REQUIRE(match_bitap("123456789xx0", "3456789x0", 2, settings) == 2);
    }

    SUBCASE("before_and_after_start") {
        REQUIRE(match_bitap("abcdef", "xxabc", 4, settings) == 0);
        REQUIRE(match_bitap("abcdef", "defyy", 4, settings) == 3);
        REQUIRE(match_bitap("abcdef", "xabcdefy", 0, settings) == 0);
    }

    SUBCASE("threshold") {
        settings.match_threshold = 0.4;
        REQUIRE(match_bitap("abcdefghijk", "efxyhi", 1, settings) == 4);
        settings.match_threshold = 0.3;
        REQUIRE(match_bitap("abcdefghijk", "efxyhi", 1, settings) == kNotFound);
        settings.match_threshold = 0.0;
        REQUIRE(match_bitap("abcdefghijk", "bcdef", 1, settings) == 1);
    }

    SUBCASE("multiple_select") {
        REQUIRE(match_bitap("abcdexyzabcde", "abccde", 3, settings) == 0);
        REQUIRE(match_bitap("abcdexyzabcde", "abccde", 5, settings) == 8);
    }

    SUBCASE("distance") {
        // Strict location.
        settings.match_distance = 10;
        REQUIRE(match_bitap("abcdefghijklmnopqrstuvwxyz", "abcdefg", 24, settings) == kNotFound);
        REQUIRE(match_bitap("abcdefghijklmnopqrstuvwxyz", "abcdxxefg", 1, settings) == 0);
        // Loose location.
        settings.match_distance = 1000;
        REQUIRE(match_bitap("abcdefghijklmnopqrstuvwxyz", "abcdefg", 24, settings) == 0);
    }

    SUBCASE("pattern_too_long") {
        settings.match_max_bits = 8;
        REQUIRE(match_bitap("abcdefghijklmnopqrstuvwxyz", "abcdefghij", 0, settings) == kNotFound);
    }
}

TEST_CASE("match_main") {
    PatchSettings settings;

    SUBCASE("shortcut_matches") {
        REQUIRE(match_main("abcdef", "abcdef", 1000, settings) == 0);
        REQUIRE(match_main("", "abcdef", 1, settings) == kNotFound);
        REQUIRE(match_main("abcdef", "", 3, settings) == 3);
        REQUIRE(match_main("abcdef", "de", 3, settings) == 3);
    }

    SUBCASE("beyond_end") {
        REQUIRE(match_main("abcdef", "defy", 4, settings) == 3);
        REQUIRE(match_main("abcdef", "abcdefy", 0, settings) == 0);
    }

    SUBCASE("complex_match") {
        settings.match_threshold = 0.7;
        REQUIRE(match_main("I am the very model of a modern major general.", " that berry ", 5, settings) == 4);
    }

    SUBCASE("location_is_clamped") {
        REQUIRE(match_main("abcdef", "ab", -10, settings) == 0);
        REQUIRE(match_main("abcdef", "ef", 1000, settings) == 4);
    }
}
