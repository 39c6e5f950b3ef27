#include "patch_apply.hpp"

#include "processing/patch_text.hpp"

#include <doctest.h>

using namespace patchy;

namespace {

Patches
parse(const std::string& text) {
    PatchParseResult result;
    Patches patches;
    REQUIRE(patch_from_text(text, result, patches));
    return patches;
}

// Patches turning "The quick brown fox jumps over the lazy dog." into
// "That quick brown fox jumped over a lazy dog."
const char* kFoxPatches =
    "@@ -1,7 +1,8 @@\n Th\n-e\n+at\n  qui\n@@ -21,18 +22,17 @@\n jump\n-s\n+ed\n  over \n-the\n+a\n  laz\n";

}  // namespace

TEST_CASE("patch_add_padding") {
    PatchSettings settings;

    SUBCASE("both_edges_full") {
        auto patches = patch_make("", "test", settings);
        REQUIRE(patch_to_text(patches) == "@@ -0,0 +1,4 @@\n+test\n");
        REQUIRE(patch_add_padding(patches, settings) == "\x01\x02\x03\x04");
        REQUIRE(patch_to_text(patches) == "@@ -1,8 +1,12 @@\n %01%02%03%04\n+test\n %01%02%03%04\n");
    }

    SUBCASE("both_edges_partial") {
        auto patches = patch_make("XY", "XtestY", settings);
        REQUIRE(patch_to_text(patches) == "@@ -1,2 +1,6 @@\n X\n+test\n Y\n");
        patch_add_padding(patches, settings);
        REQUIRE(patch_to_text(patches) == "@@ -2,8 +2,12 @@\n %02%03%04X\n+test\n Y%01%02%03\n");
    }

    SUBCASE("both_edges_none") {
        auto patches = patch_make("XXXXYYYY", "XXXXtestYYYY", settings);
        REQUIRE(patch_to_text(patches) == "@@ -1,8 +1,12 @@\n XXXX\n+test\n YYYY\n");
        patch_add_padding(patches, settings);
        REQUIRE(patch_to_text(patches) == "@@ -5,8 +5,12 @@\n XXXX\n+test\n YYYY\n");
    }

    SUBCASE("last_patch_is_padded") {
        auto patches = parse(kFoxPatches);
        patch_add_padding(patches, settings);
        REQUIRE(patches.size() == 2);
        // Only the first patch was short of leading context.
        REQUIRE(patches[0].diffs.front().text == "\x03\x04Th");
        REQUIRE(patches[0].diffs.back().text == " qui");
        REQUIRE(patches[1].diffs.front().text == "jump");
        REQUIRE(patches[1].diffs.back().text == " laz");
        REQUIRE(patches[1].start1 == 24);
    }
}

TEST_CASE("patch_split_max") {
    PatchSettings settings;

    auto check_split = [&](const std::string& a, const std::string& b) {
        auto patches = patch_make(a, b, settings);
        const auto count = patches.size();
        PatchOrigins origins;
        patch_split_max(patches, origins, settings);
        REQUIRE(origins.size() == patches.size());
        REQUIRE(patches.size() >= count);
        for (size_t i = 0; i < patches.size(); i++) {
            const auto& patch = patches[i];
            REQUIRE(patch.length1 <= settings.match_max_bits);
            REQUIRE(patch.length1 == static_cast<int64_t>(edit_ops_old_text(patch.diffs).size()));
            REQUIRE(patch.length2 == static_cast<int64_t>(edit_ops_new_text(patch.diffs).size()));
            REQUIRE(origins[i] < count);
            if (i > 0) {
                REQUIRE(origins[i] >= origins[i - 1]);
            }
        }
        return patches;
    };

    SUBCASE("interleaved_inserts") {
        const std::string letters = "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ";
        std::string with_inserts;
        for (size_t i = 0; i < letters.size(); i += 2) {
            with_inserts += "X" + letters.substr(i, 2);
        }
        auto patches = check_split(letters + "01234567890", with_inserts + "X01234567890");
        REQUIRE(patches.size() >= 2);
    }

    SUBCASE("long_deletion") {
        auto patches = check_split("abcdef12345678901234567890123456789012345678901234567890uvwxyz", "abcdefuvwxyz");
        REQUIRE(patches.size() == 3);
        REQUIRE(edit_ops_old_text(patches[0].diffs).substr(0, 4) == "cdef");
        REQUIRE(edit_ops_new_text(patches[2].diffs) == "cdefuvwx");
    }

    SUBCASE("short_patches_are_untouched") {
        auto patches = parse(kFoxPatches);
        const Patches before = patches;
        patch_split_max(patches, settings);
        REQUIRE(patches == before);
    }

    SUBCASE("monster_delete_passes_in_one_chunk") {
        std::string deleted(100, 'z');
        Patches patches = parse("@@ -1,108 +1,8 @@\n abcd\n-" + deleted + "\n efgh\n");
        PatchOrigins origins;
        patch_split_max(patches, origins, settings);
        // The first chunk carries only the leading context, the delete
        // follows with that context and passes whole.
        bool whole = false;
        for (const auto& patch : patches) {
            for (const auto& diff : patch.diffs) {
                if (diff.op == Operation::Delete && diff.text == deleted) {
                    whole = true;
                }
            }
        }
        REQUIRE(whole);
        for (auto origin : origins) {
            REQUIRE(origin == 0);
        }
    }
}

TEST_CASE("patch_apply") {
    PatchSettings settings;
    settings.match_distance = 1000;
    settings.match_threshold = 0.5;
    settings.patch_delete_threshold = 0.5;

    SUBCASE("null_case") {
        auto result = patch_apply({}, "Hello world.", settings);
        REQUIRE(result.text == "Hello world.");
        REQUIRE(result.applied.empty());
    }

    SUBCASE("no_op") {
        const std::string text = "The quick brown fox jumps over the lazy dog.";
        auto patches = patch_make(text, text, settings);
        REQUIRE(patches.empty());
        auto result = patch_apply(patches, "Anything at all", settings);
        REQUIRE(result.text == "Anything at all");
        REQUIRE(result.applied.empty());
    }

    SUBCASE("exact_match") {
        auto result = patch_apply(parse(kFoxPatches), "The quick brown fox jumps over the lazy dog.", settings);
        REQUIRE(result.text == "That quick brown fox jumped over a lazy dog.");
        REQUIRE(result.applied == std::vector<bool>{true, true});
    }

    SUBCASE("partial_match") {
        auto result = patch_apply(parse(kFoxPatches), "The quick red rabbit jumps over the tired tiger.", settings);
        REQUIRE(result.text == "That quick red rabbit jumped over a tired tiger.");
        REQUIRE(result.applied == std::vector<bool>{true, true});
    }

    SUBCASE("failed_match") {
        const std::string text = "I am the very model of a modern major general.";
        auto result = patch_apply(parse(kFoxPatches), text, settings);
        REQUIRE(result.text == text);
        REQUIRE(result.applied == std::vector<bool>{false, false});
    }

    SUBCASE("replaced_word") {
        auto patches = patch_make("The quick brown fox", "The quick red fox", settings);
        auto result = patch_apply(patches, "The quick brown fox", settings);
        REQUIRE(result.text == "The quick red fox");
        REQUIRE(result.applied == std::vector<bool>{true});
    }

    SUBCASE("exact_replay") {
        const std::string pairs[][2] = {
            {"The quick brown fox jumps over the lazy dog.", "That quick brown fox jumped over a lazy dog."},
            {"", "test"},
            {"test", ""},
            {"abcdefghijklmnopqrstuvwxyz01234567890", "XabXcdXefXghXijXklXmnXopXqrXstXuvXwxXyzX01234567890"},
            {"1\n2\n3\n4\n5\n6\n7\n8\n9\n10\n", "1\n2\nthree\n4\n5\n6\n7\neight\n9\n10\n"},
        };
        for (const auto& pair : pairs) {
            auto result = patch_apply(patch_make(pair[0], pair[1], settings), pair[0], settings);
            REQUIRE(result.text == pair[1]);
            for (bool applied : result.applied) {
                REQUIRE(applied);
            }
        }
    }

    SUBCASE("drift_tolerance") {
        const std::string a = "alpha beta gamma delta epsilon zeta eta theta iota kappa lambda mu";
        const std::string b = "alpha beta GAMMA delta epsilon zeta eta theta iota kappa LAMBDA mu";
        const std::string c = "prologue text that was not there before. " + a;
        auto result = patch_apply(patch_make(a, b, settings), c, settings);
        REQUIRE(result.text == "prologue text that was not there before. " + b);
        REQUIRE(result.applied == std::vector<bool>{true, true});
    }

    SUBCASE("big_delete_small_change") {
        auto patches = patch_make("x1234567890123456789012345678901234567890123456789012345678901234567890y", "xabcy",
                                  settings);
        auto result =
            patch_apply(patches, "x123456789012345678901234567890-----++++++++++-----123456789012345678901234567890y",
                        settings);
        REQUIRE(result.text == "xabcy");
        REQUIRE(result.applied == std::vector<bool>{true});
    }

    SUBCASE("big_delete_big_change") {
        const std::string old_text = "x1234567890123456789012345678901234567890123456789012345678901234567890y";
        const std::string target =
            "x12345678901234567890---------------++++++++++---------------12345678901234567890y";
        auto patches = patch_make(old_text, "xabcy", settings);

        auto result = patch_apply(patches, target, settings);
        REQUIRE(result.text == "xabc12345678901234567890---------------++++++++++---------------12345678901234567890y");
        REQUIRE(result.applied == std::vector<bool>{false});

        settings.patch_delete_threshold = 0.6;
        result = patch_apply(patches, target, settings);
        REQUIRE(result.text == "xabcy");
        REQUIRE(result.applied == std::vector<bool>{true});
    }

    SUBCASE("compensate_for_failed_patch") {
        settings.match_threshold = 0.0;
        settings.match_distance = 0;
        auto patches = patch_make("abcdefghijklmnopqrstuvwxyz--------------------1234567890",
                                  "abcXXXXXXXXXXdefghijklmnopqrstuvwxyz--------------------1234567YYYYYYYYYY890",
                                  settings);
        auto result = patch_apply(patches, "ABCDEFGHIJKLMNOPQRSTUVWXYZ--------------------1234567890", settings);
        REQUIRE(result.text == "ABCDEFGHIJKLMNOPQRSTUVWXYZ--------------------1234567YYYYYYYYYY890");
        REQUIRE(result.applied == std::vector<bool>{false, true});
    }

    SUBCASE("no_side_effects") {
        auto patches = patch_make("", "test", settings);
        const std::string before = patch_to_text(patches);
        patch_apply(patches, "", settings);
        REQUIRE(patch_to_text(patches) == before);

        patches = patch_make("The quick brown fox jumps over the lazy dog.", "Woof", settings);
        const std::string big_before = patch_to_text(patches);
        patch_apply(patches, "The quick brown fox jumps over the lazy dog.", settings);
        REQUIRE(patch_to_text(patches) == big_before);
    }

    SUBCASE("edge_exact_match") {
        auto result = patch_apply(patch_make("", "test", settings), "", settings);
        REQUIRE(result.text == "test");
        REQUIRE(result.applied == std::vector<bool>{true});
    }

    SUBCASE("near_edge_exact_match") {
        auto result = patch_apply(patch_make("XY", "XtestY", settings), "XY", settings);
        REQUIRE(result.text == "XtestY");
        REQUIRE(result.applied == std::vector<bool>{true});
    }

    SUBCASE("edge_partial_match") {
        auto result = patch_apply(patch_make("y", "y123", settings), "x", settings);
        REQUIRE(result.text == "x123");
        REQUIRE(result.applied == std::vector<bool>{true});
    }
}
