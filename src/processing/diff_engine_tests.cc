#include "diff_engine.hpp"

#include <doctest.h>
#include <fmt/format.h>

#include <string>

using namespace patchy;

TEST_CASE("diff_common") {
    SUBCASE("prefix") {
        REQUIRE(diff_common_prefix("abc", "xyz") == 0);
        REQUIRE(diff_common_prefix("1234abcdef", "1234xyz") == 4);
        REQUIRE(diff_common_prefix("1234", "1234xyz") == 4);
    }

    SUBCASE("suffix") {
        REQUIRE(diff_common_suffix("abc", "xyz") == 0);
        REQUIRE(diff_common_suffix("abcdef1234", "xyz1234") == 4);
        REQUIRE(diff_common_suffix("1234", "xyz1234") == 4);
    }

    SUBCASE("overlap") {
        REQUIRE(diff_common_overlap("", "abcd") == 0);
        REQUIRE(diff_common_overlap("abc", "abcd") == 3);
        REQUIRE(diff_common_overlap("123456", "abcd") == 0);
        REQUIRE(diff_common_overlap("123456xxx", "xxxabcd") == 3);
    }
}

TEST_CASE("diff_cleanup_merge") {
    SUBCASE("null_case") {
        EditOps ops;
        diff_cleanup_merge(ops);
        REQUIRE(ops.empty());
    }

    SUBCASE("no_change") {
        EditOps ops = {{Operation::Equal, "a"}, {Operation::Delete, "b"}, {Operation::Insert, "c"}};
        const EditOps expected = ops;
        diff_cleanup_merge(ops);
        REQUIRE(ops == expected);
    }

    SUBCASE("merge_equalities") {
        EditOps ops = {{Operation::Equal, "a"}, {Operation::Equal, "b"}, {Operation::Equal, "c"}};
        diff_cleanup_merge(ops);
        REQUIRE(ops == EditOps{{Operation::Equal, "abc"}});
    }

    SUBCASE("merge_deletions") {
        EditOps ops = {{Operation::Delete, "a"}, {Operation::Delete, "b"}, {Operation::Delete, "c"}};
        diff_cleanup_merge(ops);
        REQUIRE(ops == EditOps{{Operation::Delete, "abc"}});
    }

    SUBCASE("merge_interweave") {
        EditOps ops = {{Operation::Delete, "a"}, {Operation::Insert, "b"}, {Operation::Delete, "c"},
                       {Operation::Insert, "d"}, {Operation::Equal, "e"},  {Operation::Equal, "f"}};
        diff_cleanup_merge(ops);
        REQUIRE(ops == EditOps{{Operation::Delete, "ac"}, {Operation::Insert, "bd"}, {Operation::Equal, "ef"}});
    }

    SUBCASE("prefix_and_suffix_detection") {
        EditOps ops = {{Operation::Delete, "a"}, {Operation::Insert, "abc"}, {Operation::Delete, "dc"}};
        diff_cleanup_merge(ops);
        REQUIRE(ops == EditOps{{Operation::Equal, "a"},
                               {Operation::Delete, "d"},
                               {Operation::Insert, "b"},
                               {Operation::Equal, "c"}});
    }

    SUBCASE("slide_edit_left") {
        EditOps ops = {{Operation::Equal, "a"}, {Operation::Insert, "ba"}, {Operation::Equal, "c"}};
        diff_cleanup_merge(ops);
        REQUIRE(ops == EditOps{{Operation::Insert, "ab"}, {Operation::Equal, "ac"}});
    }

    SUBCASE("slide_edit_right") {
        EditOps ops = {{Operation::Equal, "c"}, {Operation::Insert, "ab"}, {Operation::Equal, "a"}};
        diff_cleanup_merge(ops);
        REQUIRE(ops == EditOps{{Operation::Equal, "ca"}, {Operation::Insert, "ba"}});
    }
}

TEST_CASE("diff_cleanup_semantic") {
    SUBCASE("no_elimination") {
        EditOps ops = {{Operation::Delete, "ab"}, {Operation::Insert, "cd"}, {Operation::Equal, "12"},
                       {Operation::Delete, "e"}};
        const EditOps expected = ops;
        diff_cleanup_semantic(ops);
        REQUIRE(ops == expected);
    }

    SUBCASE("simple_elimination") {
        EditOps ops = {{Operation::Delete, "a"}, {Operation::Equal, "b"}, {Operation::Delete, "c"}};
        diff_cleanup_semantic(ops);
        REQUIRE(ops == EditOps{{Operation::Delete, "abc"}, {Operation::Insert, "b"}});
    }

    SUBCASE("overlap_elimination") {
        EditOps ops = {{Operation::Delete, "abcxxx"}, {Operation::Insert, "xxxdef"}};
        diff_cleanup_semantic(ops);
        REQUIRE(ops == EditOps{{Operation::Delete, "abc"}, {Operation::Equal, "xxx"}, {Operation::Insert, "def"}});
    }

    SUBCASE("reverse_overlap_elimination") {
        EditOps ops = {{Operation::Delete, "xxxabc"}, {Operation::Insert, "defxxx"}};
        diff_cleanup_semantic(ops);
        REQUIRE(ops == EditOps{{Operation::Insert, "def"}, {Operation::Equal, "xxx"}, {Operation::Delete, "abc"}});
    }
}

TEST_CASE("diff_cleanup_semantic_lossless") {
    SUBCASE("blank_lines") {
        EditOps ops = {{Operation::Equal, "AAA\r\n\r\nBBB"},
                       {Operation::Insert, "\r\nDDD\r\n\r\nBBB"},
                       {Operation::Equal, "\r\nEEE"}};
        diff_cleanup_semantic_lossless(ops);
        REQUIRE(ops == EditOps{{Operation::Equal, "AAA\r\n\r\n"},
                               {Operation::Insert, "BBB\r\nDDD\r\n\r\n"},
                               {Operation::Equal, "BBB\r\nEEE"}});
    }

    SUBCASE("word_boundaries") {
        EditOps ops = {{Operation::Equal, "The c"}, {Operation::Insert, "ow and the c"}, {Operation::Equal, "at."}};
        diff_cleanup_semantic_lossless(ops);
        REQUIRE(ops == EditOps{{Operation::Equal, "The "}, {Operation::Insert, "cow and the "}, {Operation::Equal, "cat."}});
    }

    SUBCASE("hitting_the_start") {
        EditOps ops = {{Operation::Equal, "a"}, {Operation::Delete, "a"}, {Operation::Equal, "ax"}};
        diff_cleanup_semantic_lossless(ops);
        REQUIRE(ops == EditOps{{Operation::Delete, "a"}, {Operation::Equal, "aax"}});
    }
}

TEST_CASE("diff_cleanup_efficiency") {
    PatchSettings settings;
    settings.diff_edit_cost = 4;

    SUBCASE("no_elimination") {
        EditOps ops = {{Operation::Delete, "ab"}, {Operation::Insert, "12"}, {Operation::Equal, "wxyz"},
                       {Operation::Delete, "cd"}, {Operation::Insert, "34"}};
        const EditOps expected = ops;
        diff_cleanup_efficiency(ops, settings);
        REQUIRE(ops == expected);
    }

    SUBCASE("four_edit_elimination") {
        EditOps ops = {{Operation::Delete, "ab"}, {Operation::Insert, "12"}, {Operation::Equal, "xyz"},
                       {Operation::Delete, "cd"}, {Operation::Insert, "34"}};
        diff_cleanup_efficiency(ops, settings);
        REQUIRE(ops == EditOps{{Operation::Delete, "abxyzcd"}, {Operation::Insert, "12xyz34"}});
    }

    SUBCASE("three_edit_elimination") {
        EditOps ops = {{Operation::Insert, "12"}, {Operation::Equal, "x"}, {Operation::Delete, "cd"},
                       {Operation::Insert, "34"}};
        diff_cleanup_efficiency(ops, settings);
        REQUIRE(ops == EditOps{{Operation::Delete, "xcd"}, {Operation::Insert, "12x34"}});
    }
}

TEST_CASE("diff_main") {
    PatchSettings settings;

    SUBCASE("trivial") {
        REQUIRE(diff_main("", "", false, settings).empty());
        REQUIRE(diff_main("abc", "abc", false, settings) == EditOps{{Operation::Equal, "abc"}});
        REQUIRE(diff_main("a", "b", false, settings) == EditOps{{Operation::Delete, "a"}, {Operation::Insert, "b"}});
    }

    SUBCASE("simple_insertion") {
        REQUIRE(diff_main("abc", "ab123c", false, settings) ==
                EditOps{{Operation::Equal, "ab"}, {Operation::Insert, "123"}, {Operation::Equal, "c"}});
    }

    SUBCASE("simple_deletion") {
        REQUIRE(diff_main("a123bc", "abc", false, settings) ==
                EditOps{{Operation::Equal, "a"}, {Operation::Delete, "123"}, {Operation::Equal, "bc"}});
    }

    SUBCASE("two_insertions") {
        REQUIRE(diff_main("abc", "a123b456c", false, settings) == EditOps{{Operation::Equal, "a"},
                                                                          {Operation::Insert, "123"},
                                                                          {Operation::Equal, "b"},
                                                                          {Operation::Insert, "456"},
                                                                          {Operation::Equal, "c"}});
    }

    SUBCASE("reconstructs_both_texts") {
        const std::string pairs[][2] = {
            {"Apples are a fruit.", "Bananas are also fruit."},
            {"ax\t", "\xda\x80x\t"},
            {"1ayb2", "abxab"},
            {"abcy", "xaxcxabc"},
            {"ABCDa=bcd=efghijklmnopqrsEFGHIJKLMNOefg", "a-bcd-efghijklmnopqrs"},
        };
        for (const auto& pair : pairs) {
            auto ops = diff_main(pair[0], pair[1], false, settings);
            REQUIRE(edit_ops_old_text(ops) == pair[0]);
            REQUIRE(edit_ops_new_text(ops) == pair[1]);
        }
    }

    SUBCASE("line_mode") {
        std::string a;
        std::string b;
        for (int i = 0; i < 20; i++) {
            a += fmt::format("line {} of the old text\n", i);
            b += i % 3 == 0 ? fmt::format("line {} of the new text\n", i) : fmt::format("line {} of the old text\n", i);
        }

        auto with_lines = diff_main(a, b, true, settings);
        REQUIRE(edit_ops_old_text(with_lines) == a);
        REQUIRE(edit_ops_new_text(with_lines) == b);

        auto without_lines = diff_main(a, b, false, settings);
        REQUIRE(edit_ops_old_text(without_lines) == a);
        REQUIRE(edit_ops_new_text(without_lines) == b);
    }

    SUBCASE("timeout") {
        std::string a;
        std::string b;
        for (int i = 0; i < 2000; i++) {
            a += fmt::format("`Twas brillig {}, and the slithy toves\n", i);
            b += fmt::format("I am the very model {} of a modern major general,\n", i * 7);
        }
        settings.diff_timeout = 0.000001;
        auto ops = diff_main(a, b, false, settings);
        REQUIRE(edit_ops_old_text(ops) == a);
        REQUIRE(edit_ops_new_text(ops) == b);
    }
}
