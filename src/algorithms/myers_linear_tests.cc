#include "myers_linear.hpp"

#include <doctest.h>

#include <string>

using namespace patchy;

namespace {

DiffResult
run_diff(const std::string& a, const std::string& b) {
    DiffInput<char> input{gsl::span<const char>(a.data(), a.size()), gsl::span<const char>(b.data(), b.size()),
                          std::nullopt};
    return MyersLinear<char>(input).compute();
}

// Rebuild B from A and the runs.
std::string
apply_runs(const std::string& a, const std::string& b, const DiffResult& result) {
    std::string out;
    int64_t a_pos = 0;
    for (const auto& run : result.runs) {
        switch (run.type) {
            case EditType::Common:
                REQUIRE(run.a_begin == a_pos);
                REQUIRE(a.compare(run.a_begin, run.length, b, run.b_begin, run.length) == 0);
                out += a.substr(run.a_begin, run.length);
                a_pos += run.length;
                break;
            case EditType::Delete:
                REQUIRE(run.a_begin == a_pos);
                a_pos += run.length;
                break;
            case EditType::Insert:
                out += b.substr(run.b_begin, run.length);
                break;
        }
    }
    REQUIRE(a_pos == static_cast<int64_t>(a.size()));
    return out;
}

}  // namespace

TEST_CASE("MyersLinear") {
    SUBCASE("empty") {
        REQUIRE(run_diff("", "").status == DiffResultStatus::NoChanges);
    }

    SUBCASE("one_side_empty") {
        auto result = run_diff("abc", "");
        REQUIRE(result.status == DiffResultStatus::OK);
        REQUIRE(result.runs.size() == 1);
        REQUIRE(result.runs[0].type == EditType::Delete);
        REQUIRE(result.runs[0].length == 3);

        result = run_diff("", "xy");
        REQUIRE(result.runs.size() == 1);
        REQUIRE(result.runs[0].type == EditType::Insert);
        REQUIRE(result.runs[0].length == 2);
    }

    SUBCASE("identical") {
        auto result = run_diff("abcdef", "abcdef");
        REQUIRE(result.status == DiffResultStatus::NoChanges);
        REQUIRE(result.runs.size() == 1);
        REQUIRE(result.runs[0].length == 6);
    }

    SUBCASE("runs_are_coalesced") {
        // The classic example from Myers' paper: D = 5.
        const std::string a = "ABCABBA";
        const std::string b = "CBABAC";
        auto result = run_diff(a, b);
        REQUIRE(result.status == DiffResultStatus::OK);
        REQUIRE(apply_runs(a, b, result) == b);

        int64_t edits = 0;
        for (size_t i = 0; i < result.runs.size(); i++) {
            if (result.runs[i].type != EditType::Common) {
                edits += result.runs[i].length;
            }
            if (i > 0) {
                REQUIRE(result.runs[i].type != result.runs[i - 1].type);
            }
        }
        REQUIRE(edits == 5);
    }

    SUBCASE("reconstructs") {
        const std::string pairs[][2] = {{"kitten", "sitting"},
                                        {"the quick brown fox", "a quick red fox jumps"},
                                        {"aaaa", "bbbb"},
                                        {"abcabcabc", "abc"},
                                        {"x", "yxz"}};
        for (const auto& pair : pairs) {
            auto result = run_diff(pair[0], pair[1]);
            REQUIRE(apply_runs(pair[0], pair[1], result) == pair[1]);
        }
    }

    SUBCASE("deadline_in_the_past") {
        const std::string a = "abcdefghij";
        const std::string b = "jihgfedcba";
        DiffInput<char> input{gsl::span<const char>(a.data(), a.size()), gsl::span<const char>(b.data(), b.size()),
                              Clock::now() - std::chrono::seconds(1)};
        REQUIRE(MyersLinear<char>(input).compute().status == DiffResultStatus::TimedOut);
    }
}
