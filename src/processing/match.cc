#include "match.hpp"

#include "util/log.hpp"

#include <algorithm>
#include <cstdlib>
#include <vector>

using namespace patchy;

namespace {

// Score of a match with `errors` errors at location `x`. 0.0 is a perfect
// match at the expected location, larger is worse.
struct BitapScore {
    int64_t pattern_length;
    int64_t loc;
    int64_t distance;

    double
    operator()(int64_t errors, int64_t x) const {
        const double accuracy = static_cast<double>(errors) / static_cast<double>(pattern_length);
        const int64_t proximity = std::abs(loc - x);
        if (distance == 0) {
            // Dodge divide by zero error.
            return proximity == 0 ? accuracy : 1.0;
        }
        return accuracy + static_cast<double>(proximity) / static_cast<double>(distance);
    }
};

}  // namespace

int64_t
patchy::match_main(const std::string& text, const std::string& pattern, int64_t loc, const PatchSettings& settings) {
    const auto text_length = static_cast<int64_t>(text.size());
    loc = std::max<int64_t>(0, std::min(loc, text_length));

    if (text == pattern) {
        // Shortcut (potentially not guaranteed by the algorithm)
        return 0;
    } else if (text.empty()) {
        // Nothing to match.
        return kNotFound;
    } else if (static_cast<size_t>(loc) + pattern.size() <= text.size() &&
               text.compare(static_cast<size_t>(loc), pattern.size(), pattern) == 0) {
        // Perfect match at the perfect spot!
        return loc;
    }
    // Do a fuzzy compare.
    return match_bitap(text, pattern, loc, settings);
}

int64_t
patchy::match_bitap(const std::string& text, const std::string& pattern, int64_t loc, const PatchSettings& settings) {
    const auto pattern_length = static_cast<int64_t>(pattern.size());
    const auto text_length = static_cast<int64_t>(text.size());

    if (pattern_length == 0) {
        return std::max<int64_t>(0, std::min(loc, text_length));
    }
    if (pattern_length > settings.match_max_bits || pattern_length > 64) {
        PATCHY_WARN("match pattern of {} bytes exceeds the {} byte limit", pattern_length, settings.match_max_bits);
        return kNotFound;
    }

    // Initialise the alphabet.
    const MatchAlphabet s = match_alphabet(pattern);
    const BitapScore score{pattern_length, loc, settings.match_distance};

    // Highest score beyond which we give up.
    double score_threshold = settings.match_threshold;
    // Is there a nearby exact match? (speedup)
    auto best_exact = text.find(pattern, static_cast<size_t>(loc));
    if (best_exact != std::string::npos) {
        score_threshold = std::min(score(0, static_cast<int64_t>(best_exact)), score_threshold);
        // What about in the other direction? (speedup)
        best_exact = text.rfind(pattern, static_cast<size_t>(loc + pattern_length));
        if (best_exact != std::string::npos) {
            score_threshold = std::min(score(0, static_cast<int64_t>(best_exact)), score_threshold);
        }
    }

    // Initialise the bit arrays.
    const uint64_t match_mask = uint64_t{1} << (pattern_length - 1);
    int64_t best_loc = kNotFound;

    int64_t bin_min = 0;
    int64_t bin_mid = 0;
    int64_t bin_max = pattern_length + text_length;
    std::vector<uint64_t> last_rd;
    for (int64_t d = 0; d < pattern_length; d++) {
        // Scan for the best match; each iteration allows for one more error.
        // Run a binary search to determine how far from 'loc' we can stray at
        // this error level.
        bin_min = 0;
        bin_mid = bin_max;
        while (bin_min < bin_mid) {
            if (score(d, loc + bin_mid) <= score_threshold) {
                bin_min = bin_mid;
            } else {
                bin_max = bin_mid;
            }
            bin_mid = (bin_max - bin_min) / 2 + bin_min;
        }
        // Use the result from this iteration as the maximum for the next.
        bin_max = bin_mid;
        int64_t start = std::max<int64_t>(1, loc - bin_mid + 1);
        const int64_t finish = std::min(loc + bin_mid, text_length) + pattern_length;

        std::vector<uint64_t> rd(static_cast<size_t>(finish + 2), 0);
        rd[static_cast<size_t>(finish + 1)] = (uint64_t{1} << d) - 1;
        for (int64_t j = finish; j >= start; j--) {
            uint64_t char_match = 0;
            if (j - 1 < text_length) {
                char_match = s[static_cast<unsigned char>(text[static_cast<size_t>(j - 1)])];
            }
            const auto uj = static_cast<size_t>(j);
            if (d == 0) {
                // First pass: exact match.
                rd[uj] = ((rd[uj + 1] << 1) | 1) & char_match;
            } else {
                // Subsequent passes: fuzzy match.
                rd[uj] = (((rd[uj + 1] << 1) | 1) & char_match) | (((last_rd[uj + 1] | last_rd[uj]) << 1) | 1) |
                         last_rd[uj + 1];
            }
            if (rd[uj] & match_mask) {
                const double candidate_score = score(d, j - 1);
                // This match will almost certainly be better than any existing
                // match. But check anyway.
                if (candidate_score <= score_threshold) {
                    // Told you so.
                    score_threshold = candidate_score;
                    best_loc = j - 1;
                    if (best_loc > loc) {
                        // When passing loc, don't exceed our current distance from loc.
                        start = std::max<int64_t>(1, 2 * loc - best_loc);
                    } else {
                        // Already passed loc, downhill from here on in.
                        break;
                    }
                }
            }
        }
        if (score(d + 1, loc) > score_threshold) {
            // No hope for a (better) match at greater error levels.
            break;
        }
        last_rd = std::move(rd);
    }
    return best_loc;
}

MatchAlphabet
patchy::match_alphabet(const std::string& pattern) {
    MatchAlphabet s{};
    const auto pattern_length = pattern.size();
    for (size_t i = 0; i < pattern_length; i++) {
        s[static_cast<unsigned char>(pattern[i])] |= uint64_t{1} << (pattern_length - i - 1);
    }
    return s;
}
