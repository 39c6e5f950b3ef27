#pragma once

/*
    Approximate string matching.

    Locate the best instance of a pattern in a text near an expected
    location, allowing for errors. Uses the Bitap algorithm (Wu & Manber),
    so the pattern is limited to `match_max_bits` bytes.
*/

#include "config/settings.hpp"

#include <array>
#include <cstdint>
#include <string>

namespace patchy {

const int64_t kNotFound = -1;

using MatchAlphabet = std::array<uint64_t, 256>;

// Best location of `pattern` in `text` near `loc`, or kNotFound.
int64_t
match_main(const std::string& text, const std::string& pattern, int64_t loc, const PatchSettings& settings);

// Fuzzy search only; `match_main` handles the easy cases first.
int64_t
match_bitap(const std::string& text, const std::string& pattern, int64_t loc, const PatchSettings& settings);

// Bit mask of the pattern positions each byte occurs at.
MatchAlphabet
match_alphabet(const std::string& pattern);

}  // namespace patchy
