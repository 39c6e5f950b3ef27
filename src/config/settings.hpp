#pragma once

#include <cstdint>
#include <string>

namespace patchy {

// Tunables for diffing, matching and patching. Passed explicitly to every
// operation so that differently configured callers can coexist.
struct PatchSettings {
    // Longest pattern the matcher can search for (bits in a bitap word).
    int64_t match_max_bits = 32;
    // Context radius around each change.
    int64_t patch_margin = 4;
    // How different the content of a large deletion may be from the text it
    // is applied to (0.0 = identical, 1.0 = anything goes).
    double patch_delete_threshold = 0.5;

    // At what point the matcher gives up (0.0 = exact, 1.0 = anything).
    double match_threshold = 0.5;
    // How far from the expected location a match may be. A match this many
    // bytes away counts as bad as a completely wrong match.
    int64_t match_distance = 1000;

    // Seconds the diff engine may spend before settling for a coarse result.
    // Zero or negative means no limit.
    double diff_timeout = 1.0;
    // Cost of an empty edit operation, in bytes of edit.
    int64_t diff_edit_cost = 4;
};

bool
settings_validate(const PatchSettings& settings, std::string& error);

}  // namespace patchy
