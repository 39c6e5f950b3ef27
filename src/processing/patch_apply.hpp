#pragma once

/*
    Applying patches to a text that may have drifted from the one they were
    made against.

    Every patch is located with the approximate matcher near where the
    previous patches suggest it should be. A window that matches exactly is
    replaced outright; an imperfect one is diffed against the patch's old
    text and the patch's edits are replayed through that diff.
*/

#include "config/settings.hpp"
#include "processing/patch.hpp"

#include <string>
#include <vector>

namespace patchy {

struct PatchApplyResult {
    std::string text;
    // One flag per patch passed to patch_apply, in the same order.
    std::vector<bool> applied;
};

// For each working patch, the index of the caller patch it was carved from.
using PatchOrigins = std::vector<size_t>;

PatchApplyResult
patch_apply(const Patches& patches, const std::string& text, const PatchSettings& settings);

// Shift the patches and give the first and last one enough leading and
// trailing context to match at the very edges of a text. Returns the
// padding the text has to be wrapped in.
std::string
patch_add_padding(Patches& patches, const PatchSettings& settings);

// Break up patches whose old text is longer than the matcher can search
// for. `origins` maps every resulting patch back to its input index.
void
patch_split_max(Patches& patches, PatchOrigins& origins, const PatchSettings& settings);

void
patch_split_max(Patches& patches, const PatchSettings& settings);

}  // namespace patchy
