#pragma once

/*
    Patches: context-bounded groups of edit operations that can be
    relocated and applied to a text that has drifted from the one the patch
    was made against.

    start1/length1 describe the span in the old text, start2/length2 the
    span in the new text. Offsets are 0-based byte offsets.
*/

#include "config/settings.hpp"
#include "processing/edit_op.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace patchy {

struct Patch {
    EditOps diffs;
    int64_t start1 = 0;
    int64_t start2 = 0;
    int64_t length1 = 0;
    int64_t length2 = 0;

    // The empty patch; used as a sentinel, never produced by patch_make.
    bool
    is_null() const {
        return start1 == 0 && start2 == 0 && length1 == 0 && length2 == 0 && diffs.empty();
    }

    bool
    operator==(const Patch& other) const {
        return start1 == other.start1 && start2 == other.start2 && length1 == other.length1 &&
               length2 == other.length2 && diffs == other.diffs;
    }

    bool
    operator!=(const Patch& other) const {
        return !(*this == other);
    }
};

using Patches = std::vector<Patch>;

// Compute the patches turning text1 into text2.
Patches
patch_make(const std::string& text1, const std::string& text2, const PatchSettings& settings);

// Compute patches from a diff; the old text is reconstructed from it.
Patches
patch_make(const EditOps& diffs, const PatchSettings& settings);

// Compute patches turning text1 into the new text described by `diffs`.
// The Equal and Delete runs of `diffs` must add up to text1.
Patches
patch_make(const std::string& text1, const EditOps& diffs, const PatchSettings& settings);

// Grow the context around a patch until its old text is unique within
// `text`, without making it longer than the matcher can handle.
void
patch_add_context(Patch& patch, const std::string& text, const PatchSettings& settings);

}  // namespace patchy
