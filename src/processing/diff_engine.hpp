#pragma once

/*
    Compute and tidy up edit operations between two texts.

    The core is the linear space Myers algorithm, run over bytes. Long texts
    can first be compared line by line, with each block of replaced lines
    re-compared byte by byte afterwards. The cleanup passes trade minimality
    for edits that read better (semantic) or that are cheaper to store
    (efficiency).
*/

#include "config/settings.hpp"
#include "processing/edit_op.hpp"

#include <string>

namespace patchy {

// Find the differences between two texts. `check_lines` enables the faster,
// slightly less optimal line level pre-pass for texts over 100 bytes.
EditOps
diff_main(const std::string& text1, const std::string& text2, bool check_lines, const PatchSettings& settings);

// Reorder and merge like edit sections; merge equalities. Any edit section
// can move as long as it doesn't cross an equality.
void
diff_cleanup_merge(EditOps& ops);

// Reduce the number of edits by eliminating semantically trivial equalities.
void
diff_cleanup_semantic(EditOps& ops);

// Slide single edits surrounded by equalities sideways to align them with
// word and line boundaries. Never changes the number of edits.
void
diff_cleanup_semantic_lossless(EditOps& ops);

// Reduce the number of edits by eliminating operationally trivial
// equalities.
void
diff_cleanup_efficiency(EditOps& ops, const PatchSettings& settings);

// Number of bytes common to the start of both strings.
int64_t
diff_common_prefix(const std::string& text1, const std::string& text2);

// Number of bytes common to the end of both strings.
int64_t
diff_common_suffix(const std::string& text1, const std::string& text2);

// Number of bytes at the end of text1 that are also the start of text2.
int64_t
diff_common_overlap(const std::string& text1, const std::string& text2);

}  // namespace patchy
