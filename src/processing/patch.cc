#include "patch.hpp"

#include "processing/diff_engine.hpp"
#include "util/log.hpp"

#include <algorithm>

using namespace patchy;

void
patchy::patch_add_context(Patch& patch, const std::string& text, const PatchSettings& settings) {
    if (text.empty()) {
        return;
    }

    const auto text_length = static_cast<int64_t>(text.size());
    const int64_t margin = settings.patch_margin;
    const int64_t start = std::min(patch.start2, text_length);
    const int64_t end = std::min(patch.start2 + patch.length1, text_length);

    auto window = [&](int64_t padding) {
        const int64_t begin = std::max<int64_t>(0, start - padding);
        const int64_t finish = std::min(text_length, end + padding);
        return text.substr(static_cast<size_t>(begin), static_cast<size_t>(finish - begin));
    };

    std::string pattern = window(0);
    int64_t padding = 0;

    // Look for the first and last matches of pattern in text. If two
    // different matches are found, increase the pattern length.
    while (margin > 0 && text.find(pattern) != text.rfind(pattern) &&
           static_cast<int64_t>(pattern.size()) < settings.match_max_bits - margin - margin) {
        padding += margin;
        pattern = window(padding);
    }
    // Add one chunk for good luck.
    padding += margin;

    // Add the prefix.
    const int64_t prefix_begin = std::max<int64_t>(0, start - padding);
    const std::string prefix = text.substr(static_cast<size_t>(prefix_begin), static_cast<size_t>(start - prefix_begin));
    if (!prefix.empty()) {
        patch.diffs.insert(patch.diffs.begin(), EditOp{Operation::Equal, prefix});
    }

    // Add the suffix.
    const int64_t suffix_end = std::min(text_length, end + padding);
    const std::string suffix = text.substr(static_cast<size_t>(end), static_cast<size_t>(suffix_end - end));
    if (!suffix.empty()) {
        patch.diffs.push_back({Operation::Equal, suffix});
    }

    // Roll back the start points.
    const auto prefix_length = static_cast<int64_t>(prefix.size());
    const auto suffix_length = static_cast<int64_t>(suffix.size());
    patch.start1 -= prefix_length;
    patch.start2 -= prefix_length;
    // Extend the lengths.
    patch.length1 += prefix_length + suffix_length;
    patch.length2 += prefix_length + suffix_length;
}

Patches
patchy::patch_make(const std::string& text1, const std::string& text2, const PatchSettings& settings) {
    EditOps diffs = diff_main(text1, text2, true, settings);
    if (diffs.size() > 2) {
        diff_cleanup_semantic(diffs);
        diff_cleanup_efficiency(diffs, settings);
    }
    return patch_make(text1, diffs, settings);
}

Patches
patchy::patch_make(const EditOps& diffs, const PatchSettings& settings) {
    return patch_make(edit_ops_old_text(diffs), diffs, settings);
}

Patches
patchy::patch_make(const std::string& text1, const EditOps& diffs, const PatchSettings& settings) {
    Patches patches;
    if (diffs.empty()) {
        // Get rid of the null case.
        return patches;
    }

    const int64_t margin = settings.patch_margin;

    Patch patch;
    // Bytes into the old and new text.
    int64_t pos1 = 0;
    int64_t pos2 = 0;
    // Start with text1 (prepatch) and apply the diffs until we arrive at
    // text2 (postpatch). The patches are recreated one by one to determine
    // context info.
    std::string prepatch_text = text1;
    std::string postpatch_text = text1;

    for (size_t i = 0; i < diffs.size(); i++) {
        const EditOp& diff = diffs[i];
        const auto length = static_cast<int64_t>(diff.text.size());
        const bool is_last = i + 1 == diffs.size();

        if (patch.diffs.empty() && diff.op != Operation::Equal) {
            // A new patch starts here.
            patch.start1 = pos1;
            patch.start2 = pos2;
        }

        switch (diff.op) {
            case Operation::Insert:
                patch.diffs.push_back(diff);
                patch.length2 += length;
                postpatch_text.insert(static_cast<size_t>(pos2), diff.text);
                break;
            case Operation::Delete:
                patch.length1 += length;
                patch.diffs.push_back(diff);
                postpatch_text.erase(static_cast<size_t>(pos2), static_cast<size_t>(length));
                break;
            case Operation::Equal:
                if (length <= 2 * margin && !patch.diffs.empty() && !is_last) {
                    // Small equality inside a patch.
                    patch.diffs.push_back(diff);
                    patch.length1 += length;
                    patch.length2 += length;
                }
                if (length >= 2 * margin && !patch.diffs.empty()) {
                    // Time for a new patch.
                    patch_add_context(patch, prepatch_text, settings);
                    PATCHY_DEBUG("patch_make: @@ -{},{} +{},{} @@ ({} ops)\n", patch.start1, patch.length1,
                                 patch.start2, patch.length2, patch.diffs.size());
                    patches.push_back(std::move(patch));
                    patch = Patch{};
                    // Unlike Unidiff, our patch lists have a rolling context.
                    // Update prepatch text & pos to reflect the application of
                    // the just completed patch.
                    prepatch_text = postpatch_text;
                    pos1 = pos2;
                }
                break;
        }

        // Update the current byte count.
        if (diff.op != Operation::Insert) {
            pos1 += length;
        }
        if (diff.op != Operation::Delete) {
            pos2 += length;
        }
    }

    // Pick up the leftover patch if not empty.
    if (!patch.diffs.empty()) {
        patch_add_context(patch, prepatch_text, settings);
        patches.push_back(std::move(patch));
    }

    return patches;
}
