#include "patch_apply.hpp"

#include "processing/diff_engine.hpp"
#include "processing/match.hpp"
#include "util/log.hpp"

#include <algorithm>
#include <cassert>

using namespace patchy;

namespace {

int64_t
length_of(const std::string& s) {
    return static_cast<int64_t>(s.size());
}

std::string
substr(const std::string& s, int64_t pos, int64_t count = -1) {
    const int64_t size = length_of(s);
    pos = std::clamp<int64_t>(pos, 0, size);
    if (count < 0 || pos + count > size) {
        count = size - pos;
    }
    return s.substr(static_cast<size_t>(pos), static_cast<size_t>(count));
}

// Carve one oversized patch into chunks no longer than `patch_size`.
void
split_patch(Patch bigpatch, size_t origin, Patches& out, PatchOrigins& origins, const PatchSettings& settings) {
    const int64_t patch_size = settings.match_max_bits;
    const int64_t margin = settings.patch_margin;

    int64_t start1 = bigpatch.start1;
    int64_t start2 = bigpatch.start2;
    std::string precontext;

    // Index of the first diff of `bigpatch` not yet carved off.
    size_t cursor = 0;
    auto& remaining = bigpatch.diffs;

    while (cursor < remaining.size()) {
        Patch patch;
        bool empty = true;
        const int64_t precontext_length = length_of(precontext);
        patch.start1 = start1 - precontext_length;
        patch.start2 = start2 - precontext_length;
        if (!precontext.empty()) {
            patch.length1 = patch.length2 = precontext_length;
            patch.diffs.push_back({Operation::Equal, precontext});
        }

        while (cursor < remaining.size() && patch.length1 < patch_size - margin) {
            EditOp& diff = remaining[cursor];
            const int64_t diff_length = length_of(diff.text);

            switch (diff.op) {
                case Operation::Insert:
                    // Insertions are harmless.
                    patch.length2 += diff_length;
                    start2 += diff_length;
                    patch.diffs.push_back(std::move(diff));
                    cursor++;
                    empty = false;
                    break;
                case Operation::Delete:
                    if (patch.diffs.size() == 1 && patch.diffs.front().op == Operation::Equal &&
                        diff_length > 2 * patch_size) {
                        // This is a large deletion. Let it pass in one chunk.
                        patch.length1 += diff_length;
                        start1 += diff_length;
                        empty = false;
                        patch.diffs.push_back(std::move(diff));
                        cursor++;
                        break;
                    }
                    [[fallthrough]];
                case Operation::Equal: {
                    // Only take as much as fits.
                    const int64_t budget = patch_size - patch.length1 - margin;
                    std::string taken = substr(diff.text, 0, std::min(diff_length, budget));
                    const int64_t taken_length = length_of(taken);
                    patch.length1 += taken_length;
                    start1 += taken_length;
                    if (diff.op == Operation::Equal) {
                        patch.length2 += taken_length;
                        start2 += taken_length;
                    } else {
                        empty = false;
                    }
                    if (taken_length == diff_length) {
                        cursor++;
                    } else {
                        diff.text.erase(0, static_cast<size_t>(taken_length));
                    }
                    patch.diffs.push_back({diff.op, std::move(taken)});
                    break;
                }
            }
        }

        // Compute the head context for the next patch.
        precontext = edit_ops_new_text(patch.diffs);
        precontext = substr(precontext, length_of(precontext) - margin);

        // Append the end context for this patch.
        EditOps rest(remaining.begin() + static_cast<std::ptrdiff_t>(cursor), remaining.end());
        std::string postcontext = substr(edit_ops_old_text(rest), 0, margin);
        if (!postcontext.empty()) {
            const int64_t postcontext_length = length_of(postcontext);
            patch.length1 += postcontext_length;
            patch.length2 += postcontext_length;
            if (!patch.diffs.empty() && patch.diffs.back().op == Operation::Equal) {
                patch.diffs.back().text += postcontext;
            } else {
                patch.diffs.push_back({Operation::Equal, std::move(postcontext)});
            }
        }

        if (!empty) {
            out.push_back(std::move(patch));
            origins.push_back(origin);
        }
    }
}

}  // namespace

std::string
patchy::patch_add_padding(Patches& patches, const PatchSettings& settings) {
    const int64_t padding_length = settings.patch_margin;
    std::string null_padding;
    for (int64_t x = 1; x <= padding_length; x++) {
        null_padding += static_cast<char>(x);
    }

    // Bump all the patches forward.
    for (auto& patch : patches) {
        patch.start1 += padding_length;
        patch.start2 += padding_length;
    }

    if (patches.empty() || null_padding.empty()) {
        return null_padding;
    }

    // Add some padding on start of first diff.
    Patch& first = patches.front();
    if (first.diffs.empty() || first.diffs.front().op != Operation::Equal) {
        first.diffs.insert(first.diffs.begin(), EditOp{Operation::Equal, null_padding});
        first.start1 -= padding_length;  // Should be 0.
        first.start2 -= padding_length;  // Should be 0.
        first.length1 += padding_length;
        first.length2 += padding_length;
    } else if (padding_length > length_of(first.diffs.front().text)) {
        // Grow first equality.
        EditOp& diff = first.diffs.front();
        const int64_t extra_length = padding_length - length_of(diff.text);
        diff.text = null_padding.substr(diff.text.size()) + diff.text;
        first.start1 -= extra_length;
        first.start2 -= extra_length;
        first.length1 += extra_length;
        first.length2 += extra_length;
    }

    // Add some padding on end of last diff.
    Patch& last = patches.back();
    if (last.diffs.empty() || last.diffs.back().op != Operation::Equal) {
        last.diffs.push_back({Operation::Equal, null_padding});
        last.length1 += padding_length;
        last.length2 += padding_length;
    } else if (padding_length > length_of(last.diffs.back().text)) {
        // Grow last equality.
        EditOp& diff = last.diffs.back();
        const int64_t extra_length = padding_length - length_of(diff.text);
        diff.text += null_padding.substr(0, static_cast<size_t>(extra_length));
        last.length1 += extra_length;
        last.length2 += extra_length;
    }

    return null_padding;
}

void
patchy::patch_split_max(Patches& patches, PatchOrigins& origins, const PatchSettings& settings) {
    Patches out;
    PatchOrigins out_origins;
    out.reserve(patches.size());
    out_origins.reserve(patches.size());

    for (size_t i = 0; i < patches.size(); i++) {
        const size_t origin = i < origins.size() ? origins[i] : i;
        if (patches[i].length1 <= settings.match_max_bits) {
            out.push_back(std::move(patches[i]));
            out_origins.push_back(origin);
            continue;
        }
        PATCHY_DEBUG("split_max: patch {} spans {} bytes\n", origin, patches[i].length1);
        split_patch(std::move(patches[i]), origin, out, out_origins, settings);
    }

    patches = std::move(out);
    origins = std::move(out_origins);
}

void
patchy::patch_split_max(Patches& patches, const PatchSettings& settings) {
    PatchOrigins origins;
    patch_split_max(patches, origins, settings);
}

PatchApplyResult
patchy::patch_apply(const Patches& patches, const std::string& input, const PatchSettings& settings) {
    PatchApplyResult result{input, {}};
    if (patches.empty()) {
        return result;
    }
    result.applied.assign(patches.size(), true);

    const int64_t max_bits = settings.match_max_bits;

    // Work on a copy; the caller's patches stay untouched.
    Patches working = patches;
    const std::string null_padding = patch_add_padding(working, settings);
    std::string text = null_padding + input + null_padding;

    PatchOrigins origins;
    patch_split_max(working, origins, settings);
    assert(origins.size() == working.size());

    // delta keeps track of the offset between the expected and actual
    // location of the previous patch. If there are patches expected at
    // positions 10 and 20, but the first patch was found at 12, delta is 2
    // and the second patch has an effective expected position of 22.
    int64_t delta = 0;
    for (size_t x = 0; x < working.size(); x++) {
        const Patch& patch = working[x];
        const int64_t expected_loc = patch.start2 + delta;
        const std::string text1 = edit_ops_old_text(patch.diffs);
        const int64_t text1_length = length_of(text1);

        int64_t start_loc;
        int64_t end_loc = kNotFound;
        if (text1_length > max_bits) {
            // The splitter only leaves an oversized pattern behind for a
            // monster delete.
            start_loc = match_main(text, substr(text1, 0, max_bits), expected_loc, settings);
            if (start_loc != kNotFound) {
                end_loc = match_main(text, substr(text1, text1_length - max_bits), expected_loc + text1_length - max_bits,
                                     settings);
                if (end_loc == kNotFound || start_loc >= end_loc) {
                    // Can't find valid trailing context. Drop this patch.
                    start_loc = kNotFound;
                }
            }
        } else {
            start_loc = match_main(text, text1, expected_loc, settings);
        }

        bool applied = false;
        if (start_loc == kNotFound) {
            // Subtract the delta for this failed patch from subsequent patches.
            delta -= patch.length2 - patch.length1;
            PATCHY_DEBUG("apply: patch {} not found near {}\n", x, expected_loc);
        } else {
            delta = start_loc - expected_loc;
            std::string text2;
            if (end_loc == kNotFound) {
                text2 = substr(text, start_loc, text1_length);
            } else {
                text2 = substr(text, start_loc, end_loc + max_bits - start_loc);
            }

            if (text1 == text2) {
                // Perfect match, just shove the replacement text in.
                text = substr(text, 0, start_loc) + edit_ops_new_text(patch.diffs) + substr(text, start_loc + text1_length);
                applied = true;
            } else {
                // Imperfect match. Run a diff to get a framework of
                // equivalent indices.
                EditOps diffs = diff_main(text1, text2, false, settings);
                const double divergence =
                    static_cast<double>(edit_ops_levenshtein(diffs)) / static_cast<double>(text1_length);
                if (text1_length > max_bits && divergence > settings.patch_delete_threshold) {
                    // The end points match, but the content is unacceptably bad.
                    PATCHY_DEBUG("apply: patch {} diverges by {:.2f}\n", x, divergence);
                } else {
                    diff_cleanup_semantic_lossless(diffs);
                    int64_t index1 = 0;
                    for (const auto& diff : patch.diffs) {
                        switch (diff.op) {
                            case Operation::Insert: {
                                const int64_t index2 = edit_ops_translate_index(diffs, index1);
                                const int64_t at = std::clamp<int64_t>(start_loc + index2, 0, length_of(text));
                                text.insert(static_cast<size_t>(at), diff.text);
                                break;
                            }
                            case Operation::Delete: {
                                const int64_t index2 = edit_ops_translate_index(diffs, index1);
                                const int64_t from = std::clamp<int64_t>(start_loc + index2, 0, length_of(text));
                                const int64_t to = std::clamp<int64_t>(
                                    start_loc + edit_ops_translate_index(diffs, index1 + length_of(diff.text)), from,
                                    length_of(text));
                                text.erase(static_cast<size_t>(from), static_cast<size_t>(to - from));
                                break;
                            }
                            case Operation::Equal:
                                break;
                        }
                        if (diff.op != Operation::Delete) {
                            index1 += length_of(diff.text);
                        }
                    }
                    applied = true;
                }
            }
        }

        if (!applied) {
            result.applied[origins[x]] = false;
        }
    }

    // Strip the padding off.
    result.text = substr(text, length_of(null_padding), length_of(text) - 2 * length_of(null_padding));
    return result;
}
