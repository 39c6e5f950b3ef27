#include "diff_engine.hpp"

#include "algorithms/myers_linear.hpp"
#include "util/log.hpp"
#include "util/readlines.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>

using namespace patchy;

namespace {

// Texts shorter than this are always compared byte by byte.
const std::size_t kLineModeMinLength = 100;

EditOps
diff_main_until(const std::string& text1, const std::string& text2, bool check_lines, const Deadline& deadline);

// Append a unit of text to `ops`, growing the last run if it has the same kind.
void
append_run(EditOps& ops, Operation op, const std::string& text) {
    if (!ops.empty() && ops.back().op == op) {
        ops.back().text += text;
    } else {
        ops.push_back({op, text});
    }
}

Operation
to_operation(EditType type) {
    switch (type) {
        case EditType::Insert:
            return Operation::Insert;
        case EditType::Delete:
            return Operation::Delete;
        case EditType::Common:
            return Operation::Equal;
    }
    return Operation::Equal;
}

// Byte level diff of two texts that have no common prefix or suffix.
EditOps
diff_bytes(const std::string& text1, const std::string& text2, const Deadline& deadline) {
    DiffInput<char> diff_input{gsl::span<const char>(text1.data(), text1.size()),
                               gsl::span<const char>(text2.data(), text2.size()), deadline};

    DiffResult result = MyersLinear<char>(diff_input).compute();
    if (result.status == DiffResultStatus::Failed || result.status == DiffResultStatus::TimedOut) {
        PATCHY_DEBUG("diff: giving up on {} x {} bytes\n", text1.size(), text2.size());
        return {{Operation::Delete, text1}, {Operation::Insert, text2}};
    }

    EditOps ops;
    for (const auto& run : result.runs) {
        const auto& source = run.type == EditType::Insert ? text2 : text1;
        const auto begin = run.type == EditType::Insert ? run.b_begin : run.a_begin;
        ops.push_back({to_operation(run.type),
                       source.substr(static_cast<size_t>(begin), static_cast<size_t>(run.length))});
    }
    return ops;
}

// Compare the texts line by line, then re-diff each block of replaced lines.
EditOps
diff_line_mode(const std::string& text1, const std::string& text2, const Deadline& deadline) {
    std::vector<Line> lines1;
    std::vector<Line> lines2;
    parselines(text1, lines1);
    parselines(text2, lines2);

    DiffInput<Line> diff_input{gsl::span<const Line>(lines1.data(), lines1.size()),
                               gsl::span<const Line>(lines2.data(), lines2.size()), deadline};

    DiffResult result = MyersLinear<Line>(diff_input).compute();
    if (result.status == DiffResultStatus::Failed || result.status == DiffResultStatus::TimedOut) {
        return {{Operation::Delete, text1}, {Operation::Insert, text2}};
    }

    EditOps line_ops;
    for (const auto& run : result.runs) {
        const auto& lines = run.type == EditType::Insert ? lines2 : lines1;
        const auto begin = run.type == EditType::Insert ? run.b_begin : run.a_begin;
        for (int64_t i = begin; i < begin + run.length; i++) {
            append_run(line_ops, to_operation(run.type), lines[static_cast<size_t>(i)].line);
        }
    }

    // Eliminate freak matches (e.g. blank lines).
    diff_cleanup_merge(line_ops);
    diff_cleanup_semantic(line_ops);

    // Re-diff any replacement blocks, this time byte by byte.
    EditOps ops;
    std::string text_delete;
    std::string text_insert;
    auto flush = [&]() {
        if (!text_delete.empty() && !text_insert.empty()) {
            for (auto& e : diff_main_until(text_delete, text_insert, false, deadline)) {
                ops.push_back(std::move(e));
            }
        } else if (!text_delete.empty()) {
            ops.push_back({Operation::Delete, text_delete});
        } else if (!text_insert.empty()) {
            ops.push_back({Operation::Insert, text_insert});
        }
        text_delete.clear();
        text_insert.clear();
    };

    for (auto& e : line_ops) {
        switch (e.op) {
            case Operation::Insert:
                text_insert += e.text;
                break;
            case Operation::Delete:
                text_delete += e.text;
                break;
            case Operation::Equal:
                flush();
                ops.push_back(std::move(e));
                break;
        }
    }
    flush();

    return ops;
}

// Diff two texts which have no common prefix or suffix.
EditOps
diff_compute(const std::string& text1, const std::string& text2, bool check_lines, const Deadline& deadline) {
    if (text1.empty()) {
        // Just add some text (speedup).
        return {{Operation::Insert, text2}};
    }

    if (text2.empty()) {
        // Just delete some text (speedup).
        return {{Operation::Delete, text1}};
    }

    const bool text1_longer = text1.size() > text2.size();
    const std::string& long_text = text1_longer ? text1 : text2;
    const std::string& short_text = text1_longer ? text2 : text1;

    auto i = long_text.find(short_text);
    if (i != std::string::npos) {
        // Shorter text is inside the longer text (speedup).
        const Operation op = text1_longer ? Operation::Delete : Operation::Insert;
        return {{op, long_text.substr(0, i)},
                {Operation::Equal, short_text},
                {op, long_text.substr(i + short_text.size())}};
    }

    if (short_text.size() == 1) {
        // Single byte string. After the previous speedup, the byte can't be
        // an equality.
        return {{Operation::Delete, text1}, {Operation::Insert, text2}};
    }

    if (check_lines && text1.size() > kLineModeMinLength && text2.size() > kLineModeMinLength) {
        return diff_line_mode(text1, text2, deadline);
    }

    return diff_bytes(text1, text2, deadline);
}

EditOps
diff_main_until(const std::string& text1, const std::string& text2, bool check_lines, const Deadline& deadline) {
    // Check for equality (speedup).
    if (text1 == text2) {
        if (text1.empty()) {
            return {};
        }
        return {{Operation::Equal, text1}};
    }

    // Trim off common prefix (speedup).
    auto prefix_length = static_cast<size_t>(diff_common_prefix(text1, text2));
    const std::string common_prefix = text1.substr(0, prefix_length);
    std::string a = text1.substr(prefix_length);
    std::string b = text2.substr(prefix_length);

    // Trim off common suffix (speedup).
    auto suffix_length = static_cast<size_t>(diff_common_suffix(a, b));
    const std::string common_suffix = a.substr(a.size() - suffix_length);
    a.resize(a.size() - suffix_length);
    b.resize(b.size() - suffix_length);

    EditOps ops;
    if (!common_prefix.empty()) {
        ops.push_back({Operation::Equal, common_prefix});
    }
    for (auto& e : diff_compute(a, b, check_lines, deadline)) {
        ops.push_back(std::move(e));
    }
    if (!common_suffix.empty()) {
        ops.push_back({Operation::Equal, common_suffix});
    }

    diff_cleanup_merge(ops);
    return ops;
}

// Given two strings, compute a score representing whether the internal
// boundary falls on logical boundaries. Scores range from 6 (best) to 0
// (worst).
int
cleanup_semantic_score(const std::string& one, const std::string& two) {
    if (one.empty() || two.empty()) {
        // Edges are the best.
        return 6;
    }

    const auto char1 = static_cast<unsigned char>(one.back());
    const auto char2 = static_cast<unsigned char>(two.front());
    const bool non_alpha_numeric1 = !std::isalnum(char1);
    const bool non_alpha_numeric2 = !std::isalnum(char2);
    const bool whitespace1 = non_alpha_numeric1 && std::isspace(char1);
    const bool whitespace2 = non_alpha_numeric2 && std::isspace(char2);
    const bool line_break1 = whitespace1 && (char1 == '\r' || char1 == '\n');
    const bool line_break2 = whitespace2 && (char2 == '\r' || char2 == '\n');

    auto ends_with = [](const std::string& s, const char* suffix) {
        std::string tail{suffix};
        return s.size() >= tail.size() && s.compare(s.size() - tail.size(), tail.size(), tail) == 0;
    };
    auto starts_with = [](const std::string& s, const char* prefix) { return s.rfind(prefix, 0) == 0; };

    const bool blank_line1 = line_break1 && (ends_with(one, "\n\n") || ends_with(one, "\n\r\n"));
    const bool blank_line2 = line_break2 && (starts_with(two, "\n\n") || starts_with(two, "\n\r\n") ||
                                             starts_with(two, "\r\n\n") || starts_with(two, "\r\n\r\n"));

    if (blank_line1 || blank_line2) {
        // Five points for blank lines.
        return 5;
    } else if (line_break1 || line_break2) {
        // Four points for line breaks.
        return 4;
    } else if (non_alpha_numeric1 && !whitespace1 && whitespace2) {
        // Three points for end of sentences.
        return 3;
    } else if (whitespace1 || whitespace2) {
        // Two points for whitespace.
        return 2;
    } else if (non_alpha_numeric1 || non_alpha_numeric2) {
        // One point for non-alphanumeric.
        return 1;
    }
    return 0;
}

}  // namespace

EditOps
patchy::diff_main(const std::string& text1,
                  const std::string& text2,
                  bool check_lines,
                  const PatchSettings& settings) {
    Deadline deadline;
    if (settings.diff_timeout > 0) {
        deadline = Clock::now() + std::chrono::duration_cast<Clock::duration>(
                                      std::chrono::duration<double>(settings.diff_timeout));
    }
    return diff_main_until(text1, text2, check_lines, deadline);
}

int64_t
patchy::diff_common_prefix(const std::string& text1, const std::string& text2) {
    const auto n = std::min(text1.size(), text2.size());
    for (size_t i = 0; i < n; i++) {
        if (text1[i] != text2[i]) {
            return static_cast<int64_t>(i);
        }
    }
    return static_cast<int64_t>(n);
}

int64_t
patchy::diff_common_suffix(const std::string& text1, const std::string& text2) {
    const auto text1_length = text1.size();
    const auto text2_length = text2.size();
    const auto n = std::min(text1_length, text2_length);
    for (size_t i = 1; i <= n; i++) {
        if (text1[text1_length - i] != text2[text2_length - i]) {
            return static_cast<int64_t>(i - 1);
        }
    }
    return static_cast<int64_t>(n);
}

int64_t
patchy::diff_common_overlap(const std::string& text1, const std::string& text2) {
    const auto text1_length = text1.size();
    const auto text2_length = text2.size();
    // Eliminate the null case.
    if (text1_length == 0 || text2_length == 0) {
        return 0;
    }

    // Truncate the longer string.
    std::string a = text1_length > text2_length ? text1.substr(text1_length - text2_length) : text1;
    std::string b = text1_length < text2_length ? text2.substr(0, text1_length) : text2;
    const auto text_length = std::min(text1_length, text2_length);

    // Quick check for the worst case.
    if (a == b) {
        return static_cast<int64_t>(text_length);
    }

    // Start by looking for a single character match and increase length
    // until no match is found.
    size_t best = 0;
    size_t length = 1;
    while (length <= text_length) {
        const std::string pattern = a.substr(text_length - length);
        auto found = b.find(pattern);
        if (found == std::string::npos) {
            return static_cast<int64_t>(best);
        }
        length += found;
        if (length > text_length) {
            break;
        }
        if (found == 0 || a.compare(text_length - length, length, b, 0, length) == 0) {
            best = length;
            length++;
        }
    }
    return static_cast<int64_t>(best);
}

void
patchy::diff_cleanup_merge(EditOps& ops) {
    if (ops.empty()) {
        return;
    }

    // Add a dummy entry at the end.
    ops.push_back({Operation::Equal, ""});

    size_t pointer = 0;
    size_t count_delete = 0;
    size_t count_insert = 0;
    std::string text_delete;
    std::string text_insert;

    while (pointer < ops.size()) {
        switch (ops[pointer].op) {
            case Operation::Insert:
                count_insert++;
                text_insert += ops[pointer].text;
                pointer++;
                break;
            case Operation::Delete:
                count_delete++;
                text_delete += ops[pointer].text;
                pointer++;
                break;
            case Operation::Equal: {
                // Upon reaching an equality, check for prior redundancies.
                if (count_delete + count_insert > 1) {
                    if (count_delete != 0 && count_insert != 0) {
                        // Factor out any common prefixes.
                        auto common_length = static_cast<size_t>(diff_common_prefix(text_insert, text_delete));
                        if (common_length != 0) {
                            const size_t run_start = pointer - count_delete - count_insert;
                            if (run_start > 0 && ops[run_start - 1].op == Operation::Equal) {
                                ops[run_start - 1].text += text_insert.substr(0, common_length);
                            } else {
                                ops.insert(ops.begin(), EditOp{Operation::Equal, text_insert.substr(0, common_length)});
                                pointer++;
                            }
                            text_insert.erase(0, common_length);
                            text_delete.erase(0, common_length);
                        }
                        // Factor out any common suffixes.
                        common_length = static_cast<size_t>(diff_common_suffix(text_insert, text_delete));
                        if (common_length != 0) {
                            ops[pointer].text = text_insert.substr(text_insert.size() - common_length) + ops[pointer].text;
                            text_insert.resize(text_insert.size() - common_length);
                            text_delete.resize(text_delete.size() - common_length);
                        }
                    }

                    // Delete the offending records and add the merged ones.
                    EditOps merged;
                    if (!text_delete.empty()) {
                        merged.push_back({Operation::Delete, text_delete});
                    }
                    if (!text_insert.empty()) {
                        merged.push_back({Operation::Insert, text_insert});
                    }
                    pointer -= count_delete + count_insert;
                    auto first = ops.begin() + static_cast<std::ptrdiff_t>(pointer);
                    ops.erase(first, first + static_cast<std::ptrdiff_t>(count_delete + count_insert));
                    ops.insert(ops.begin() + static_cast<std::ptrdiff_t>(pointer), merged.begin(), merged.end());
                    pointer += merged.size() + 1;
                } else if (pointer != 0 && ops[pointer - 1].op == Operation::Equal) {
                    // Merge this equality with the previous one.
                    ops[pointer - 1].text += ops[pointer].text;
                    ops.erase(ops.begin() + static_cast<std::ptrdiff_t>(pointer));
                } else {
                    pointer++;
                }
                count_insert = 0;
                count_delete = 0;
                text_delete.clear();
                text_insert.clear();
            } break;
        }
    }

    // Remove the dummy entry at the end.
    if (!ops.empty() && ops.back().text.empty()) {
        ops.pop_back();
    }

    // Second pass: look for single edits surrounded on both sides by
    // equalities which can be shifted sideways to eliminate an equality.
    // e.g: A<ins>BA</ins>C -> <ins>AB</ins>AC
    bool changes = false;
    pointer = 1;
    // Intentionally ignore the first and last element (don't need checking).
    while (ops.size() >= 3 && pointer < ops.size() - 1) {
        auto& prev = ops[pointer - 1];
        auto& curr = ops[pointer];
        auto& next = ops[pointer + 1];
        if (prev.op == Operation::Equal && next.op == Operation::Equal) {
            // This is a single edit surrounded by equalities.
            const bool ends_with_prev =
                curr.text.size() >= prev.text.size() &&
                curr.text.compare(curr.text.size() - prev.text.size(), prev.text.size(), prev.text) == 0;
            const bool starts_with_next = curr.text.compare(0, next.text.size(), next.text) == 0;
            if (ends_with_prev && !prev.text.empty()) {
                // Shift the edit over the previous equality.
                curr.text = prev.text + curr.text.substr(0, curr.text.size() - prev.text.size());
                next.text = prev.text + next.text;
                ops.erase(ops.begin() + static_cast<std::ptrdiff_t>(pointer - 1));
                changes = true;
            } else if (!ends_with_prev && starts_with_next) {
                // Shift the edit over the next equality.
                prev.text += next.text;
                curr.text = curr.text.substr(next.text.size()) + next.text;
                ops.erase(ops.begin() + static_cast<std::ptrdiff_t>(pointer + 1));
                changes = true;
            }
        }
        pointer++;
    }

    // If shifts were made, the diff needs reordering and another shift sweep.
    if (changes) {
        diff_cleanup_merge(ops);
    }
}

void
patchy::diff_cleanup_semantic(EditOps& ops) {
    bool changes = false;
    // Stack of indices where equalities are found.
    std::vector<int64_t> equalities;
    // Always equal to ops[equalities.back()].text
    std::string last_equality;
    int64_t pointer = 0;
    // Number of bytes that changed prior to the equality.
    size_t length_insertions1 = 0;
    size_t length_deletions1 = 0;
    // Number of bytes that changed after the equality.
    size_t length_insertions2 = 0;
    size_t length_deletions2 = 0;

    while (pointer < static_cast<int64_t>(ops.size())) {
        auto& e = ops[static_cast<size_t>(pointer)];
        if (e.op == Operation::Equal) {
            equalities.push_back(pointer);
            length_insertions1 = length_insertions2;
            length_deletions1 = length_deletions2;
            length_insertions2 = 0;
            length_deletions2 = 0;
            last_equality = e.text;
        } else {
            if (e.op == Operation::Insert) {
                length_insertions2 += e.text.size();
            } else {
                length_deletions2 += e.text.size();
            }
            // Eliminate an equality that is smaller or equal to the edits on
            // both sides of it.
            if (!last_equality.empty() &&
                last_equality.size() <= std::max(length_insertions1, length_deletions1) &&
                last_equality.size() <= std::max(length_insertions2, length_deletions2)) {
                const auto at = static_cast<size_t>(equalities.back());
                // Duplicate record, and change the second copy to an insert.
                ops.insert(ops.begin() + static_cast<std::ptrdiff_t>(at), EditOp{Operation::Delete, last_equality});
                ops[at + 1].op = Operation::Insert;
                // Throw away the equality we just deleted, and the previous one.
                equalities.pop_back();
                if (!equalities.empty()) {
                    equalities.pop_back();
                }
                pointer = equalities.empty() ? -1 : equalities.back();
                length_insertions1 = 0;
                length_deletions1 = 0;
                length_insertions2 = 0;
                length_deletions2 = 0;
                last_equality.clear();
                changes = true;
            }
        }
        pointer++;
    }

    // Normalize the diff.
    if (changes) {
        diff_cleanup_merge(ops);
    }
    diff_cleanup_semantic_lossless(ops);

    // Find any overlaps between deletions and insertions.
    // e.g: <del>abcxxx</del><ins>xxxdef</ins>
    //   -> <del>abc</del>xxx<ins>def</ins>
    // e.g: <del>xxxabc</del><ins>defxxx</ins>
    //   -> <ins>def</ins>xxx<del>abc</del>
    // Only extract an overlap if it is as big as the edit ahead or behind it.
    size_t index = 1;
    while (index < ops.size()) {
        if (ops[index - 1].op == Operation::Delete && ops[index].op == Operation::Insert) {
            const std::string deletion = ops[index - 1].text;
            const std::string insertion = ops[index].text;
            const auto overlap_length1 = static_cast<size_t>(diff_common_overlap(deletion, insertion));
            const auto overlap_length2 = static_cast<size_t>(diff_common_overlap(insertion, deletion));
            if (overlap_length1 >= overlap_length2) {
                if (overlap_length1 * 2 >= deletion.size() || overlap_length1 * 2 >= insertion.size()) {
                    // Overlap found. Insert an equality and trim the surrounding edits.
                    ops.insert(ops.begin() + static_cast<std::ptrdiff_t>(index),
                               EditOp{Operation::Equal, insertion.substr(0, overlap_length1)});
                    ops[index - 1].text = deletion.substr(0, deletion.size() - overlap_length1);
                    ops[index + 1].text = insertion.substr(overlap_length1);
                    index++;
                }
            } else {
                if (overlap_length2 * 2 >= deletion.size() || overlap_length2 * 2 >= insertion.size()) {
                    // Reverse overlap found. Insert an equality and swap and trim
                    // the surrounding edits.
                    ops.insert(ops.begin() + static_cast<std::ptrdiff_t>(index),
                               EditOp{Operation::Equal, deletion.substr(0, overlap_length2)});
                    ops[index - 1] = {Operation::Insert, insertion.substr(0, insertion.size() - overlap_length2)};
                    ops[index + 1] = {Operation::Delete, deletion.substr(overlap_length2)};
                    index++;
                }
            }
            index++;
        }
        index++;
    }
}

void
patchy::diff_cleanup_semantic_lossless(EditOps& ops) {
    int64_t pointer = 1;
    // Intentionally ignore the first and last element (don't need checking).
    while (pointer < static_cast<int64_t>(ops.size()) - 1) {
        const auto at = static_cast<size_t>(pointer);
        if (ops[at - 1].op == Operation::Equal && ops[at + 1].op == Operation::Equal) {
            // This is a single edit surrounded by equalities.
            std::string equality1 = ops[at - 1].text;
            std::string edit = ops[at].text;
            std::string equality2 = ops[at + 1].text;

            // First, shift the edit as far left as possible.
            const auto common_offset = static_cast<size_t>(diff_common_suffix(equality1, edit));
            if (common_offset > 0) {
                const std::string common_string = edit.substr(edit.size() - common_offset);
                equality1.resize(equality1.size() - common_offset);
                edit = common_string + edit.substr(0, edit.size() - common_offset);
                equality2 = common_string + equality2;
            }

            // Second, step byte by byte right, looking for the best fit.
            std::string best_equality1 = equality1;
            std::string best_edit = edit;
            std::string best_equality2 = equality2;
            int best_score = cleanup_semantic_score(equality1, edit) + cleanup_semantic_score(edit, equality2);
            while (!edit.empty() && !equality2.empty() && edit[0] == equality2[0]) {
                equality1 += edit[0];
                edit = edit.substr(1) + equality2[0];
                equality2.erase(0, 1);
                const int score = cleanup_semantic_score(equality1, edit) + cleanup_semantic_score(edit, equality2);
                // The >= encourages trailing rather than leading whitespace on edits.
                if (score >= best_score) {
                    best_score = score;
                    best_equality1 = equality1;
                    best_edit = edit;
                    best_equality2 = equality2;
                }
            }

            if (ops[at - 1].text != best_equality1) {
                // We have an improvement, save it back to the diff.
                size_t edit_at = at;
                if (!best_equality1.empty()) {
                    ops[edit_at - 1].text = best_equality1;
                } else {
                    ops.erase(ops.begin() + static_cast<std::ptrdiff_t>(edit_at - 1));
                    edit_at--;
                    pointer--;
                }
                ops[edit_at].text = best_edit;
                if (!best_equality2.empty()) {
                    ops[edit_at + 1].text = best_equality2;
                } else {
                    ops.erase(ops.begin() + static_cast<std::ptrdiff_t>(edit_at + 1));
                    pointer--;
                }
                pointer = std::max<int64_t>(pointer, 0);
            }
        }
        pointer++;
    }
}

void
patchy::diff_cleanup_efficiency(EditOps& ops, const PatchSettings& settings) {
    bool changes = false;
    // Stack of indices where equalities are found.
    std::vector<int64_t> equalities;
    // Always equal to ops[equalities.back()].text
    std::string last_equality;
    int64_t pointer = 0;
    // Is there an insertion/deletion operation before the last equality.
    bool pre_ins = false;
    bool pre_del = false;
    // Is there an insertion/deletion operation after the last equality.
    bool post_ins = false;
    bool post_del = false;

    const auto edit_cost = static_cast<size_t>(settings.diff_edit_cost);

    while (pointer < static_cast<int64_t>(ops.size())) {
        auto& e = ops[static_cast<size_t>(pointer)];
        if (e.op == Operation::Equal) {
            if (e.text.size() < edit_cost && (post_ins || post_del)) {
                // Candidate found.
                equalities.push_back(pointer);
                pre_ins = post_ins;
                pre_del = post_del;
                last_equality = e.text;
            } else {
                // Not a candidate, and can never become one.
                equalities.clear();
                last_equality.clear();
            }
            post_ins = false;
            post_del = false;
        } else {
            if (e.op == Operation::Delete) {
                post_del = true;
            } else {
                post_ins = true;
            }

            // Five types to be split:
            // <ins>A</ins><del>B</del>XY<ins>C</ins><del>D</del>
            // <ins>A</ins>X<ins>C</ins><del>D</del>
            // <ins>A</ins><del>B</del>X<ins>C</ins>
            // <ins>A</del>X<ins>C</ins><del>D</del>
            // <ins>A</ins><del>B</del>X<del>C</del>
            const int edits_around = int(pre_ins) + int(pre_del) + int(post_ins) + int(post_del);
            if (!last_equality.empty() && ((pre_ins && pre_del && post_ins && post_del) ||
                                           (last_equality.size() * 2 < edit_cost && edits_around == 3))) {
                const auto at = static_cast<size_t>(equalities.back());
                // Duplicate record, and change the second copy to an insert.
                ops.insert(ops.begin() + static_cast<std::ptrdiff_t>(at), EditOp{Operation::Delete, last_equality});
                ops[at + 1].op = Operation::Insert;
                // Throw away the equality we just deleted.
                equalities.pop_back();
                last_equality.clear();
                if (pre_ins && pre_del) {
                    // No changes made which could affect previous entry, keep going.
                    post_ins = true;
                    post_del = true;
                    equalities.clear();
                } else {
                    if (!equalities.empty()) {
                        // Throw away the previous equality.
                        equalities.pop_back();
                    }
                    pointer = equalities.empty() ? -1 : equalities.back();
                    post_ins = false;
                    post_del = false;
                }
                changes = true;
            }
        }
        pointer++;
    }

    if (changes) {
        diff_cleanup_merge(ops);
    }
}
