#include "edit_op.hpp"

#include <fmt/format.h>

#include <algorithm>

using namespace patchy;

std::string
patchy::edit_ops_old_text(const EditOps& ops) {
    std::string text;
    for (const auto& e : ops) {
        switch (e.op) {
            case Operation::Equal:
            case Operation::Delete:
                text += e.text;
                break;
            case Operation::Insert:
                break;
        }
    }
    return text;
}

std::string
patchy::edit_ops_new_text(const EditOps& ops) {
    std::string text;
    for (const auto& e : ops) {
        switch (e.op) {
            case Operation::Equal:
            case Operation::Insert:
                text += e.text;
                break;
            case Operation::Delete:
                break;
        }
    }
    return text;
}

int64_t
patchy::edit_ops_levenshtein(const EditOps& ops) {
    int64_t levenshtein = 0;
    int64_t insertions = 0;
    int64_t deletions = 0;
    for (const auto& e : ops) {
        auto length = static_cast<int64_t>(e.text.size());
        switch (e.op) {
            case Operation::Insert:
                insertions += length;
                break;
            case Operation::Delete:
                deletions += length;
                break;
            case Operation::Equal:
                // A deletion and an insertion is one substitution.
                levenshtein += std::max(insertions, deletions);
                insertions = 0;
                deletions = 0;
                break;
        }
    }
    return levenshtein + std::max(insertions, deletions);
}

int64_t
patchy::edit_ops_translate_index(const EditOps& ops, int64_t loc) {
    int64_t chars1 = 0;
    int64_t chars2 = 0;
    int64_t last_chars1 = 0;
    int64_t last_chars2 = 0;

    const EditOp* last = nullptr;
    for (const auto& e : ops) {
        auto length = static_cast<int64_t>(e.text.size());
        switch (e.op) {
            case Operation::Equal:
                chars1 += length;
                chars2 += length;
                break;
            case Operation::Insert:
                chars2 += length;
                break;
            case Operation::Delete:
                chars1 += length;
                break;
        }
        if (chars1 > loc) {
            // Overshot the location.
            last = &e;
            break;
        }
        last_chars1 = chars1;
        last_chars2 = chars2;
    }

    if (last && last->op == Operation::Delete) {
        // The location was deleted.
        return last_chars2;
    }
    // Add the remaining character length.
    return last_chars2 + (loc - last_chars1);
}

std::string
patchy::repr(Operation op) {
    switch (op) {
        case Operation::Equal:
            return "Equal";
        case Operation::Insert:
            return "Insert";
        case Operation::Delete:
            return "Delete";
    }
    return "?";
}

std::string
patchy::repr(const EditOp& op) {
    return fmt::format("{}(\"{}\")", repr(op.op), op.text);
}

std::string
patchy::repr(const EditOps& ops) {
    std::string out = "[";
    for (size_t i = 0; i < ops.size(); i++) {
        if (i != 0) {
            out += ", ";
        }
        out += repr(ops[i]);
    }
    out += "]";
    return out;
}
