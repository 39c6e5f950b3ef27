#pragma once

/*
    Edit operations: runs of text that are kept, inserted or deleted when
    turning an old text into a new one. This is what the diff engine emits
    and what patches are made of.
*/

#include <cstdint>
#include <string>
#include <vector>

namespace patchy {

enum class Operation {
    Equal,
    Insert,
    Delete,
};

struct EditOp {
    Operation op;
    std::string text;

    bool
    operator==(const EditOp& other) const {
        return op == other.op && text == other.text;
    }

    bool
    operator!=(const EditOp& other) const {
        return !(*this == other);
    }
};

using EditOps = std::vector<EditOp>;

// The old text: all Equal and Delete runs.
std::string
edit_ops_old_text(const EditOps& ops);

// The new text: all Equal and Insert runs.
std::string
edit_ops_new_text(const EditOps& ops);

// Number of inserted, deleted or substituted bytes.
int64_t
edit_ops_levenshtein(const EditOps& ops);

// Map a location in the old text to the equivalent location in the new
// text. A location inside a deletion maps to where the deletion happened.
int64_t
edit_ops_translate_index(const EditOps& ops, int64_t loc);

std::string
repr(Operation op);

std::string
repr(const EditOp& op);

std::string
repr(const EditOps& ops);

}  // namespace patchy
