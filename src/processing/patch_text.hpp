#pragma once

/*
    The textual patch format.

        @@ -382,8 +481,9 @@
         context
        -deleted
        +inserted

    Header numbers are 1-based starts with a length; a length of one is
    left out and an empty span is written as "start,0" with a 0-based start.
    Body text is percent-encoded so that every op fits on one line.
*/

#include "processing/patch.hpp"

#include <string>
#include <vector>

namespace patchy {

enum class PatchParseErrorKind {
    None,
    Header,
    Body,
    Escape,
};

struct PatchParseResult {
    PatchParseErrorKind kind = PatchParseErrorKind::None;
    std::string error;

    bool
    is_ok() const {
        return kind == PatchParseErrorKind::None;
    }

    void
    set_error(PatchParseErrorKind error_kind, size_t line_number, const std::string& line, std::string message);
};

std::string
to_string(const Patch& patch);

std::string
patch_to_text(const Patches& patches);

// Parse patches written by patch_to_text. On failure `out` is left empty and
// `result` names the offending line.
bool
patch_from_text(const std::string& text, PatchParseResult& result, Patches& out);

std::string
repr(PatchParseErrorKind kind);

}  // namespace patchy
