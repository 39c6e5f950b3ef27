#pragma once

/*
    Percent-encoding for patch bodies.

    Bytes in A-Z, a-z, 0-9 and " !#$&'()*+,-./:;=?@_~" pass through
    untouched; everything else becomes %XX with uppercase hex digits. This is
    encodeURI() with the reserved characters left readable and spaces kept
    literal, which is what every diff-match-patch port writes.
*/

#include <string>

namespace patchy {

std::string
uri_escape(const std::string& text);

// Decode %XX escapes. A literal '+' is kept as '+'. Returns false on a
// truncated or non-hex escape; `out` is unspecified in that case.
bool
uri_unescape(const std::string& text, std::string& out);

}  // namespace patchy
