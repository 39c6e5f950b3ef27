#pragma once

#include <cstdint>
#include <cstdio>

namespace patchy {

const uint16_t TermColorSupport_None      = 0;
const uint16_t TermColorSupport_Ansi4bit  = 1;  // 16 color palette
const uint16_t TermColorSupport_Ansi8bit  = 2;  // 256 color palette
const uint16_t TermColorSupport_Ansi24bit = 4;  // 24 bit true color

// Color support of the terminal behind `stream`. Nothing when the stream
// isn't a terminal or NO_COLOR is set.
uint16_t
tty_get_capabilities(FILE* stream);

}  // namespace patchy
