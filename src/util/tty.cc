#include "tty.hpp"

#include <cstdlib>
#include <string>

#ifdef PATCHY_PLATFORM_POSIX
#include <unistd.h>
#endif

using namespace patchy;

uint16_t
patchy::tty_get_capabilities(FILE* stream) {
#ifdef PATCHY_PLATFORM_POSIX
    // If we're not outputting to a terminal, we don't output any colors.
    // NOTE: This will prevent colored output when piping to less or when
    //       redirecting to files.
    if (stream == nullptr || isatty(fileno(stream)) == 0) {
        return TermColorSupport_None;
    }

    // https://no-color.org
    if (getenv("NO_COLOR") != nullptr) {
        return TermColorSupport_None;
    }

    const char* term_var = getenv("TERM");
    const std::string term = term_var != nullptr ? term_var : "";
    if (term.empty() || term == "dumb") {
        return TermColorSupport_None;
    }

    uint16_t capabilities = TermColorSupport_Ansi4bit;

    // The COLORTERM variable is usually available to indicate 24bit color support.
    const char* colorterm_var = getenv("COLORTERM");
    if (colorterm_var != nullptr) {
        const std::string colorterm(colorterm_var);
        if (colorterm == "24bit" || colorterm == "truecolor") {
            capabilities |= TermColorSupport_Ansi8bit | TermColorSupport_Ansi24bit;
        }
    }

    if (term.find("256color") != std::string::npos) {
        capabilities |= TermColorSupport_Ansi8bit;
    }
    return capabilities;
#else
    (void) stream;
    return TermColorSupport_None;
#endif
}
