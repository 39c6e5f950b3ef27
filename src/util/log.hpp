#pragma once

// Diagnostics for library internals. Compile with PATCHY_ENABLE_DEBUG=1 to
// get a trace of patch placement on stderr.

#include <fmt/format.h>

#include <cstdio>

#ifndef PATCHY_ENABLE_DEBUG
#define PATCHY_ENABLE_DEBUG 0
#endif

#define PATCHY_DEBUG(...)                     \
    do {                                      \
        if (PATCHY_ENABLE_DEBUG) {            \
            fmt::print(stderr, __VA_ARGS__);  \
        }                                     \
    } while (0)

#define PATCHY_WARN(...)                                   \
    do {                                                   \
        fmt::print(stderr, "warning: {}\n", fmt::format(__VA_ARGS__)); \
    } while (0)
