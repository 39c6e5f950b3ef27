#pragma once

#include "processing/patch.hpp"

#include <string>

namespace patchy {

struct PatchRenderOptions {
    bool color = false;
};

// Human readable rendering of patches: the header of every patch followed
// by its operations, one output line per line of operation text. Line
// breaks inside the text are shown as "\n", other control bytes as "\xNN".
std::string
patch_render(const Patches& patches, const PatchRenderOptions& options);

}  // namespace patchy
