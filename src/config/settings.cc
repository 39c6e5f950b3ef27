#include "settings.hpp"

#include <fmt/format.h>

bool
patchy::settings_validate(const PatchSettings& settings, std::string& error) {
    if (settings.patch_margin < 0) {
        error = fmt::format("patch margin must not be negative ({})", settings.patch_margin);
        return false;
    }
    if (settings.match_max_bits > 64 || settings.match_max_bits <= 2 * settings.patch_margin) {
        error = fmt::format("match max bits must be in [{}, 64] ({})", 2 * settings.patch_margin + 1,
                            settings.match_max_bits);
        return false;
    }
    if (settings.patch_delete_threshold < 0.0 || settings.patch_delete_threshold > 1.0) {
        error = fmt::format("patch delete threshold must be in [0, 1] ({})", settings.patch_delete_threshold);
        return false;
    }
    if (settings.match_threshold < 0.0 || settings.match_threshold > 1.0) {
        error = fmt::format("match threshold must be in [0, 1] ({})", settings.match_threshold);
        return false;
    }
    if (settings.match_distance < 0) {
        error = fmt::format("match distance must not be negative ({})", settings.match_distance);
        return false;
    }
    if (settings.diff_edit_cost < 0) {
        error = fmt::format("diff edit cost must not be negative ({})", settings.diff_edit_cost);
        return false;
    }
    error.clear();
    return true;
}
