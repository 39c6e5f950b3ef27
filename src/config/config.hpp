#pragma once

#include "config/config_file.hpp"
#include "config/settings.hpp"

#include <string>
#include <vector>

namespace patchy {

enum class Command { kInvalid, kMake, kApply, kShow };

Command
command_from_string(const std::string& s);

struct ProgramOptions {
    bool debug = false;
    bool help = false;

    Command command = Command::kInvalid;
    std::vector<std::string> files;

    // Where `apply` writes the patched text. Empty means stdout.
    std::string output_file;

    PatchSettings settings;
};

enum class ConfigLoadResult {
    Ok,
    Invalid,
    DoesNotExist,
};

std::string
config_get_directory();

ConfigLoadResult
config_load_file(const std::string& config_path, ConfigTable& config_table, ConfigParseResult& load_result);

// Copy the values found in `config` into `program_options`. Options the
// table doesn't mention are added to it with their current value.
void
config_apply_table(ConfigTable& config, ProgramOptions& program_options);

// Load patchy.conf from the config directory, creating it with defaults
// when it doesn't exist.
void
config_apply_options(ProgramOptions& program_options);

}  // namespace patchy
