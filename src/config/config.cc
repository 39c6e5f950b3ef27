#include "config.hpp"

#include "util/readlines.hpp"

#include <fmt/format.h>
#include <sago/platform_folders.h>

#include <filesystem>
#include <string>
#include <tuple>
#include <vector>

static std::string config_doc_general = R"foo(# General configuration for `patchy`
#
# Configure default options. These can be overridden with command-line arguments.
#
#   patch.margin            bytes of context kept around every change
#   patch.delete_threshold  how different a large deletion may be from the
#                           text it is applied to (0.0 - 1.0)
#   match.max_bits          longest pattern the matcher searches for (<= 64)
#   match.threshold         how fuzzy a match may be (0.0 exact - 1.0 anything)
#   match.distance          how far (in bytes) a patch may have drifted
#   diff.timeout            seconds to spend on a diff, 0 for no limit
#   diff.edit_cost          cost of an edit when tidying up diffs
#   general.debug           print per-patch status when applying
#
)foo";

enum class ConfigVariableType {
    Bool,
    Int,
    Float,
};

std::string
patchy::config_get_directory() {
    return fmt::format("{}/patchy", sago::getConfigHome());
}

patchy::Command
patchy::command_from_string(const std::string& s) {
    if (s == "make" || s == "m")
        return Command::kMake;
    else if (s == "apply" || s == "a")
        return Command::kApply;
    else if (s == "show" || s == "s")
        return Command::kShow;
    return Command::kInvalid;
}

patchy::ConfigLoadResult
patchy::config_load_file(const std::string& config_path,
                         ConfigTable& config_table,
                         ConfigParseResult& load_result) {
    if (cfg_load_file(config_path, load_result, config_table)) {
        return ConfigLoadResult::Ok;
    }
    if (load_result.kind == ConfigParseErrorKind::File) {
        return ConfigLoadResult::DoesNotExist;
    }
    return ConfigLoadResult::Invalid;
}

static void
config_save(const std::string& config_root, const std::string& config_name, const patchy::ConfigTable& config) {
    std::error_code ec;
    std::filesystem::create_directories(config_root, ec);
    if (ec) {
        fmt::print(stderr, "Failed to create '{}': {}\n", config_root, ec.message());
        return;
    }
    if (!patchy::writefile(config_name, patchy::cfg_serialize(config))) {
        fmt::print(stderr, "warning: continuing with built in defaults\n");
    }
}

using OptionVector = std::vector<std::tuple<std::string, ConfigVariableType, void*>>;

static void
config_sync_options(patchy::ConfigTable& config, const OptionVector& options) {
    for (const auto& [path, type, ptr] : options) {
        // Do we have a value for this option in the config we loaded?
        if (auto stored_value = config.lookup_value_by_path(path); stored_value) {
            // Yes. So we take the value and write it into our settings struct.
            bool ok = false;
            switch (type) {
                case ConfigVariableType::Bool: {
                    if (auto v = stored_value->as_bool()) {
                        *((bool*) ptr) = *v;
                        ok = true;
                    }
                } break;
                case ConfigVariableType::Int: {
                    if (auto v = stored_value->as_int()) {
                        *((int64_t*) ptr) = *v;
                        ok = true;
                    }
                } break;
                case ConfigVariableType::Float: {
                    if (auto v = stored_value->as_float()) {
                        *((double*) ptr) = *v;
                        ok = true;
                    }
                } break;
            }
            if (!ok) {
                fmt::print(stderr, "warning: ignoring '{}', unexpected {} value\n", path,
                           patchy::repr(stored_value->type));
            }
        } else {
            // No such setting in the stored file, so we store the default value
            // from the struct.
            switch (type) {
                case ConfigVariableType::Bool: {
                    config.set_value_at(path, patchy::ConfigValue::Bool(*(bool*) ptr));
                } break;
                case ConfigVariableType::Int: {
                    config.set_value_at(path, patchy::ConfigValue::Int(*(int64_t*) ptr));
                } break;
                case ConfigVariableType::Float: {
                    config.set_value_at(path, patchy::ConfigValue::Float(*(double*) ptr));
                } break;
            }
        }
    }
}

void
patchy::config_apply_table(ConfigTable& config, ProgramOptions& program_options) {
    PatchSettings& settings = program_options.settings;

    // clang-format off
    const OptionVector options = {
        { "patch.margin",           ConfigVariableType::Int,   &settings.patch_margin },
        { "patch.delete_threshold", ConfigVariableType::Float, &settings.patch_delete_threshold },
        { "match.max_bits",         ConfigVariableType::Int,   &settings.match_max_bits },
        { "match.threshold",        ConfigVariableType::Float, &settings.match_threshold },
        { "match.distance",         ConfigVariableType::Int,   &settings.match_distance },
        { "diff.timeout",           ConfigVariableType::Float, &settings.diff_timeout },
        { "diff.edit_cost",         ConfigVariableType::Int,   &settings.diff_edit_cost },
        { "general.debug",          ConfigVariableType::Bool,  &program_options.debug },
    };
    // clang-format on

    config_sync_options(config, options);
}

void
patchy::config_apply_options(ProgramOptions& program_options) {
    const std::string config_file_name = "patchy.conf";
    const std::string config_root = patchy::config_get_directory();
    const std::string config_path = fmt::format("{}/{}", config_root, config_file_name);

    bool flush_config_to_disk = false;

    ConfigParseResult config_parse_result;
    ConfigTable config_table;
    switch (config_load_file(config_path, config_table, config_parse_result)) {
        case ConfigLoadResult::Ok: {
            // yay!
        } break;
        case ConfigLoadResult::Invalid: {
            fmt::print(stderr, "error: {}\n\twhile parsing: {}\n", config_parse_result.error, config_path);
            // Stick with the built in defaults.
            return;
        } break;
        case ConfigLoadResult::DoesNotExist: {
            fmt::print(stderr, "warning: could not find default config. creating file:\n\t{}\n", config_path);
            flush_config_to_disk = true;
        } break;
    };

    config_apply_table(config_table, program_options);

    // Write the configuration to disk with default settings
    if (flush_config_to_disk) {
        config_table.header_comments.push_back(config_doc_general);
        config_save(config_root, config_path, config_table);
    }
}
