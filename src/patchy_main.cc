#include "config/config.hpp"
#include "output/patch_render.hpp"
#include "processing/patch.hpp"
#include "processing/patch_apply.hpp"
#include "processing/patch_text.hpp"
#include "util/readlines.hpp"
#include "util/tty.hpp"

#include <getopt.h>

#include <fmt/format.h>

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <type_traits>
#include <vector>

namespace fs = std::filesystem;

namespace patchy {

enum class FileStatus {
    kOk,
    kNullPath,
    kFileDoesNotExist,
    kFileNotReadable,
    kNoPermission,
};

// Exit codes
const int kExitOk = 0;
const int kExitPatchFailed = 1;
const int kExitUsage = 2;

FileStatus
check_file_status(const std::string& path) {
    if (path.empty()) {
        return FileStatus::kNullPath;
    }

    fs::path file_path(path);
    std::error_code ec;

    if (!fs::exists(file_path, ec)) {
        return FileStatus::kFileDoesNotExist;
    }

    if (!(fs::is_regular_file(file_path, ec) || fs::is_fifo(file_path, ec) || fs::is_character_file(file_path, ec))) {
        return FileStatus::kFileNotReadable;
    }

    auto perms = fs::status(file_path, ec).permissions();
    if (((perms & fs::perms::owner_read) == fs::perms::none) &&
        ((perms & fs::perms::group_read) == fs::perms::none) &&
        ((perms & fs::perms::others_read) == fs::perms::none)) {
        return FileStatus::kNoPermission;
    }

    return FileStatus::kOk;
}

std::string
to_string(const FileStatus error_code) {
    switch (error_code) {
        case FileStatus::kOk:
            return "Success";
        case FileStatus::kFileDoesNotExist:
            return "File does not exist";
        case FileStatus::kFileNotReadable:
            return "File is not readable (invalid file)";
        case FileStatus::kNoPermission:
            return "File is not readable (no permission)";
        case FileStatus::kNullPath:
            return "Null path";
    }
    return "Unknown error";
}

bool
load_input(const std::string& path, std::string& contents) {
    auto status = check_file_status(path);
    if (status != FileStatus::kOk) {
        fmt::print(stderr, "error: '{}': {}\n", path, to_string(status));
        return false;
    }
    if (!readfile(path, contents)) {
        fmt::print(stderr, "error: '{}': read failed\n", path);
        return false;
    }
    return true;
}

bool
emit_output(const ProgramOptions& opts, const std::string& text) {
    if (opts.output_file.empty()) {
        fmt::print("{}", text);
        return true;
    }
    if (!writefile(opts.output_file, text)) {
        fmt::print(stderr, "error: '{}': write failed\n", opts.output_file);
        return false;
    }
    return true;
}

bool
load_patches(const std::string& path, Patches& patches) {
    std::string patch_text;
    if (!load_input(path, patch_text)) {
        return false;
    }
    PatchParseResult result;
    if (!patch_from_text(patch_text, result, patches)) {
        fmt::print(stderr, "error: '{}': {}\n", path, result.error);
        return false;
    }
    return true;
}

int
run_make(const ProgramOptions& opts) {
    std::string old_text;
    std::string new_text;
    if (!load_input(opts.files[0], old_text) || !load_input(opts.files[1], new_text)) {
        return kExitUsage;
    }
    const auto patches = patch_make(old_text, new_text, opts.settings);
    if (opts.debug) {
        fmt::print(stderr, "{} patch(es)\n", patches.size());
    }
    return emit_output(opts, patch_to_text(patches)) ? kExitOk : kExitUsage;
}

int
run_apply(const ProgramOptions& opts) {
    Patches patches;
    if (!load_patches(opts.files[0], patches)) {
        return kExitUsage;
    }
    std::string text;
    if (!load_input(opts.files[1], text)) {
        return kExitUsage;
    }

    const auto result = patch_apply(patches, text, opts.settings);

    bool all_applied = true;
    for (size_t i = 0; i < result.applied.size(); i++) {
        const auto patch_text = to_string(patches[i]);
        const auto header = patch_text.substr(0, patch_text.find('\n'));
        fmt::print(stderr, "patch {} {}: {}\n", i + 1, header, result.applied[i] ? "applied" : "FAILED");
        all_applied = all_applied && result.applied[i];
    }

    if (!emit_output(opts, result.text)) {
        return kExitUsage;
    }
    return all_applied ? kExitOk : kExitPatchFailed;
}

int
run_show(const ProgramOptions& opts) {
    Patches patches;
    if (!load_patches(opts.files[0], patches)) {
        return kExitUsage;
    }
    PatchRenderOptions render_options;
    render_options.color = tty_get_capabilities(stdout) != TermColorSupport_None;
    fmt::print("{}", patch_render(patches, render_options));
    return kExitOk;
}

}  // namespace patchy

int
main(int argc, char* argv[]) {
    patchy::ProgramOptions opts;

    auto show_help = [&](const std::string& optional_error_message) {
        std::string help = fmt::format(R"(
Usage: {0} make OLD NEW [-o OUT]         print the patch turning OLD into NEW
       {0} apply PATCH TARGET [-o OUT]   apply PATCH to TARGET
       {0} show PATCH                    pretty print the patches in PATCH

Make, apply and show text patches that survive changes to the patched text.

Options:
    -v, --version                show program version and exit
    -h, --help                   show this help and exit
    -o, --output [file]          write the result to a file instead of stdout

    -m, --margin [bytes]         context kept around every change
    -b, --max-bits [bits]        longest pattern the matcher searches for
    -t, --delete-threshold [f]   how different a large deletion may be (0.0 - 1.0)
    -T, --match-threshold [f]    how fuzzy a match may be (0.0 - 1.0)
    -d, --match-distance [bytes] how far a patch may have drifted
        --timeout [seconds]      time limit for diffing, 0 for none
        --debug                  print extra diagnostics
)",
                                       argv[0]);

        help += "\n";

        help += "Config directory:\n    " + patchy::config_get_directory() + "\n\n";

        if (!optional_error_message.empty()) {
            help += optional_error_message;
            fmt::print(stderr, "{}\n", help);
            return;
        }
        fmt::print("{}\n", help);
    };

    auto parse_number = [&](const char* arg, auto& value) {
        char* end = nullptr;
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_floating_point_v<T>) {
            value = strtod(arg, &end);
        } else {
            value = strtoll(arg, &end, 10);
        }
        return end != arg && *end == '\0';
    };

    auto parse_args = [&](int in_argc, char* in_argv[]) {
        static struct option long_options[] = {{"help", no_argument, 0, 'h'},
                                               {"version", no_argument, 0, 'v'},
                                               {"output", required_argument, 0, 'o'},
                                               {"margin", required_argument, 0, 'm'},
                                               {"max-bits", required_argument, 0, 'b'},
                                               {"delete-threshold", required_argument, 0, 't'},
                                               {"match-threshold", required_argument, 0, 'T'},
                                               {"match-distance", required_argument, 0, 'd'},
                                               {"timeout", required_argument, 0, '1'},
                                               {"debug", no_argument, 0, '2'},
                                               {0, 0, 0, 0}};
        int c = 0, option_index = 0;
        while ((c = getopt_long(in_argc, in_argv, "hvo:m:b:t:T:d:", long_options, &option_index)) >= 0) {
            bool valid = true;
            switch (c) {
                case 'v':
                    fmt::print("version: {}\n", PATCHY_VERSION);
                    exit(0);
                case 'h':
                    opts.help = true;
                    return true;
                case 'o':
                    opts.output_file = optarg;
                    break;
                case 'm':
                    valid = parse_number(optarg, opts.settings.patch_margin);
                    break;
                case 'b':
                    valid = parse_number(optarg, opts.settings.match_max_bits);
                    break;
                case 't':
                    valid = parse_number(optarg, opts.settings.patch_delete_threshold);
                    break;
                case 'T':
                    valid = parse_number(optarg, opts.settings.match_threshold);
                    break;
                case 'd':
                    valid = parse_number(optarg, opts.settings.match_distance);
                    break;
                case '1':
                    valid = parse_number(optarg, opts.settings.diff_timeout);
                    break;
                case '2':
                    opts.debug = true;
                    break;
                case '?':
                    show_help("error: invalid option");
                    return false;
                default:
                    show_help(fmt::format("error: invalid option: -{}", static_cast<char>(c)));
                    return false;
            }
            if (!valid) {
                show_help(fmt::format("error: invalid value for -{} ({})", static_cast<char>(c), optarg));
                return false;
            }
        }

        int positional_count = in_argc - optind;
        if (positional_count < 1) {
            show_help("error: missing command");
            return false;
        }

        opts.command = patchy::command_from_string(in_argv[optind]);
        for (int i = optind + 1; i < in_argc; i++) {
            opts.files.emplace_back(in_argv[i]);
        }

        size_t expected_files = 0;
        switch (opts.command) {
            case patchy::Command::kMake:
            case patchy::Command::kApply:
                expected_files = 2;
                break;
            case patchy::Command::kShow:
                expected_files = 1;
                break;
            case patchy::Command::kInvalid:
                show_help(fmt::format("error: unknown command '{}'", in_argv[optind]));
                return false;
        }
        if (opts.files.size() != expected_files) {
            show_help(fmt::format("error: '{}' takes {} file argument(s)", in_argv[optind], expected_files));
            return false;
        }

        std::string settings_error;
        if (!patchy::settings_validate(opts.settings, settings_error)) {
            show_help(fmt::format("error: {}", settings_error));
            return false;
        }
        return true;
    };

    // Load the global defaults before we override them with command line args
    patchy::config_apply_options(opts);

    if (!parse_args(argc, argv)) {
        return patchy::kExitUsage;
    }

    if (opts.help) {
        show_help("");
        return patchy::kExitOk;
    }

    if (opts.debug) {
        const auto& s = opts.settings;
        fmt::print(stderr, "margin={} max_bits={} delete_threshold={} match_threshold={} distance={} timeout={}\n",
                   s.patch_margin, s.match_max_bits, s.patch_delete_threshold, s.match_threshold, s.match_distance,
                   s.diff_timeout);
    }

    switch (opts.command) {
        case patchy::Command::kMake:
            return patchy::run_make(opts);
        case patchy::Command::kApply:
            return patchy::run_apply(opts);
        case patchy::Command::kShow:
            return patchy::run_show(opts);
        case patchy::Command::kInvalid:
            break;
    }
    return patchy::kExitUsage;
}
