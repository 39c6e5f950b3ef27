#include "patch_render.hpp"

#include "processing/patch_text.hpp"

#include <fmt/color.h>
#include <fmt/format.h>

#include <vector>

using namespace patchy;

namespace {

std::string
escape_control(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        const auto uc = static_cast<unsigned char>(c);
        if (c == '\n') {
            out += "\\n";
        } else if (c == '\t') {
            out += c;
        } else if (uc < 0x20 || uc == 0x7f) {
            out += fmt::format("\\x{:02x}", uc);
        } else {
            out += c;
        }
    }
    return out;
}

// Break after every '\n' so that each piece ends up on its own output line.
std::vector<std::string>
split_after_newlines(const std::string& text) {
    std::vector<std::string> pieces;
    size_t start = 0;
    while (start < text.size()) {
        auto end = text.find('\n', start);
        end = end == std::string::npos ? text.size() : end + 1;
        pieces.push_back(text.substr(start, end - start));
        start = end;
    }
    return pieces;
}

std::string
stylize(const std::string& text, fmt::text_style style, bool color) {
    if (!color) {
        return text;
    }
    return fmt::format(style, "{}", text);
}

}  // namespace

std::string
patchy::patch_render(const Patches& patches, const PatchRenderOptions& options) {
    std::string out;
    for (const auto& patch : patches) {
        const auto text = to_string(patch);
        const auto header = text.substr(0, text.find('\n'));
        out += stylize(header, fmt::fg(fmt::terminal_color::cyan) | fmt::emphasis::bold, options.color);
        out += '\n';

        for (const auto& diff : patch.diffs) {
            char prefix = ' ';
            fmt::text_style style;
            switch (diff.op) {
                case Operation::Insert:
                    prefix = '+';
                    style = fmt::fg(fmt::terminal_color::green);
                    break;
                case Operation::Delete:
                    prefix = '-';
                    style = fmt::fg(fmt::terminal_color::red);
                    break;
                case Operation::Equal:
                    break;
            }
            for (const auto& piece : split_after_newlines(diff.text)) {
                const auto line = fmt::format("{}{}", prefix, escape_control(piece));
                out += diff.op == Operation::Equal ? line : stylize(line, style, options.color);
                out += '\n';
            }
        }
    }
    return out;
}
