#include "patch_text.hpp"

#include "util/uri_escape.hpp"

#include <fmt/format.h>

#include <regex>

using namespace patchy;

namespace {

void
format_range(std::string& out, int64_t start, int64_t length) {
    if (length == 0) {
        out += fmt::format("{},0", start);
    } else if (length == 1) {
        out += fmt::format("{}", start + 1);
    } else {
        out += fmt::format("{},{}", start + 1, length);
    }
}

bool
parse_number(const std::string& digits, int64_t& value) {
    if (digits.empty() || digits.size() > 18) {
        return false;
    }
    value = std::stoll(digits);
    return true;
}

// Decode one "start[,length]" pair from the header.
bool
parse_range(const std::string& start_digits, const std::string& length_digits, int64_t& start, int64_t& length) {
    if (!parse_number(start_digits, start)) {
        return false;
    }
    if (length_digits.empty()) {
        start--;
        length = 1;
    } else if (length_digits == "0") {
        length = 0;
    } else {
        start--;
        if (!parse_number(length_digits, length)) {
            return false;
        }
    }
    return true;
}

}  // namespace

void
PatchParseResult::set_error(PatchParseErrorKind error_kind,
                            size_t line_number,
                            const std::string& line,
                            std::string message) {
    this->kind = error_kind;
    this->error = fmt::format("{} at line {}: '{}'", message, line_number, line);
}

std::string
patchy::to_string(const Patch& patch) {
    std::string out = "@@ -";
    format_range(out, patch.start1, patch.length1);
    out += " +";
    format_range(out, patch.start2, patch.length2);
    out += " @@\n";

    // Escape the body of the patch with %xx notation.
    for (const auto& diff : patch.diffs) {
        switch (diff.op) {
            case Operation::Insert:
                out += '+';
                break;
            case Operation::Delete:
                out += '-';
                break;
            case Operation::Equal:
                out += ' ';
                break;
        }
        out += uri_escape(diff.text);
        out += '\n';
    }
    return out;
}

std::string
patchy::patch_to_text(const Patches& patches) {
    std::string out;
    for (const auto& patch : patches) {
        out += to_string(patch);
    }
    return out;
}

bool
patchy::patch_from_text(const std::string& text, PatchParseResult& result, Patches& out) {
    static const std::regex header_pattern(R"(^@@ -(\d+),?(\d*) \+(\d+),?(\d*) @@$)");

    out.clear();
    result = PatchParseResult{};

    std::vector<std::string> lines;
    std::string::size_type begin = 0;
    while (begin <= text.size()) {
        auto end = text.find('\n', begin);
        if (end == std::string::npos) {
            lines.push_back(text.substr(begin));
            break;
        }
        lines.push_back(text.substr(begin, end - begin));
        begin = end + 1;
    }

    Patches patches;
    size_t pointer = 0;

    auto fail = [&](PatchParseErrorKind kind, const std::string& message) {
        result.set_error(kind, pointer + 1, lines[pointer], message);
        out.clear();
        return false;
    };

    while (pointer < lines.size()) {
        if (lines[pointer].empty()) {
            // Blank line between patches, or the end of the input.
            pointer++;
            continue;
        }

        std::smatch m;
        if (!std::regex_match(lines[pointer], m, header_pattern)) {
            return fail(PatchParseErrorKind::Header, "invalid patch header");
        }

        Patch patch;
        if (!parse_range(m[1].str(), m[2].str(), patch.start1, patch.length1) ||
            !parse_range(m[3].str(), m[4].str(), patch.start2, patch.length2)) {
            return fail(PatchParseErrorKind::Header, "patch header out of range");
        }
        pointer++;

        while (pointer < lines.size()) {
            const std::string& line = lines[pointer];
            if (line.empty()) {
                // Blank line? Whatever.
                pointer++;
                continue;
            }

            const char sign = line[0];
            if (sign == '@') {
                // Start of next patch.
                break;
            }

            Operation op;
            if (sign == '-') {
                op = Operation::Delete;
            } else if (sign == '+') {
                op = Operation::Insert;
            } else if (sign == ' ') {
                op = Operation::Equal;
            } else {
                return fail(PatchParseErrorKind::Body, fmt::format("invalid patch mode '{}'", sign));
            }

            std::string decoded;
            if (!uri_unescape(line.substr(1), decoded)) {
                return fail(PatchParseErrorKind::Escape, "malformed escape sequence");
            }
            patch.diffs.push_back({op, std::move(decoded)});
            pointer++;
        }

        patches.push_back(std::move(patch));
    }

    out = std::move(patches);
    return true;
}

std::string
patchy::repr(PatchParseErrorKind kind) {
    switch (kind) {
        case PatchParseErrorKind::None:
            return "None";
        case PatchParseErrorKind::Header:
            return "Header";
        case PatchParseErrorKind::Body:
            return "Body";
        case PatchParseErrorKind::Escape:
            return "Escape";
    }
    return "?";
}
