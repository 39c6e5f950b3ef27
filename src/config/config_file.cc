#include "config_file.hpp"

#include "util/readlines.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <filesystem>

using namespace patchy;

namespace {

struct LineCursor {
    const std::string& line;
    size_t line_number;
    size_t pos = 0;

    bool
    at_end() const {
        return pos >= line.size();
    }

    char
    peek() const {
        return at_end() ? '\0' : line[pos];
    }

    void
    skip_whitespace() {
        while (!at_end() && (line[pos] == ' ' || line[pos] == '\t' || line[pos] == '\r')) {
            pos++;
        }
    }

    // Only whitespace or a comment remains.
    bool
    at_line_end() {
        skip_whitespace();
        return at_end() || peek() == '#';
    }

    size_t
    column() const {
        return pos + 1;
    }
};

bool
is_key_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-';
}

bool
parse_identifier(LineCursor& cursor, std::string& out) {
    const size_t start = cursor.pos;
    while (!cursor.at_end() && is_key_char(cursor.peek())) {
        cursor.pos++;
    }
    out = cursor.line.substr(start, cursor.pos - start);
    return !out.empty();
}

bool
parse_quoted(LineCursor& cursor, ConfigParseResult& result, std::string& out) {
    const char quote = cursor.peek();
    const size_t start_column = cursor.column();
    cursor.pos++;
    out.clear();
    while (!cursor.at_end()) {
        char c = cursor.line[cursor.pos++];
        if (c == quote) {
            return true;
        }
        if (c == '\\' && quote == '"' && !cursor.at_end()) {
            char escaped = cursor.line[cursor.pos++];
            switch (escaped) {
                case 'n':
                    out += '\n';
                    break;
                case 't':
                    out += '\t';
                    break;
                case '"':
                case '\\':
                    out += escaped;
                    break;
                default:
                    result.set_error(cursor.line_number, cursor.column() - 1,
                                     fmt::format("unknown escape sequence '\\{}'", escaped));
                    return false;
            }
            continue;
        }
        out += c;
    }
    result.set_error(cursor.line_number, start_column, "unterminated string");
    return false;
}

// Classify an unquoted value.
ConfigValue
parse_bare(const std::string& text) {
    if (text == "true") {
        return ConfigValue::Bool(true);
    }
    if (text == "false") {
        return ConfigValue::Bool(false);
    }

    const char* begin = text.c_str();
    char* end = nullptr;

    errno = 0;
    const long long int_value = std::strtoll(begin, &end, 10);
    if (end != begin && *end == '\0' && errno == 0) {
        return ConfigValue::Int(int_value);
    }

    errno = 0;
    const double float_value = std::strtod(begin, &end);
    if (end != begin && *end == '\0' && errno == 0) {
        return ConfigValue::Float(float_value);
    }

    return ConfigValue::String(text);
}

bool
parse_value(LineCursor& cursor, ConfigParseResult& result, ConfigValue& value) {
    cursor.skip_whitespace();
    if (cursor.at_line_end()) {
        result.set_error(cursor.line_number, cursor.column(), "missing value");
        return false;
    }

    if (cursor.peek() == '"' || cursor.peek() == '\'') {
        std::string text;
        if (!parse_quoted(cursor, result, text)) {
            return false;
        }
        if (!cursor.at_line_end()) {
            result.set_error(cursor.line_number, cursor.column(), "unexpected text after string");
            return false;
        }
        value = ConfigValue::String(text);
        return true;
    }

    const size_t start = cursor.pos;
    while (!cursor.at_end() && cursor.peek() != '#') {
        cursor.pos++;
    }
    std::string text = cursor.line.substr(start, cursor.pos - start);
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.pop_back();
    }
    value = parse_bare(text);
    return true;
}

std::string
quote(const std::string& s) {
    std::string out = "\"";
    for (char c : s) {
        switch (c) {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\t':
                out += "\\t";
                break;
            default:
                out += c;
        }
    }
    out += '"';
    return out;
}

std::string
serialize_value(const ConfigValue& value) {
    switch (value.type) {
        case ConfigValueType::Int:
            return fmt::format("{}", value.int_value);
        case ConfigValueType::Float: {
            // Keep a decimal point so the value reads back as a float.
            std::string s = fmt::format("{}", value.float_value);
            if (s.find_first_of(".eEn") == std::string::npos) {
                s += ".0";
            }
            return s;
        }
        case ConfigValueType::Bool:
            return value.bool_value ? "true" : "false";
        case ConfigValueType::String:
            return quote(value.string_value);
    }
    return "";
}

}  // namespace

std::optional<int64_t>
ConfigValue::as_int() const {
    if (type == ConfigValueType::Int) {
        return int_value;
    }
    return std::nullopt;
}

std::optional<double>
ConfigValue::as_float() const {
    if (type == ConfigValueType::Float) {
        return float_value;
    }
    if (type == ConfigValueType::Int) {
        return static_cast<double>(int_value);
    }
    return std::nullopt;
}

std::optional<bool>
ConfigValue::as_bool() const {
    if (type == ConfigValueType::Bool) {
        return bool_value;
    }
    return std::nullopt;
}

std::optional<std::string>
ConfigValue::as_string() const {
    if (type == ConfigValueType::String) {
        return string_value;
    }
    return std::nullopt;
}

void
ConfigParseResult::set_error(size_t line, size_t column, const std::string& error_message) {
    this->kind = ConfigParseErrorKind::Syntax;
    this->error = fmt::format("'{}' at line {} column {}", error_message, line, column);
}

const ConfigValue*
ConfigTable::lookup_value_by_path(const std::string& path) const {
    for (const auto& entry : entries) {
        if (entry.path == path) {
            return &entry.value;
        }
    }
    return nullptr;
}

void
ConfigTable::set_value_at(const std::string& path, const ConfigValue& value) {
    for (auto& entry : entries) {
        if (entry.path == path) {
            entry.value = value;
            return;
        }
    }
    entries.push_back({path, value});
}

bool
patchy::cfg_parse(const std::string& input_data, ConfigParseResult& result, ConfigTable& table) {
    result = ConfigParseResult{};

    std::vector<Line> lines;
    parselines(input_data, lines);

    std::string section;
    for (const auto& input_line : lines) {
        std::string text = input_line.line;
        if (!text.empty() && text.back() == '\n') {
            text.pop_back();
        }

        LineCursor cursor{text, static_cast<size_t>(input_line.line_number)};
        if (cursor.at_line_end()) {
            continue;
        }

        if (cursor.peek() == '[') {
            cursor.pos++;
            cursor.skip_whitespace();
            if (!parse_identifier(cursor, section)) {
                result.set_error(cursor.line_number, cursor.column(), "expected section name");
                return false;
            }
            cursor.skip_whitespace();
            if (cursor.peek() != ']') {
                result.set_error(cursor.line_number, cursor.column(), "expected ']'");
                return false;
            }
            cursor.pos++;
            if (!cursor.at_line_end()) {
                result.set_error(cursor.line_number, cursor.column(), "unexpected text after section header");
                return false;
            }
            continue;
        }

        std::string key;
        if (!parse_identifier(cursor, key)) {
            result.set_error(cursor.line_number, cursor.column(), "expected key");
            return false;
        }
        cursor.skip_whitespace();
        if (cursor.peek() != '=') {
            result.set_error(cursor.line_number, cursor.column(), "expected '='");
            return false;
        }
        cursor.pos++;

        ConfigValue value;
        if (!parse_value(cursor, result, value)) {
            return false;
        }
        table.set_value_at(section.empty() ? key : fmt::format("{}.{}", section, key), value);
    }

    return true;
}

bool
patchy::cfg_load_file(const std::string& path, ConfigParseResult& result, ConfigTable& table) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        result.kind = ConfigParseErrorKind::File;
        result.error = fmt::format("'{}' does not exist", path);
        return false;
    }

    std::string contents;
    if (!readfile(path, contents)) {
        result.kind = ConfigParseErrorKind::File;
        result.error = fmt::format("could not read '{}'", path);
        return false;
    }
    return cfg_parse(contents, result, table);
}

std::string
patchy::cfg_serialize(const ConfigTable& table) {
    std::string out;
    for (const auto& comment : table.header_comments) {
        out += comment;
        if (!comment.empty() && comment.back() != '\n') {
            out += '\n';
        }
    }

    // Sections in the order they first appear.
    std::vector<std::string> sections;
    auto section_of = [](const std::string& path) {
        auto dot = path.find('.');
        return dot == std::string::npos ? std::string{} : path.substr(0, dot);
    };
    for (const auto& entry : table.entries) {
        auto section = section_of(entry.path);
        if (std::find(sections.begin(), sections.end(), section) == sections.end()) {
            sections.push_back(section);
        }
    }
    // Keys without a section must come before any header.
    std::stable_partition(sections.begin(), sections.end(), [](const std::string& s) { return s.empty(); });

    for (const auto& section : sections) {
        if (!section.empty()) {
            if (!out.empty()) {
                out += '\n';
            }
            out += fmt::format("[{}]\n", section);
        }
        for (const auto& entry : table.entries) {
            if (section_of(entry.path) != section) {
                continue;
            }
            const auto key = section.empty() ? entry.path : entry.path.substr(section.size() + 1);
            out += fmt::format("    {} = {}\n", key, serialize_value(entry.value));
        }
    }
    return out;
}

std::string
patchy::repr(ConfigValueType type) {
    switch (type) {
        case ConfigValueType::Int:
            return "Int";
        case ConfigValueType::Float:
            return "Float";
        case ConfigValueType::Bool:
            return "Bool";
        case ConfigValueType::String:
            return "String";
    }
    return "?";
}
