#pragma once

/*
    Configuration file format

    A small INI dialect:

        # comment
        [section]
            key = value    # trailing comment

    Values are integers, floats, booleans (true/false) or strings. Strings
    can be quoted with ' or ", double quoted strings understand the escapes
    \" \\ \n and \t. An unquoted value that is neither a number nor a
    boolean is taken as a string.

    Keys are addressed by their dotted path, "section.key". Keys given
    before the first section header have no section prefix.
*/

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace patchy {

enum class ConfigValueType {
    Int,
    Float,
    Bool,
    String,
};

struct ConfigValue {
    ConfigValueType type = ConfigValueType::String;
    int64_t int_value = 0;
    double float_value = 0.0;
    bool bool_value = false;
    std::string string_value;

    static ConfigValue
    Int(int64_t value) {
        ConfigValue v;
        v.type = ConfigValueType::Int;
        v.int_value = value;
        return v;
    }

    static ConfigValue
    Float(double value) {
        ConfigValue v;
        v.type = ConfigValueType::Float;
        v.float_value = value;
        return v;
    }

    static ConfigValue
    Bool(bool value) {
        ConfigValue v;
        v.type = ConfigValueType::Bool;
        v.bool_value = value;
        return v;
    }

    static ConfigValue
    String(const std::string& value) {
        ConfigValue v;
        v.type = ConfigValueType::String;
        v.string_value = value;
        return v;
    }

    std::optional<int64_t>
    as_int() const;

    // Integers are accepted where a float is expected.
    std::optional<double>
    as_float() const;

    std::optional<bool>
    as_bool() const;

    std::optional<std::string>
    as_string() const;
};

enum class ConfigParseErrorKind {
    None,
    File,
    Syntax,
};

struct ConfigParseResult {
    ConfigParseErrorKind kind = ConfigParseErrorKind::None;
    std::string error;

    bool
    is_ok() const {
        return kind == ConfigParseErrorKind::None;
    }

    void
    set_error(size_t line, size_t column, const std::string& error_message);
};

struct ConfigEntry {
    std::string path;
    ConfigValue value;
};

struct ConfigTable {
    // In the order they were read or set.
    std::vector<ConfigEntry> entries;

    // Written at the top of the file when serialized.
    std::vector<std::string> header_comments;

    const ConfigValue*
    lookup_value_by_path(const std::string& path) const;

    void
    set_value_at(const std::string& path, const ConfigValue& value);
};

bool
cfg_parse(const std::string& input_data, ConfigParseResult& result, ConfigTable& table);

bool
cfg_load_file(const std::string& path, ConfigParseResult& result, ConfigTable& table);

std::string
cfg_serialize(const ConfigTable& table);

std::string
repr(ConfigValueType type);

}  // namespace patchy
