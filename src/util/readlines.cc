#include "readlines.hpp"

#include "util/hash.hpp"

#include <fmt/format.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <string>
#include <vector>

void
patchy::parselines(const std::string& input_text, std::vector<patchy::Line>& lines) {
    lines.clear();

    uint32_t line_number = 1;
    std::string::size_type start = 0;
    while (start < input_text.size()) {
        auto end = input_text.find('\n', start);
        if (end == std::string::npos) {
            end = input_text.size();
        } else {
            end += 1;
        }

        std::string line = input_text.substr(start, end - start);
        uint32_t checksum = line_checksum(line);
        lines.push_back({line_number, checksum, std::move(line)});

        line_number++;
        start = end;
    }
}

bool
patchy::readfile(const std::string& path, std::string& contents) {
    contents.clear();

    FILE* stream = fopen(path.c_str(), "rb");
    if (!stream) {
        fmt::print(stderr, "Failed to open file '{}': {}\n", path, strerror(errno));
        return false;
    }

    char buffer[64 * 1024];
    size_t count = 0;
    while ((count = fread(buffer, 1, sizeof(buffer), stream)) > 0) {
        contents.append(buffer, count);
    }

    bool ok = !ferror(stream);
    if (!ok) {
        fmt::print(stderr, "Failed to read file '{}'\n", path);
    }
    fclose(stream);
    return ok;
}

bool
patchy::writefile(const std::string& path, const std::string& contents) {
    FILE* stream = fopen(path.c_str(), "wb");
    if (!stream) {
        fmt::print(stderr, "Failed to open '{}' for writing: {}\n", path, strerror(errno));
        return false;
    }

    bool ok = fwrite(contents.data(), 1, contents.size(), stream) == contents.size();
    if (fclose(stream) != 0) {
        ok = false;
    }
    if (!ok) {
        fmt::print(stderr, "Failed to write file '{}'\n", path);
    }
    return ok;
}
