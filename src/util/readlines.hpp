#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace patchy {

// A line of text, terminator included. Lines compare by checksum first
// and fall back to the text so that a crc collision can't fake a match.
struct Line {
    uint32_t line_number;
    uint32_t checksum;

    std::string line;

    uint32_t
    hash() const {
        return checksum;
    }

    bool
    operator<(const Line& other) const {
        return checksum < other.checksum;
    }

    bool
    operator==(const Line& other) const {
        return checksum == other.checksum && line == other.line;
    }

    bool
    operator!=(const Line& other) const {
        return !(*this == other);
    }
};

// Split text after every '\n'. The last line has no terminator if the text
// doesn't end with one. Empty text gives no lines.
void
parselines(const std::string& input_text, std::vector<Line>& lines);

// Read a whole file as bytes.
bool
readfile(const std::string& path, std::string& contents);

bool
writefile(const std::string& path, const std::string& contents);

}  // namespace patchy
