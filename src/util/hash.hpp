#pragma once

#include <cstdint>
#include <string_view>

namespace patchy {

// CRC-32C of a line of text. Used to compare lines before comparing text.
uint32_t
line_checksum(std::string_view text);

}  // namespace patchy
