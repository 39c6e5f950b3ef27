#include "util/hash.hpp"

#include <crc32c/crc32c.h>

uint32_t
patchy::line_checksum(std::string_view text) {
    return crc32c::Crc32c(text.data(), text.size());
}
