#include "uri_escape.hpp"

#include <cstring>

namespace {

bool
is_unreserved(unsigned char c) {
    if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9')) {
        return true;
    }
    return c != 0 && std::strchr(" !#$&'()*+,-./:;=?@_~", c) != nullptr;
}

int
hex_value(char c) {
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

}  // namespace

std::string
patchy::uri_escape(const std::string& text) {
    static const char* hex_digits = "0123456789ABCDEF";

    std::string escaped;
    escaped.reserve(text.size());
    for (char ch : text) {
        auto c = static_cast<unsigned char>(ch);
        if (is_unreserved(c)) {
            escaped.push_back(ch);
        } else {
            escaped.push_back('%');
            escaped.push_back(hex_digits[c >> 4]);
            escaped.push_back(hex_digits[c & 0x0f]);
        }
    }
    return escaped;
}

bool
patchy::uri_unescape(const std::string& text, std::string& out) {
    out.clear();
    out.reserve(text.size());
    for (std::string::size_type i = 0; i < text.size(); i++) {
        if (text[i] != '%') {
            out.push_back(text[i]);
            continue;
        }
        if (i + 2 >= text.size()) {
            return false;
        }
        int hi = hex_value(text[i + 1]);
        int lo = hex_value(text[i + 2]);
        if (hi < 0 || lo < 0) {
            return false;
        }
        out.push_back(static_cast<char>((hi << 4) | lo));
        i += 2;
    }
    return true;
}
