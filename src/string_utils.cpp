#include "string_utils.hpp"

#include <cctype>

std::string UnicodeToUTF8(int code_point) {
    if (code_point < 0 || code_point > 0x10FFFF || (code_point >= 0xD800 && code_point <= 0xDFFF)) {
        code_point = 0xFFFD;
    }

    std::string out;
    if (code_point < 0x80) {
        out += static_cast<char>(code_point);
    } else if (code_point < 0x800) {
        out += static_cast<char>(0xC0 | (code_point >> 6));
        out += static_cast<char>(0x80 | (code_point & 0x3F));
    } else if (code_point < 0x10000) {
        out += static_cast<char>(0xE0 | (code_point >> 12));
        out += static_cast<char>(0x80 | ((code_point >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (code_point & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (code_point >> 18));
        out += static_cast<char>(0x80 | ((code_point >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((code_point >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (code_point & 0x3F));
    }
    return out;
}

size_t whitespace_length(const std::string& s, size_t pos) {
    if (pos >= s.length()) {
        return 0;
    }
    if (std::isspace(static_cast<unsigned char>(s[pos]))) {
        return 1;
    }
    // U+00A0 is common in extracted pdf text
    if (s.compare(pos, 2, "\xC2\xA0") == 0) {
        return 2;
    }
    return 0;
}

std::string trim_copy(const std::string& s) {
    size_t first = 0;
    size_t last = s.length();
    size_t width;
    while (first < last && (width = whitespace_length(s, first)) > 0) {
        first += width;
    }
    while (last > first) {
        if (std::isspace(static_cast<unsigned char>(s[last - 1]))) {
            --last;
        } else if (last - first >= 2 && whitespace_length(s, last - 2) == 2) {
            last -= 2;
        } else {
            break;
        }
    }
    return s.substr(first, last - first);
}

bool is_blank(const std::string& s) {
    return is_blank(s, 0, s.length());
}

bool is_blank(const std::string& s, size_t begin, size_t end) {
    if (end > s.length()) {
        end = s.length();
    }
    size_t i = begin;
    while (i < end) {
        size_t width = whitespace_length(s, i);
        if (width == 0 || i + width > end) {
            return false;
        }
        i += width;
    }
    return true;
}
