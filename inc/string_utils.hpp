#pragma once

#include <string>

// encode one unicode code point as utf-8, invalid code points become U+FFFD
std::string UnicodeToUTF8(int code_point);

// byte length of the whitespace character at s[pos]: ascii whitespace or a utf-8 no-break space, 0 otherwise
size_t whitespace_length(const std::string& s, size_t pos);

std::string trim_copy(const std::string& s);

// true when s holds nothing but whitespace
bool is_blank(const std::string& s);
bool is_blank(const std::string& s, size_t begin, size_t end);
