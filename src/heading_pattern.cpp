#include "heading_pattern.hpp"
#include "string_utils.hpp"

#include <cstring>
#include <utility>

std::string escape_literal(const std::string& s) {
    static const char* const metacharacters = "\\^$.|?*+()[]{}";
    std::string out;
    out.reserve(s.length() * 2);
    for (char c : s) {
        if (c != '\0' && std::strchr(metacharacters, c)) {
            out += '\\';
        }
        out += c;
    }
    return out;
}

std::string relax_title(const std::string& title) {
    std::string out;
    bool in_whitespace = false;
    std::string word;

    auto flush_word = [&out, &word]() {
        if (!word.empty()) {
            out += escape_literal(word);
            word.clear();
        }
    };

    size_t i = 0;
    while (i < title.length()) {
        size_t width = whitespace_length(title, i);
        if (width > 0) {
            if (!in_whitespace) {
                flush_word();
                out += "\\s*";
                in_whitespace = true;
            }
            i += width;
        } else {
            word += title[i];
            in_whitespace = false;
            ++i;
        }
    }
    flush_word();
    return out;
}

boost::u32regex make_heading_regex(const std::string& expression) {
    return boost::make_u32regex(expression, boost::regex::perl | boost::regex::icase);
}

Heading_Pattern::Heading_Pattern(std::string expression) :
    expression_(std::move(expression)),
    regex_(make_heading_regex(expression_)) {

}

Heading_Pattern Heading_Pattern::chapter(const std::string& number, const std::string& title, const std::string& marker) {
    return Heading_Pattern(relax_title(marker) + "\\s*" + escape_literal(number) + "\\s*" + relax_title(title));
}

Heading_Pattern Heading_Pattern::section(const std::string& number, const std::string& title) {
    return Heading_Pattern("^" + escape_literal(number) + "\\s*" + relax_title(title));
}

std::optional<Heading_Match> Heading_Pattern::find(const std::string& text, size_t from) const {
    if (from > text.length()) {
        return std::nullopt;
    }

    boost::match_flag_type flags = boost::match_default | boost::match_not_dot_newline;
    if (from > 0) {
        // text[from - 1] is real context, ^ only matches there after a line break
        flags |= boost::match_prev_avail;
    }

    boost::match_results<std::string::const_iterator> match;
    if (!boost::u32regex_search(text.cbegin() + from, text.cend(), match, regex_, flags, text.cbegin())) {
        return std::nullopt;
    }

    size_t start = static_cast<size_t>(match[0].first - text.cbegin());
    size_t end = static_cast<size_t>(match[0].second - text.cbegin());
    return Heading_Match{start, end};
}
