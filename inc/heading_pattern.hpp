#pragma once

#include <optional>
#include <string>

#include <boost/regex/icu.hpp>

#ifndef PDF_SPLITTER_CHAPTER_MARKER
#define PDF_SPLITTER_CHAPTER_MARKER "Глава"
#endif

// [start, end) byte offsets of a heading occurrence inside the document text
struct Heading_Match {
    size_t start;
    size_t end;
};

class Heading_Pattern {
  public:
    // "Глава <number> <title>" anywhere in the text
    static Heading_Pattern chapter(const std::string& number, const std::string& title,
                                   const std::string& marker = PDF_SPLITTER_CHAPTER_MARKER);

    // "<number> <title>" at the beginning of a line
    static Heading_Pattern section(const std::string& number, const std::string& title);

    // first occurrence at or after `from`, offsets are bytes of the utf-8 text
    std::optional<Heading_Match> find(const std::string& text, size_t from = 0) const;

    const std::string& expression() const { return expression_; }

  private:
    explicit Heading_Pattern(std::string expression);

    std::string expression_;
    boost::u32regex regex_;  // unicode aware, so case folding covers cyrillic
};

// perl syntax, case-insensitive over unicode, ^ matches at every line start
boost::u32regex make_heading_regex(const std::string& expression);

// escape regex metacharacters, every run of whitespace (no-break space included) becomes \s*
std::string relax_title(const std::string& title);

std::string escape_literal(const std::string& s);
