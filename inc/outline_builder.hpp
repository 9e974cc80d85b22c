#pragma once

#include <optional>
#include <string>
#include <vector>

#include "heading_pattern.hpp"
#include "outline.hpp"

struct Outline_Builder_Options {
    std::string chapter_marker = PDF_SPLITTER_CHAPTER_MARKER;
};

struct Outline_Build_Result {
    PDF_Outline outline;
    Split_Warnings warnings;
};

enum class Number_Class {SECTION, SUBSECTION, UNSUPPORTED};

struct Parsed_Heading {
    std::string number;
    std::string title;
};

// "Глава 3. Title", "3 Title"; nullopt when there is no leading integer
std::optional<Parsed_Heading> parse_chapter_title(const std::string& raw_title,
                                                  const std::string& marker = PDF_SPLITTER_CHAPTER_MARKER);

// "2 Title", "2.1. Title", "2.1.3 Title"; nullopt when there is no leading numeral
std::optional<Parsed_Heading> parse_section_title(const std::string& raw_title);

// "N" is a section, "N.M" a subsection, everything else is unsupported
Number_Class classify_number(const std::string& number);

Outline_Build_Result build_outline(const std::vector<PDF_Outline_Entry>& entries,
                                   const Outline_Builder_Options& options = Outline_Builder_Options());
