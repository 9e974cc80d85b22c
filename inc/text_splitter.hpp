#pragma once

#include <optional>
#include <string>
#include <vector>

#include "heading_pattern.hpp"
#include "outline.hpp"

enum class Search_Mode {
    FULL_TEXT,   // every heading is searched from offset 0, the first occurrence wins
    FROM_CURSOR  // headings are searched from the cursor onwards
};

struct Splitter_Options {
    Search_Mode search_mode = Search_Mode::FULL_TEXT;
    // do not look for the sections of an unmatched chapter (or the subsections of an unmatched section)
    bool skip_children_of_unmatched = false;
    std::string chapter_marker = PDF_SPLITTER_CHAPTER_MARKER;
};

// the node that owns text read after its heading, text points into the outline being split
struct Active_Node {
    PDF_Node_Kind kind;
    std::string number;
    std::string* text;
};

struct Split_State {
    size_t cursor = 0;
    std::optional<Active_Node> active;  // empty while reading the preamble
};

struct Heading_Hit {
    PDF_Node_Kind kind;
    std::string number;
    size_t cursor;  // cursor when the search started
    size_t start;
    size_t end;
};

// text[begin, end) was written to the node
struct Span_Assignment {
    PDF_Node_Kind kind;
    std::string number;
    size_t begin;
    size_t end;
};

struct Split_Result {
    std::vector<Heading_Hit> matches;
    std::vector<Span_Assignment> assignments;
    Split_Warnings warnings;
};

// Looks for one heading and moves the state forward, node_text becomes the active text on success.
Split_State split_step(Split_State state,
                       PDF_Node_Kind kind, const std::string& number, std::string& node_text,
                       const Heading_Pattern& pattern,
                       const std::string& text,
                       const Splitter_Options& options,
                       Split_Result& result);

// hands text[cursor:] to the active node, even when it is only whitespace
void close_split(const Split_State& state, const std::string& text, Split_Result& result);

// Fills the text of every node in outline order. Previous texts are cleared first.
Split_Result split_text(PDF_Outline& outline, const std::string& text,
                        const Splitter_Options& options = Splitter_Options());
