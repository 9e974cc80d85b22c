#pragma once

#include <list>
#include <string>
#include <vector>

// one row of the document table of contents, depth 1 is a chapter
struct PDF_Outline_Entry {
    int depth;
    std::string title;
    int page;
};

struct PDF_Subsection {
    std::string number;  // "N.M"
    std::string title;
    std::string text;
};

struct PDF_Section {
    std::string number;  // "N"
    std::string title;
    std::string text;
    std::list<PDF_Subsection> subsections;
};

struct PDF_Chapter {
    std::string number;
    std::string title;
    std::string text;
    std::list<PDF_Section> sections;
};

// chapters, sections and subsections are kept in outline encounter order, numbers are unique per parent
struct PDF_Outline {
    std::list<PDF_Chapter> chapters;

    PDF_Chapter* find_chapter(const std::string& number);
    const PDF_Chapter* find_chapter(const std::string& number) const;

    // nullptr when the chapter or the section does not exist
    const PDF_Section* find_section(const std::string& chapter, const std::string& section) const;
    const PDF_Subsection* find_subsection(const std::string& chapter, const std::string& section, const std::string& subsection) const;
};

PDF_Section* find_section(PDF_Chapter& chapter, const std::string& number);
PDF_Subsection* find_subsection(PDF_Section& section, const std::string& number);

enum class PDF_Node_Kind {CHAPTER, SECTION, SUBSECTION};

const char* to_string(PDF_Node_Kind kind);

struct Split_Warning {
    enum class KIND {
        MALFORMED_ENTRY,     // no usable number in the outline title
        UNSUPPORTED_NUMBER,  // number is neither "N" nor "N.M"
        ORPHAN_ENTRY,        // section/subsection before any chapter
        DUPLICATE_NUMBER,    // later entry replaced an earlier node
        UNMATCHED_HEADING,   // heading pattern not found in the text
        OUT_OF_ORDER_MATCH   // heading found before the current cursor
    };

    KIND kind;
    std::string number;
    std::string message;
};

const char* to_string(Split_Warning::KIND kind);

using Split_Warnings = std::vector<Split_Warning>;

// appends the warning and logs it on the given channel
void report_warning(Split_Warnings& warnings, Split_Warning::KIND kind,
                    const std::string& number, const std::string& message, const char* channel);
