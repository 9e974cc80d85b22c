#include "outline.hpp"
#include "logging.hpp"

#include <algorithm>

PDF_Chapter* PDF_Outline::find_chapter(const std::string& number) {
    auto it = std::find_if(chapters.begin(), chapters.end(),
                           [&number](const PDF_Chapter& chapter) { return chapter.number == number; });
    return it != chapters.end() ? &(*it) : nullptr;
}

const PDF_Chapter* PDF_Outline::find_chapter(const std::string& number) const {
    auto it = std::find_if(chapters.begin(), chapters.end(),
                           [&number](const PDF_Chapter& chapter) { return chapter.number == number; });
    return it != chapters.end() ? &(*it) : nullptr;
}

const PDF_Section* PDF_Outline::find_section(const std::string& chapter, const std::string& section) const {
    const PDF_Chapter* parent = find_chapter(chapter);
    if (!parent) {
        return nullptr;
    }
    for (const PDF_Section& s : parent->sections) {
        if (s.number == section) {
            return &s;
        }
    }
    return nullptr;
}

const PDF_Subsection* PDF_Outline::find_subsection(const std::string& chapter, const std::string& section, const std::string& subsection) const {
    const PDF_Section* parent = find_section(chapter, section);
    if (!parent) {
        return nullptr;
    }
    for (const PDF_Subsection& s : parent->subsections) {
        if (s.number == subsection) {
            return &s;
        }
    }
    return nullptr;
}

PDF_Section* find_section(PDF_Chapter& chapter, const std::string& number) {
    for (PDF_Section& section : chapter.sections) {
        if (section.number == number) {
            return &section;
        }
    }
    return nullptr;
}

PDF_Subsection* find_subsection(PDF_Section& section, const std::string& number) {
    for (PDF_Subsection& subsection : section.subsections) {
        if (subsection.number == number) {
            return &subsection;
        }
    }
    return nullptr;
}

const char* to_string(PDF_Node_Kind kind) {
    switch (kind) {
        case PDF_Node_Kind::CHAPTER:    return "chapter";
        case PDF_Node_Kind::SECTION:    return "section";
        case PDF_Node_Kind::SUBSECTION: return "subsection";
    }
    return "unknown";
}

const char* to_string(Split_Warning::KIND kind) {
    switch (kind) {
        case Split_Warning::KIND::MALFORMED_ENTRY:    return "malformed entry";
        case Split_Warning::KIND::UNSUPPORTED_NUMBER: return "unsupported number";
        case Split_Warning::KIND::ORPHAN_ENTRY:       return "orphan entry";
        case Split_Warning::KIND::DUPLICATE_NUMBER:   return "duplicate number";
        case Split_Warning::KIND::UNMATCHED_HEADING:  return "unmatched heading";
        case Split_Warning::KIND::OUT_OF_ORDER_MATCH: return "out of order match";
    }
    return "unknown";
}

void report_warning(Split_Warnings& warnings, Split_Warning::KIND kind,
                    const std::string& number, const std::string& message, const char* channel) {
    LOG_CHANNEL_WARNING(channel) << to_string(kind) << " [" << number << "]: " << message;
    warnings.push_back(Split_Warning{kind, number, message});
}
