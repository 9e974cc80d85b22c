#include "outline_builder.hpp"
#include "logging.hpp"
#include "string_utils.hpp"

#include <regex>

namespace {

const std::regex section_number_regex("^\\d+$");
const std::regex subsection_number_regex("^\\d+\\.\\d+$");

PDF_Chapter* insert_chapter(Outline_Build_Result& result, const std::string& number, const std::string& title) {
    PDF_Chapter* chapter = result.outline.find_chapter(number);
    if (chapter) {
        report_warning(result.warnings, Split_Warning::KIND::DUPLICATE_NUMBER, number,
                       "chapter \"" + chapter->title + "\" replaced by \"" + title + "\"", LOG_CHANNEL_OUTLINE);
        *chapter = PDF_Chapter();
    } else {
        result.outline.chapters.emplace_back();
        chapter = &result.outline.chapters.back();
    }
    chapter->number = number;
    chapter->title = title;
    return chapter;
}

PDF_Section* insert_section(Outline_Build_Result& result, PDF_Chapter& chapter, const std::string& number, const std::string& title) {
    PDF_Section* section = find_section(chapter, number);
    if (section) {
        report_warning(result.warnings, Split_Warning::KIND::DUPLICATE_NUMBER, number,
                       "section \"" + section->title + "\" of chapter " + chapter.number + " replaced by \"" + title + "\"",
                       LOG_CHANNEL_OUTLINE);
        *section = PDF_Section();
    } else {
        chapter.sections.emplace_back();
        section = &chapter.sections.back();
    }
    section->number = number;
    section->title = title;
    return section;
}

void insert_subsection(Outline_Build_Result& result, PDF_Section& section, const std::string& number, const std::string& title) {
    PDF_Subsection* subsection = find_subsection(section, number);
    if (subsection) {
        report_warning(result.warnings, Split_Warning::KIND::DUPLICATE_NUMBER, number,
                       "subsection \"" + subsection->title + "\" replaced by \"" + title + "\"", LOG_CHANNEL_OUTLINE);
        *subsection = PDF_Subsection();
    } else {
        section.subsections.emplace_back();
        subsection = &section.subsections.back();
    }
    subsection->number = number;
    subsection->title = title;
}

// Some outlines carry a bare "Глава N" entry and put the chapter name in the entry that follows it.
std::string borrowed_chapter_title(const std::vector<PDF_Outline_Entry>& entries, size_t index) {
    if (index + 1 < entries.size()) {
        return trim_copy(entries[index + 1].title);
    }
    return std::string();
}

}

std::optional<Parsed_Heading> parse_chapter_title(const std::string& raw_title, const std::string& marker) {
    // the marker is matched the way the text is searched, "ГЛАВА 2" and "глава 2" both count
    const boost::u32regex chapter_regex = make_heading_regex("(?:" + relax_title(marker) + "\\s*)?([0-9]+)\\.?\\s*(.*)");
    std::string title = trim_copy(raw_title);
    boost::match_results<std::string::const_iterator> match;
    if (!boost::u32regex_search(title, match, chapter_regex, boost::match_continuous | boost::match_not_dot_newline)) {
        return std::nullopt;
    }
    return Parsed_Heading{match[1].str(), trim_copy(match[2].str())};
}

std::optional<Parsed_Heading> parse_section_title(const std::string& raw_title) {
    static const std::regex section_regex("^(\\d+(?:\\.\\d+)*)\\.?\\s*(.*)");
    std::string title = trim_copy(raw_title);
    std::smatch match;
    if (!std::regex_search(title, match, section_regex)) {
        return std::nullopt;
    }
    return Parsed_Heading{match[1].str(), trim_copy(match[2].str())};
}

Number_Class classify_number(const std::string& number) {
    if (std::regex_match(number, section_number_regex)) {
        return Number_Class::SECTION;
    }
    if (std::regex_match(number, subsection_number_regex)) {
        return Number_Class::SUBSECTION;
    }
    return Number_Class::UNSUPPORTED;
}

Outline_Build_Result build_outline(const std::vector<PDF_Outline_Entry>& entries, const Outline_Builder_Options& options) {
    Outline_Build_Result result;
    PDF_Chapter* current_chapter = nullptr;
    PDF_Section* current_section = nullptr;

    for (size_t i = 0; i < entries.size(); ++i) {
        const PDF_Outline_Entry& entry = entries[i];

        if (entry.depth == 1) {
            std::optional<Parsed_Heading> heading = parse_chapter_title(entry.title, options.chapter_marker);
            if (!heading) {
                report_warning(result.warnings, Split_Warning::KIND::MALFORMED_ENTRY, "",
                               "no chapter number in \"" + entry.title + "\" (page " + std::to_string(entry.page) + ")",
                               LOG_CHANNEL_OUTLINE);
                continue;
            }
            if (heading->title.empty()) {
                heading->title = borrowed_chapter_title(entries, i);
            }
            current_chapter = insert_chapter(result, heading->number, heading->title);
            current_section = nullptr;
            continue;
        }

        if (entry.depth != 2 && entry.depth != 3) {
            report_warning(result.warnings, Split_Warning::KIND::MALFORMED_ENTRY, "",
                           "unsupported depth " + std::to_string(entry.depth) + " for \"" + entry.title + "\"",
                           LOG_CHANNEL_OUTLINE);
            continue;
        }

        if (!current_chapter) {
            report_warning(result.warnings, Split_Warning::KIND::ORPHAN_ENTRY, "",
                           "\"" + entry.title + "\" appears before any chapter", LOG_CHANNEL_OUTLINE);
            continue;
        }

        std::optional<Parsed_Heading> heading = parse_section_title(entry.title);
        if (!heading) {
            report_warning(result.warnings, Split_Warning::KIND::MALFORMED_ENTRY, "",
                           "no section number in \"" + entry.title + "\" (page " + std::to_string(entry.page) + ")",
                           LOG_CHANNEL_OUTLINE);
            continue;
        }

        switch (classify_number(heading->number)) {
            case Number_Class::SECTION:
                current_section = insert_section(result, *current_chapter, heading->number, heading->title);
                break;

            case Number_Class::SUBSECTION:
                if (!current_section) {
                    std::string section_number = heading->number.substr(0, heading->number.find('.'));
                    current_section = find_section(*current_chapter, section_number);
                    if (!current_section) {
                        LOG_CHANNEL_DEBUG(LOG_CHANNEL_OUTLINE) << "implicit section " << section_number
                                                               << " in chapter " << current_chapter->number;
                        current_chapter->sections.emplace_back();
                        current_section = &current_chapter->sections.back();
                        current_section->number = section_number;
                    }
                }
                insert_subsection(result, *current_section, heading->number, heading->title);
                break;

            case Number_Class::UNSUPPORTED:
                report_warning(result.warnings, Split_Warning::KIND::UNSUPPORTED_NUMBER, heading->number,
                               "\"" + entry.title + "\" is neither a section nor a subsection", LOG_CHANNEL_OUTLINE);
                break;
        }
    }

    LOG_CHANNEL_INFO(LOG_CHANNEL_OUTLINE) << "Outline built: " << result.outline.chapters.size() << " chapters, "
                                          << result.warnings.size() << " warnings";
    return result;
}
