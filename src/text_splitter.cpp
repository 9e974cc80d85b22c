#include "text_splitter.hpp"
#include "logging.hpp"
#include "string_utils.hpp"

#include <utility>

namespace {

// blank spans between two headings are dropped, the closing span is always kept
void assign_span(const Split_State& state, const std::string& text, size_t end, bool keep_blank, Split_Result& result) {
    if (state.cursor >= end) {
        return;
    }
    if (!state.active) {
        LOG_CHANNEL_DEBUG(LOG_CHANNEL_SPLITTER) << "Discarding " << end - state.cursor << " bytes of preamble";
        return;
    }
    if (!keep_blank && is_blank(text, state.cursor, end)) {
        return;
    }

    const Active_Node& active = *state.active;
    active.text->assign(text, state.cursor, end - state.cursor);
    result.assignments.push_back(Span_Assignment{active.kind, active.number, state.cursor, end});
}

std::string describe(PDF_Node_Kind kind, const std::string& number, const std::string& title) {
    return std::string(to_string(kind)) + " " + number + (title.empty() ? "" : " \"" + title + "\"");
}

bool visit(Split_State& state, PDF_Node_Kind kind, const std::string& number, const std::string& title, std::string& node_text,
           const Heading_Pattern& pattern, const std::string& text, const Splitter_Options& options, Split_Result& result) {
    size_t matched_before = result.matches.size();
    state = split_step(std::move(state), kind, number, node_text, pattern, text, options, result);
    if (result.matches.size() == matched_before) {
        report_warning(result.warnings, Split_Warning::KIND::UNMATCHED_HEADING, number,
                       "no match found for " + describe(kind, number, title), LOG_CHANNEL_SPLITTER);
        return false;
    }
    return true;
}

void clear_texts(PDF_Outline& outline) {
    for (PDF_Chapter& chapter : outline.chapters) {
        chapter.text.clear();
        for (PDF_Section& section : chapter.sections) {
            section.text.clear();
            for (PDF_Subsection& subsection : section.subsections) {
                subsection.text.clear();
            }
        }
    }
}

}

Split_State split_step(Split_State state,
                       PDF_Node_Kind kind, const std::string& number, std::string& node_text,
                       const Heading_Pattern& pattern,
                       const std::string& text,
                       const Splitter_Options& options,
                       Split_Result& result) {
    size_t from = options.search_mode == Search_Mode::FROM_CURSOR ? state.cursor : 0;
    std::optional<Heading_Match> match = pattern.find(text, from);
    if (!match) {
        return state;
    }

    result.matches.push_back(Heading_Hit{kind, number, state.cursor, match->start, match->end});

    if (match->start < state.cursor) {
        report_warning(result.warnings, Split_Warning::KIND::OUT_OF_ORDER_MATCH, number,
                       std::string(to_string(kind)) + " heading found at " + std::to_string(match->start) +
                       ", before cursor " + std::to_string(state.cursor), LOG_CHANNEL_SPLITTER);
    } else {
        assign_span(state, text, match->start, false, result);
    }

    state.cursor = match->end;
    state.active = Active_Node{kind, number, &node_text};
    return state;
}

void close_split(const Split_State& state, const std::string& text, Split_Result& result) {
    assign_span(state, text, text.length(), true, result);
}

Split_Result split_text(PDF_Outline& outline, const std::string& text, const Splitter_Options& options) {
    Split_Result result;
    Split_State state;

    clear_texts(outline);

    for (PDF_Chapter& chapter : outline.chapters) {
        Heading_Pattern chapter_pattern = Heading_Pattern::chapter(chapter.number, chapter.title, options.chapter_marker);
        bool chapter_found = visit(state, PDF_Node_Kind::CHAPTER, chapter.number, chapter.title, chapter.text,
                                   chapter_pattern, text, options, result);
        if (!chapter_found && options.skip_children_of_unmatched) {
            continue;
        }

        for (PDF_Section& section : chapter.sections) {
            Heading_Pattern section_pattern = Heading_Pattern::section(section.number, section.title);
            bool section_found = visit(state, PDF_Node_Kind::SECTION, section.number, section.title, section.text,
                                       section_pattern, text, options, result);
            if (!section_found && options.skip_children_of_unmatched) {
                continue;
            }

            for (PDF_Subsection& subsection : section.subsections) {
                Heading_Pattern subsection_pattern = Heading_Pattern::section(subsection.number, subsection.title);
                visit(state, PDF_Node_Kind::SUBSECTION, subsection.number, subsection.title, subsection.text,
                      subsection_pattern, text, options, result);
            }
        }
    }

    close_split(state, text, result);

    LOG_CHANNEL_INFO(LOG_CHANNEL_SPLITTER) << "Structure matching complete: " << result.matches.size() << " headings matched, "
                                           << result.warnings.size() << " warnings";
    return result;
}
