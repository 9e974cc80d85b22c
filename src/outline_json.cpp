#include "outline_json.hpp"
#include "logging.hpp"

#include <fstream>
#include <stdexcept>

namespace {

nlohmann::ordered_json add_json_node(const PDF_Subsection& subsection) {
    nlohmann::ordered_json json_subsection;
    json_subsection["title"] = subsection.title;
    json_subsection["text"] = subsection.text;
    return json_subsection;
}

nlohmann::ordered_json add_json_node(const PDF_Section& section) {
    nlohmann::ordered_json json_section;
    json_section["title"] = section.title;
    json_section["text"] = section.text;
    json_section["subsections"] = nlohmann::ordered_json::object();
    for (const PDF_Subsection& subsection : section.subsections) {
        json_section["subsections"][subsection.number] = add_json_node(subsection);
    }
    return json_section;
}

nlohmann::ordered_json add_json_node(const PDF_Chapter& chapter) {
    nlohmann::ordered_json json_chapter;
    json_chapter["title"] = chapter.title;
    json_chapter["text"] = chapter.text;
    json_chapter["sections"] = nlohmann::ordered_json::object();
    for (const PDF_Section& section : chapter.sections) {
        json_chapter["sections"][section.number] = add_json_node(section);
    }
    return json_chapter;
}

}

nlohmann::ordered_json outline_to_json(const PDF_Outline& outline) {
    nlohmann::ordered_json json_outline = nlohmann::ordered_json::object();
    for (const PDF_Chapter& chapter : outline.chapters) {
        json_outline[chapter.number] = add_json_node(chapter);
    }
    return json_outline;
}

std::string format_outline_tree(const PDF_Outline& outline, int indent) {
    // pdf text is not always valid utf-8, replace broken sequences instead of throwing
    return outline_to_json(outline).dump(indent, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
}

nlohmann::ordered_json warnings_to_json(const Split_Warnings& warnings) {
    nlohmann::ordered_json json_warnings = nlohmann::ordered_json::array();
    for (const Split_Warning& warning : warnings) {
        nlohmann::ordered_json json_warning;
        json_warning["kind"] = to_string(warning.kind);
        json_warning["number"] = warning.number;
        json_warning["message"] = warning.message;
        json_warnings.push_back(json_warning);
    }
    return json_warnings;
}

void save_json(const nlohmann::ordered_json& data, const std::string& output_path) {
    std::ofstream json_file(output_path);
    if (!json_file) {
        throw std::runtime_error("cannot open " + output_path + " for writing");
    }
    json_file << data.dump(4, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
    if (!json_file) {
        throw std::runtime_error("cannot write " + output_path);
    }
    LOG_CHANNEL_INFO(LOG_CHANNEL_MAIN) << "Structure saved to " << output_path;
}
