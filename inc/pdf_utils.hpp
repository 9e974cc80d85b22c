#pragma once

#include <optional>
#include <string>
#include <vector>

#include "document_processor.hpp"
#include "outline.hpp"

struct PDF_Document_Content {
    std::vector<PDF_Outline_Entry> outline;  // depth-first table of contents, depth starts at 1
    std::vector<std::string> pages;          // plain text of every page, one line per text line
};

// return nullopt if cant read pdf document
std::optional<PDF_Document_Content> read_pdf_file(const std::string& file_path);

// read_pdf_file followed by process_document
std::optional<Processed_Document> process_pdf_file(const std::string& file_path, const Processor_Options& options);
