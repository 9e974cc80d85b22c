#pragma once

#include <string>
#include <vector>

#include "outline.hpp"
#include "outline_builder.hpp"
#include "text_assembler.hpp"
#include "text_splitter.hpp"

struct Processor_Options {
    int start_page = PDF_SPLITTER_DEFAULT_START_PAGE;
    Outline_Builder_Options outline;
    Splitter_Options splitter;
};

struct Processed_Document {
    PDF_Outline outline;
    Split_Warnings warnings;  // outline warnings first, then splitter warnings
    Split_Result split;
};

// outline entries -> tree, pages -> text, then the text is split over the tree
Processed_Document process_document(const std::vector<PDF_Outline_Entry>& entries,
                                     const std::vector<std::string>& pages,
                                     const Processor_Options& options = Processor_Options());
