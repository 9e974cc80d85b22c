#include "document_processor.hpp"
#include "logging.hpp"

#include <utility>

Processed_Document process_document(const std::vector<PDF_Outline_Entry>& entries,
                                     const std::vector<std::string>& pages,
                                     const Processor_Options& options) {
    Processed_Document document;

    Outline_Build_Result built = build_outline(entries, options.outline);
    document.outline = std::move(built.outline);
    document.warnings = std::move(built.warnings);

    std::string text = assemble_document_text(pages, options.start_page);
    if (text.empty()) {
        LOG_CHANNEL_WARNING(LOG_CHANNEL_SPLITTER) << "Document text is empty, every node stays empty";
    }

    document.split = split_text(document.outline, text, options.splitter);
    document.warnings.insert(document.warnings.end(), document.split.warnings.begin(), document.split.warnings.end());
    return document;
}
