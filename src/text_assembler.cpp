#include "text_assembler.hpp"
#include "logging.hpp"

std::string assemble_document_text(const std::vector<std::string>& pages, int start_page) {
    size_t first = start_page > 1 ? static_cast<size_t>(start_page - 1) : 0;

    std::string text;
    size_t joined = 0;
    for (size_t i = first; i < pages.size(); ++i) {
        if (pages[i].empty()) {
            continue;
        }
        if (joined++ > 0) {
            text += '\n';
        }
        text += pages[i];
    }

    LOG_CHANNEL_INFO(LOG_CHANNEL_SPLITTER) << "Text extraction complete: " << joined << " pages, " << text.length() << " bytes";
    return text;
}
