#include "pdf_utils.hpp"
#include "logging.hpp"
#include "string_utils.hpp"

#include <mupdf/fitz.h>

namespace {

void collect_outline(fz_context* ctx, fz_document* doc, fz_outline* node, int depth, std::vector<PDF_Outline_Entry>& entries) {
    for (; node; node = node->next) {
        PDF_Outline_Entry entry;
        entry.depth = depth;
        entry.title = node->title ? node->title : "";
        entry.page = fz_page_number_from_location(ctx, doc, node->page) + 1;
        entries.push_back(std::move(entry));

        if (node->down) {
            collect_outline(ctx, doc, node->down, depth + 1, entries);
        }
    }
}

std::string stext_page_to_string(fz_stext_page* text) {
    std::string page_text;
    for (fz_stext_block* block = text->first_block; block; block = block->next) {
        if (block->type != FZ_STEXT_BLOCK_TEXT) { // only text blocks have lines, image blocks do not have lines
            continue;
        }
        for (fz_stext_line* line = block->u.t.first_line; line; line = line->next) {
            for (fz_stext_char* ch = line->first_char; ch; ch = ch->next) {
                page_text += UnicodeToUTF8(ch->c);
            }
            page_text += '\n';
        }
    }
    return page_text;
}

}

std::optional<PDF_Document_Content> read_pdf_file(const std::string& file_path) {
    PDF_Document_Content content;
    int page_number, page_count = 0;
    fz_context* ctx = nullptr;
    fz_document* doc = nullptr;
    fz_outline* outline = nullptr;

    /* Create a context to hold the exception stack and various caches. */
    ctx = fz_new_context(NULL, NULL, FZ_STORE_UNLIMITED);
    if (!ctx) {
        LOG_CHANNEL_ERROR(LOG_CHANNEL_PDF) << "cannot create mupdf context";
        return std::nullopt;
    }

    /* Register the default file types to handle. */
    fz_try(ctx) {
        fz_register_document_handlers(ctx);
    } fz_catch(ctx) {
        LOG_CHANNEL_ERROR(LOG_CHANNEL_PDF) << "cannot register document handlers: " << fz_caught_message(ctx);
        fz_drop_context(ctx);
        return std::nullopt;
    }

    /* Open the document. */
    fz_try(ctx) {
        doc = fz_open_document(ctx, file_path.c_str());
    } fz_catch(ctx) {
        LOG_CHANNEL_ERROR(LOG_CHANNEL_PDF) << "cannot open document " << file_path << ": " << fz_caught_message(ctx);
        fz_drop_context(ctx);
        return std::nullopt;
    }

    /* Count the number of pages. */
    fz_try(ctx) {
        page_count = fz_count_pages(ctx, doc);
    } fz_catch(ctx) {
        LOG_CHANNEL_ERROR(LOG_CHANNEL_PDF) << "cannot count number of pages: " << fz_caught_message(ctx);
        fz_drop_document(ctx, doc);
        fz_drop_context(ctx);
        return std::nullopt;
    }

    /* Table of contents, a document without one yields an empty outline. */
    fz_var(outline);
    fz_try(ctx) {
        outline = fz_load_outline(ctx, doc);
        collect_outline(ctx, doc, outline, 1, content.outline);
    } fz_always(ctx) {
        fz_drop_outline(ctx, outline);
    } fz_catch(ctx) {
        LOG_CHANNEL_WARNING(LOG_CHANNEL_PDF) << "cannot load outline: " << fz_caught_message(ctx);
        content.outline.clear();
    }
    LOG_CHANNEL_INFO(LOG_CHANNEL_PDF) << "Outline of " << file_path << ": " << content.outline.size() << " entries";

    content.pages.reserve(page_count);
    for (page_number = 0; page_number < page_count; ++page_number) {
        fz_page* page = nullptr;
        fz_stext_page* text = nullptr;
        fz_var(page);
        fz_var(text);

        fz_try(ctx) {
            fz_stext_options stext_options{};
            page = fz_load_page(ctx, doc, page_number);
            text = fz_new_stext_page_from_page(ctx, page, &stext_options);
        } fz_catch(ctx) {
            LOG_CHANNEL_ERROR(LOG_CHANNEL_PDF) << "render page " << page_number + 1 << " error: " << fz_caught_message(ctx);
            fz_drop_stext_page(ctx, text);
            fz_drop_page(ctx, page);
            fz_drop_document(ctx, doc);
            fz_drop_context(ctx);
            return std::nullopt;
        }

        content.pages.push_back(stext_page_to_string(text));

        fz_drop_stext_page(ctx, text);
        fz_drop_page(ctx, page);
    }

    /* Clean up. */
    fz_drop_document(ctx, doc);
    fz_drop_context(ctx);
    return content;
}

std::optional<Processed_Document> process_pdf_file(const std::string& file_path, const Processor_Options& options) {
    std::optional<PDF_Document_Content> content = read_pdf_file(file_path);
    if (!content) {
        return std::nullopt;
    }
    return process_document(content->outline, content->pages, options);
}
