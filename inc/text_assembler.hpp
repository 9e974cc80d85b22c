#pragma once

#include <string>
#include <vector>

#ifndef PDF_SPLITTER_DEFAULT_START_PAGE
#define PDF_SPLITTER_DEFAULT_START_PAGE 13
#endif

// Joins the plain text of pages [start_page, end] (1-based) with '\n'. Empty pages are left out.
std::string assemble_document_text(const std::vector<std::string>& pages,
                                   int start_page = PDF_SPLITTER_DEFAULT_START_PAGE);
