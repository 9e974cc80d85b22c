#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "outline.hpp"
#include "text_splitter.hpp"

// {"<chapter>": {"title", "text", "sections": {"<n>": {"title", "text", "subsections": {...}}}}}, keys in outline order
nlohmann::ordered_json outline_to_json(const PDF_Outline& outline);

std::string format_outline_tree(const PDF_Outline& outline, int indent = 4);

// [{"kind", "number", "message"}]
nlohmann::ordered_json warnings_to_json(const Split_Warnings& warnings);

// throws std::runtime_error when the file cannot be written
void save_json(const nlohmann::ordered_json& data, const std::string& output_path);
