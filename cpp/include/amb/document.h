// AMB/cpp/include/amb/document.h
#pragma once
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "amb/errors.h"

namespace amb {

// One rendered document as handed over by the renderer. Read-only to the
// packer; blocks are UTF-8 and the first document of a set is the root.
struct Document {
    std::string slug;
    std::string title;
    std::vector<std::string> blocks;
};

// {"slug": "...", "title": "...", "blocks": ["...", ...]} per line
bool parse_documents_jsonl(std::string_view jsonl, std::vector<Document>& out, Error* err);

bool load_documents_jsonl(const std::filesystem::path& path, std::vector<Document>& out, Error* err);

// Structural checks: non-empty unique slugs, no TABs, valid UTF-8.
bool check_documents(const std::vector<Document>& docs, Error* err);

} // namespace amb
