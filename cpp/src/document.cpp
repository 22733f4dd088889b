// AMB/cpp/src/document.cpp
#include "amb/document.h"

#include <fstream>
#include <sstream>
#include <unordered_set>

#include <simdjson.h>

#include "text_common.h"

namespace amb {

namespace {

static std::string_view get_sv_or_empty(const simdjson::dom::element& doc, const char* key) {
    std::string_view sv{};
    auto err = doc.at_key(key).get(sv);
    if (err) return std::string_view{};
    return sv;
}

static bool parse_line(simdjson::dom::parser& parser,
                       std::string_view line,
                       size_t line_no,
                       Document& out,
                       Error* err) {
    const std::string where = "documents line " + std::to_string(line_no);

    simdjson::dom::element doc;
    if (parser.parse(line.data(), line.size()).get(doc)) {
        return fail(err, ErrorCode::MalformedDocument, where + ": not valid JSON");
    }
    if (!doc.is_object()) {
        return fail(err, ErrorCode::MalformedDocument, where + ": not a JSON object");
    }

    std::string_view slug_sv;
    if (doc["slug"].get(slug_sv) || slug_sv.empty()) {
        return fail(err, ErrorCode::MalformedDocument, where + ": missing \"slug\"");
    }

    simdjson::dom::array blocks;
    if (doc["blocks"].get(blocks)) {
        return fail(err, ErrorCode::MalformedDocument, where + ": \"blocks\" must be an array");
    }

    out = Document{};
    out.slug = std::string(slug_sv);
    out.title = std::string(get_sv_or_empty(doc, "title"));

    for (simdjson::dom::element b : blocks) {
        std::string_view sv;
        if (b.get(sv)) {
            return fail(err, ErrorCode::MalformedDocument, where + ": every block must be a string");
        }
        out.blocks.emplace_back(sv);
    }
    return true;
}

} // namespace

bool parse_documents_jsonl(std::string_view jsonl, std::vector<Document>& out, Error* err) {
    out.clear();
    simdjson::dom::parser parser;

    size_t line_no = 0;
    size_t pos = 0;
    while (pos <= jsonl.size()) {
        size_t eol = jsonl.find('\n', pos);
        if (eol == std::string_view::npos) eol = jsonl.size();
        std::string_view line = jsonl.substr(pos, eol - pos);
        ++line_no;
        pos = eol + 1;

        if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
        if (line.find_first_not_of(" \t") == std::string_view::npos) continue;

        Document d;
        if (!parse_line(parser, line, line_no, d, err)) return false;
        out.push_back(std::move(d));
    }

    if (out.empty()) {
        return fail(err, ErrorCode::MalformedDocument, "no documents in input");
    }
    return check_documents(out, err);
}

bool load_documents_jsonl(const std::filesystem::path& path, std::vector<Document>& out, Error* err) {
    std::ifstream in(path, std::ios::binary);
    if (!in) return fail(err, ErrorCode::IoError, "cannot open documents: " + path.string());

    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad()) return fail(err, ErrorCode::IoError, "read failed: " + path.string());

    return parse_documents_jsonl(ss.str(), out, err);
}

bool check_documents(const std::vector<Document>& docs, Error* err) {
    if (docs.empty()) return fail(err, ErrorCode::MalformedDocument, "no documents in input");

    std::unordered_set<std::string> slugs;
    std::u32string scratch;

    for (const auto& d : docs) {
        if (d.slug.empty()) return fail(err, ErrorCode::MalformedDocument, "document with empty slug");
        if (!slugs.insert(d.slug).second) {
            return fail(err, ErrorCode::MalformedDocument, "duplicate document slug '" + d.slug + "'");
        }

        for (size_t i = 0; i < d.blocks.size(); ++i) {
            const std::string& b = d.blocks[i];
            size_t bad = 0;
            if (!utf8_to_u32(b, scratch, &bad)) {
                return fail(err, ErrorCode::MalformedDocument,
                            "document '" + d.slug + "' block " + std::to_string(i + 1) +
                            ": invalid UTF-8 at byte " + std::to_string(bad));
            }
            if (b.find('\t') != std::string::npos) {
                return fail(err, ErrorCode::MalformedDocument,
                            "document '" + d.slug + "' block " + std::to_string(i + 1) +
                            " contains tab characters");
            }
        }
    }
    return true;
}

} // namespace amb
