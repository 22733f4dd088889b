#include "amb/report.h"

namespace amb {

nlohmann::json to_json(const BuildStats& st) {
    nlohmann::json j;
    j["archive"] = st.archive_path.string();
    j["archive_bytes"] = st.archive_bytes;
    j["codepage"] = st.codepage;
    j["title"] = st.title;
    j["documents"] = st.documents;
    j["chunks"] = st.chunks;

    nlohmann::json idx;
    idx["present"] = st.index_present;
    idx["skipped"] = st.index_skipped;
    idx["words"] = st.index_words;
    idx["occurrences"] = st.index_occurrences;
    idx["bytes"] = st.index_bytes;
    j["index"] = std::move(idx);

    nlohmann::json m;
    m["high_bytes"] = st.high_bytes;
    m["embedded"] = st.map_embedded;
    m["written"] = st.map_written;
    m["path"] = st.map_written ? st.map_path.string() : std::string();
    j["unicode_map"] = std::move(m);

    j["warnings"] = st.warnings;
    j["built_at_utc"] = st.built_at_utc;
    return j;
}

nlohmann::json to_json(const ValidationResult& vr) {
    nlohmann::json j;
    j["ok"] = vr.ok;
    j["errors"] = vr.errors;
    j["articles"] = vr.articles;
    j["has_index"] = vr.has_index;
    j["index_words"] = vr.index_words;
    j["has_map"] = vr.has_map;
    return j;
}

nlohmann::json to_json(const Error& e) {
    return {
        {"ok", false},
        {"error", error_code_name(e.code)},
        {"message", e.message},
    };
}

} // namespace amb
