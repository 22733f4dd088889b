// AMB/cpp/src/builder.cpp
#include "amb/builder.h"
#include "amb/indexer.h"
#include "amb/naming.h"
#include "amb/splitter.h"
#include "amb/unicode_map.h"

#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <optional>
#include <unordered_map>
#include <utility>

#include "text_common.h"

namespace fs = std::filesystem;

namespace amb {

namespace {

// --------------------
// helpers / config
// --------------------

static bool env_bool(const char* key, bool defv) {
    const char* s = std::getenv(key);
    if (!s || !*s) return defv;
    if (std::strcmp(s, "1") == 0) return true;
    if (std::strcmp(s, "0") == 0) return false;
    if (std::strcmp(s, "true") == 0 || std::strcmp(s, "TRUE") == 0) return true;
    if (std::strcmp(s, "false") == 0 || std::strcmp(s, "FALSE") == 0) return false;
    return defv;
}

static uint32_t env_u32(const char* key, uint32_t defv) {
    const char* s = std::getenv(key);
    if (!s || !*s) return defv;
    char* end = nullptr;
    const unsigned long v = std::strtoul(s, &end, 10);
    if (end == s || *end != '\0' || v > 0xFFFFFFFFul) return defv;
    return (uint32_t)v;
}

struct Article {
    const Document* doc{nullptr};
    std::string name;
    std::string encoded;
};

struct TmpCleanupOnFail {
    std::vector<fs::path> paths;
    bool keep{false};
    ~TmpCleanupOnFail() {
        if (keep) return;
        for (const auto& p : paths) {
            std::error_code ec;
            fs::remove(p, ec);
        }
    }
};

static void warn(BuildStats& st, const std::string& msg) {
    std::cerr << "[amb] " << msg << "\n";
    st.warnings.push_back(msg);
}

// block + '\n' for every block
static bool document_text(const Document& d, std::u32string& text, Error* err) {
    text.clear();
    std::u32string block;
    for (size_t i = 0; i < d.blocks.size(); ++i) {
        size_t bad = 0;
        if (!utf8_to_u32(d.blocks[i], block, &bad)) {
            return fail(err, ErrorCode::MalformedDocument,
                        "document '" + d.slug + "' block " + std::to_string(i + 1) +
                        ": invalid UTF-8 at byte " + std::to_string(bad));
        }
        text += block;
        text.push_back(U'\n');
    }
    return true;
}

// "%l<slug>:" -> "%l<ARTICLE.AMA>:" for slugs of documents in this build
static std::u32string rewrite_links(const std::u32string& text,
                                    const std::unordered_map<std::string, std::string>& names) {
    std::u32string out;
    out.reserve(text.size());

    size_t i = 0;
    while (i < text.size()) {
        if (text[i] != U'%' || i + 1 >= text.size() || text[i + 1] != U'l') {
            out.push_back(text[i++]);
            continue;
        }

        const size_t t0 = i + 2;
        size_t t1 = t0;
        while (t1 < text.size() && text[t1] != U':' && text[t1] != U'\n' && text[t1] != U'%') ++t1;

        if (t1 < text.size() && text[t1] == U':') {
            auto it = names.find(u32_to_utf8(std::u32string_view(text).substr(t0, t1 - t0)));
            if (it != names.end()) {
                out += U"%l";
                for (char c : it->second) out.push_back((char32_t)(unsigned char)c);
                i = t1;
                continue;
            }
        }
        out.push_back(text[i++]);
    }
    return out;
}

} // namespace

BuildOptions options_from_env() {
    BuildOptions opt;
    if (const char* cp = std::getenv("AMB_CODEPAGE")) {
        if (*cp) opt.codepage = cp;
    }
    opt.max_chunk_bytes = env_u32("AMB_MAX_CHUNK_BYTES", opt.max_chunk_bytes);
    opt.build_index = !env_bool("AMB_NO_INDEX", false);
    opt.embed_unicode_map = env_bool("AMB_EMBED_MAP", false);
    return opt;
}

bool build_archive_image(const std::vector<Document>& docs,
                         const BuildOptions& opt,
                         ArchiveImage& out,
                         Error* err) {
    out = ArchiveImage{};
    BuildStats& st = out.stats;

    SplitOptions sopt;
    sopt.max_chunk_bytes = opt.max_chunk_bytes;
    if (!check_split_options(sopt, err)) return false;

    std::optional<Codepage> cp = resolve_codepage(opt.codepage, err);
    if (!cp) return false;

    if (!check_documents(docs, err)) return false;

    // -------------------------
    // article names (root first, then input order)
    // -------------------------
    NameSet taken;
    std::vector<Article> articles(docs.size());
    std::unordered_map<std::string, std::string> slug_to_name;

    taken.insert(kRootArticle);
    for (size_t i = 0; i < docs.size(); ++i) {
        articles[i].doc = &docs[i];
        articles[i].name = (i == 0) ? std::string(kRootArticle) : assign_article_name(docs[i].slug, taken);
        slug_to_name.emplace(docs[i].slug, articles[i].name);
    }

    // -------------------------
    // encode (fatal on the first unmappable character)
    // -------------------------
    // source text first so line/column refer to the document, then the
    // linked text (rewritten targets are ASCII names)
    std::u32string text;
    for (auto& a : articles) {
        if (!document_text(*a.doc, text, err)) return false;
        if (!encode_text(*cp, text, a.doc->slug, a.encoded, err)) return false;

        const std::u32string linked = rewrite_links(text, slug_to_name);
        if (linked != text && !encode_text(*cp, linked, a.doc->slug, a.encoded, err)) return false;
    }

    // archive order: root article, then by name
    std::sort(articles.begin() + 1, articles.end(),
              [](const Article& x, const Article& y) { return x.name < y.name; });

    // -------------------------
    // split
    // -------------------------
    std::vector<Chunk> chunks;
    std::vector<Chunk> parts;
    for (const auto& a : articles) {
        if (!split_article(a.name, a.encoded, *cp, sopt, taken, parts, err)) return false;
        for (auto& c : parts) chunks.push_back(std::move(c));
    }

    // TITLE + chunks + SEARCH.IDX + UNICODE.MAP
    if (chunks.size() + 3 > kMaxEntries) {
        return fail(err, ErrorCode::ArticleTooLarge,
                    "too many chunks for one archive: " + std::to_string(chunks.size()));
    }
    for (size_t i = 0; i < chunks.size(); ++i) chunks[i].id = (uint16_t)i;

    // -------------------------
    // index (all or nothing)
    // -------------------------
    std::optional<WordIndex> index;
    if (opt.build_index) {
        IndexOutcome io = build_index(chunks, *cp);
        st.index_bytes = io.candidate_bytes;
        st.index_words = io.candidate_words;
        if (io.overflow) {
            st.index_skipped = true;
            warn(st, "search index skipped: " + std::to_string(io.candidate_bytes) +
                     " bytes exceeds " + std::to_string(kMaxIndexBytes));
        } else {
            index = std::move(io.index);
            st.index_present = true;
            st.index_occurrences = index->occurrence_count();
        }
    }

    // -------------------------
    // title + high-half map
    // -------------------------
    const std::string title = sanitize_title(opt.title.empty() ? docs.front().title : opt.title);
    const HighHalfMap map = derive_map(title, chunks, index ? &*index : nullptr, *cp);

    // -------------------------
    // pack
    // -------------------------
    std::vector<ArchiveFile> files;
    files.reserve(chunks.size() + 3);
    if (!title.empty()) files.push_back(ArchiveFile{kTitleEntry, title});
    for (const auto& c : chunks) files.push_back(ArchiveFile{c.name, c.payload()});
    if (index) files.push_back(ArchiveFile{kSearchIndexEntry, index->serialize()});
    if (!map.empty() && opt.embed_unicode_map) files.push_back(ArchiveFile{kUnicodeMapEntry, map.serialize()});

    if (!pack_amb(files, out.archive, err)) return false;
    if (!map.empty() && !opt.embed_unicode_map) out.unicode_map = map.serialize();

    st.codepage = cp->name();
    st.title = title;
    st.documents = docs.size();
    st.chunks = chunks.size();
    st.archive_bytes = out.archive.size();
    st.high_bytes = (uint32_t)map.count();
    st.map_embedded = !map.empty() && opt.embed_unicode_map;
    st.built_at_utc = utc_now_compact();
    return true;
}

bool build_archive_jsonl(const fs::path& documents_jsonl,
                         const fs::path& archive_path,
                         const BuildOptions& opt,
                         BuildStats& stats,
                         Error* err) {
    // unknown codepage is reported before any document is read
    if (!resolve_codepage(opt.codepage, err)) return false;

    std::vector<Document> docs;
    if (!load_documents_jsonl(documents_jsonl, docs, err)) return false;

    ArchiveImage img;
    if (!build_archive_image(docs, opt, img, err)) return false;

    const fs::path map_fin = opt.map_path.empty() ? default_map_path(archive_path) : opt.map_path;
    if (!opt.embed_unicode_map && map_fin.lexically_normal() == archive_path.lexically_normal()) {
        return fail(err, ErrorCode::InvalidArgs, "unicode map path collides with archive " + archive_path.string());
    }
    const fs::path archive_tmp = fs::path(archive_path.string() + ".tmp");
    const fs::path map_tmp = fs::path(map_fin.string() + ".tmp");

    TmpCleanupOnFail cleanup;
    cleanup.paths = {archive_tmp, map_tmp};

    try {
        if (archive_path.has_parent_path()) fs::create_directories(archive_path.parent_path());

        write_file_tmp(archive_tmp, img.archive);
        if (!img.unicode_map.empty()) write_file_tmp(map_tmp, img.unicode_map);

        if (!img.unicode_map.empty() && !atomic_replace_file_best_effort(map_tmp, map_fin)) {
            throw AmbException("atomic replace failed (map)");
        }
        if (!atomic_replace_file_best_effort(archive_tmp, archive_path)) {
            if (!img.unicode_map.empty()) {
                std::error_code ec;
                fs::remove(map_fin, ec);
            }
            throw AmbException("atomic replace failed (archive)");
        }
    } catch (const std::exception& e) {
        return fail(err, ErrorCode::IoError, e.what());
    }
    cleanup.keep = true;

    stats = std::move(img.stats);
    stats.archive_path = archive_path;

    if (!img.unicode_map.empty()) {
        stats.map_written = true;
        stats.map_path = map_fin;
    } else {
        // no companion map for this build (none needed, or embedded)
        std::error_code ec;
        if (map_fin.lexically_normal() != archive_path.lexically_normal() &&
            fs::exists(map_fin, ec) && fs::remove(map_fin, ec)) {
            warn(stats, "removed stale unicode map " + map_fin.string());
        }
    }
    return true;
}

} // namespace amb
