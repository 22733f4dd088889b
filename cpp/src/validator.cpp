// AMB/cpp/src/validator.cpp
#include "amb/validator.h"
#include "amb/indexer.h"
#include "amb/splitter.h"

#include <cstdio>
#include <sstream>
#include <unordered_set>

#include "text_common.h"

namespace amb {

static std::string hex_byte(unsigned b) {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "0x%02X", b);
    return buf;
}

// bytes -> code points through the map; unknown high bytes decode to 0
static uint32_t decode_with_map(const HighHalfMap* m, unsigned char b) {
    if (b < 0x80) return b;
    if (!m) return 0;
    return m->slots[(size_t)(b - 0x80)];
}

static bool same_word(const HighHalfMap* m, std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        const uint32_t x = fold_case_cp(decode_with_map(m, (unsigned char)a[i]));
        const uint32_t y = fold_case_cp(decode_with_map(m, (unsigned char)b[i]));
        if (x != y || x == 0) return false;
    }
    return true;
}

// "...%l<NAME>:Continue%t\n" at the end of a chunk => NAME
static bool continuation_target(std::string_view payload, std::string& target) {
    const std::string tail = std::string(":") + kContinueLabel + "%t\n";
    if (payload.size() < tail.size() || payload.substr(payload.size() - tail.size()) != tail) return false;

    const std::string_view head = payload.substr(0, payload.size() - tail.size());
    const size_t at = head.rfind("%l");
    if (at == std::string_view::npos) return false;
    target = std::string(head.substr(at + 2));
    return true;
}

static void check_map(const ArchiveData& a, const HighHalfMap* map, ValidationResult& vr) {
    bool used[128] = {false};

    auto mark = [&](std::string_view data) {
        for (unsigned char b : data) if (b >= 0x80) used[b - 0x80] = true;
    };

    const int title = a.find(kTitleEntry);
    if (title >= 0) mark(a.payload((size_t)title));
    for (size_t i : a.article_entries()) mark(a.payload(i));

    const int idx = a.find(kSearchIndexEntry);
    if (idx >= 0) {
        WordIndex wi;
        if (parse_index(a.payload((size_t)idx), wi, nullptr)) {
            for (const auto& e : wi.entries) mark(e.word);
        }
    }

    bool any_used = false;
    for (bool u : used) any_used = any_used || u;

    if (!map) {
        if (any_used) vr.errors.push_back("archive uses high-half bytes but no unicode map is available");
        return;
    }

    for (unsigned i = 0; i < 128; ++i) {
        const bool listed = map->slots[i] != 0;
        if (used[i] && !listed) vr.errors.push_back("unicode map misses byte " + hex_byte(0x80 + i));
        if (!used[i] && listed) vr.errors.push_back("unicode map lists unused byte " + hex_byte(0x80 + i));
    }
}

static void check_index(const ArchiveData& a, const HighHalfMap* map, ValidationResult& vr) {
    const int idx = a.find(kSearchIndexEntry);
    if (idx < 0) return;
    vr.has_index = true;

    WordIndex wi;
    std::string err;
    if (!parse_index(a.payload((size_t)idx), wi, &err)) {
        vr.errors.push_back("SEARCH.IDX: " + err);
        return;
    }
    vr.index_words = wi.entries.size();

    const std::vector<size_t> chunks = a.article_entries();

    for (const auto& e : wi.entries) {
        if (e.word.size() < kMinWordChars || e.word.size() > kMaxWordChars) {
            vr.errors.push_back("index word '" + e.word + "' has invalid length " + std::to_string(e.word.size()));
            continue;
        }
        for (const auto& o : e.occurrences) {
            if (o.chunk >= chunks.size()) {
                vr.errors.push_back("index word '" + e.word + "' refers to missing chunk " + std::to_string(o.chunk));
                break;
            }
            const std::string_view p = a.payload(chunks[o.chunk]);
            const size_t end = (size_t)o.offset + e.word.size();
            if (end > p.size()) {
                vr.errors.push_back("index word '" + e.word + "' offset out of range in " + a.entries[chunks[o.chunk]].name);
                break;
            }

            const bool whole = same_word(map, p.substr(o.offset, e.word.size()), e.word) &&
                               (o.offset == 0 || !is_word_cp(decode_with_map(map, (unsigned char)p[o.offset - 1]))) &&
                               (end == p.size() || !is_word_cp(decode_with_map(map, (unsigned char)p[end])));
            if (!whole) {
                vr.errors.push_back("index word '" + e.word + "' does not match " +
                                    a.entries[chunks[o.chunk]].name + " at offset " + std::to_string(o.offset));
                break;
            }
        }
    }
}

ValidationResult validate_archive(const ArchiveData& a, const HighHalfMap* companion) {
    ValidationResult vr;

    std::unordered_set<std::string> names;
    for (size_t i = 0; i < a.entries.size(); ++i) {
        const auto& e = a.entries[i];
        if (!is_valid_83_name(e.name)) vr.errors.push_back("invalid entry name '" + e.name + "'");
        if (!names.insert(e.name).second) vr.errors.push_back("duplicate entry '" + e.name + "'");
        if (bsd_checksum(a.payload(i)) != e.checksum) {
            vr.errors.push_back("checksum mismatch in " + e.name);
        }
    }

    const int title = a.find(kTitleEntry);
    if (title >= 0 && a.entries[(size_t)title].length > kMaxTitleBytes) {
        vr.errors.push_back("TITLE longer than " + std::to_string(kMaxTitleBytes) + " bytes");
    }

    const std::vector<size_t> chunks = a.article_entries();
    vr.articles = chunks.size();
    if (chunks.empty() || a.entries[chunks.front()].name != kRootArticle) {
        vr.errors.push_back(std::string("first article must be ") + kRootArticle);
    }

    for (size_t i : chunks) {
        std::string target;
        if (!continuation_target(a.payload(i), target)) continue;
        if (a.find(target) < 0) {
            vr.errors.push_back(a.entries[i].name + ": continuation link to missing " + target);
        }
    }

    // map: embedded wins over companion
    HighHalfMap embedded;
    const HighHalfMap* map = companion;
    const int mi = a.find(kUnicodeMapEntry);
    if (mi >= 0) {
        std::string err;
        if (parse_unicode_map(a.payload((size_t)mi), embedded, &err)) map = &embedded;
        else vr.errors.push_back("UNICODE.MAP: " + err);
    }
    vr.has_map = map != nullptr;

    check_map(a, map, vr);
    check_index(a, map, vr);

    vr.ok = vr.errors.empty();
    return vr;
}

ValidationResult validate_archive_file(const std::filesystem::path& archive_path,
                                       const std::filesystem::path& map_path) {
    ValidationResult vr;
    ArchiveData a;
    std::string err;

    if (!load_archive(archive_path, a, &err)) {
        vr.errors.push_back(err);
        vr.ok = false;
        return vr;
    }

    std::filesystem::path mp = map_path;
    if (mp.empty()) {
        std::error_code ec;
        const auto def = default_map_path(archive_path);
        if (std::filesystem::exists(def, ec)) mp = def;
    }

    HighHalfMap companion;
    bool have_companion = false;
    if (!mp.empty()) {
        std::string bytes;
        if (!read_file_bytes(mp, bytes, &err) || !parse_unicode_map(bytes, companion, &err)) {
            vr.errors.push_back(err);
            vr.ok = false;
            return vr;
        }
        have_companion = true;
    }

    return validate_archive(a, have_companion ? &companion : nullptr);
}

} // namespace amb
