// AMB/cpp/src/indexer.cpp
#include "amb/indexer.h"

#include <algorithm>
#include <cstring>
#include <map>

#include "text_common.h"

namespace amb {

size_t WordIndex::serialized_size() const {
    size_t sz = sizeof(kIndexMagic) + 2;
    for (const auto& e : entries) {
        sz += 1 + e.word.size() + 2 + 4 * e.occurrences.size();
    }
    return sz;
}

std::string WordIndex::serialize() const {
    std::string out;
    out.reserve(serialized_size());
    out.append(kIndexMagic, sizeof(kIndexMagic));
    put_u16(out, (uint16_t)entries.size());
    for (const auto& e : entries) {
        out.push_back((char)(uint8_t)e.word.size());
        out += e.word;
        put_u16(out, (uint16_t)e.occurrences.size());
        for (const auto& o : e.occurrences) {
            put_u16(out, o.chunk);
            put_u16(out, o.offset);
        }
    }
    return out;
}

size_t WordIndex::occurrence_count() const {
    size_t n = 0;
    for (const auto& e : entries) n += e.occurrences.size();
    return n;
}

WordIndex collect_words(const std::vector<Chunk>& chunks, const Codepage& cp) {
    // ordered by folded key => deterministic serialization
    std::map<std::u32string, IndexEntry> words;

    std::vector<TokenSpan> spans;
    spans.reserve(1024);

    for (const auto& c : chunks) {
        // the link sits after the text, so offsets into text are payload offsets
        const std::u32string decoded = decode_text(cp, c.text);
        tokenize_word_spans(decoded, spans);

        for (const auto& sp : spans) {
            if (sp.len < kMinWordChars || sp.len > kMaxWordChars) continue;

            std::u32string key;
            key.reserve(sp.len);
            for (uint32_t i = 0; i < sp.len; ++i) {
                key.push_back((char32_t)fold_case_cp((uint32_t)decoded[sp.start + i]));
            }

            auto it = words.find(key);
            if (it == words.end()) {
                IndexEntry e;
                e.key = key;
                e.word = c.text.substr(sp.start, sp.len);
                it = words.emplace(std::move(key), std::move(e)).first;
            }
            it->second.occurrences.push_back(Occurrence{c.id, (uint16_t)sp.start});
        }
    }

    WordIndex idx;
    idx.entries.reserve(words.size());
    for (auto& kv : words) idx.entries.push_back(std::move(kv.second));
    return idx;
}

IndexOutcome build_index(const std::vector<Chunk>& chunks, const Codepage& cp, size_t max_bytes) {
    IndexOutcome r;
    WordIndex idx = collect_words(chunks, cp);

    r.candidate_bytes = idx.serialized_size();
    r.candidate_words = idx.entries.size();

    if (r.candidate_bytes > max_bytes) {
        r.overflow = true;
        return r;
    }
    r.index = std::move(idx);
    return r;
}

bool parse_index(std::string_view bytes, WordIndex& out, std::string* err) {
    out = WordIndex{};
    if (bytes.size() < 6 || std::memcmp(bytes.data(), kIndexMagic, 4) != 0) {
        if (err) *err = "missing AMI1 magic";
        return false;
    }

    const uint16_t n = get_u16(bytes, 4);
    size_t p = 6;
    out.entries.reserve(n);

    for (uint16_t w = 0; w < n; ++w) {
        if (p + 1 > bytes.size()) {
            if (err) *err = "index truncated (word length)";
            return false;
        }
        const size_t len = (uint8_t)bytes[p++];
        if (p + len + 2 > bytes.size()) {
            if (err) *err = "index truncated (word)";
            return false;
        }
        IndexEntry e;
        e.word = std::string(bytes.substr(p, len));
        p += len;

        const uint16_t cnt = get_u16(bytes, p);
        p += 2;
        if (p + 4 * (size_t)cnt > bytes.size()) {
            if (err) *err = "index truncated (occurrences)";
            return false;
        }
        e.occurrences.reserve(cnt);
        for (uint16_t i = 0; i < cnt; ++i) {
            Occurrence o;
            o.chunk = get_u16(bytes, p);
            o.offset = get_u16(bytes, p + 2);
            p += 4;
            e.occurrences.push_back(o);
        }
        out.entries.push_back(std::move(e));
    }

    if (p != bytes.size()) {
        if (err) *err = "trailing bytes after index";
        return false;
    }
    return true;
}

} // namespace amb
