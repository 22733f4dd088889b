// AMB/cpp/src/splitter.cpp
#include "amb/splitter.h"

#include "text_common.h"

namespace amb {

namespace {

constexpr const char* kPlaceholderTarget = "XXXXXXXX.XXX";

static inline bool is_word_byte(const Codepage& cp, char c) {
    return is_word_cp(cp.decode((uint8_t)c));
}

// cut between encoded[i-1] and encoded[i] keeps every word whole
static inline bool is_word_boundary(const Codepage& cp, std::string_view encoded, size_t i) {
    if (i == 0 || i >= encoded.size()) return true;
    return !(is_word_byte(cp, encoded[i - 1]) && is_word_byte(cp, encoded[i]));
}

// Longest prefix of the window ending on a word boundary (line ends count).
static size_t pick_cut(std::string_view encoded, const Codepage& cp, size_t start, size_t window_end) {
    for (size_t i = window_end; i > start; --i) {
        if (is_word_boundary(cp, encoded, i)) return i;
    }
    // one word wider than the window: take it whole
    size_t cut = window_end;
    while (cut < encoded.size() && !is_word_boundary(cp, encoded, cut)) ++cut;
    return cut;
}

} // namespace

std::string Chunk::payload() const {
    if (next.empty()) return text;
    return text + continuation_link(text, next);
}

std::string continuation_link(std::string_view text, std::string_view next) {
    std::string link;
    if (!text.empty() && text.back() != '\n') link.push_back('\n');
    link.push_back('\n');
    link += "%l";
    link += next;
    link += ":";
    link += kContinueLabel;
    link += "%t\n";
    return link;
}

size_t continuation_reserve() {
    return continuation_link("x", kPlaceholderTarget).size();
}

bool check_split_options(const SplitOptions& opt, Error* err) {
    if (opt.max_chunk_bytes < kMinChunkBytes || opt.max_chunk_bytes > kMaxEntryBytes) {
        return fail(err, ErrorCode::InvalidArgs,
                    "max_chunk_bytes must be in [" + std::to_string(kMinChunkBytes) + ", " +
                    std::to_string(kMaxEntryBytes) + "], got " + std::to_string(opt.max_chunk_bytes));
    }
    return true;
}

std::vector<size_t> find_chunk_ends(std::string_view encoded, const Codepage& cp, uint32_t max_chunk_bytes) {
    std::vector<size_t> ends;
    const size_t n = encoded.size();
    const size_t budget = max_chunk_bytes;
    const size_t reserve = continuation_reserve();
    const size_t limit = budget > reserve ? budget - reserve : 1;

    size_t start = 0;
    // tentative close at budget - reserve, so the link always fits afterwards
    while (n - start > budget) {
        const size_t window_end = start + limit;
        const size_t cut = pick_cut(encoded, cp, start, window_end);
        ends.push_back(cut);
        start = cut;
    }
    ends.push_back(n);
    return ends;
}

bool split_article(std::string_view article_name,
                   std::string_view encoded,
                   const Codepage& cp,
                   const SplitOptions& opt,
                   NameSet& taken,
                   std::vector<Chunk>& out,
                   Error* err) {
    out.clear();
    if (!check_split_options(opt, err)) return false;

    const std::vector<size_t> ends = find_chunk_ends(encoded, cp, opt.max_chunk_bytes);

    out.reserve(ends.size());
    size_t start = 0;
    for (size_t i = 0; i < ends.size(); ++i) {
        Chunk c;
        c.name = (i == 0) ? std::string(article_name) : continuation_name(article_name, i, taken);
        c.text = std::string(encoded.substr(start, ends[i] - start));
        start = ends[i];
        out.push_back(std::move(c));
    }

    for (size_t i = 0; i + 1 < out.size(); ++i) out[i].next = out[i + 1].name;

    for (const auto& c : out) {
        const size_t sz = c.text.size() + (c.next.empty() ? 0 : continuation_link(c.text, c.next).size());
        if (sz > kMaxEntryBytes) {
            return fail(err, ErrorCode::ArticleTooLarge,
                        "article '" + c.name + "' holds a word that cannot fit in " +
                        std::to_string(kMaxEntryBytes) + " bytes");
        }
    }
    return true;
}

} // namespace amb
