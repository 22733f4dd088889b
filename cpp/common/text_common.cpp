// AMB/cpp/common/text_common.cpp
#include "text_common.h"

#include <cstdio>

namespace {

struct Utf8Dec {
    uint32_t cp{0};
    size_t   len{1};
    bool     ok{false};
};

static inline bool is_cont(unsigned char c) { return (c & 0xC0) == 0x80; }

static inline Utf8Dec decode_utf8(std::string_view s, size_t i) {
    Utf8Dec r{};
    if (i >= s.size()) return r;

    const unsigned char c0 = (unsigned char)s[i];
    if (c0 < 0x80) {
        r.cp = c0; r.len = 1; r.ok = true;
        return r;
    }

    size_t len = 0;
    if (c0 >= 0xC2 && c0 <= 0xDF) len = 2;
    else if (c0 >= 0xE0 && c0 <= 0xEF) len = 3;
    else if (c0 >= 0xF0 && c0 <= 0xF4) len = 4;
    else return r;

    if (i + len > s.size()) return r;

    const unsigned char c1 = (unsigned char)s[i + 1];
    if (!is_cont(c1)) return r;

    if (len == 2) {
        uint32_t cp = ((uint32_t)(c0 & 0x1F) << 6) | (uint32_t)(c1 & 0x3F);
        r.cp = cp; r.len = 2; r.ok = true;
        return r;
    }

    const unsigned char c2 = (unsigned char)s[i + 2];
    if (!is_cont(c2)) return r;

    if (len == 3) {
        // overlong / surrogate checks
        if (c0 == 0xE0 && c1 < 0xA0) return r;
        if (c0 == 0xED && c1 >= 0xA0) return r;
        uint32_t cp = ((uint32_t)(c0 & 0x0F) << 12)
                    | ((uint32_t)(c1 & 0x3F) << 6)
                    |  (uint32_t)(c2 & 0x3F);
        r.cp = cp; r.len = 3; r.ok = true;
        return r;
    }

    const unsigned char c3 = (unsigned char)s[i + 3];
    if (!is_cont(c3)) return r;

    if (c0 == 0xF0 && c1 < 0x90) return r;
    if (c0 == 0xF4 && c1 > 0x8F) return r;

    uint32_t cp = ((uint32_t)(c0 & 0x07) << 18)
                | ((uint32_t)(c1 & 0x3F) << 12)
                | ((uint32_t)(c2 & 0x3F) << 6)
                |  (uint32_t)(c3 & 0x3F);
    if (cp > 0x10FFFF) return r;

    r.cp = cp; r.len = 4; r.ok = true;
    return r;
}

static inline bool is_ascii_alnum(uint32_t c) {
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

} // namespace

bool utf8_to_u32(std::string_view s, std::u32string& out, size_t* bad_offset) {
    out.clear();
    out.reserve(s.size());

    for (size_t i = 0; i < s.size();) {
        const unsigned char b = (unsigned char)s[i];

        // ASCII fast path
        if (b < 0x80) {
            out.push_back((char32_t)b);
            ++i;
            continue;
        }

        Utf8Dec d = decode_utf8(s, i);
        if (!d.ok) {
            if (bad_offset) *bad_offset = i;
            return false;
        }
        out.push_back((char32_t)d.cp);
        i += d.len;
    }
    return true;
}

void append_utf8(uint32_t cp, std::string& out) {
    if (cp <= 0x7F) {
        out.push_back((char)cp);
    } else if (cp <= 0x7FF) {
        out.push_back((char)(0xC0 | ((cp >> 6) & 0x1F)));
        out.push_back((char)(0x80 | (cp & 0x3F)));
    } else if (cp <= 0xFFFF) {
        out.push_back((char)(0xE0 | ((cp >> 12) & 0x0F)));
        out.push_back((char)(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back((char)(0x80 | (cp & 0x3F)));
    } else {
        out.push_back((char)(0xF0 | ((cp >> 18) & 0x07)));
        out.push_back((char)(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back((char)(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back((char)(0x80 | (cp & 0x3F)));
    }
}

std::string u32_to_utf8(std::u32string_view s) {
    std::string out;
    out.reserve(s.size());
    for (char32_t c : s) append_utf8((uint32_t)c, out);
    return out;
}

bool is_word_cp(uint32_t cp) {
    if (cp < 0x80) return is_ascii_alnum(cp);

    // Latin-1 letters (without the multiplication/division signs)
    if (cp >= 0x00C0 && cp <= 0x00FF) return cp != 0x00D7 && cp != 0x00F7;
    // Latin Extended-A/B
    if (cp >= 0x0100 && cp <= 0x024F) return true;
    // Greek letters
    if (cp >= 0x0386 && cp <= 0x03FF) return cp != 0x0387;
    // Cyrillic + Supplement
    if (cp >= 0x0400 && cp <= 0x052F) return !(cp >= 0x0482 && cp <= 0x0489);
    return false;
}

uint32_t fold_case_cp(uint32_t cp) {
    // ASCII
    if (cp >= 'A' && cp <= 'Z') return cp - 'A' + 'a';
    if (cp < 0x80) return cp;

    // Latin-1 À..Þ (except ×)
    if (cp >= 0x00C0 && cp <= 0x00DE && cp != 0x00D7) return cp + 0x20;

    // Latin Extended-A: pairs with uppercase on even code points ...
    if ((cp >= 0x0100 && cp <= 0x0137) || (cp >= 0x014A && cp <= 0x0177)) {
        return (cp % 2 == 0) ? cp + 1 : cp;
    }
    // ... and on odd code points
    if ((cp >= 0x0139 && cp <= 0x0148) || (cp >= 0x0179 && cp <= 0x017E)) {
        return (cp % 2 == 1) ? cp + 1 : cp;
    }
    if (cp == 0x0178) return 0x00FF; // Ÿ

    // Greek Α..Ω (0x03A2 is unassigned)
    if (cp >= 0x0391 && cp <= 0x03A9 && cp != 0x03A2) return cp + 0x20;
    if (cp == 0x0386) return 0x03AC;
    if (cp >= 0x0388 && cp <= 0x038A) return cp + 0x25;
    if (cp == 0x038C) return 0x03CC;
    if (cp == 0x038E || cp == 0x038F) return cp + 0x3F;

    // Cyrillic А..Я -> а..я, Ѐ..Џ -> ѐ..џ
    if (cp >= 0x0410 && cp <= 0x042F) return cp + 0x20;
    if (cp >= 0x0400 && cp <= 0x040F) return cp + 0x50;
    // Ѡ..ѿ, Ґ..ӿ pairs (uppercase on even code points)
    if ((cp >= 0x0460 && cp <= 0x0481) || (cp >= 0x048A && cp <= 0x04BF) ||
        (cp >= 0x04D0 && cp <= 0x052F)) {
        return (cp % 2 == 0) ? cp + 1 : cp;
    }
    // Ӂ..Ӎ (uppercase on odd code points)
    if (cp >= 0x04C1 && cp <= 0x04CE) return (cp % 2 == 1) ? cp + 1 : cp;

    return cp;
}

void tokenize_word_spans(std::u32string_view s, std::vector<TokenSpan>& out) {
    out.clear();
    const size_t n = s.size();
    size_t i = 0;

    while (i < n) {
        while (i < n && !is_word_cp((uint32_t)s[i])) ++i;
        if (i >= n) break;

        const size_t start = i;
        while (i < n && is_word_cp((uint32_t)s[i])) ++i;

        TokenSpan ts;
        ts.start = (uint32_t)start;
        ts.len = (uint32_t)(i - start);
        out.push_back(ts);
    }
}

std::string describe_codepoint(uint32_t cp) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "U+%04X", (unsigned)cp);
    std::string out(buf);
    if (cp >= 0x20 && cp != 0x7F) {
        out += " '";
        append_utf8(cp, out);
        out += "'";
    }
    return out;
}

void line_col_at(std::u32string_view s, size_t pos, uint32_t& line, uint32_t& col) {
    line = 1;
    col = 1;
    const size_t end = pos < s.size() ? pos : s.size();
    for (size_t i = 0; i < end; ++i) {
        if (s[i] == U'\n') {
            ++line;
            col = 1;
        } else {
            ++col;
        }
    }
}
