// AMB/cpp/common/text_common.h
#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

struct TokenSpan {
    uint32_t start{0};
    uint32_t len{0};
};

// Strict UTF-8 -> code points. On failure returns false and sets *bad_offset
// (byte offset of the first invalid sequence) when given.
bool utf8_to_u32(std::string_view s, std::u32string& out, size_t* bad_offset = nullptr);

void append_utf8(uint32_t cp, std::string& out);
std::string u32_to_utf8(std::u32string_view s);

// Letters/digits that make up indexable words:
// - ASCII [A-Za-z0-9]
// - Latin-1 letters, Latin Extended-A/B, Greek, Cyrillic
bool is_word_cp(uint32_t cp);

// Simple one-to-one lower-casing (ASCII, Latin-1, Latin Extended-A, Greek, Cyrillic)
uint32_t fold_case_cp(uint32_t cp);

// Maximal runs of word code points
void tokenize_word_spans(std::u32string_view s, std::vector<TokenSpan>& out);

// "U+00E9 'é'" style text for diagnostics
std::string describe_codepoint(uint32_t cp);

// 1-based line/column of position pos (lines split at '\n')
void line_col_at(std::u32string_view s, size_t pos, uint32_t& line, uint32_t& col);
