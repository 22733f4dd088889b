#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "amb/codepage.h"
#include "amb/indexer.h"
#include "amb/splitter.h"

namespace amb {

constexpr size_t kUnicodeMapBytes = 128 * 2;

// Byte 0x80+i -> code point in slots[i]; 0 = byte not used by the archive.
struct HighHalfMap {
    std::array<uint32_t, 128> slots{};

    bool empty() const;
    size_t count() const;
    bool has(uint8_t b) const { return b >= 0x80 && slots[(size_t)(b - 0x80)] != 0; }

    // 128 little-endian u16 slots
    std::string serialize() const;
};

// Marks every high byte of data using the codepage's inverse mapping.
void note_high_bytes(HighHalfMap& m, std::string_view data, const Codepage& cp);

// Map over every text byte the archive emits: title, chunk payloads and the
// words of the retained index. Binary fields (entry table, index counts and
// offsets) are not text and are not mapped.
HighHalfMap derive_map(std::string_view title,
                       const std::vector<Chunk>& chunks,
                       const WordIndex* index,
                       const Codepage& cp);

bool parse_unicode_map(std::string_view bytes, HighHalfMap& out, std::string* err);

} // namespace amb
