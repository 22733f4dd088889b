#include "amb/unicode_map.h"

#include "amb/format.h"

namespace amb {

bool HighHalfMap::empty() const {
    return count() == 0;
}

size_t HighHalfMap::count() const {
    size_t n = 0;
    for (uint32_t v : slots) if (v != 0) ++n;
    return n;
}

std::string HighHalfMap::serialize() const {
    std::string out;
    out.reserve(kUnicodeMapBytes);
    for (uint32_t v : slots) put_u16(out, (uint16_t)v);
    return out;
}

void note_high_bytes(HighHalfMap& m, std::string_view data, const Codepage& cp) {
    for (unsigned char b : data) {
        if (b < 0x80) continue;
        m.slots[(size_t)(b - 0x80)] = cp.decode(b);
    }
}

HighHalfMap derive_map(std::string_view title,
                       const std::vector<Chunk>& chunks,
                       const WordIndex* index,
                       const Codepage& cp) {
    // text bytes only; header and index integers never reach the map
    HighHalfMap m;
    note_high_bytes(m, title, cp);
    for (const auto& c : chunks) note_high_bytes(m, c.payload(), cp);
    if (index) {
        for (const auto& e : index->entries) note_high_bytes(m, e.word, cp);
    }
    return m;
}

bool parse_unicode_map(std::string_view bytes, HighHalfMap& out, std::string* err) {
    out = HighHalfMap{};
    if (bytes.size() != kUnicodeMapBytes) {
        if (err) *err = "unicode map must be " + std::to_string(kUnicodeMapBytes) +
                        " bytes, got " + std::to_string(bytes.size());
        return false;
    }
    for (size_t i = 0; i < 128; ++i) out.slots[i] = get_u16(bytes, i * 2);
    return true;
}

} // namespace amb
