#undef NDEBUG
#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "amb/codepage.h"
#include "amb/unicode_map.h"

int main() {
    amb::Error err;
    auto cp = amb::resolve_codepage("437", &err);
    assert(cp);

    amb::Chunk plain;
    plain.name = "INDEX.AMA";
    plain.text = "only ascii here\n";

    // all bytes < 0x80 => empty map
    const amb::HighHalfMap none = amb::derive_map("Demo", {plain}, nullptr, *cp);
    assert(none.empty());
    assert(none.count() == 0);

    // a codepage that could produce high bytes does not matter, emitted bytes do
    auto cp852 = amb::resolve_codepage("852", &err);
    assert(cp852);
    assert(amb::derive_map("Demo", {plain}, nullptr, *cp852).empty());

    // index integers that happen to be >= 0x80 are not text
    amb::WordIndex idx;
    amb::IndexEntry e;
    e.word = "only";
    e.occurrences.push_back(amb::Occurrence{0x0080, 0x0082});
    idx.entries.push_back(e);
    assert(idx.serialize().find('\x82') != std::string::npos);
    assert(amb::derive_map("Demo", {plain}, &idx, *cp).empty());

    amb::Chunk accented;
    accented.name = "CAFE.AMA";
    accented.text = "caf\x82 cr\x8Ame caf\x82\n"; // café crème café

    const amb::HighHalfMap m = amb::derive_map("", {plain, accented}, nullptr, *cp);
    assert(m.count() == 2);
    assert(m.has(0x82) && m.slots[0x02] == 0x00E9);
    assert(m.has(0x8A) && m.slots[0x0A] == 0x00E8);
    assert(!m.has(0x81));

    const std::string bytes = m.serialize();
    assert(bytes.size() == amb::kUnicodeMapBytes);
    assert((unsigned char)bytes[0x02 * 2] == 0xE9 && bytes[0x02 * 2 + 1] == 0);
    assert(bytes[0] == 0 && bytes[1] == 0);

    amb::HighHalfMap back;
    std::string perr;
    assert(amb::parse_unicode_map(bytes, back, &perr));
    assert(back.slots == m.slots);
    assert(!amb::parse_unicode_map(bytes.substr(1), back, &perr));

    std::cout << "OK\n";
    return 0;
}
