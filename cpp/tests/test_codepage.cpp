#undef NDEBUG
#include <cassert>
#include <iostream>
#include <string>

#include "amb/codepage.h"

static std::u32string u32(const char32_t* s) { return std::u32string(s); }

int main() {
    // aliases
    assert(amb::normalize_codepage_name("437") == "cp437");
    assert(amb::normalize_codepage_name("IBM-437") == "cp437");
    assert(amb::normalize_codepage_name("dos_850") == "cp850");
    assert(amb::normalize_codepage_name("Windows-1250") == "cp1250");
    assert(amb::normalize_codepage_name("win1252") == "cp1252");
    assert(amb::normalize_codepage_name("Kamenicky") == "kam");
    assert(amb::normalize_codepage_name("MAZOVIA") == "maz");

    amb::Error err;
    auto cp437 = amb::resolve_codepage(amb::kDefaultCodepage, &err);
    assert(cp437);
    assert(cp437->name() == "cp437");

    uint8_t b = 0;
    assert(cp437->encode('A', b) && b == 'A');
    assert(cp437->encode(0x00E9, b) && b == 0x82); // é
    assert(cp437->decode(0x82) == 0x00E9);
    assert(!cp437->encode(0x20AC, b));             // € is not in cp437

    // cp808 = cp866 + euro at 0xFD
    auto cp808 = amb::resolve_codepage("808", &err);
    assert(cp808);
    assert(cp808->encode(0x20AC, b) && b == 0xFD);
    assert(cp808->encode(0x0416, b) && b == 0x86); // Ж

    auto cp858 = amb::resolve_codepage("cp858", &err);
    assert(cp858 && cp858->encode(0x20AC, b) && b == 0xD5);

    // Kamenicky / Mazovia overrides on top of cp437
    auto kam = amb::resolve_codepage("kam", &err);
    assert(kam && kam->encode(0x010C, b) && b == 128); // Č
    assert(kam->decode(0x82) == 0x00E9);               // untouched cp437 byte
    auto maz = amb::resolve_codepage("maz", &err);
    assert(maz && maz->encode(0x0105, b) && b == 134); // ą

    // holes in cp1252 decode to 0 and are never produced
    auto cp1252 = amb::resolve_codepage("1252", &err);
    assert(cp1252);
    assert(cp1252->decode(0x81) == 0);
    assert(cp1252->encode(0x20AC, b) && b == 0x80);

    // unknown codepage
    amb::Error bad;
    assert(!amb::resolve_codepage("cp9999", &bad));
    assert(bad.code == amb::ErrorCode::UnsupportedCodepage);

    // encode_text ok
    std::string out;
    assert(amb::encode_text(*cp437, u32(U"café\n"), "demo", out, &err));
    assert(out == std::string("caf\x82\n"));
    assert(amb::decode_text(*cp437, out) == u32(U"café\n"));

    // encode_text reports the character and its location
    amb::Error ue;
    assert(!amb::encode_text(*cp437, u32(U"first line\nPrice: 5 €\n"), "prices", out, &ue));
    assert(ue.code == amb::ErrorCode::UnmappableCharacter);
    assert(ue.message.find("U+20AC") != std::string::npos);
    assert(ue.message.find("'prices'") != std::string::npos);
    assert(ue.message.find("line 2, column 10") != std::string::npos);
    assert(ue.message.find("cp437") != std::string::npos);

    std::cout << "OK\n";
    return 0;
}
