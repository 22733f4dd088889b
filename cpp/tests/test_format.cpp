#undef NDEBUG
#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "amb/format.h"

int main() {
    assert(amb::bsd_checksum("") == 0);
    assert(amb::bsd_checksum("abc") == 16556);

    assert(amb::is_valid_83_name("INDEX.AMA"));
    assert(amb::is_valid_83_name("TITLE"));
    assert(amb::is_valid_83_name("_1ABC_EF.AMA"));
    assert(!amb::is_valid_83_name("index.ama"));
    assert(!amb::is_valid_83_name("TOOLONGNAME.AMA"));
    assert(!amb::is_valid_83_name("A.AMAX"));
    assert(!amb::is_valid_83_name(""));

    assert(amb::sanitize_title("Caf\xC3\xA9 Guide") == "Caf Guide");
    assert(amb::sanitize_title(std::string(100, 'T')).size() == amb::kMaxTitleBytes);
    assert(amb::sanitize_title("Demo") == "Demo"); // never padded

    std::vector<amb::ArchiveFile> files = {
        {"TITLE", "Demo"},
        {"INDEX.AMA", "abc"},
    };

    std::string img;
    amb::Error err;
    assert(amb::pack_amb(files, img, &err));

    // header + 2 records + payloads
    assert(img.size() == 6 + 2 * 20 + 4 + 3);
    assert(img.substr(0, 4) == "AMB1");
    assert(amb::get_u16(img, 4) == 2);
    assert(img.substr(6, 12) == std::string("TITLE\0\0\0\0\0\0\0", 12));
    assert(amb::get_u32(img, 6 + 12) == 46);
    assert(amb::get_u16(img, 6 + 16) == 4);
    assert(amb::get_u32(img, 26 + 12) == 50);
    assert(amb::get_u16(img, 26 + 18) == 16556);
    assert(img.substr(46) == "Demoabc");

    // byte-identical on repeat
    std::string again;
    assert(amb::pack_amb(files, again, &err));
    assert(again == img);

    std::vector<amb::EntryRecord> entries;
    std::string perr;
    assert(amb::parse_amb(img, entries, &perr));
    assert(entries.size() == 2);
    assert(entries[1].name == "INDEX.AMA" && entries[1].offset == 50 && entries[1].length == 3);

    assert(!amb::parse_amb(img.substr(0, img.size() - 1), entries, &perr));
    assert(!amb::parse_amb("AMX1", entries, &perr));

    // bad names / oversized entries are refused
    const std::vector<amb::ArchiveFile> bad_name = {amb::ArchiveFile{"bad name", "x"}};
    amb::Error e1;
    assert(!amb::pack_amb(bad_name, img, &e1));
    assert(e1.code == amb::ErrorCode::InvalidArgs);
    const std::vector<amb::ArchiveFile> too_big = {amb::ArchiveFile{"BIG.AMA", std::string(amb::kMaxEntryBytes + 1, 'x')}};
    amb::Error e2;
    assert(!amb::pack_amb(too_big, img, &e2));
    assert(e2.code == amb::ErrorCode::ArticleTooLarge);

    assert(amb::default_map_path("out/book.amb") == std::filesystem::path("out/book.MAP"));

    std::cout << "OK\n";
    return 0;
}
