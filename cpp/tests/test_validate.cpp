#undef NDEBUG
#include <cassert>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include "amb/builder.h"
#include "amb/validator.h"

static std::filesystem::path mk_tmp_dir() {
    auto base = std::filesystem::temp_directory_path();
    auto p = base / ("amb_validate_" + std::to_string((uint64_t)std::time(nullptr)));
    std::filesystem::create_directories(p);
    return p;
}

static std::filesystem::path test_data_file(const char* name) {
#ifndef AMB_TEST_DATA_DIR
    return std::filesystem::path("cpp/tests/data") / name; // fallback
#else
    return std::filesystem::path(AMB_TEST_DATA_DIR) / name;
#endif
}

static bool has_error(const amb::ValidationResult& vr, const std::string& needle) {
    for (const auto& e : vr.errors) {
        if (e.find(needle) != std::string::npos) return true;
    }
    return false;
}

int main() {
    amb::Error err;
    std::vector<amb::Document> docs;
    assert(amb::load_documents_jsonl(test_data_file("book.jsonl"), docs, &err));

    amb::BuildOptions opt;
    amb::ArchiveImage img;
    assert(amb::build_archive_image(docs, opt, img, &err));
    assert(!img.unicode_map.empty());

    amb::HighHalfMap map;
    std::string perr;
    assert(amb::parse_unicode_map(img.unicode_map, map, &perr));

    amb::ArchiveData a;
    assert(amb::load_archive_bytes(img.archive, a, &perr));

    auto vr = amb::validate_archive(a, &map);
    for (const auto& e : vr.errors) std::cerr << e << "\n";
    assert(vr.ok);
    assert(vr.articles == 3);
    assert(vr.has_index && vr.index_words > 0);

    // high bytes without any map
    vr = amb::validate_archive(a, nullptr);
    assert(!vr.ok);
    assert(has_error(vr, "no unicode map"));

    // a map that misses a byte, and one that lists an extra byte
    amb::HighHalfMap missing = map;
    missing.slots[0x02] = 0;
    vr = amb::validate_archive(a, &missing);
    assert(!vr.ok && has_error(vr, "misses byte 0x82"));

    amb::HighHalfMap extra = map;
    extra.slots[0x01] = 0x00FC;
    vr = amb::validate_archive(a, &extra);
    assert(!vr.ok && has_error(vr, "lists unused byte 0x81"));

    // flipped payload byte => checksum mismatch in that entry
    {
        std::string bad = img.archive;
        const size_t root = (size_t)a.find(amb::kRootArticle);
        bad[a.entries[root].offset] ^= 0x01;
        amb::ArchiveData b;
        assert(amb::load_archive_bytes(bad, b, &perr));
        vr = amb::validate_archive(b, &map);
        assert(!vr.ok && has_error(vr, "checksum mismatch in INDEX.AMA"));
    }

    // truncated image does not load
    {
        amb::ArchiveData b;
        assert(!amb::load_archive_bytes(img.archive.substr(0, img.archive.size() - 1), b, &perr));
    }

    // files on disk: default companion picked up, explicit wrong-size map refused
    {
        auto out_root = mk_tmp_dir();
        const auto archive = out_root / "book.amb";
        amb::BuildStats st;
        assert(amb::build_archive_jsonl(test_data_file("book.jsonl"), archive, opt, st, &err));
        assert(amb::validate_archive_file(archive).ok);

        const auto short_map = out_root / "short.map";
        {
            std::ofstream f(short_map, std::ios::binary);
            f << img.unicode_map.substr(0, 10);
        }
        vr = amb::validate_archive_file(archive, short_map);
        assert(!vr.ok);

        vr = amb::validate_archive_file(out_root / "missing.amb");
        assert(!vr.ok);

        std::filesystem::remove_all(out_root);
    }

    std::cout << "OK\n";
    return 0;
}
