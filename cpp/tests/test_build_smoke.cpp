#undef NDEBUG
#include <cassert>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iostream>

#include "amb/builder.h"
#include "amb/reader.h"
#include "amb/validator.h"

static std::filesystem::path mk_tmp_dir() {
    auto base = std::filesystem::temp_directory_path();
    auto p = base / ("amb_smoke_" + std::to_string((uint64_t)std::time(nullptr)));
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

static void write_text(const std::filesystem::path& p, const std::string& s) {
    std::ofstream f(p, std::ios::binary);
    f << s;
}

static void dump(const amb::ValidationResult& vr) {
    for (const auto& e : vr.errors) std::cerr << e << "\n";
}

// 8 lowercase letters, distinct for every i < 26^8
static std::string nth_word(size_t i) {
    std::string w(8, 'a');
    for (size_t k = 0; k < 8; ++k) {
        w[7 - k] = (char)('a' + i % 26);
        i /= 26;
    }
    return w;
}

int main() {
    auto out_root = mk_tmp_dir();
    amb::Error err;

    // demo: one chunk, no link, no map
    {
        const auto archive = out_root / "demo.amb";
        amb::BuildOptions opt;
        amb::BuildStats st;
        assert(amb::build_archive_jsonl(test_data_file("demo.jsonl"), archive, opt, st, &err));

        assert(st.documents == 1);
        assert(st.chunks == 1);
        assert(st.title == "Demo");
        assert(st.codepage == "cp437");
        assert(st.index_present && !st.index_skipped);
        assert(st.high_bytes == 0);
        assert(!st.map_written);
        assert(std::filesystem::exists(archive));
        assert(!std::filesystem::exists(amb::default_map_path(archive)));
        assert(!std::filesystem::exists(archive.string() + ".tmp"));

        amb::ArchiveData a;
        std::string perr;
        assert(amb::load_archive(archive, a, &perr));
        assert(a.entries.size() == 3);
        assert(a.entries[0].name == "TITLE" && a.payload(0) == "Demo");
        assert(a.entries[1].name == "INDEX.AMA");
        assert(a.entries[2].name == "SEARCH.IDX");
        assert(a.payload(1).find("%l") == std::string_view::npos);

        auto vr = amb::validate_archive_file(archive);
        if (!vr.ok) dump(vr);
        assert(vr.ok);
        assert(!vr.has_map);
    }

    // 2500 bytes of text at a 1000-byte budget => three chained chunks
    {
        amb::Document d;
        d.slug = "long";
        d.title = "Long";
        for (int i = 0; i < 50; ++i) d.blocks.push_back(std::string(49, (char)('a' + i % 26)));

        amb::BuildOptions opt;
        opt.max_chunk_bytes = 1000;
        amb::ArchiveImage img;
        assert(amb::build_archive_image({d}, opt, img, &err));
        assert(img.stats.chunks == 3);

        amb::ArchiveData a;
        std::string perr;
        assert(amb::load_archive_bytes(img.archive, a, &perr));
        const auto arts = a.article_entries();
        assert(arts.size() == 3);
        assert(a.entries[arts[0]].name == "INDEX.AMA");
        assert(a.entries[arts[1]].name == "INDEX01.AMA");
        assert(a.entries[arts[2]].name == "INDEX02.AMA");
        for (size_t i : arts) assert(a.entries[i].length <= 1000);

        const std::string_view first = a.payload(arts[0]);
        assert(first.substr(first.size() - 26) == "\n%lINDEX01.AMA:Continue%t\n");
        const std::string_view last = a.payload(arts[2]);
        assert(last.find("%l") == std::string_view::npos);

        auto vr = amb::validate_archive(a, nullptr);
        if (!vr.ok) dump(vr);
        assert(vr.ok);
    }

    // unmappable character: fatal, nothing written
    {
        const auto src = out_root / "euro.jsonl";
        write_text(src, "{\"slug\": \"prices\", \"title\": \"Prices\", \"blocks\": [\"Coffee\", \"Price: 5 \xE2\x82\xAC\"]}\n");
        const auto archive = out_root / "euro.amb";

        amb::BuildOptions opt;
        amb::BuildStats st;
        amb::Error e;
        assert(!amb::build_archive_jsonl(src, archive, opt, st, &e));
        assert(e.code == amb::ErrorCode::UnmappableCharacter);
        assert(e.message.find("U+20AC") != std::string::npos);
        assert(!std::filesystem::exists(archive));
        assert(!std::filesystem::exists(archive.string() + ".tmp"));

        // the same text packs fine with a codepage that has the euro sign
        opt.codepage = "858";
        assert(amb::build_archive_jsonl(src, archive, opt, st, &e));
        assert(st.map_written && st.high_bytes == 1);
        assert(amb::validate_archive_file(archive).ok);
    }

    // location of an unmappable character is taken from the source text
    {
        amb::Document root;
        root.slug = "index";
        root.blocks = {"intro", "%lvery-long-slug-name:x%t \xE2\x82\xAC"};
        amb::Document other;
        other.slug = "very-long-slug-name";
        other.blocks = {"target"};

        amb::BuildOptions opt;
        amb::ArchiveImage img;
        amb::Error e;
        assert(!amb::build_archive_image({root, other}, opt, img, &e));
        assert(e.code == amb::ErrorCode::UnmappableCharacter);
        assert(e.message.find("'index'") != std::string::npos);
        assert(e.message.find("line 2, column 27") != std::string::npos);
    }

    // unknown codepage
    {
        amb::BuildOptions opt;
        opt.codepage = "cp9999";
        amb::BuildStats st;
        amb::Error e;
        assert(!amb::build_archive_jsonl(test_data_file("demo.jsonl"), out_root / "bad.amb", opt, st, &e));
        assert(e.code == amb::ErrorCode::UnsupportedCodepage);
        assert(!std::filesystem::exists(out_root / "bad.amb"));
    }

    // index over the ceiling is dropped, the archive still builds
    {
        amb::Document d;
        d.slug = "words";
        d.title = "Words";
        std::string block;
        for (size_t i = 0; i < 5000; ++i) {
            block += nth_word(i);
            block += (i % 10 == 9) ? "\n" : " ";
        }
        d.blocks.push_back(block);

        amb::BuildOptions opt;
        amb::ArchiveImage img;
        assert(amb::build_archive_image({d}, opt, img, &err));
        assert(img.stats.index_skipped);
        assert(!img.stats.index_present);
        assert(img.stats.index_bytes > amb::kMaxEntryBytes);
        assert(img.stats.warnings.size() == 1);

        amb::ArchiveData a;
        std::string perr;
        assert(amb::load_archive_bytes(img.archive, a, &perr));
        assert(a.find(amb::kSearchIndexEntry) < 0);
        assert(amb::validate_archive(a, nullptr).ok);

        // AMB_NO_INDEX skips it without a warning
        opt.build_index = false;
        assert(amb::build_archive_image({d}, opt, img, &err));
        assert(!img.stats.index_present && !img.stats.index_skipped);
        assert(img.stats.warnings.empty());
    }

    // linked book with accents: companion map, rewritten links, deterministic bytes
    {
        const auto archive = out_root / "book.amb";
        amb::BuildOptions opt;
        amb::BuildStats st;
        assert(amb::build_archive_jsonl(test_data_file("book.jsonl"), archive, opt, st, &err));
        assert(st.documents == 3);
        assert(st.title == "Caf Guide");
        assert(st.map_written);
        assert(st.high_bytes == 3);
        assert(std::filesystem::exists(st.map_path));
        assert(std::filesystem::file_size(st.map_path) == amb::kUnicodeMapBytes);

        amb::ArchiveData a;
        std::string perr;
        assert(amb::load_archive(archive, a, &perr));
        const auto arts = a.article_entries();
        assert(arts.size() == 3);
        assert(a.entries[arts[0]].name == "INDEX.AMA");
        assert(a.entries[arts[1]].name == "HISTORY_.AMA");
        assert(a.entries[arts[2]].name == "RECIPES.AMA");
        assert(a.payload(arts[0]).find("%lRECIPES.AMA:the recipes%t") != std::string_view::npos);
        assert(a.payload(arts[0]).find("%lHISTORY_.AMA:") != std::string_view::npos);
        assert(a.payload(arts[2]).find("%lINDEX.AMA:") != std::string_view::npos);
        assert(a.find(amb::kUnicodeMapEntry) < 0);

        auto vr = amb::validate_archive_file(archive);
        if (!vr.ok) dump(vr);
        assert(vr.ok);
        assert(vr.has_map && vr.has_index);

        std::vector<amb::Document> docs;
        assert(amb::load_documents_jsonl(test_data_file("book.jsonl"), docs, &err));
        amb::ArchiveImage x, y;
        assert(amb::build_archive_image(docs, opt, x, &err));
        assert(amb::build_archive_image(docs, opt, y, &err));
        assert(x.archive == y.archive);
        assert(x.unicode_map == y.unicode_map);

        // embedded map variant
        opt.embed_unicode_map = true;
        amb::ArchiveImage z;
        assert(amb::build_archive_image(docs, opt, z, &err));
        assert(z.unicode_map.empty());
        assert(z.stats.map_embedded);
        amb::ArchiveData za;
        assert(amb::load_archive_bytes(z.archive, za, &perr));
        assert(za.find(amb::kUnicodeMapEntry) == (int)za.entries.size() - 1);
        assert(za.payload((size_t)za.find(amb::kUnicodeMapEntry)) == x.unicode_map);
        assert(amb::validate_archive(za, nullptr).ok);

        // rebuilding embedded over the same path drops the stale companion
        assert(amb::build_archive_jsonl(test_data_file("book.jsonl"), archive, opt, st, &err));
        assert(!std::filesystem::exists(amb::default_map_path(archive)));
    }

    // document contract
    {
        std::vector<amb::Document> docs;
        amb::Error e;
        assert(amb::parse_documents_jsonl("\n{\"slug\": \"a\", \"blocks\": [\"x\"]}\r\n\n", docs, &e));
        assert(docs.size() == 1 && docs[0].title.empty());

        assert(!amb::parse_documents_jsonl("", docs, &e));
        assert(e.code == amb::ErrorCode::MalformedDocument);
        assert(!amb::parse_documents_jsonl("{\"slug\": \"a\"}", docs, &e));
        assert(!amb::parse_documents_jsonl("{\"slug\": \"a\", \"blocks\": [1]}", docs, &e));
        assert(!amb::parse_documents_jsonl("{\"slug\": \"a\", \"blocks\": [\"x\\ty\"]}", docs, &e));
        assert(e.message.find("tab") != std::string::npos);

        amb::Error dup;
        assert(!amb::parse_documents_jsonl("{\"slug\": \"a\", \"blocks\": []}\n{\"slug\": \"a\", \"blocks\": []}\n", docs, &dup));
        assert(dup.code == amb::ErrorCode::MalformedDocument);
        assert(dup.message.find("duplicate") != std::string::npos);

        amb::Error io;
        assert(!amb::load_documents_jsonl(out_root / "nope.jsonl", docs, &io));
        assert(io.code == amb::ErrorCode::IoError);
    }

    // environment overrides
    {
        setenv("AMB_CODEPAGE", "852", 1);
        setenv("AMB_MAX_CHUNK_BYTES", "4096", 1);
        setenv("AMB_NO_INDEX", "1", 1);
        setenv("AMB_EMBED_MAP", "true", 1);
        const amb::BuildOptions opt = amb::options_from_env();
        assert(opt.codepage == "852");
        assert(opt.max_chunk_bytes == 4096);
        assert(!opt.build_index);
        assert(opt.embed_unicode_map);
        unsetenv("AMB_CODEPAGE");
        unsetenv("AMB_MAX_CHUNK_BYTES");
        unsetenv("AMB_NO_INDEX");
        unsetenv("AMB_EMBED_MAP");
    }

    std::filesystem::remove_all(out_root);
    std::cout << "OK\n";
    return 0;
}
