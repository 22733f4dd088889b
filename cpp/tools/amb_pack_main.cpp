// AMB/cpp/tools/amb_pack_main.cpp
#include <iostream>
#include <string>
#include <filesystem>

#include <nlohmann/json.hpp>
#include "amb/builder.h"
#include "amb/report.h"

static std::string arg_value(int& i, int argc, char** argv) {
    if (i + 1 >= argc) return "";
    return argv[++i];
}

int main(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "Usage: amb_pack <documents.jsonl> <out.amb> [--title T] [--codepage CP]\n"
                     "                [--max-chunk-bytes N] [--no-index] [--embed-map] [--map PATH]\n";
        return 1;
    }

    std::filesystem::path documents = argv[1];
    std::filesystem::path out = argv[2];

    amb::BuildOptions opt = amb::options_from_env();
    for (int i = 3; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--title") opt.title = arg_value(i, argc, argv);
        else if (a == "--codepage") opt.codepage = arg_value(i, argc, argv);
        else if (a == "--max-chunk-bytes") {
            try {
                opt.max_chunk_bytes = (uint32_t)std::stoul(arg_value(i, argc, argv));
            } catch (const std::exception&) {
                std::cerr << "--max-chunk-bytes expects a number\n";
                return 1;
            }
        }
        else if (a == "--no-index") opt.build_index = false;
        else if (a == "--embed-map") opt.embed_unicode_map = true;
        else if (a == "--map") opt.map_path = arg_value(i, argc, argv);
        else {
            std::cerr << "Unknown option: " << a << "\n";
            return 1;
        }
    }

    amb::BuildStats st;
    amb::Error err;
    if (!amb::build_archive_jsonl(documents, out, opt, st, &err)) {
        std::cerr << "amb_pack failed: " << err.message << "\n";
        std::cout << amb::to_json(err).dump() << "\n";
        return 2;
    }

    std::cout << amb::to_json(st).dump() << "\n";
    return 0;
}
