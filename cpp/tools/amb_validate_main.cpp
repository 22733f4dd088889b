// AMB/cpp/tools/amb_validate_main.cpp
#include <iostream>
#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>
#include "amb/report.h"
#include "amb/validator.h"

static std::string arg_value(int& i, int argc, char** argv) {
    if (i + 1 >= argc) return "";
    return argv[++i];
}

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "Usage: amb_validate <archive.amb> [--map PATH]\n";
        return 1;
    }

    std::filesystem::path archive = argv[1];
    std::filesystem::path map_path;

    for (int i = 2; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--map") map_path = arg_value(i, argc, argv);
        else {
            std::cerr << "Unknown option: " << a << "\n";
            return 1;
        }
    }

    amb::ValidationResult vr = amb::validate_archive_file(archive, map_path);
    std::cout << amb::to_json(vr).dump() << "\n";
    return vr.ok ? 0 : 2;
}
