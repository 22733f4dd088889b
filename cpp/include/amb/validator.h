#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "amb/reader.h"
#include "amb/unicode_map.h"

namespace amb {

struct ValidationResult {
    bool ok{false};
    std::vector<std::string> errors;

    uint64_t articles{0};
    uint64_t index_words{0};
    bool has_index{false};
    bool has_map{false};
};

// companion may be null (then an embedded UNICODE.MAP is used, if any)
ValidationResult validate_archive(const ArchiveData& a, const HighHalfMap* companion);

// map_path empty => the default companion path, used only when it exists
ValidationResult validate_archive_file(const std::filesystem::path& archive_path,
                                       const std::filesystem::path& map_path = {});

} // namespace amb
