#pragma once
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "amb/format.h"

namespace amb {

struct ArchiveData {
    std::filesystem::path path;
    std::string image;
    std::vector<EntryRecord> entries;

    std::string_view payload(size_t i) const;

    // entry index or -1
    int find(std::string_view name) const;

    // .AMA entries in archive order (position i == chunk id i)
    std::vector<size_t> article_entries() const;
};

bool load_archive_bytes(std::string image, ArchiveData& out, std::string* err);

bool load_archive(const std::filesystem::path& path, ArchiveData& out, std::string* err);

// optional companion file; returns false with *err set when it is unreadable
bool read_file_bytes(const std::filesystem::path& path, std::string& out, std::string* err);

} // namespace amb
