#include "amb/reader.h"

#include <fstream>
#include <sstream>
#include <utility>

namespace amb {

static bool ends_with(std::string_view s, std::string_view suffix) {
    return s.size() >= suffix.size() && s.substr(s.size() - suffix.size()) == suffix;
}

std::string_view ArchiveData::payload(size_t i) const {
    const auto& e = entries[i];
    return std::string_view(image).substr(e.offset, e.length);
}

int ArchiveData::find(std::string_view name) const {
    for (size_t i = 0; i < entries.size(); ++i) {
        if (entries[i].name == name) return (int)i;
    }
    return -1;
}

std::vector<size_t> ArchiveData::article_entries() const {
    std::vector<size_t> out;
    for (size_t i = 0; i < entries.size(); ++i) {
        if (ends_with(entries[i].name, ".AMA")) out.push_back(i);
    }
    return out;
}

bool read_file_bytes(const std::filesystem::path& path, std::string& out, std::string* err) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        if (err) *err = "cannot open " + path.string();
        return false;
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad()) {
        if (err) *err = "read failed: " + path.string();
        return false;
    }
    out = ss.str();
    return true;
}

bool load_archive_bytes(std::string image, ArchiveData& out, std::string* err) {
    out.image = std::move(image);
    return parse_amb(out.image, out.entries, err);
}

bool load_archive(const std::filesystem::path& path, ArchiveData& out, std::string* err) {
    out = ArchiveData{};
    out.path = path;

    std::string bytes;
    if (!read_file_bytes(path, bytes, err)) return false;
    if (!load_archive_bytes(std::move(bytes), out, err)) {
        if (err) *err = path.string() + ": " + *err;
        return false;
    }
    return true;
}

} // namespace amb
