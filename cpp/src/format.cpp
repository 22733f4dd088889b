// AMB/cpp/src/format.cpp
#include "amb/format.h"

#include <chrono>
#include <cstring>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace amb {

void put_u16(std::string& out, uint16_t v) {
    out.push_back((char)(v & 0xFF));
    out.push_back((char)((v >> 8) & 0xFF));
}

void put_u32(std::string& out, uint32_t v) {
    for (int sh = 0; sh < 32; sh += 8) out.push_back((char)((v >> sh) & 0xFF));
}

uint16_t get_u16(std::string_view s, size_t off) {
    return (uint16_t)((uint16_t)(unsigned char)s[off] | ((uint16_t)(unsigned char)s[off + 1] << 8));
}

uint32_t get_u32(std::string_view s, size_t off) {
    uint32_t v = 0;
    for (int i = 3; i >= 0; --i) v = (v << 8) | (uint32_t)(unsigned char)s[off + (size_t)i];
    return v;
}

uint16_t bsd_checksum(std::string_view data) {
    uint16_t sum = 0;
    for (unsigned char b : data) {
        sum = (uint16_t)((sum >> 1) | ((sum & 1u) << 15));
        sum = (uint16_t)(sum + b);
    }
    return sum;
}

static bool is_name_char(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_';
}

bool is_valid_83_name(std::string_view name) {
    if (name.empty() || name.size() > kEntryNameBytes) return false;
    const size_t dot = name.find('.');
    const std::string_view base = name.substr(0, dot);
    if (base.empty() || base.size() > 8) return false;
    for (char c : base) if (!is_name_char(c)) return false;
    if (dot == std::string_view::npos) return true;

    const std::string_view ext = name.substr(dot + 1);
    if (ext.empty() || ext.size() > 3) return false;
    for (char c : ext) if (!is_name_char(c)) return false;
    return true;
}

std::string sanitize_title(std::string_view title) {
    std::string out;
    out.reserve(kMaxTitleBytes);
    for (unsigned char c : title) {
        if (c >= 0x80) continue;
        out.push_back((char)c);
        if (out.size() == kMaxTitleBytes) break;
    }
    return out;
}

bool pack_amb(const std::vector<ArchiveFile>& files, std::string& out, Error* err) {
    out.clear();
    if (files.size() > kMaxEntries) {
        return fail(err, ErrorCode::InvalidArgs, "too many archive entries: " + std::to_string(files.size()));
    }

    uint64_t offset = kAmbHeaderBytes + kEntryRecordBytes * (uint64_t)files.size();
    uint64_t total = offset;
    for (const auto& f : files) {
        if (!is_valid_83_name(f.name)) {
            return fail(err, ErrorCode::InvalidArgs, "entry name '" + f.name + "' does not fit 8.3 constraints");
        }
        if (f.data.size() > kMaxEntryBytes) {
            return fail(err, ErrorCode::ArticleTooLarge,
                        "entry '" + f.name + "' is " + std::to_string(f.data.size()) +
                        " bytes, limit is " + std::to_string(kMaxEntryBytes));
        }
        total += f.data.size();
    }
    if (total > 0xFFFFFFFFull) {
        return fail(err, ErrorCode::ArticleTooLarge, "archive exceeds 4 GiB");
    }

    out.reserve((size_t)total);
    out.append(kAmbMagic, 4);
    put_u16(out, (uint16_t)files.size());

    for (const auto& f : files) {
        std::string name = f.name;
        name.resize(kEntryNameBytes, '\0');
        out += name;
        put_u32(out, (uint32_t)offset);
        put_u16(out, (uint16_t)f.data.size());
        put_u16(out, bsd_checksum(f.data));
        offset += f.data.size();
    }

    for (const auto& f : files) out += f.data;
    return true;
}

bool parse_amb(std::string_view image, std::vector<EntryRecord>& entries, std::string* err) {
    entries.clear();
    if (image.size() < kAmbHeaderBytes || std::memcmp(image.data(), kAmbMagic, 4) != 0) {
        if (err) *err = "missing AMB1 magic";
        return false;
    }

    const uint16_t count = get_u16(image, 4);
    const size_t table_end = kAmbHeaderBytes + kEntryRecordBytes * (size_t)count;
    if (image.size() < table_end) {
        if (err) *err = "entry table truncated";
        return false;
    }

    entries.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        const size_t rec = kAmbHeaderBytes + i * kEntryRecordBytes;
        EntryRecord e;
        std::string_view raw = image.substr(rec, kEntryNameBytes);
        const size_t nul = raw.find('\0');
        e.name = std::string(raw.substr(0, nul));
        e.offset = get_u32(image, rec + 12);
        e.length = get_u16(image, rec + 16);
        e.checksum = get_u16(image, rec + 18);

        if (e.offset < table_end || (uint64_t)e.offset + e.length > image.size()) {
            if (err) *err = "entry '" + e.name + "' points outside the archive";
            return false;
        }
        entries.push_back(std::move(e));
    }
    return true;
}

std::filesystem::path default_map_path(const std::filesystem::path& archive_path) {
    std::filesystem::path p = archive_path;
    p.replace_extension(".MAP");
    return p;
}

std::string utc_now_compact() {
    using namespace std::chrono;
    const auto now = system_clock::now();
    const std::time_t t = system_clock::to_time_t(now);
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &t);
#else
    gmtime_r(&t, &tm);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y%m%d_%H%M%S");
    return oss.str();
}

void write_file_tmp(const std::filesystem::path& tmp, std::string_view bytes) {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out) throw AmbException("cannot open " + tmp.string());
    out.write(bytes.data(), (std::streamsize)bytes.size());
    out.flush();
    if (!out) throw AmbException("write failed: " + tmp.string());
}

bool atomic_replace_file_best_effort(const std::filesystem::path& tmp,
                                     const std::filesystem::path& fin) {
    try {
        std::error_code ec;
        if (fin.has_parent_path()) std::filesystem::create_directories(fin.parent_path(), ec);

        std::filesystem::rename(tmp, fin, ec);
        if (!ec) return true;

        std::filesystem::remove(fin, ec);
        ec.clear();
        std::filesystem::rename(tmp, fin, ec);
        if (!ec) return true;

        std::cerr << "[amb] atomic_replace failed: " << ec.message()
                  << " tmp=" << tmp << " fin=" << fin << "\n";
        return false;
    } catch (const std::exception& e) {
        std::cerr << "[amb] atomic_replace exception: " << e.what()
                  << " tmp=" << tmp << " fin=" << fin << "\n";
        return false;
    }
}

} // namespace amb
