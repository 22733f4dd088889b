#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "amb/errors.h"

namespace amb {

// AMB container:
//   "AMB1" | u16 entry count | entries (20 B each) | payloads
//   entry: name[12] (NUL padded) | u32 offset | u16 length | u16 bsd checksum
// All integers little-endian.
constexpr char     kAmbMagic[4]      = {'A', 'M', 'B', '1'};
constexpr size_t   kAmbHeaderBytes   = 6;
constexpr size_t   kEntryNameBytes   = 12;
constexpr size_t   kEntryRecordBytes = 20;
constexpr uint32_t kMaxEntryBytes    = 65535;
constexpr size_t   kMaxEntries       = 65535;
constexpr size_t   kMaxTitleBytes    = 64;    // TITLE is truncated to this, stored unpadded

constexpr const char* kTitleEntry      = "TITLE";
constexpr const char* kRootArticle     = "INDEX.AMA";
constexpr const char* kSearchIndexEntry = "SEARCH.IDX";
constexpr const char* kUnicodeMapEntry = "UNICODE.MAP";

struct ArchiveFile {
    std::string name;
    std::string data;
};

struct EntryRecord {
    std::string name;
    uint32_t offset{0};
    uint16_t length{0};
    uint16_t checksum{0};
};

void put_u16(std::string& out, uint16_t v);
void put_u32(std::string& out, uint32_t v);
uint16_t get_u16(std::string_view s, size_t off);
uint32_t get_u32(std::string_view s, size_t off);

// 16-bit rotate-right-then-add (BSD sum)
uint16_t bsd_checksum(std::string_view data);

// upper case 8.3 (or a bare name of up to 8 chars), [A-Z0-9_] only
bool is_valid_83_name(std::string_view name);

// ASCII only, at most 64 bytes
std::string sanitize_title(std::string_view title);

bool pack_amb(const std::vector<ArchiveFile>& files, std::string& out, Error* err);

// Parses the entry table of an AMB image and checks offsets/lengths fit.
bool parse_amb(std::string_view image, std::vector<EntryRecord>& entries, std::string* err);

// companion map next to the archive: "book.amb" -> "book.MAP"
std::filesystem::path default_map_path(const std::filesystem::path& archive_path);

std::string utc_now_compact();

void write_file_tmp(const std::filesystem::path& tmp, std::string_view bytes);

bool atomic_replace_file_best_effort(const std::filesystem::path& tmp,
                                     const std::filesystem::path& fin);

} // namespace amb
