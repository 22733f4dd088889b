// AMB/cpp/include/amb/builder.h
#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "amb/codepage.h"
#include "amb/document.h"
#include "amb/errors.h"
#include "amb/format.h"

namespace amb {

struct BuildOptions {
    std::string title;                     // empty => root document title
    std::string codepage{kDefaultCodepage};
    uint32_t max_chunk_bytes{kMaxEntryBytes};

    bool build_index{true};

    // store UNICODE.MAP inside the archive instead of next to it
    bool embed_unicode_map{false};
    std::filesystem::path map_path;        // empty => archive path with ".MAP"
};

// Defaults overridden by AMB_CODEPAGE, AMB_MAX_CHUNK_BYTES, AMB_NO_INDEX,
// AMB_EMBED_MAP.
BuildOptions options_from_env();

struct BuildStats {
    std::string codepage;
    std::string title;
    uint64_t documents{0};
    uint64_t chunks{0};
    uint64_t archive_bytes{0};

    bool index_present{false};
    bool index_skipped{false};   // over the size ceiling
    uint64_t index_words{0};
    uint64_t index_occurrences{0};
    uint64_t index_bytes{0};     // candidate size, kept or not

    uint32_t high_bytes{0};      // distinct 0x80..0xFF bytes emitted
    bool map_embedded{false};
    bool map_written{false};

    std::filesystem::path archive_path;
    std::filesystem::path map_path;
    std::string built_at_utc;
    std::vector<std::string> warnings;
};

struct ArchiveImage {
    std::string archive;      // full AMB bytes
    std::string unicode_map;  // companion map bytes, empty when none
    BuildStats stats;
};

// Pure pipeline: documents -> archive bytes. Nothing touches the filesystem.
bool build_archive_image(const std::vector<Document>& docs,
                         const BuildOptions& opt,
                         ArchiveImage& out,
                         Error* err);

// Reads documents JSONL, builds in memory, then commits archive (and the
// companion map) atomically. On failure no output file is left behind.
bool build_archive_jsonl(const std::filesystem::path& documents_jsonl,
                         const std::filesystem::path& archive_path,
                         const BuildOptions& opt,
                         BuildStats& stats,
                         Error* err);

} // namespace amb
