// AMB/cpp/include/amb/indexer.h
#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "amb/codepage.h"
#include "amb/splitter.h"

namespace amb {

constexpr size_t kMinWordChars = 2;
constexpr size_t kMaxWordChars = 17;

// 64 KiB ceiling, capped by what one archive entry can hold
constexpr size_t kMaxIndexBytes = kMaxEntryBytes;

constexpr char kIndexMagic[4] = {'A', 'M', 'I', '1'};

struct Occurrence {
    uint16_t chunk{0};  // Chunk::id
    uint16_t offset{0}; // byte offset inside the chunk payload
};

struct IndexEntry {
    std::u32string key;   // case-folded
    std::string word;     // first-seen spelling, encoded
    std::vector<Occurrence> occurrences; // scan order
};

// SEARCH.IDX layout, little-endian:
//   "AMI1" | u16 words | per word sorted by key:
//   u8 len | bytes | u16 count | count * (u16 chunk, u16 offset)
struct WordIndex {
    std::vector<IndexEntry> entries;

    size_t serialized_size() const;
    std::string serialize() const;
    size_t occurrence_count() const;
};

struct IndexOutcome {
    std::optional<WordIndex> index; // empty when dropped
    bool overflow{false};
    size_t candidate_bytes{0};
    size_t candidate_words{0};
};

// Full candidate index over every chunk, no size limit applied.
WordIndex collect_words(const std::vector<Chunk>& chunks, const Codepage& cp);

// collect_words + the all-or-nothing size ceiling
IndexOutcome build_index(const std::vector<Chunk>& chunks, const Codepage& cp,
                         size_t max_bytes = kMaxIndexBytes);

bool parse_index(std::string_view bytes, WordIndex& out, std::string* err);

} // namespace amb
