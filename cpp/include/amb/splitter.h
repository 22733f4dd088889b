// AMB/cpp/include/amb/splitter.h
#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "amb/codepage.h"
#include "amb/errors.h"
#include "amb/format.h"
#include "amb/naming.h"

namespace amb {

constexpr const char* kContinueLabel = "Continue";
constexpr uint32_t kMinChunkBytes = 64;

struct Chunk {
    uint16_t id{0};      // ordinal in archive order, set by the packer
    std::string name;    // 8.3 entry name
    std::string text;    // encoded article slice
    std::string next;    // name of the following chunk, empty for the last one

    // text + continuation link (when next is set)
    std::string payload() const;
};

struct SplitOptions {
    uint32_t max_chunk_bytes{kMaxEntryBytes};
};

// Bytes appended after `text` to link to `next`:
//   ["\n"] "\n%l<next>:Continue%t\n"
std::string continuation_link(std::string_view text, std::string_view next);

// Worst-case link size (longest 8.3 name, text not ending in '\n').
size_t continuation_reserve();

bool check_split_options(const SplitOptions& opt, Error* err);

// End offsets of each chunk inside encoded. Deterministic; every cut is
// after a '\n' or between two bytes that are not both word characters,
// except when a single word is longer than the budget.
std::vector<size_t> find_chunk_ends(std::string_view encoded, const Codepage& cp, uint32_t max_chunk_bytes);

// Splits one encoded article. The first chunk keeps article_name, later
// ones get continuation names (added to taken).
bool split_article(std::string_view article_name,
                   std::string_view encoded,
                   const Codepage& cp,
                   const SplitOptions& opt,
                   NameSet& taken,
                   std::vector<Chunk>& out,
                   Error* err);

} // namespace amb
