// AMB/cpp/include/amb/codepage.h
#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "amb/errors.h"

namespace amb {

constexpr const char* kDefaultCodepage = "437";

// Immutable 8-bit codepage. Bytes 0x00..0x7F are identity, the high half comes
// from a 128-entry table (0 = undefined byte).
class Codepage {
public:
    Codepage(std::string canonical, const std::array<uint32_t, 128>& high);

    const std::string& name() const { return name_; }

    bool encode(uint32_t cp, uint8_t& out) const;

    // 0 for an undefined high byte
    uint32_t decode(uint8_t b) const;

private:
    std::string name_;
    std::array<uint32_t, 128> high_{};
    std::unordered_map<uint32_t, uint8_t> enc_;
};

// "IBM-437", "dos_437", "437" -> "cp437"; "Kamenicky" -> "kam"
std::string normalize_codepage_name(std::string_view raw);

std::optional<Codepage> resolve_codepage(std::string_view name, Error* err);

// Encodes text into out. An unmappable code point fails with
// UnmappableCharacter naming the character, slug, line and column.
bool encode_text(const Codepage& cp,
                 std::u32string_view text,
                 std::string_view slug,
                 std::string& out,
                 Error* err);

std::u32string decode_text(const Codepage& cp, std::string_view bytes);

} // namespace amb
