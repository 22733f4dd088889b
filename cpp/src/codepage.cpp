// AMB/cpp/src/codepage.cpp
#include "amb/codepage.h"

#include <algorithm>
#include <cctype>
#include <utility>
#include <vector>

#include "codepage_tables.h"
#include "text_common.h"

namespace amb {

namespace {

struct Override {
    uint8_t byte;
    uint32_t cp;
};

// Kamenicky (Czech/Slovak): cp437 with these bytes replaced
const Override k_kam_overrides[] = {
    {128, 0x010C}, {131, 0x010F}, {133, 0x010E}, {134, 0x0164}, {135, 0x010D},
    {136, 0x011B}, {137, 0x011A}, {138, 0x0139}, {139, 0x00CD}, {140, 0x013E},
    {141, 0x013A}, {143, 0x00C1}, {145, 0x017E}, {146, 0x017D}, {149, 0x00D3},
    {150, 0x016F}, {151, 0x00DA}, {152, 0x00FD}, {155, 0x0160}, {156, 0x013D},
    {157, 0x00DD}, {158, 0x0158}, {159, 0x0165}, {164, 0x0148}, {165, 0x0147},
    {166, 0x016E}, {167, 0x00D4}, {168, 0x0161}, {169, 0x0159}, {170, 0x0155},
    {171, 0x0154}, {173, 0x00A7},
};

// Mazovia (Polish): cp437 with these bytes replaced
const Override k_maz_overrides[] = {
    {134, 0x0105}, {141, 0x0107}, {143, 0x0104}, {144, 0x0118}, {145, 0x0119},
    {146, 0x0142}, {149, 0x0106}, {152, 0x015A}, {156, 0x0141}, {158, 0x015B},
    {160, 0x0179}, {161, 0x017B}, {163, 0x00D3}, {164, 0x0144}, {165, 0x0143},
    {166, 0x017A}, {167, 0x017C},
};

static const std::vector<std::pair<const char*, const char*>>& aliases() {
    static const std::vector<std::pair<const char*, const char*>> a = {
        {"ibm437", "cp437"},   {"dos437", "cp437"},
        {"windows1250", "cp1250"}, {"win1250", "cp1250"},
        {"windows1252", "cp1252"}, {"win1252", "cp1252"},
        {"kam", "kam"}, {"kamenicky", "kam"}, {"kamenickyencoding", "kam"},
        {"maz", "maz"}, {"mazovia", "maz"},
    };
    return a;
}

static bool all_digits(std::string_view s) {
    if (s.empty()) return false;
    return std::all_of(s.begin(), s.end(), [](char c) { return c >= '0' && c <= '9'; });
}

static std::array<uint32_t, 128> widen(const uint16_t (&t)[128]) {
    std::array<uint32_t, 128> out{};
    for (size_t i = 0; i < 128; ++i) out[i] = t[i];
    return out;
}

template <size_t N>
static std::array<uint32_t, 128> with_overrides(const uint16_t (&base)[128], const Override (&ov)[N]) {
    std::array<uint32_t, 128> out = widen(base);
    for (const auto& o : ov) out[(size_t)(o.byte - 0x80)] = o.cp;
    return out;
}

} // namespace

Codepage::Codepage(std::string canonical, const std::array<uint32_t, 128>& high)
    : name_(std::move(canonical)), high_(high) {
    enc_.reserve(128);
    // first byte wins when two bytes share a code point
    for (size_t i = 0; i < 128; ++i) {
        const uint32_t cp = high_[i];
        if (cp < 0x80) continue;
        enc_.emplace(cp, (uint8_t)(0x80 + i));
    }
}

bool Codepage::encode(uint32_t cp, uint8_t& out) const {
    if (cp < 0x80) {
        out = (uint8_t)cp;
        return true;
    }
    auto it = enc_.find(cp);
    if (it == enc_.end()) return false;
    out = it->second;
    return true;
}

uint32_t Codepage::decode(uint8_t b) const {
    if (b < 0x80) return b;
    return high_[(size_t)(b - 0x80)];
}

std::string normalize_codepage_name(std::string_view raw) {
    std::string t;
    t.reserve(raw.size());
    for (char c : raw) {
        if (c == '-' || c == '_' || std::isspace((unsigned char)c)) continue;
        t.push_back((char)std::tolower((unsigned char)c));
    }

    for (const auto& a : aliases()) {
        if (t == a.first) return a.second;
    }

    const std::string_view sv(t);
    if (sv.size() > 3 && sv.substr(0, 3) == "ibm" && all_digits(sv.substr(3))) return "cp" + t.substr(3);
    if (sv.size() > 3 && sv.substr(0, 3) == "dos" && all_digits(sv.substr(3))) return "cp" + t.substr(3);
    if (sv.size() > 7 && sv.substr(0, 7) == "windows" && all_digits(sv.substr(7))) return "cp" + t.substr(7);
    if (sv.size() > 3 && sv.substr(0, 3) == "win" && all_digits(sv.substr(3))) return "cp" + t.substr(3);
    if (all_digits(sv)) return "cp" + t;
    return t;
}

std::optional<Codepage> resolve_codepage(std::string_view name, Error* err) {
    const std::string c = normalize_codepage_name(name);

    if (c == "cp437")  return Codepage(c, widen(tables::k_cp437_high));
    if (c == "cp775")  return Codepage(c, widen(tables::k_cp775_high));
    if (c == "cp850")  return Codepage(c, widen(tables::k_cp850_high));
    if (c == "cp852")  return Codepage(c, widen(tables::k_cp852_high));
    if (c == "cp857")  return Codepage(c, widen(tables::k_cp857_high));
    if (c == "cp858")  return Codepage(c, widen(tables::k_cp858_high));
    if (c == "cp866")  return Codepage(c, widen(tables::k_cp866_high));
    if (c == "cp1250") return Codepage(c, widen(tables::k_cp1250_high));
    if (c == "cp1252") return Codepage(c, widen(tables::k_cp1252_high));

    if (c == "cp808") {
        // cp866 with the euro sign at 0xFD
        std::array<uint32_t, 128> t = widen(tables::k_cp866_high);
        t[0xFD - 0x80] = 0x20AC;
        return Codepage(c, t);
    }
    if (c == "kam") return Codepage(c, with_overrides(tables::k_cp437_high, k_kam_overrides));
    if (c == "maz") return Codepage(c, with_overrides(tables::k_cp437_high, k_maz_overrides));

    fail(err, ErrorCode::UnsupportedCodepage, "unsupported codepage '" + std::string(name) + "'");
    return std::nullopt;
}

bool encode_text(const Codepage& cp,
                 std::u32string_view text,
                 std::string_view slug,
                 std::string& out,
                 Error* err) {
    out.clear();
    out.reserve(text.size());

    for (size_t i = 0; i < text.size(); ++i) {
        uint8_t b = 0;
        if (!cp.encode((uint32_t)text[i], b)) {
            uint32_t line = 0, col = 0;
            line_col_at(text, i, line, col);
            return fail(err, ErrorCode::UnmappableCharacter,
                        "character " + describe_codepoint((uint32_t)text[i]) +
                        " in document '" + std::string(slug) + "' at line " + std::to_string(line) +
                        ", column " + std::to_string(col) +
                        " is not representable in codepage '" + cp.name() + "'");
        }
        out.push_back((char)b);
    }
    return true;
}

std::u32string decode_text(const Codepage& cp, std::string_view bytes) {
    std::u32string out;
    out.reserve(bytes.size());
    for (char c : bytes) out.push_back((char32_t)cp.decode((uint8_t)c));
    return out;
}

} // namespace amb
