// AMB/cpp/src/codepage_tables.h
#pragma once
#include <cstdint>

namespace amb {
namespace tables {

extern const uint16_t k_cp437_high[128];
extern const uint16_t k_cp775_high[128];
extern const uint16_t k_cp850_high[128];
extern const uint16_t k_cp852_high[128];
extern const uint16_t k_cp857_high[128];
extern const uint16_t k_cp858_high[128];
extern const uint16_t k_cp866_high[128];
extern const uint16_t k_cp1250_high[128];
extern const uint16_t k_cp1252_high[128];

} // namespace tables
} // namespace amb
