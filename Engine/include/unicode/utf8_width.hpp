/**
 * @file utf8_width.hpp
 * @brief UTF-8 lead-byte classification
 *
 * Maps a byte to the total length of the UTF-8 sequence it starts:
 *
 *   0x00..0x7F  -> 1   (ASCII)
 *   0xC2..0xDF  -> 2
 *   0xE0..0xEF  -> 3
 *   0xF0..0xF4  -> 4
 *   otherwise   -> 0   (continuation byte, overlong lead 0xC0/0xC1, or > U+10FFFF)
 *
 * Legal second bytes, per lead (RFC 3629):
 *
 *   Lead      2nd byte
 *   ------------------
 *   E0        A0..BF
 *   ED        80..9F
 *   F0        90..BF
 *   F4        80..8F
 *   others    80..BF
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

namespace Runestream {

namespace detail {

constexpr std::array<uint8_t, 256> make_width_table() {
    std::array<uint8_t, 256> table{};
    for (int b = 0; b < 256; ++b) {
        if (b < 0x80) table[b] = 1;
        else if (b >= 0xC2 && b <= 0xDF) table[b] = 2;
        else if (b >= 0xE0 && b <= 0xEF) table[b] = 3;
        else if (b >= 0xF0 && b <= 0xF4) table[b] = 4;
    }
    return table;
}

inline constexpr std::array<uint8_t, 256> UTF8_WIDTH_TABLE = make_width_table();

} // namespace detail

/**
 * @brief Total byte length of the sequence led by @p b, or 0 if @p b cannot lead one.
 */
constexpr size_t utf8_width(uint8_t b) {
    return detail::UTF8_WIDTH_TABLE[b];
}

constexpr bool is_width_0(uint8_t b) { return utf8_width(b) == 0; }
constexpr bool is_width_1(uint8_t b) { return utf8_width(b) == 1; }
constexpr bool is_width_2(uint8_t b) { return utf8_width(b) == 2; }
constexpr bool is_width_3(uint8_t b) { return utf8_width(b) == 3; }
constexpr bool is_width_4(uint8_t b) { return utf8_width(b) == 4; }

// 10xxxxxx
constexpr bool is_continuation(uint8_t b) {
    return (b & 0xC0) == 0x80;
}

/**
 * @brief Whether @p b may appear at @p index (1..3) of a sequence led by @p lead.
 *
 * Only the second byte (index 1) has lead-dependent bounds; they exclude
 * overlong forms, UTF-16 surrogates and code points above U+10FFFF.
 */
constexpr bool is_valid_continuation(uint8_t lead, size_t index, uint8_t b) {
    if (index == 1) {
        switch (lead) {
            case 0xE0: return b >= 0xA0 && b <= 0xBF;
            case 0xED: return b >= 0x80 && b <= 0x9F;
            case 0xF0: return b >= 0x90 && b <= 0xBF;
            case 0xF4: return b >= 0x80 && b <= 0x8F;
            default: break;
        }
    }
    return is_continuation(b);
}

} // namespace Runestream
