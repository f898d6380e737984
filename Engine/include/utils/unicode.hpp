#pragma once

#include <unicode/utf8_width.hpp>
#include <string>
#include <string_view>
#include <cstddef>
#include <cstdint>

namespace Runestream {

/**
 * @brief True for U+0000..U+10FFFF excluding the surrogate range U+D800..U+DFFF.
 */
inline bool is_scalar_value(char32_t cp) {
    return cp <= 0x10FFFF && (cp < 0xD800 || cp > 0xDFFF);
}

/**
 * @brief Encode one scalar value into @p out.
 * @return Number of bytes written (1-4). @p cp must satisfy is_scalar_value().
 */
inline size_t encode_utf8(char32_t cp, char out[4]) {
    if (cp < 0x80) {
        out[0] = static_cast<char>(cp);
        return 1;
    }
    if (cp < 0x800) {
        out[0] = static_cast<char>(0xC0 | (cp >> 6));
        out[1] = static_cast<char>(0x80 | (cp & 0x3F));
        return 2;
    }
    if (cp < 0x10000) {
        out[0] = static_cast<char>(0xE0 | (cp >> 12));
        out[1] = static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out[2] = static_cast<char>(0x80 | (cp & 0x3F));
        return 3;
    }
    out[0] = static_cast<char>(0xF0 | (cp >> 18));
    out[1] = static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
    out[2] = static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out[3] = static_cast<char>(0x80 | (cp & 0x3F));
    return 4;
}

/**
 * @brief Decode UTF-8 text into codepoints.
 *
 * Intended for text that already passed validation. Bytes that cannot lead a
 * sequence, and a sequence cut short by the end of input, are skipped.
 */
inline std::u32string utf8_to_utf32(std::string_view s) {
    std::u32string out;
    out.reserve(s.size());
    size_t i = 0;
    while (i < s.size()) {
        const auto lead = static_cast<uint8_t>(s[i]);
        const size_t width = utf8_width(lead);
        if (width == 0 || i + width > s.size()) { ++i; continue; }

        char32_t cp = (width == 1) ? lead : (lead & (0xFF >> (width + 1)));
        for (size_t j = 1; j < width; ++j) {
            cp = (cp << 6) | (static_cast<uint8_t>(s[i + j]) & 0x3F);
        }
        out.push_back(cp);
        i += width;
    }
    return out;
}

inline std::string utf32_to_utf8(const std::u32string& s) {
    std::string out;
    out.reserve(s.size() * 3 / 2);
    char units[4];
    for (char32_t cp : s) {
        out.append(units, encode_utf8(cp, units));
    }
    return out;
}

} // namespace Runestream
