#pragma once

/// @file utf8.hpp
/// @author Aleksandr Loshkarev
/// @brief UTF-8 encoding utilities shared by the JSON and XML lexers.
///
///   - Encoding a code point to UTF-8 (1-4 bytes)
///   - Combining UTF-16 surrogate pairs from \uXXXX escapes
///   - Code point ranges allowed by XML character references

#include <cstdint>
#include <string>

namespace yadec::detail::utf8 {

/// @brief Encodes a Unicode code point as UTF-8 and appends to the string.
/// @param cp   Unicode code point (0x0000..0x10FFFF).
/// @param out  Destination string for UTF-8 bytes.
/// @return false (and nothing appended) for a code point beyond 0x10FFFF.
inline bool encode(uint32_t cp, std::string& out) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp <= 0x10FFFF) {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        return false;
    }
    return true;
}

// ─── UTF-16 surrogates ──────────────────────────────────────────────────

inline constexpr bool is_high_surrogate(uint32_t u) noexcept { return u >= 0xD800 && u <= 0xDBFF; }
inline constexpr bool is_low_surrogate(uint32_t u) noexcept  { return u >= 0xDC00 && u <= 0xDFFF; }

/// @brief Combine a high/low surrogate pair into one code point.
inline constexpr uint32_t combine_surrogates(uint32_t high, uint32_t low) noexcept {
    return 0x10000 + ((high - 0xD800) << 10) + (low - 0xDC00);
}

// ─── XML ────────────────────────────────────────────────────────────────

/// @brief Whether @p cp matches the XML 1.0 Char production.
inline constexpr bool is_xml_char(uint32_t cp) noexcept {
    return cp == 0x09 || cp == 0x0A || cp == 0x0D ||
           (cp >= 0x20 && cp <= 0xD7FF) ||
           (cp >= 0xE000 && cp <= 0xFFFD) ||
           (cp >= 0x10000 && cp <= 0x10FFFF);
}

} // namespace yadec::detail::utf8
