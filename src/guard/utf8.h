#pragma once

/// @file utf8.h
/// @brief Minimal UTF-8 helpers for code-point aware scanning

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace promptguard::guard::utf8 {

/// @brief Decode the code point starting at *index and advance past it
///
/// Malformed or truncated sequences decode as a single byte and return false.
bool DecodeNext(std::string_view text, size_t* index, uint32_t* code_point);

/// @brief Number of code points (malformed bytes count as one each)
size_t Length(std::string_view text);

/// @brief Prefix holding at most max_chars code points
std::string_view Truncate(std::string_view text, size_t max_chars);

/// @brief Copy of bytes with every malformed sequence dropped
std::string DropInvalid(std::string_view bytes);

/// @brief Zero-width / invisible format characters (U+200B..U+200F,
///        U+2060..U+206F)
inline bool IsZeroWidth(uint32_t cp) {
    return (cp >= 0x200B && cp <= 0x200F) || (cp >= 0x2060 && cp <= 0x206F);
}

/// @brief Combining diacritical marks (U+0300..U+036F)
inline bool IsCombiningMark(uint32_t cp) {
    return cp >= 0x0300 && cp <= 0x036F;
}

/// @brief Unicode white space (ASCII controls, NEL, NBSP, the U+2000 block
///        spaces, line/paragraph separators, ideographic space)
inline bool IsWhitespace(uint32_t cp) {
    return (cp >= 0x09 && cp <= 0x0D) || (cp >= 0x1C && cp <= 0x20) || cp == 0x85 ||
           cp == 0xA0 || cp == 0x1680 || (cp >= 0x2000 && cp <= 0x200A) || cp == 0x2028 ||
           cp == 0x2029 || cp == 0x202F || cp == 0x205F || cp == 0x3000;
}

/// @brief Input with all zero-width characters removed
std::string StripZeroWidth(std::string_view text);

/// @brief True when every code point is white space (or the text is empty)
bool IsBlank(std::string_view text);

/// @brief Text without leading and trailing white space
std::string_view Trim(std::string_view text);

/// @brief Replace every white-space run of at least min_run code points
///
/// Shorter runs are copied unchanged.
std::string CollapseWhitespace(std::string_view text, size_t min_run,
                               std::string_view replacement);

}  // namespace promptguard::guard::utf8
