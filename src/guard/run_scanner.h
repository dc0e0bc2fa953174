#pragma once

/// @file run_scanner.h
/// @brief Linear scanners for long runs of one character class
///
/// std::regex recurses once per repeated character, so a quantified class
/// over a long run exhausts the stack. These scans walk the input once and
/// use constant stack.

#include <cstddef>
#include <string_view>

namespace promptguard::guard {

/// @brief First run of at least min_length Base64-alphabet characters
///        ([A-Za-z0-9+/]), extended by up to two trailing '='
/// @param from Byte offset to start searching at
/// @return The run, or an empty view at the end of text when there is none
std::string_view FindBase64Run(std::string_view text, size_t min_length, size_t from = 0);

/// @brief First run of one or more zero-width characters
std::string_view FindZeroWidthRun(std::string_view text);

/// @brief First run of at least min_length combining marks
std::string_view FindCombiningMarkRun(std::string_view text, size_t min_length);

}  // namespace promptguard::guard
