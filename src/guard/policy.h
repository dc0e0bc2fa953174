#pragma once

/// @file policy.h
/// @brief Score-to-level mapping, accept/reject policy and sanitization

#include <string>
#include <string_view>

#include "guard/types.h"

namespace promptguard::guard {

inline constexpr std::string_view kOkMessage = "OK";
inline constexpr std::string_view kEmptyInputMessage = "Empty input";

/// @brief 0 -> Safe, 1-2 -> Low, 3-4 -> Medium, 5-6 -> High, 7+ -> Critical
ThreatLevel LevelForScore(int score);

/// @brief Strict mode accepts Safe and Low; normal mode rejects High and
///        Critical
bool IsAcceptable(ThreatLevel level, bool strict_mode);

/// @brief User-facing text for a rejected input
std::string_view RejectionMessage(ThreatLevel level);

/// @brief Normalize accepted text before it is forwarded
///
/// Removes zero-width characters and tag-shaped substrings, collapses runs of
/// three or more Unicode white-space characters to two spaces, and trims
/// Unicode white space. Tags are
/// removed before whitespace is collapsed so that the result is a fixed
/// point: Sanitize(Sanitize(x)) == Sanitize(x).
std::string Sanitize(std::string_view text);

}  // namespace promptguard::guard
