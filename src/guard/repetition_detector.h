#pragma once

/// @file repetition_detector.h
/// @brief Flags low-information flooding inputs

#include <cstddef>
#include <string_view>

namespace promptguard::guard {

inline constexpr size_t kDefaultRepetitionThreshold = 10;

struct RepetitionOptions {
    /// A code point repeated threshold + 1 times in a row triggers
    size_t char_threshold = kDefaultRepetitionThreshold;

    /// Token dominance is checked only when there are more tokens than this
    size_t min_token_count = 5;

    /// The most frequent token must exceed this share of all tokens
    double dominant_ratio = 0.5;
};

/// @brief True if any code point other than newline repeats more than
///        threshold times consecutively
bool HasCharacterRun(std::string_view text, size_t threshold);

/// @brief True if one token (split on Unicode white space) dominates the input
bool HasDominantToken(std::string_view text, size_t min_token_count, double dominant_ratio);

/// @brief Either trigger is sufficient
bool HasExcessiveRepetition(std::string_view text, const RepetitionOptions& options);

inline bool HasExcessiveRepetition(std::string_view text,
                                   size_t threshold = kDefaultRepetitionThreshold) {
    RepetitionOptions options;
    options.char_threshold = threshold;
    return HasExcessiveRepetition(text, options);
}

}  // namespace promptguard::guard
