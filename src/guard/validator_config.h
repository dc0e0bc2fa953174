#pragma once

/// @file validator_config.h
/// @brief Validator configuration and tunable scoring constants

#include <cstddef>

#include <absl/status/status.h>
#include <absl/status/statusor.h>

#include "common/config.h"
#include "guard/types.h"

namespace promptguard::guard {

/// @brief Score contribution of each category
///
/// Base64HiddenJailbreak defaults to 0: the payload already contributed the
/// EncodingBypass weight and the category only marks what was found inside.
struct ScoringWeights {
    int prompt_leak = 3;
    int jailbreak = 4;
    int system_tag_spoof = 3;
    int dangerous_keyword = 2;
    int encoding_bypass = 2;
    int obfuscation = 2;
    int excessive_repetition = 1;
    int length_exceeded = 1;
    int base64_hidden_jailbreak = 0;

    int WeightFor(DetectionCategory category) const;
    void SetWeight(DetectionCategory category, int weight);
};

/// @brief Largest accepted max_length, in code points
inline constexpr size_t kMaxLengthLimit = 100000;

/// @brief Configuration fixed for the lifetime of a Validator
struct ValidatorConfig {
    /// Maximum input length in Unicode code points; longer input is truncated
    size_t max_length = 5000;

    /// Strict mode accepts only Safe and Low
    bool strict_mode = false;

    ScoringWeights weights;

    /// A character repeated more than this many times in a row is flooding
    size_t repetition_threshold = 10;

    /// Token dominance is only checked above this many tokens
    size_t min_token_count_for_repetition = 5;

    /// Share of all tokens the most frequent token must exceed
    double dominant_token_ratio = 0.5;

    /// Minimum Base64-alphabet run counted as an encoding bypass
    size_t encoded_run_min_length = 40;

    /// Minimum run the payload inspector tries to decode
    size_t inspector_run_min_length = 20;

    /// Evidence snippets keep at most this many code points
    size_t evidence_max_chars = 30;

    /// @brief Check ranges of all fields
    absl::Status Validate() const;

    /// @brief Read the "validator" section of a configuration
    ///
    /// Missing keys keep their defaults. Weights are read from
    /// validator.weights.<category name>, e.g. validator.weights.jailbreak.
    static absl::StatusOr<ValidatorConfig> FromConfig(const Config& config);
};

}  // namespace promptguard::guard
