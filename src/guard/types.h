#pragma once

/// @file types.h
/// @brief Core value types of the input-validation engine

#include <array>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace promptguard::guard {

/// @brief Ordered severity bucket derived from the accumulated score
enum class ThreatLevel {
    kSafe,
    kLow,
    kMedium,
    kHigh,
    kCritical
};

/// @brief Attack family a detection belongs to
enum class DetectionCategory {
    kPromptLeak,             ///< System prompt extraction
    kJailbreak,              ///< Persona switch / restriction removal
    kSystemTagSpoof,         ///< Fake system or role markers
    kDangerousKeyword,       ///< Command / destructive keywords
    kEncodingBypass,         ///< Base64 runs, hex/unicode escapes, HTML entities
    kObfuscation,            ///< Zero-width and stacked combining characters
    kExcessiveRepetition,    ///< Flooding with one character or token
    kLengthExceeded,         ///< Input longer than the configured maximum
    kBase64HiddenJailbreak   ///< Jailbreak phrase inside a Base64 payload
};

inline constexpr size_t kDetectionCategoryCount = 9;

/// @brief All categories in detection order
inline constexpr std::array<DetectionCategory, kDetectionCategoryCount> kAllCategories = {
    DetectionCategory::kLengthExceeded,
    DetectionCategory::kPromptLeak,
    DetectionCategory::kJailbreak,
    DetectionCategory::kSystemTagSpoof,
    DetectionCategory::kDangerousKeyword,
    DetectionCategory::kEncodingBypass,
    DetectionCategory::kBase64HiddenJailbreak,
    DetectionCategory::kObfuscation,
    DetectionCategory::kExcessiveRepetition,
};

/// @brief One triggered category with a bounded evidence snippet
struct Detection {
    DetectionCategory category;
    std::string evidence;

    bool operator==(const Detection& other) const {
        return category == other.category && evidence == other.evidence;
    }
};

/// @brief Outcome of validating one input
///
/// sanitized_input is non-empty only when is_valid is true. detections is
/// empty iff threat_level is kSafe.
struct ValidationResult {
    bool is_valid = true;
    ThreatLevel threat_level = ThreatLevel::kSafe;
    std::string sanitized_input;
    std::vector<Detection> detections;
    std::string message;

    /// Accumulated score the level was derived from
    int score = 0;

    /// @brief True if any detection has the given category
    bool HasCategory(DetectionCategory category) const;

    /// @brief Audit record: verdict, level, score and evidence. Never carries
    ///        the raw input.
    nlohmann::json ToJson() const;
};

std::string_view ThreatLevelToString(ThreatLevel level);
std::string_view CategoryToString(DetectionCategory category);

/// @brief Inverse of CategoryToString
/// @return false if the name is not a known category
bool CategoryFromString(std::string_view name, DetectionCategory* category);

}  // namespace promptguard::guard
