#include "guard/types.h"

#include <algorithm>

namespace promptguard::guard {

bool ValidationResult::HasCategory(DetectionCategory category) const {
    return std::any_of(detections.begin(), detections.end(),
                       [category](const Detection& d) { return d.category == category; });
}

nlohmann::json ValidationResult::ToJson() const {
    nlohmann::json detections_json = nlohmann::json::array();
    for (const auto& detection : detections) {
        detections_json.push_back({
            {"category", std::string(CategoryToString(detection.category))},
            {"evidence", detection.evidence},
        });
    }

    return {
        {"is_valid", is_valid},
        {"threat_level", std::string(ThreatLevelToString(threat_level))},
        {"score", score},
        {"detections", std::move(detections_json)},
        {"message", message},
    };
}

std::string_view ThreatLevelToString(ThreatLevel level) {
    switch (level) {
        case ThreatLevel::kSafe: return "safe";
        case ThreatLevel::kLow: return "low";
        case ThreatLevel::kMedium: return "medium";
        case ThreatLevel::kHigh: return "high";
        case ThreatLevel::kCritical: return "critical";
    }
    return "unknown";
}

std::string_view CategoryToString(DetectionCategory category) {
    switch (category) {
        case DetectionCategory::kPromptLeak: return "prompt_leak";
        case DetectionCategory::kJailbreak: return "jailbreak";
        case DetectionCategory::kSystemTagSpoof: return "system_tag";
        case DetectionCategory::kDangerousKeyword: return "dangerous_keyword";
        case DetectionCategory::kEncodingBypass: return "encoding_bypass";
        case DetectionCategory::kObfuscation: return "obfuscation";
        case DetectionCategory::kExcessiveRepetition: return "excessive_repetition";
        case DetectionCategory::kLengthExceeded: return "length_exceeded";
        case DetectionCategory::kBase64HiddenJailbreak: return "base64_hidden_jailbreak";
    }
    return "unknown";
}

bool CategoryFromString(std::string_view name, DetectionCategory* category) {
    for (DetectionCategory candidate : kAllCategories) {
        if (CategoryToString(candidate) == name) {
            *category = candidate;
            return true;
        }
    }
    return false;
}

}  // namespace promptguard::guard
