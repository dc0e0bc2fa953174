#include "guard/validator_config.h"

#include <absl/strings/str_cat.h>

#include "common/error.h"

namespace promptguard::guard {

int ScoringWeights::WeightFor(DetectionCategory category) const {
    switch (category) {
        case DetectionCategory::kPromptLeak: return prompt_leak;
        case DetectionCategory::kJailbreak: return jailbreak;
        case DetectionCategory::kSystemTagSpoof: return system_tag_spoof;
        case DetectionCategory::kDangerousKeyword: return dangerous_keyword;
        case DetectionCategory::kEncodingBypass: return encoding_bypass;
        case DetectionCategory::kObfuscation: return obfuscation;
        case DetectionCategory::kExcessiveRepetition: return excessive_repetition;
        case DetectionCategory::kLengthExceeded: return length_exceeded;
        case DetectionCategory::kBase64HiddenJailbreak: return base64_hidden_jailbreak;
    }
    return 0;
}

void ScoringWeights::SetWeight(DetectionCategory category, int weight) {
    switch (category) {
        case DetectionCategory::kPromptLeak: prompt_leak = weight; break;
        case DetectionCategory::kJailbreak: jailbreak = weight; break;
        case DetectionCategory::kSystemTagSpoof: system_tag_spoof = weight; break;
        case DetectionCategory::kDangerousKeyword: dangerous_keyword = weight; break;
        case DetectionCategory::kEncodingBypass: encoding_bypass = weight; break;
        case DetectionCategory::kObfuscation: obfuscation = weight; break;
        case DetectionCategory::kExcessiveRepetition: excessive_repetition = weight; break;
        case DetectionCategory::kLengthExceeded: length_exceeded = weight; break;
        case DetectionCategory::kBase64HiddenJailbreak: base64_hidden_jailbreak = weight; break;
    }
}

absl::Status ValidatorConfig::Validate() const {
    PROMPTGUARD_CHECK_OR_RETURN(max_length > 0,
        ConfigurationError("max_length must be positive"));
    PROMPTGUARD_CHECK_OR_RETURN(max_length <= kMaxLengthLimit,
        ConfigurationError(absl::StrCat("max_length must be at most ", kMaxLengthLimit)));
    PROMPTGUARD_CHECK_OR_RETURN(repetition_threshold >= 1,
        ConfigurationError("repetition_threshold must be at least 1"));
    PROMPTGUARD_CHECK_OR_RETURN(dominant_token_ratio > 0.0 && dominant_token_ratio <= 1.0,
        ConfigurationError("dominant_token_ratio must be in (0, 1]"));
    PROMPTGUARD_CHECK_OR_RETURN(encoded_run_min_length >= 4,
        ConfigurationError("encoded_run_min_length must be at least 4"));
    PROMPTGUARD_CHECK_OR_RETURN(inspector_run_min_length >= 4,
        ConfigurationError("inspector_run_min_length must be at least 4"));
    PROMPTGUARD_CHECK_OR_RETURN(evidence_max_chars >= 1,
        ConfigurationError("evidence_max_chars must be at least 1"));

    // A zero weight would let a detection coexist with a Safe verdict. The
    // hidden-payload flag is exempt: it always follows an encoding detection.
    for (DetectionCategory category : kAllCategories) {
        const int minimum = category == DetectionCategory::kBase64HiddenJailbreak ? 0 : 1;
        if (weights.WeightFor(category) < minimum) {
            return ConfigurationError(absl::StrCat(
                "weight for ", std::string(CategoryToString(category)), " must be at least ", minimum));
        }
    }
    return absl::OkStatus();
}

absl::StatusOr<ValidatorConfig> ValidatorConfig::FromConfig(const Config& config) {
    ValidatorConfig result;

    // Read signed so that negative values are rejected instead of wrapping
    auto read_size = [&config](const std::string& key, size_t* out) -> absl::Status {
        int64_t value = 0;
        PROMPTGUARD_ASSIGN_OR_RETURN(value, config.Read<int64_t>(key, static_cast<int64_t>(*out)));
        if (value < 0) {
            return ConfigurationError(absl::StrCat(key, " must not be negative"));
        }
        *out = static_cast<size_t>(value);
        return absl::OkStatus();
    };

    PROMPTGUARD_RETURN_IF_ERROR(read_size("validator.max_length", &result.max_length));
    PROMPTGUARD_RETURN_IF_ERROR(
        read_size("validator.repetition_threshold", &result.repetition_threshold));
    PROMPTGUARD_RETURN_IF_ERROR(read_size("validator.min_token_count_for_repetition",
                                          &result.min_token_count_for_repetition));
    PROMPTGUARD_RETURN_IF_ERROR(
        read_size("validator.encoded_run_min_length", &result.encoded_run_min_length));
    PROMPTGUARD_RETURN_IF_ERROR(
        read_size("validator.inspector_run_min_length", &result.inspector_run_min_length));
    PROMPTGUARD_RETURN_IF_ERROR(
        read_size("validator.evidence_max_chars", &result.evidence_max_chars));

    PROMPTGUARD_ASSIGN_OR_RETURN(
        result.strict_mode, config.Read<bool>("validator.strict_mode", result.strict_mode));
    PROMPTGUARD_ASSIGN_OR_RETURN(
        result.dominant_token_ratio,
        config.Read<double>("validator.dominant_token_ratio", result.dominant_token_ratio));

    for (DetectionCategory category : kAllCategories) {
        const std::string key =
            absl::StrCat("validator.weights.", std::string(CategoryToString(category)));
        int weight = 0;
        PROMPTGUARD_ASSIGN_OR_RETURN(weight,
                                     config.Read<int>(key, result.weights.WeightFor(category)));
        result.weights.SetWeight(category, weight);
    }

    PROMPTGUARD_RETURN_IF_ERROR(result.Validate());
    return result;
}

}  // namespace promptguard::guard
