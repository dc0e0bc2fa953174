/// @file validator.cpp
/// @brief Validation pipeline: score, level, policy, sanitize-or-reject

#include "guard/validator.h"

#include <mutex>
#include <utility>

#include <absl/strings/str_cat.h>
#include <absl/strings/str_join.h>

#include "common/error.h"
#include "common/logging.h"
#include "guard/policy.h"
#include "guard/utf8.h"

namespace promptguard::guard {

absl::StatusOr<std::unique_ptr<Validator>> Validator::Create(ValidatorConfig config) {
    PROMPTGUARD_RETURN_IF_ERROR(config.Validate());

    RegistryOptions options;
    options.encoded_run_min_length = config.encoded_run_min_length;
    options.inspector_run_min_length = config.inspector_run_min_length;

    auto registry_or = PatternRegistry::Create(options);
    if (!registry_or.ok()) {
        return Annotate(registry_or.status(), "rule set");
    }
    std::shared_ptr<const PatternRegistry> registry = *std::move(registry_or);

    PROMPTGUARD_LOG_DEBUG("Validator ready: {} rules, max_length={}, strict_mode={}",
                          registry->RuleCount(), config.max_length, config.strict_mode);

    return std::unique_ptr<Validator>(new Validator(std::move(config), std::move(registry)));
}

Validator::Validator(ValidatorConfig config, std::shared_ptr<const PatternRegistry> registry)
    : config_(std::move(config)),
      registry_(std::move(registry)),
      scorer_(registry_, config_) {}

ValidationResult Validator::Validate(std::string_view text) const {
    ValidationResult result;

    if (utf8::IsBlank(text)) {
        result.message = std::string(kEmptyInputMessage);
        return result;
    }

    ScoreResult score = scorer_.Score(text);

    result.score = score.total;
    result.threat_level = LevelForScore(score.total);
    result.is_valid = IsAcceptable(result.threat_level, config_.strict_mode);
    result.detections = std::move(score.detections);

    if (result.is_valid) {
        result.sanitized_input = Sanitize(score.scored_text);
        result.message = std::string(kOkMessage);
    } else {
        result.message = std::string(RejectionMessage(result.threat_level));
    }

    if (!result.detections.empty()) {
        LogVerdict(result);
    }
    if (AuditLogEnabled()) {
        WriteAuditRecord(result.ToJson().dump());
    }
    return result;
}

std::vector<ValidationResult> Validator::ValidateBatch(
    const std::vector<std::string>& texts) const {
    std::vector<ValidationResult> results;
    results.reserve(texts.size());
    for (const auto& text : texts) {
        results.push_back(Validate(text));
    }
    return results;
}

void Validator::LogVerdict(const ValidationResult& result) const {
    // Evidence is already bounded; the raw input is never logged
    const std::string detections = absl::StrJoin(
        result.detections, ", ", [](std::string* out, const Detection& d) {
            absl::StrAppend(out, std::string(CategoryToString(d.category)), "='", d.evidence, "'");
        });

    PROMPTGUARD_LOG_WARN("Injection patterns detected: [{}], threat_level={}, score={}, {}",
                         detections, ThreatLevelToString(result.threat_level), result.score,
                         result.is_valid ? "accepted" : "rejected");
}

absl::StatusOr<ValidationResult> Validate(std::string_view text, const ValidatorConfig& config) {
    std::unique_ptr<Validator> validator;
    PROMPTGUARD_ASSIGN_OR_RETURN(validator, Validator::Create(config));
    return validator->Validate(text);
}

absl::StatusOr<const Validator*> SharedValidator() {
    static std::once_flag once;
    static absl::StatusOr<std::unique_ptr<Validator>>* shared = nullptr;

    std::call_once(once, []() {
        shared = new absl::StatusOr<std::unique_ptr<Validator>>(Validator::Create());
    });

    if (!shared->ok()) {
        return shared->status();
    }
    return static_cast<const Validator*>(shared->value().get());
}

}  // namespace promptguard::guard
