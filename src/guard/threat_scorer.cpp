#include "guard/threat_scorer.h"

#include <utility>

#include <absl/strings/ascii.h>
#include <absl/strings/match.h>

#include "common/logging.h"
#include "guard/repetition_detector.h"
#include "guard/utf8.h"

namespace promptguard::guard {

namespace {

constexpr std::string_view kLengthExceededEvidence = "length_exceeded";
constexpr std::string_view kRepetitionEvidence = "excessive_repetition";

}  // namespace

ThreatScorer::ThreatScorer(std::shared_ptr<const PatternRegistry> registry,
                           ValidatorConfig config)
    : registry_(std::move(registry)),
      config_(std::move(config)),
      inspector_(registry_) {}

ScoreResult ThreatScorer::Score(std::string_view text) const {
    ScoreResult result;

    // 1. Length
    const size_t length = utf8::Length(text);
    if (length > config_.max_length) {
        PROMPTGUARD_LOG_WARN("Input exceeds max length: {} > {}", length, config_.max_length);
        result.scored_text = std::string(utf8::Truncate(text, config_.max_length));
        result.truncated = true;
        Record(DetectionCategory::kLengthExceeded, kLengthExceededEvidence, &result);
    } else {
        result.scored_text = std::string(text);
    }
    const std::string& input = result.scored_text;

    // 2-4. Linguistic rule families. White-space runs are folded to one
    // space so that every \s* in these rules spans at most one character.
    const std::string folded = utf8::CollapseWhitespace(input, 1, " ");
    ScanRules(DetectionCategory::kPromptLeak, folded, &result);
    ScanRules(DetectionCategory::kJailbreak, folded, &result);
    ScanRules(DetectionCategory::kSystemTagSpoof, folded, &result);

    // 5. Keywords
    ScanKeywords(input, &result);

    // 6. Encodings, with payload inspection
    ScanEncodings(input, &result);

    // 7. Obfuscation
    ScanRules(DetectionCategory::kObfuscation, input, &result);

    // 8. Repetition
    RepetitionOptions repetition;
    repetition.char_threshold = config_.repetition_threshold;
    repetition.min_token_count = config_.min_token_count_for_repetition;
    repetition.dominant_ratio = config_.dominant_token_ratio;
    if (HasExcessiveRepetition(input, repetition)) {
        Record(DetectionCategory::kExcessiveRepetition, kRepetitionEvidence, &result);
    }

    return result;
}

void ThreatScorer::ScanRules(DetectionCategory category, std::string_view text,
                             ScoreResult* result) const {
    for (const auto& rule : registry_->Rules(category)) {
        std::string_view match;
        if (rule.Search(text, &match)) {
            Record(category, match, result);
        }
    }
}

void ThreatScorer::ScanKeywords(const std::string& text, ScoreResult* result) const {
    const std::string lowered = absl::AsciiStrToLower(text);
    for (const auto& keyword : registry_->DangerousKeywords()) {
        if (absl::StrContains(lowered, keyword.lowered)) {
            Record(DetectionCategory::kDangerousKeyword, keyword.literal, result);
        }
    }
}

void ThreatScorer::ScanEncodings(const std::string& text, ScoreResult* result) const {
    for (const auto& rule : registry_->Rules(DetectionCategory::kEncodingBypass)) {
        std::string_view match;
        if (!rule.Search(text, &match)) {
            continue;
        }
        Record(DetectionCategory::kEncodingBypass, match, result);

        if (rule.triggers_payload_inspection) {
            if (auto hidden = inspector_.Inspect(text)) {
                Record(hidden->category, hidden->evidence, result);
            }
        }
    }
}

void ThreatScorer::Record(DetectionCategory category, std::string_view evidence,
                          ScoreResult* result) const {
    result->total += config_.weights.WeightFor(category);
    result->detections.push_back(
        {category, std::string(utf8::Truncate(evidence, config_.evidence_max_chars))});
}

}  // namespace promptguard::guard
